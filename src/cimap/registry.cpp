#include <cimap/log.hpp>
#include <cimap/memory/alloc.hpp>
#include <cimap/registry.hpp>

namespace cimap
{
    registry &registry::instance()
    {
        static registry g_registry;
        return g_registry;
    }

    registry::~registry()
    {
        for (auto &entry : _variants) cimap::release(entry.second);
        _variants.clear();
    }

    const variant *registry::find(std::type_index id) const
    {
        std::lock_guard<std::mutex> guard(_lock);
        auto it = _variants.find(id);
        return it == _variants.end() ? nullptr : it->second;
    }

    size_t registry::size() const
    {
        std::lock_guard<std::mutex> guard(_lock);
        return _variants.size();
    }

    const variant &registry::emplace(std::type_index id, const std::string &name, bool preserves_order)
    {
        variant *created = nullptr;
        {
            std::lock_guard<std::mutex> guard(_lock);
            auto it = _variants.find(id);
            if (it != _variants.end()) return *it->second;
            created = cimap::alloc<variant>(name, id, preserves_order);
            try
            {
                _variants.try_emplace(id, created);
            }
            catch (...)
            {
                cimap::release(created);
                throw;
            }
        }
        logDebug("Registered case-insensitive variant %s (%s)", name.c_str(),
                 preserves_order ? "ordered" : "unordered");
        return *created;
    }
} // namespace cimap
