#pragma once

#include <mutex>
#include <string>
#include <typeindex>
#include <typeinfo>
#include "api.hpp"
#include "exception/exception.hpp"
#include "hash/hashmap.hpp"
#include "log.hpp"
#include "store_kind.hpp"

namespace cimap
{
    /// Description of one case-insensitive configuration.
    class CIMAP_API variant
    {
    public:
        variant(const std::string &name, std::type_index store_type, bool preserves_order)
            : _name(name), _store_type(store_type), _preserves_order(preserves_order)
        {
        }

        const std::string &name() const { return _name; }

        /// Type identity of the store kind the configuration was built from.
        std::type_index store_type() const { return _store_type; }

        bool preserves_order() const { return _preserves_order; }

    private:
        std::string _name;
        std::type_index _store_type;
        bool _preserves_order;
    };

    namespace internal
    {
        template <typename Kind, typename = void>
        struct kind_name
        {
            static std::string get()
            {
#ifdef _MSC_VER
                return typeid(Kind).name();
#else
                return demangle(typeid(Kind).name());
#endif
            }
        };

        template <typename Kind>
        struct kind_name<Kind, std::void_t<decltype(Kind::name)>>
        {
            static std::string get() { return Kind::name; }
        };
    } // namespace internal

    /**
     * @brief Memoized factory of case-insensitive configurations.
     *
     * Configurations are keyed by the type identity of their store kind and created on first request.
     * Repeated requests for one kind return the same object for the life of the process.
     */
    class CIMAP_API registry
    {
    public:
        static registry &instance();

        registry() = default;
        ~registry();

        registry(const registry &) = delete;
        registry &operator=(const registry &) = delete;

        /**
         * @brief Returns the configuration over the store kind `Kind`, registering it on first use.
         * @param name Display name used on first registration. Defaults to `Kind::name` when the kind
         * declares one and to the demangled type name otherwise.
         * @throws invalid_backing_store when the store selected by `Kind` is not a mutable mapping.
         */
        template <typename Kind>
        const variant &build(const char *name = nullptr)
        {
            const std::type_index id(typeid(Kind));
            if (const variant *found = find(id)) return *found;
            if constexpr (!is_store_kind_v<Kind>)
            {
                std::string kind = internal::kind_name<Kind>::get();
                logError("Cannot build a case-insensitive variant over %s: not a mutable mapping", kind.c_str());
                throw invalid_backing_store(kind.c_str());
            }
            else
                return emplace(id, name ? std::string(name) : internal::kind_name<Kind>::get(),
                               store_kind_traits<Kind>::preserves_order);
        }

        /// Registered configuration for the kind `id`, or nullptr.
        const variant *find(std::type_index id) const;

        size_t size() const;

    private:
        mutable std::mutex _lock;
        hashmap<std::type_index, variant *> _variants;

        const variant &emplace(std::type_index id, const std::string &name, bool preserves_order);
    };
} // namespace cimap
