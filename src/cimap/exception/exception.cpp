#include <cimap/exception/exception.hpp>
#include <cimap/string/utils.hpp>
#include <cstdlib>
#include <cstring>

#ifdef _WIN32
    #include <windows.h>
#else
    #include <cxxabi.h>
    #include <execinfo.h>
#endif

namespace cimap
{
    constexpr size_t max_stack_frames = 64;

    void capture_stack_trace(except_info &info) noexcept
    {
        void *buffer[max_stack_frames];
#ifdef _WIN32
        int frames = static_cast<int>(CaptureStackBackTrace(1, max_stack_frames, buffer, nullptr));
#else
        int frames = backtrace(buffer, max_stack_frames);
#endif
        if (frames <= 0) return;
        auto *addresses = static_cast<except_addr *>(malloc(sizeof(except_addr) * frames));
        if (!addresses) return;
        memcpy(addresses, buffer, sizeof(except_addr) * frames);
        info.addresses = addresses;
        info.addresses_count = static_cast<size_t>(frames);
    }

#ifndef _MSC_VER
    std::string demangle(const char *mangled_name)
    {
        int status = 0;
        char *demangled = abi::__cxa_demangle(mangled_name, nullptr, nullptr, &status);
        if (status != 0 || !demangled) return mangled_name;
        std::string result(demangled);
        free(demangled);
        return result;
    }
#endif

    void write_stack_trace(std::ostream &stream, const except_info &info)
    {
        stream << "Stack trace:\n";
#ifdef _WIN32
        for (size_t i = 0; i < info.addresses_count; ++i) stream << format("\t#%zu %p\n", i, info.addresses[i]);
#else
        char **symbols = backtrace_symbols(info.addresses, static_cast<int>(info.addresses_count));
        for (size_t i = 0; i < info.addresses_count; ++i)
        {
            stream << format("\t#%zu %p", i, info.addresses[i]);
            if (symbols)
            {
                // "module(mangled+offset) [address]"
                std::string line = symbols[i];
                size_t open = line.find('('), plus = line.find('+', open);
                if (open != std::string::npos && plus != std::string::npos && plus > open + 1)
                    stream << ' ' << demangle(line.substr(open + 1, plus - open - 1).c_str());
                else
                    stream << ' ' << line;
            }
            stream << '\n';
        }
        free(symbols);
#endif
    }

    exception::exception(const exception &other) noexcept
    {
        if (!other.except_info.addresses) return;
        size_t bytes = sizeof(except_addr) * other.except_info.addresses_count;
        auto *addresses = static_cast<except_addr *>(malloc(bytes));
        if (!addresses) return;
        memcpy(addresses, other.except_info.addresses, bytes);
        except_info.addresses = addresses;
        except_info.addresses_count = other.except_info.addresses_count;
    }

    exception::~exception() noexcept { free(except_info.addresses); }

    bad_alloc::bad_alloc(size_t size) noexcept
    {
        std::string temp = format("bad alloc: failed to allocate %zu bytes", size);
        _message = temp.c_str();
    }

    key_not_found::key_not_found(const std::string &key) noexcept : exception(), _key(key.data(), key.size())
    {
        std::string temp = key.empty() ? std::string("key not found") : format("key not found: %s", key.c_str());
        _message = temp.c_str();
    }

    invalid_backing_store::invalid_backing_store(const char *store_name) noexcept : exception()
    {
        std::string temp = format("invalid backing store: %s is not a mutable mapping", store_name);
        _message = temp.c_str();
    }
} // namespace cimap
