#pragma once

#include <exception>
#include <ostream>
#include <string>
#include "../api.hpp"
#include "../string/refstring.hpp"

namespace cimap
{
    using except_addr = void *;

    struct except_info
    {
        except_addr *addresses = nullptr;
        size_t addresses_count = 0;
    };

    /// Fills `info` with the return addresses of the calling thread.
    CIMAP_API void capture_stack_trace(except_info &info) noexcept;

    /// Writes one symbolized line per captured frame.
    CIMAP_API void write_stack_trace(std::ostream &stream, const except_info &info);

    class CIMAP_API exception : public std::exception
    {
    public:
        struct except_info except_info;

        exception() noexcept
        {
#ifndef PROCESS_UNITTEST
            capture_stack_trace(except_info);
#endif
        }

        exception(const exception &other) noexcept;
        exception &operator=(const exception &) = delete;

        virtual ~exception() noexcept;

        virtual const char *what() const noexcept = 0;
    };

    class CIMAP_API runtime_error final : public exception
    {
    public:
        explicit runtime_error(const std::string &message) noexcept
            : exception(), _message(message.data(), message.size())
        {
        }
        explicit runtime_error(const char *message) noexcept : exception(), _message(message) {}

        const char *what() const noexcept override { return _message.c_str(); }

    private:
        refstring _message;
    };

    class CIMAP_API bad_alloc final : public exception
    {
    public:
        explicit bad_alloc(size_t size) noexcept;

        const char *what() const noexcept override { return _message.c_str(); }

    private:
        refstring _message;
    };

    /// Lookup, delete or pop of a key whose folded form has no entry.
    class CIMAP_API key_not_found final : public exception
    {
    public:
        /// @param key Printable form of the requested key, or empty when the key type has none.
        explicit key_not_found(const std::string &key) noexcept;

        const char *what() const noexcept override { return _message.c_str(); }

        /// The printable key as passed to the constructor.
        const char *key() const noexcept { return _key.c_str(); }

    private:
        refstring _message;
        refstring _key;
    };

    /// A case-insensitive variant was requested over a store without the mapping capability.
    class CIMAP_API invalid_backing_store final : public exception
    {
    public:
        explicit invalid_backing_store(const char *store_name) noexcept;

        const char *what() const noexcept override { return _message.c_str(); }

    private:
        refstring _message;
    };

#ifndef _MSC_VER
    CIMAP_API std::string demangle(const char *mangled_name);
#endif
} // namespace cimap
