#pragma once

#include <atomic>
#include <cstddef>
#include <cstring>
#include <new>

namespace cimap
{
    /// Immutable ref-counted C string. Copies share one buffer and never allocate,
    /// which keeps exception copies and `what()` noexcept.
    class refstring
    {
    private:
        struct rep
        {
            std::atomic<int> count;
            size_t len;
            char data[];
        };

        const char *_data;

        static rep *rep_from_data(const char *data) noexcept
        {
            return reinterpret_cast<rep *>(const_cast<char *>(data) - offsetof(rep, data));
        }

        void assign(const char *msg, size_t len) noexcept
        {
            release();
            auto *r = static_cast<rep *>(::operator new(sizeof(rep) + len + 1, std::nothrow));
            if (!r) return;
            new (&r->count) std::atomic<int>(1);
            r->len = len;
            memcpy(r->data, msg, len);
            r->data[len] = '\0';
            _data = r->data;
        }

        void release() noexcept
        {
            if (!_data) return;
            rep *r = rep_from_data(_data);
            if (r->count.fetch_sub(1, std::memory_order_acq_rel) == 1)
            {
                r->count.~atomic();
                ::operator delete(r);
            }
            _data = nullptr;
        }

    public:
        refstring() noexcept : _data(nullptr) {}

        explicit refstring(const char *msg) noexcept : _data(nullptr)
        {
            if (msg) assign(msg, strlen(msg));
        }

        refstring(const char *msg, size_t len) noexcept : _data(nullptr) { assign(msg, len); }

        refstring(const refstring &other) noexcept : _data(other._data)
        {
            if (_data) rep_from_data(_data)->count.fetch_add(1, std::memory_order_relaxed);
        }

        refstring &operator=(const refstring &other) noexcept
        {
            if (this != &other)
            {
                release();
                _data = other._data;
                if (_data) rep_from_data(_data)->count.fetch_add(1, std::memory_order_relaxed);
            }
            return *this;
        }

        refstring &operator=(const char *msg) noexcept
        {
            if (msg)
                assign(msg, strlen(msg));
            else
                release();
            return *this;
        }

        ~refstring() noexcept { release(); }

        const char *c_str() const noexcept { return _data ? _data : ""; }

        size_t size() const noexcept { return _data ? rep_from_data(_data)->len : 0; }
    };
} // namespace cimap
