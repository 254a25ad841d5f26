#ifndef CIMAP_MEM_ALLOCATOR_H
#define CIMAP_MEM_ALLOCATOR_H

#include <algorithm>
#include <cstddef>
#include <cstdlib>
#include <limits>
#include <oneapi/tbb/scalable_allocator.h>
#include <type_traits>
#include <utility>
#include "../exception/exception.hpp"
#include "../type_traits.hpp"

namespace cimap
{
    /// Stateless allocator over the TBB scalable heap. Every store in the library allocates through it.
    template <typename T>
    class mem_allocator
    {
    public:
        using value_type = T;
        using pointer = T *;
        using const_pointer = const T *;
        using size_type = size_t;
        using difference_type = ptrdiff_t;

        mem_allocator() noexcept = default;

        template <typename U>
        mem_allocator(const mem_allocator<U> &) noexcept
        {
        }

        static inline pointer allocate(size_type num)
        {
            if (num > max_size()) throw bad_alloc(num);
            if (auto p = static_cast<pointer>(scalable_malloc(num * sizeof(T)))) return p;
            throw bad_alloc(num * sizeof(T));
        }

        static inline void deallocate(pointer p, size_type = 0) noexcept { scalable_free(p); }

        static inline size_type max_size() noexcept { return std::numeric_limits<size_type>::max() / sizeof(T); }

        template <typename U, typename... Args>
        static inline void construct(U *p, Args &&...args)
        {
            if constexpr (std::is_aggregate_v<U>)
                ::new ((void *)p) U{std::forward<Args>(args)...};
            else
                ::new ((void *)p) U(std::forward<Args>(args)...);
        }

        template <typename U>
        static inline void destroy(U *p) noexcept
        {
            if (!p) return;
            if constexpr (!std::is_trivially_destructible_v<U>) p->~U();
        }

        template <typename U>
        struct rebind
        {
            using other = mem_allocator<U>;
        };
    };

    template <typename T, typename U>
    bool operator==(const mem_allocator<T> &, const mem_allocator<U> &) noexcept
    {
        return true;
    }

    template <typename T, typename U>
    bool operator!=(const mem_allocator<T> &, const mem_allocator<U> &) noexcept
    {
        return false;
    }

    template <typename T, typename... Args>
    inline T *alloc(Args &&...args)
    {
        auto ptr = mem_allocator<T>::allocate(1);
        if constexpr (!std::is_trivially_constructible_v<T> || has_args<Args...>())
            mem_allocator<T>::construct(ptr, std::forward<Args>(args)...);
        return ptr;
    }

    template <typename T>
    inline void release(T *ptr)
    {
        if (!ptr) return;
        mem_allocator<T>::destroy(ptr);
        mem_allocator<T>::deallocate(ptr, 1);
    }

    /// Power-of-two bucket count not below `x` (minimum 8).
    inline uint32_t get_growth_size_aligned(uint32_t x)
    {
        if (x <= 8) return 8;
        --x;
        x |= x >> 1;
        x |= x >> 2;
        x |= x >> 4;
        x |= x >> 8;
        x |= x >> 16;
        uint32_t r = x + 1;
        return r ? r : 0x80000000u;
    }
} // namespace cimap
#endif
