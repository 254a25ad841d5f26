#ifndef CIMAP_HASH_UTILS_H
#define CIMAP_HASH_UTILS_H

#include <cstddef>
#include <functional>
#include <tuple>
#include <utility>
#include "../pair.hpp"
#include "../scalars.hpp"

#define CIMAP_HASH_PHI 11400714819323198485ull

namespace cimap
{
    template <typename T>
    struct hash;

    template <class T>
    inline void hash_combine(std::size_t &seed, const T &v)
    {
        hash<T> hasher;
        seed ^= hasher(v) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    }

    /// std::hash with support for pair-like and tuple keys.
    template <typename T>
    struct hash : std::hash<T>
    {
    };

    template <typename F, typename S>
    struct hash<pair<F, S>>
    {
        size_t operator()(const pair<F, S> &p) const noexcept
        {
            size_t seed = 0;
            hash_combine(seed, p.first);
            hash_combine(seed, p.second);
            return seed;
        }
    };

    template <typename F, typename S>
    struct hash<std::pair<F, S>>
    {
        size_t operator()(const std::pair<F, S> &p) const noexcept
        {
            size_t seed = 0;
            hash_combine(seed, p.first);
            hash_combine(seed, p.second);
            return seed;
        }
    };

    template <typename... Ts>
    struct hash<std::tuple<Ts...>>
    {
        size_t operator()(const std::tuple<Ts...> &t) const noexcept
        {
            size_t seed = 0;
            std::apply([&seed](const Ts &...v) { (hash_combine(seed, v), ...); }, t);
            return seed;
        }
    };

    /// Fibonacci scrambling of a hash into `log2b` bucket bits.
    inline u32 scramble_hash(size_t h, u32 log2b) noexcept
    {
        if (log2b == 0) return 0;
        return static_cast<u32>((static_cast<u64>(h) * CIMAP_HASH_PHI) >> (64 - log2b));
    }
} // namespace cimap

#endif
