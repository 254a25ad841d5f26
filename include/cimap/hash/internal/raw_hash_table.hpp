#pragma once

#include <cassert>
#include <cstddef>
#include <cstring>
#include <initializer_list>
#include <iterator>
#include <limits>
#include <optional>
#include "../../api.hpp"
#include "../../exception/exception.hpp"
#include "../../memory/alloc.hpp"
#include "../../pair.hpp"
#include "../utils.hpp"

#define CIMAP_CTRL_EMPTY 0x00
#define CIMAP_CTRL_FULL  0x01
#ifndef CIMAP_HASH_LOAD_FACTOR
    #define CIMAP_HASH_LOAD_FACTOR 75
#endif

namespace cimap
{
    namespace internal
    {
        /// Open-addressing table with linear probing and backward-shift deletion.
        /// Slots and control bytes live in one allocation: [values x N][ctrl x N].
        template <typename Allocator, typename Traits>
        class raw_hashtable
        {
        public:
            using size_type = typename Traits::size_type;
            using value_type = typename Traits::value_type;
            using key_type = typename Traits::key_type;
            using mapped_type = typename Traits::mapped_type;
            using reference = value_type &;
            using const_reference = const value_type &;
            using allocator_type = Allocator;
            using pointer = value_type *;
            using const_pointer = const value_type *;
            using raw_pointer = typename Allocator::pointer;
            using difference_type = std::ptrdiff_t;
            using hasher = typename Traits::hasher;
            using key_equal = typename Traits::key_equal;

            template <typename value_ret_t>
            class basic_iterator
            {
            public:
                using iterator_category = std::forward_iterator_tag;
                using value_type = typename raw_hashtable::value_type;
                using difference_type = std::ptrdiff_t;
                using pointer = value_ret_t *;
                using reference = value_ret_t &;

                basic_iterator() noexcept : _h(nullptr), _idx(0) {}
                basic_iterator(const raw_hashtable *h, size_type idx) noexcept : _h(h), _idx(idx) {}

                template <typename P, typename = std::enable_if_t<std::is_const_v<value_ret_t> &&
                                                                  !std::is_same_v<P, value_ret_t>>>
                basic_iterator(const basic_iterator<P> &o) noexcept : _h(o._h), _idx(o._idx)
                {
                }

                reference operator*() const noexcept { return _h->_values[_idx]; }
                pointer operator->() const noexcept { return &_h->_values[_idx]; }

                basic_iterator &operator++() noexcept
                {
                    advance();
                    return *this;
                }

                basic_iterator operator++(int) noexcept
                {
                    basic_iterator tmp = *this;
                    advance();
                    return tmp;
                }

                friend bool operator==(const basic_iterator &a, const basic_iterator &b) noexcept
                {
                    return a._h == b._h && a._idx == b._idx;
                }
                friend bool operator!=(const basic_iterator &a, const basic_iterator &b) noexcept { return !(a == b); }

            private:
                friend class raw_hashtable;
                template <typename>
                friend class basic_iterator;

                CIMAP_FORCEINLINE void advance() noexcept
                {
                    assert(_h);
                    const size_type n = _h->_num_buckets;
                    if (_idx >= n) return;
                    size_type i = _idx + 1;
                    while (i < n && _h->_ctrl[i] == CIMAP_CTRL_EMPTY) ++i;
                    _idx = i;
                }

                const raw_hashtable *_h;
                size_type _idx;
            };

            using iterator = basic_iterator<value_type>;
            using const_iterator = basic_iterator<const value_type>;

            raw_hashtable() noexcept
                : _values(nullptr), _ctrl(nullptr), _num_buckets(0), _num_filled(0), _log2b(0)
            {
            }

            explicit raw_hashtable(size_type bucket_count) : raw_hashtable() { reserve(bucket_count); }

            raw_hashtable(const raw_hashtable &rhs) : raw_hashtable()
            {
                if (rhs._num_filled == 0) return;
                allocate_blocks(rhs._num_buckets);
                std::memcpy(_ctrl, rhs._ctrl, _num_buckets);
                for (size_type i = 0; i < _num_buckets; ++i)
                    if (_ctrl[i] == CIMAP_CTRL_FULL) ::new ((void *)&_values[i]) value_type(rhs._values[i]);
                _num_filled = rhs._num_filled;
            }

            raw_hashtable(raw_hashtable &&rhs) noexcept
                : _values(rhs._values),
                  _ctrl(rhs._ctrl),
                  _num_buckets(rhs._num_buckets),
                  _num_filled(rhs._num_filled),
                  _log2b(rhs._log2b)
            {
                rhs._values = nullptr;
                rhs._ctrl = nullptr;
                rhs._num_buckets = rhs._num_filled = rhs._log2b = 0;
            }

            raw_hashtable &operator=(const raw_hashtable &rhs)
            {
                if (this == &rhs) return *this;
                raw_hashtable tmp(rhs);
                swap(tmp);
                return *this;
            }

            raw_hashtable &operator=(raw_hashtable &&rhs) noexcept
            {
                if (this == &rhs) return *this;
                destroy_all();
                _values = rhs._values;
                _ctrl = rhs._ctrl;
                _num_buckets = rhs._num_buckets;
                _num_filled = rhs._num_filled;
                _log2b = rhs._log2b;

                rhs._values = nullptr;
                rhs._ctrl = nullptr;
                rhs._num_buckets = rhs._num_filled = rhs._log2b = 0;
                return *this;
            }

            raw_hashtable(std::initializer_list<value_type> ilist) : raw_hashtable()
            {
                reserve((size_type)ilist.size());
                for (const auto &kv : ilist) insert(kv);
            }

            template <class InputIt>
            raw_hashtable(InputIt first, InputIt last) : raw_hashtable()
            {
                using Cat = typename std::iterator_traits<InputIt>::iterator_category;
                if constexpr (std::is_base_of_v<std::forward_iterator_tag, Cat>)
                    reserve((size_type)std::distance(first, last));
                for (; first != last; ++first) insert(*first);
            }

            ~raw_hashtable() { destroy_all(); }

            bool empty() const noexcept { return _num_filled == 0; }
            size_type size() const noexcept { return _num_filled; }
            size_type max_size() const noexcept { return std::numeric_limits<size_type>::max() / sizeof(value_type); }
            size_type bucket_count() const noexcept { return _num_buckets; }

            float load_factor() const noexcept
            {
                return _num_buckets ? float(_num_filled) / float(_num_buckets) : 0.0f;
            }

            float max_load_factor() const noexcept { return float(CIMAP_HASH_LOAD_FACTOR) / 100.0f; }

            hasher hash_function() const noexcept { return hasher(); }

            key_equal key_eq() const noexcept { return key_equal(); }

            /// Grows the table so that `n` elements fit under the load factor.
            void reserve(size_type n)
            {
                if (n == 0) return;
                if (uint64_t(n) * 100 <= uint64_t(_num_buckets) * CIMAP_HASH_LOAD_FACTOR) return;
                rehash((size_type)(uint64_t(n) * 100 / CIMAP_HASH_LOAD_FACTOR + 1));
            }

            void rehash(size_type required)
            {
                if (required < _num_filled) required = _num_filled;
                const size_type new_b = get_growth_size_aligned(required);
                if (new_b == _num_buckets) return;

                value_type *old_values = _values;
                u8 *old_ctrl = _ctrl;
                const size_type old_b = _num_buckets;
                const size_type old_filled = _num_filled;

                allocate_blocks(new_b);
                for (size_type i = 0; i < old_b; ++i)
                {
                    if (old_ctrl[i] != CIMAP_CTRL_FULL) continue;
                    size_type pos = key_to_bucket(Traits::get_key(old_values[i]));
                    while (_ctrl[pos] == CIMAP_CTRL_FULL) pos = (pos + 1) & (_num_buckets - 1);
                    place_move(old_values[i], &_values[pos]);
                    _ctrl[pos] = CIMAP_CTRL_FULL;
                }
                _num_filled = old_filled;
                if (old_values) Allocator::deallocate((raw_pointer)old_values);
            }

            template <class Kx, class... Args>
            CIMAP_FORCEINLINE pair<iterator, bool> try_emplace(Kx &&key, Args &&...margs)
            {
                grow_for_one();
                auto [pos, existed] = find_slot(key);
                if (existed) return {iterator(this, pos), false};
                ::new ((void *)&_values[pos])
                    value_type{key_type(std::forward<Kx>(key)), mapped_type(std::forward<Args>(margs)...)};
                _ctrl[pos] = CIMAP_CTRL_FULL;
                ++_num_filled;
                return {iterator(this, pos), true};
            }

            template <class Kx, class... Args>
            CIMAP_FORCEINLINE pair<iterator, bool> emplace(Kx &&key, Args &&...margs)
            {
                if constexpr (sizeof...(Args) == 0 && std::is_same_v<std::decay_t<Kx>, value_type>)
                    return insert(std::forward<Kx>(key));
                else
                    return try_emplace(std::forward<Kx>(key), std::forward<Args>(margs)...);
            }

            pair<iterator, bool> insert(const value_type &x)
            {
                grow_for_one();
                auto [pos, existed] = find_slot(Traits::get_key(x));
                if (existed) return {iterator(this, pos), false};
                ::new ((void *)&_values[pos]) value_type(x);
                _ctrl[pos] = CIMAP_CTRL_FULL;
                ++_num_filled;
                return {iterator(this, pos), true};
            }

            pair<iterator, bool> insert(value_type &&x)
            {
                grow_for_one();
                auto [pos, existed] = find_slot(Traits::get_key(x));
                if (existed) return {iterator(this, pos), false};
                ::new ((void *)&_values[pos]) value_type(std::move(x));
                _ctrl[pos] = CIMAP_CTRL_FULL;
                ++_num_filled;
                return {iterator(this, pos), true};
            }

            template <class InputIt>
            void insert(InputIt first, InputIt last)
            {
                for (; first != last; ++first) insert(*first);
            }

            template <class Kx, class M>
            CIMAP_FORCEINLINE pair<iterator, bool> insert_or_assign(Kx &&key, M &&obj)
            {
                auto [it, inserted] = try_emplace(std::forward<Kx>(key), std::forward<M>(obj));
                if (!inserted) it->second = std::forward<M>(obj);
                return {it, inserted};
            }

            size_type bucket(const key_type &key) const noexcept
            {
                if (_num_filled == 0) return _num_buckets;
                const size_type mask = _num_buckets - 1;
                size_type i = key_to_bucket(key);
                while (_ctrl[i] == CIMAP_CTRL_FULL)
                {
                    if (key_equal{}(Traits::get_key(_values[i]), key)) return i;
                    i = (i + 1) & mask;
                }
                return _num_buckets;
            }

            inline iterator find(const key_type &key) noexcept { return iterator(this, bucket(key)); }
            inline const_iterator find(const key_type &key) const noexcept { return const_iterator(this, bucket(key)); }
            inline bool contains(const key_type &key) const noexcept { return bucket(key) != _num_buckets; }
            size_type count(const key_type &key) const noexcept { return contains(key) ? 1 : 0; }

            mapped_type &at(const key_type &key)
            {
                size_type idx = bucket(key);
                if (idx == _num_buckets) throw key_not_found("");
                return _values[idx].second;
            }

            const mapped_type &at(const key_type &key) const
            {
                size_type idx = bucket(key);
                if (idx == _num_buckets) throw key_not_found("");
                return _values[idx].second;
            }

            mapped_type &operator[](const key_type &key) { return try_emplace(key).first->second; }

            mapped_type &operator[](key_type &&key) { return try_emplace(std::move(key)).first->second; }

            size_type erase(const key_type &key) noexcept
            {
                size_type idx = bucket(key);
                if (idx == _num_buckets) return 0;
                erase_at(idx);
                return 1;
            }

            /// Removing an element may shift a later element of the same probe run into `pos`;
            /// the returned iterator points at that element, or at the next occupied slot.
            iterator erase(const_iterator pos) noexcept
            {
                size_type i = pos._idx;
                if (i >= _num_buckets) return end();
                erase_at(i);
                if (_ctrl[i] == CIMAP_CTRL_FULL) return iterator(this, i);
                return iterator(this, find_next_bucket(i));
            }

            std::optional<value_type> extract(const key_type &key)
            {
                size_type idx = bucket(key);
                if (idx == _num_buckets) return std::nullopt;
                std::optional<value_type> out(std::move(_values[idx]));
                erase_at(idx);
                return out;
            }

            inline iterator begin() noexcept { return iterator(this, find_next_bucket(0, true)); }
            inline iterator end() noexcept { return iterator(this, _num_buckets); }
            inline const_iterator begin() const noexcept { return cbegin(); }
            inline const_iterator end() const noexcept { return cend(); }
            inline const_iterator cbegin() const noexcept { return const_iterator(this, find_next_bucket(0, true)); }
            inline const_iterator cend() const noexcept { return const_iterator(this, _num_buckets); }

            void clear() noexcept
            {
                if (!_values) return;
                if constexpr (!std::is_trivially_destructible_v<value_type>)
                    for (size_type i = 0; i < _num_buckets; ++i)
                        if (_ctrl[i] == CIMAP_CTRL_FULL) _values[i].~value_type();
                std::memset(_ctrl, CIMAP_CTRL_EMPTY, _num_buckets);
                _num_filled = 0;
            }

            void swap(raw_hashtable &other) noexcept
            {
                using std::swap;
                swap(_values, other._values);
                swap(_ctrl, other._ctrl);
                swap(_num_buckets, other._num_buckets);
                swap(_num_filled, other._num_filled);
                swap(_log2b, other._log2b);
            }

            /// Order-insensitive: same size and every element found with an equal value.
            bool operator==(const raw_hashtable &rhs) const
            {
                if (_num_filled != rhs._num_filled) return false;
                for (const auto &v : *this)
                {
                    size_type idx = rhs.bucket(Traits::get_key(v));
                    if (idx == rhs._num_buckets || !(rhs._values[idx] == v)) return false;
                }
                return true;
            }

            bool operator!=(const raw_hashtable &rhs) const { return !(*this == rhs); }

        private:
            value_type *_values;
            u8 *_ctrl;
            size_type _num_buckets, _num_filled;
            u32 _log2b;

            void allocate_blocks(size_type bucket_count)
            {
                const size_t bytes_values = size_t(bucket_count) * sizeof(value_type);
                auto *base = Allocator::allocate(bytes_values + bucket_count);
                _values = reinterpret_cast<value_type *>(base);
                _ctrl = reinterpret_cast<u8 *>(base) + bytes_values;
                std::memset(_ctrl, CIMAP_CTRL_EMPTY, bucket_count);
                _num_buckets = bucket_count;
                _num_filled = 0;
                _log2b = 0;
                while ((size_type(1) << _log2b) < bucket_count) ++_log2b;
            }

            void destroy_all() noexcept
            {
                if (!_values) return;
                clear();
                Allocator::deallocate((raw_pointer)_values);
                _values = nullptr;
                _ctrl = nullptr;
                _num_buckets = _num_filled = _log2b = 0;
            }

            CIMAP_FORCEINLINE void place_move(value_type &src, value_type *dst)
            {
                ::new ((void *)dst) value_type(std::move(src));
                if constexpr (!std::is_trivially_destructible_v<value_type>) src.~value_type();
            }

            CIMAP_FORCEINLINE void grow_for_one()
            {
                if (uint64_t(_num_filled + 1) * 100 > uint64_t(_num_buckets) * CIMAP_HASH_LOAD_FACTOR)
                    rehash(_num_buckets ? _num_buckets * 2 : 8);
            }

            /// First slot holding `key`, or the empty slot that ends its probe run.
            pair<size_type, bool> find_slot(const key_type &key) const noexcept
            {
                const size_type mask = _num_buckets - 1;
                size_type i = key_to_bucket(key);
                while (_ctrl[i] == CIMAP_CTRL_FULL)
                {
                    if (key_equal{}(Traits::get_key(_values[i]), key)) return {i, true};
                    i = (i + 1) & mask;
                }
                return {i, false};
            }

            void erase_at(size_type i) noexcept
            {
                if constexpr (!std::is_trivially_destructible_v<value_type>) _values[i].~value_type();
                _ctrl[i] = CIMAP_CTRL_EMPTY;
                --_num_filled;

                const size_type mask = _num_buckets - 1;
                size_type j = i;
                for (;;)
                {
                    j = (j + 1) & mask;
                    if (_ctrl[j] != CIMAP_CTRL_FULL) break;
                    const size_type home = key_to_bucket(Traits::get_key(_values[j]));
                    // Entries whose home lies cyclically in (i, j] are still reachable.
                    const bool reachable = i <= j ? (i < home && home <= j) : (i < home || home <= j);
                    if (reachable) continue;
                    place_move(_values[j], &_values[i]);
                    _ctrl[i] = CIMAP_CTRL_FULL;
                    _ctrl[j] = CIMAP_CTRL_EMPTY;
                    i = j;
                }
            }

            CIMAP_FORCEINLINE size_type find_next_bucket(size_type i, bool inclusive = false) const noexcept
            {
                if (_num_filled == 0) return _num_buckets;
                size_type j = inclusive ? i : i + 1;
                while (j < _num_buckets && _ctrl[j] != CIMAP_CTRL_FULL) ++j;
                return j;
            }

            CIMAP_FORCEINLINE size_type key_to_bucket(const key_type &k) const noexcept
            {
                return scramble_hash(hasher{}(k), _log2b);
            }
        };
    } // namespace internal
} // namespace cimap
