#pragma once

#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <vector>
#include "../memory/alloc.hpp"
#include "hashmap.hpp"

#ifndef CIMAP_ORDERED_COMPACT_RATIO
    #define CIMAP_ORDERED_COMPACT_RATIO 50
#endif

namespace cimap
{
    /**
     * @brief Hash map that iterates in insertion order.
     *
     * Elements live in a dense slot array in the order their keys were first inserted; a hashmap
     * maps each key to its slot. Assigning to an existing key keeps its slot. Erasing leaves a
     * tombstone, and the slot array is compacted once tombstones exceed CIMAP_ORDERED_COMPACT_RATIO
     * percent of it. Compaction invalidates iterators.
     */
    template <typename K, typename V, typename H = hash<K>, typename Eq = std::equal_to<K>>
    class ordered_hashmap
    {
    public:
        using size_type = u32;
        using key_type = K;
        using mapped_type = V;
        using value_type = pair<K, V>;
        using reference = value_type &;
        using const_reference = const value_type &;
        using hasher = H;
        using key_equal = Eq;
        using difference_type = std::ptrdiff_t;

        static constexpr bool preserves_order = true;

    private:
        using slot_type = std::optional<value_type>;
        using slot_list = std::vector<slot_type, mem_allocator<slot_type>>;
        using index_type = hashmap<K, size_type, mem_allocator<std::byte>, H, Eq>;

    public:
        template <typename value_ret_t>
        class basic_iterator
        {
        public:
            using iterator_category = std::forward_iterator_tag;
            using value_type = typename ordered_hashmap::value_type;
            using difference_type = std::ptrdiff_t;
            using pointer = value_ret_t *;
            using reference = value_ret_t &;

            basic_iterator() noexcept : _slots(nullptr), _idx(0) {}

            template <typename P, typename = std::enable_if_t<std::is_const_v<value_ret_t> &&
                                                              !std::is_same_v<P, value_ret_t>>>
            basic_iterator(const basic_iterator<P> &o) noexcept : _slots(o._slots), _idx(o._idx)
            {
            }

            reference operator*() const noexcept { return *(*_slots)[_idx]; }
            pointer operator->() const noexcept { return &*(*_slots)[_idx]; }

            basic_iterator &operator++() noexcept
            {
                ++_idx;
                skip_dead();
                return *this;
            }

            basic_iterator operator++(int) noexcept
            {
                basic_iterator tmp = *this;
                ++(*this);
                return tmp;
            }

            friend bool operator==(const basic_iterator &a, const basic_iterator &b) noexcept
            {
                return a._slots == b._slots && a._idx == b._idx;
            }
            friend bool operator!=(const basic_iterator &a, const basic_iterator &b) noexcept { return !(a == b); }

        private:
            friend class ordered_hashmap;
            template <typename>
            friend class basic_iterator;

            basic_iterator(slot_list *slots, size_type idx) noexcept : _slots(slots), _idx(idx) { skip_dead(); }

            void skip_dead() noexcept
            {
                const size_type n = static_cast<size_type>(_slots->size());
                while (_idx < n && !(*_slots)[_idx]) ++_idx;
            }

            slot_list *_slots;
            size_type _idx;
        };

        using iterator = basic_iterator<value_type>;
        using const_iterator = basic_iterator<const value_type>;

        ordered_hashmap() = default;

        explicit ordered_hashmap(size_type capacity) { reserve(capacity); }

        ordered_hashmap(std::initializer_list<value_type> ilist)
        {
            reserve((size_type)ilist.size());
            for (const auto &kv : ilist) insert(kv);
        }

        template <class InputIt>
        ordered_hashmap(InputIt first, InputIt last)
        {
            for (; first != last; ++first) insert(*first);
        }

        bool empty() const noexcept { return _index.empty(); }
        size_type size() const noexcept { return _index.size(); }

        void reserve(size_type n)
        {
            _slots.reserve(n);
            _index.reserve(n);
        }

        iterator find(const key_type &key) noexcept
        {
            auto it = _index.find(key);
            return it == _index.end() ? end() : iterator(&_slots, it->second);
        }

        const_iterator find(const key_type &key) const noexcept
        {
            auto it = _index.find(key);
            return it == _index.end() ? end() : const_iterator(mutable_slots(), it->second);
        }

        bool contains(const key_type &key) const noexcept { return _index.contains(key); }
        size_type count(const key_type &key) const noexcept { return _index.count(key); }

        /// Appends a new element. An existing key is left untouched.
        template <class Kx, class... Args>
        pair<iterator, bool> try_emplace(Kx &&key, Args &&...margs)
        {
            auto it = _index.find(key);
            if (it != _index.end()) return {iterator(&_slots, it->second), false};
            const size_type pos = static_cast<size_type>(_slots.size());
            _slots.emplace_back(std::in_place, value_type{key_type(key), mapped_type(std::forward<Args>(margs)...)});
            try
            {
                _index.try_emplace(std::forward<Kx>(key), pos);
            }
            catch (...)
            {
                _slots.pop_back();
                throw;
            }
            return {iterator(&_slots, pos), true};
        }

        template <class Kx, class... Args>
        pair<iterator, bool> emplace(Kx &&key, Args &&...margs)
        {
            if constexpr (sizeof...(Args) == 0 && std::is_same_v<std::decay_t<Kx>, value_type>)
                return insert(std::forward<Kx>(key));
            else
                return try_emplace(std::forward<Kx>(key), std::forward<Args>(margs)...);
        }

        pair<iterator, bool> insert(const value_type &x) { return try_emplace(x.first, x.second); }

        pair<iterator, bool> insert(value_type &&x) { return try_emplace(std::move(x.first), std::move(x.second)); }

        /// Existing keys are assigned in place and keep their position.
        template <class Kx, class M>
        pair<iterator, bool> insert_or_assign(Kx &&key, M &&obj)
        {
            auto [it, inserted] = try_emplace(std::forward<Kx>(key), std::forward<M>(obj));
            if (!inserted) it->second = std::forward<M>(obj);
            return {it, inserted};
        }

        mapped_type &operator[](const key_type &key) { return try_emplace(key).first->second; }

        mapped_type &at(const key_type &key)
        {
            auto it = _index.find(key);
            if (it == _index.end()) throw key_not_found("");
            return _slots[it->second]->second;
        }

        const mapped_type &at(const key_type &key) const
        {
            auto it = _index.find(key);
            if (it == _index.end()) throw key_not_found("");
            return _slots[it->second]->second;
        }

        size_type erase(const key_type &key)
        {
            auto it = _index.find(key);
            if (it == _index.end()) return 0;
            erase_slot(it->second);
            return 1;
        }

        iterator erase(const_iterator pos)
        {
            if (pos._idx >= _slots.size()) return end();
            size_type next = erase_slot(pos._idx);
            return iterator(&_slots, next);
        }

        std::optional<value_type> extract(const key_type &key)
        {
            auto it = _index.find(key);
            if (it == _index.end()) return std::nullopt;
            std::optional<value_type> out(std::move(*_slots[it->second]));
            erase_slot(it->second);
            return out;
        }

        /// Most recently inserted live element. Undefined on an empty map.
        value_type &back() noexcept
        {
            size_type i = static_cast<size_type>(_slots.size()) - 1;
            while (!_slots[i]) --i;
            return *_slots[i];
        }

        void clear() noexcept
        {
            _slots.clear();
            _index.clear();
        }

        iterator begin() noexcept { return iterator(&_slots, 0); }
        iterator end() noexcept { return iterator(&_slots, static_cast<size_type>(_slots.size())); }
        const_iterator begin() const noexcept { return cbegin(); }
        const_iterator end() const noexcept { return cend(); }
        const_iterator cbegin() const noexcept { return const_iterator(mutable_slots(), 0); }
        const_iterator cend() const noexcept
        {
            return const_iterator(mutable_slots(), static_cast<size_type>(_slots.size()));
        }

        void swap(ordered_hashmap &other) noexcept
        {
            _slots.swap(other._slots);
            _index.swap(other._index);
        }

        /// Order-sensitive, as with any insertion-ordered map.
        bool operator==(const ordered_hashmap &rhs) const
        {
            if (size() != rhs.size()) return false;
            auto a = begin(), b = rhs.begin();
            for (; a != end(); ++a, ++b)
                if (!(*a == *b)) return false;
            return true;
        }

        bool operator!=(const ordered_hashmap &rhs) const { return !(*this == rhs); }

    private:
        slot_list _slots;
        index_type _index;

        slot_list *mutable_slots() const noexcept { return const_cast<slot_list *>(&_slots); }

        /// Tombstones slot `idx` and returns the slot index of the element that followed it.
        size_type erase_slot(size_type idx)
        {
            _index.erase(_slots[idx]->first);
            _slots[idx].reset();

            size_type next = idx + 1;
            const size_t dead = _slots.size() - _index.size();
            if (_index.empty())
            {
                _slots.clear();
                return 0;
            }
            if (_slots.size() >= 8 && dead * 100 > _slots.size() * CIMAP_ORDERED_COMPACT_RATIO)
                next = compact(next);
            return next;
        }

        /// Drops tombstones and re-indexes. Returns where slot `ref` moved to.
        size_type compact(size_type ref)
        {
            size_type out = 0, moved_ref = 0;
            for (size_type i = 0; i < _slots.size(); ++i)
            {
                if (i == ref) moved_ref = out;
                if (!_slots[i]) continue;
                if (i != out) _slots[out] = std::move(_slots[i]);
                _index.at(_slots[out]->first) = out;
                ++out;
            }
            if (ref >= _slots.size()) moved_ref = out;
            _slots.resize(out);
            return moved_ref;
        }
    };

    template <typename K, typename V, typename H, typename Eq>
    inline void swap(ordered_hashmap<K, V, H, Eq> &a, ordered_hashmap<K, V, H, Eq> &b) noexcept
    {
        a.swap(b);
    }
} // namespace cimap
