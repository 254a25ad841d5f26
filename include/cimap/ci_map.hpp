#pragma once

#include <initializer_list>
#include <iterator>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>
#include "exception/exception.hpp"
#include "fold.hpp"
#include "mapping_traits.hpp"
#include "memory/clone.hpp"
#include "pair.hpp"
#include "registry.hpp"
#include "store_kind.hpp"
#include "string/literal.hpp"

namespace cimap
{
    namespace internal
    {
        /// Printable form of a key for error messages, empty when the key type has none.
        template <typename K>
        std::string describe_key(const K &key)
        {
            if constexpr (std::is_same_v<K, std::string>)
                return '\'' + key + '\'';
            else if constexpr (is_literal_v<K>)
            {
                std::ostringstream os;
                write_literal(os, key);
                return os.str();
            }
            else
                return {};
        }

        struct item_projection
        {
            template <typename E>
            static const E &get(const E &entry) noexcept
            {
                return entry;
            }
        };

        struct key_projection
        {
            template <typename E>
            static const auto &get(const E &entry) noexcept
            {
                return entry.first;
            }
        };

        struct value_projection
        {
            template <typename E>
            static const auto &get(const E &entry) noexcept
            {
                return entry.second;
            }
        };

        /// Walks store entries (normalized key -> item) and exposes a projection of the item.
        template <typename It, typename Proj>
        class projected_iterator
        {
        public:
            using iterator_category = std::forward_iterator_tag;
            using reference = decltype(Proj::get(std::declval<It &>()->second));
            using value_type = std::remove_cv_t<std::remove_reference_t<reference>>;
            using pointer = std::add_pointer_t<std::remove_reference_t<reference>>;
            using difference_type = std::ptrdiff_t;

            projected_iterator() = default;
            explicit projected_iterator(It it) : _it(it) {}

            reference operator*() const { return Proj::get(_it->second); }
            pointer operator->() const { return &Proj::get(_it->second); }

            projected_iterator &operator++()
            {
                ++_it;
                return *this;
            }

            projected_iterator operator++(int)
            {
                projected_iterator tmp = *this;
                ++_it;
                return tmp;
            }

            /// Underlying store iterator.
            const It &base() const noexcept { return _it; }

            friend bool operator==(const projected_iterator &a, const projected_iterator &b) { return a._it == b._it; }
            friend bool operator!=(const projected_iterator &a, const projected_iterator &b) { return !(a == b); }

        private:
            It _it{};
        };

        template <typename Iterator>
        class view
        {
        public:
            using iterator = Iterator;
            using const_iterator = Iterator;
            using value_type = typename Iterator::value_type;

            view(Iterator first, Iterator last, size_t size) : _first(first), _last(last), _size(size) {}

            Iterator begin() const { return _first; }
            Iterator end() const { return _last; }
            size_t size() const noexcept { return _size; }
            bool empty() const noexcept { return _size == 0; }

        private:
            Iterator _first, _last;
            size_t _size;
        };
    } // namespace internal

    /**
     * @brief Associative container with case-insensitive keys that remembers the original casing.
     *
     * The store maps `Fold(key)` to the pair (original key, value). Lookup, membership, removal and
     * equality go through the folded key, while iteration yields the key as last written. Writing an
     * existing key under a different casing replaces both the value and the stored casing.
     *
     * @warning Equality is not transitive across store kinds. With `i` unordered and `oi`, `roi`
     * ordered over the same items in opposite insertion order, `roi == i` and `i == oi` hold while
     * `oi != roi`. See `equals`.
     *
     * @tparam K Key type. Text keys are lowercased by the default fold, other keys compare unchanged.
     * @tparam V Mapped type.
     * @tparam Store Store kind selecting the backing map (`unordered_store` or `ordered_store`).
     * @tparam Fold Stateless key normalization.
     */
    template <typename K, typename V, typename Store = unordered_store, typename Fold = case_fold<K>>
    class basic_ci_map
    {
        template <typename, typename, typename, typename>
        friend class basic_ci_map;

    public:
        using key_type = K;
        using mapped_type = V;
        using value_type = pair<K, V>;
        using reference = const value_type &;
        using const_reference = const value_type &;
        using store_kind = Store;
        using fold_type = Fold;
        using store_type = store_t<Store, K, value_type>;
        using size_type = typename store_type::size_type;
        using difference_type = std::ptrdiff_t;
        using is_case_insensitive = std::true_type;

        using const_iterator =
            internal::projected_iterator<typename store_type::const_iterator, internal::item_projection>;
        using iterator = const_iterator;
        using key_iterator = internal::projected_iterator<typename store_type::const_iterator, internal::key_projection>;
        using value_iterator =
            internal::projected_iterator<typename store_type::const_iterator, internal::value_projection>;

        static constexpr bool preserves_order = mapping_traits<store_type>::preserves_order;

        basic_ci_map() = default;

        basic_ci_map(std::initializer_list<value_type> ilist) { update(ilist); }

        template <class InputIt, typename = std::enable_if_t<!std::is_integral_v<InputIt>>>
        basic_ci_map(InputIt first, InputIt last)
        {
            update(first, last);
        }

        /// Builds from any mapping or range of pairs, including a case-insensitive map of another configuration.
        template <class Source, typename = std::enable_if_t<!std::is_same_v<std::decay_t<Source>, basic_ci_map> &&
                                                            is_pair_range_v<Source>>>
        explicit basic_ci_map(const Source &source)
        {
            update(source);
        }

        /// Inserts or replaces the entry for `key`. The stored casing becomes that of `key`.
        void set(K key, V value)
        {
            K normalized = Fold{}(key);
            _store.insert_or_assign(std::move(normalized), value_type{std::move(key), std::move(value)});
        }

        /// Value for `key`, inserting a default-constructed one under this casing when absent.
        V &operator[](K key) { return setdefault(std::move(key), V{}); }

        V &get(const K &key)
        {
            auto it = _store.find(Fold{}(key));
            if (it == _store.end()) throw key_not_found(internal::describe_key(key));
            return it->second.second;
        }

        const V &get(const K &key) const
        {
            auto it = _store.find(Fold{}(key));
            if (it == _store.end()) throw key_not_found(internal::describe_key(key));
            return it->second.second;
        }

        V &at(const K &key) { return get(key); }
        const V &at(const K &key) const { return get(key); }

        V get_or(const K &key, const V &default_value) const
        {
            auto it = _store.find(Fold{}(key));
            return it == _store.end() ? default_value : it->second.second;
        }

        const_iterator find(const K &key) const { return const_iterator(_store.find(Fold{}(key))); }

        bool contains(const K &key) const { return _store.find(Fold{}(key)) != _store.end(); }

        size_type count(const K &key) const { return contains(key) ? 1 : 0; }

        /// Removes the entry for `key`.
        /// @throws key_not_found when no entry matches.
        void erase(const K &key)
        {
            if (_store.erase(Fold{}(key)) == 0) throw key_not_found(internal::describe_key(key));
        }

        /// Removes the entry for `key` if present.
        bool discard(const K &key) { return _store.erase(Fold{}(key)) != 0; }

        size_type size() const noexcept { return static_cast<size_type>(_store.size()); }
        bool empty() const noexcept { return _store.empty(); }
        explicit operator bool() const noexcept { return !_store.empty(); }

        const_iterator begin() const { return const_iterator(_store.begin()); }
        const_iterator end() const { return const_iterator(_store.end()); }
        const_iterator cbegin() const { return begin(); }
        const_iterator cend() const { return end(); }

        internal::view<key_iterator> keys() const
        {
            return {key_iterator(_store.begin()), key_iterator(_store.end()), _store.size()};
        }

        internal::view<value_iterator> values() const
        {
            return {value_iterator(_store.begin()), value_iterator(_store.end()), _store.size()};
        }

        internal::view<const_iterator> items() const { return {begin(), end(), _store.size()}; }

        void clear() noexcept { _store.clear(); }

        /// Copy sharing any pointer payloads with this map.
        basic_ci_map copy() const { return *this; }

        /// Copy with every value cloned through `deep_clone`.
        basic_ci_map deep_copy() const
        {
            basic_ci_map out;
            for (const auto &entry : _store)
                out._store.try_emplace(entry.first, value_type{entry.second.first, deep_clone(entry.second.second)});
            return out;
        }

        /// Removes the entry for `key` and returns its value.
        /// @throws key_not_found when no entry matches.
        V pop(const K &key)
        {
            auto it = _store.find(Fold{}(key));
            if (it == _store.end()) throw key_not_found(internal::describe_key(key));
            V value = std::move(it->second.second);
            _store.erase(it);
            return value;
        }

        V pop(const K &key, V default_value)
        {
            auto it = _store.find(Fold{}(key));
            if (it == _store.end()) return default_value;
            V value = std::move(it->second.second);
            _store.erase(it);
            return value;
        }

        /// Removes and returns the first item in iteration order.
        /// @throws key_not_found when the map is empty.
        value_type popitem()
        {
            if (_store.empty()) throw key_not_found("");
            auto it = _store.begin();
            value_type item = std::move(it->second);
            _store.erase(it);
            return item;
        }

        /// Value for `key`, inserting `default_value` under this casing when absent.
        V &setdefault(K key, V default_value)
        {
            K normalized = Fold{}(key);
            auto it = _store.find(normalized);
            if (it != _store.end()) return it->second.second;
            return _store.try_emplace(std::move(normalized), value_type{std::move(key), std::move(default_value)})
                .first->second.second;
        }

        void update(std::initializer_list<value_type> ilist) { update(ilist.begin(), ilist.end()); }

        /// Calls `set` for each pair in order. Earlier pairs stay applied if a later one throws.
        template <class InputIt>
        void update(InputIt first, InputIt last)
        {
            for (; first != last; ++first)
            {
                const auto &kv = *first;
                set(kv.first, kv.second);
            }
        }

        template <class Source>
        std::enable_if_t<is_pair_range_v<Source>> update(const Source &source)
        {
            if constexpr (std::is_same_v<Source, basic_ci_map>)
                if (&source == this) return;
            update(std::begin(source), std::end(source));
        }

        std::vector<value_type> to_pairs() const { return std::vector<value_type>(begin(), end()); }

        /// (normalized key, value) pairs in iteration order.
        std::vector<value_type> lower_items() const
        {
            std::vector<value_type> out;
            out.reserve(_store.size());
            for (const auto &entry : _store) out.push_back({entry.first, entry.second.second});
            return out;
        }

        /// Mapping from normalized key to value over the same store kind.
        store_t<Store, K, V> lower_dict() const
        {
            store_t<Store, K, V> out;
            for (const auto &entry : _store) out.try_emplace(entry.first, entry.second.second);
            return out;
        }

        /// Plain mapping `M` holding the original keys.
        template <typename M>
        M to_store() const
        {
            static_assert(is_mapping_v<M>, "target must be a mapping");
            M out;
            for (const auto &entry : _store) out.emplace(entry.second.first, entry.second.second);
            return out;
        }

        template <typename F>
        void for_each_item(F &&f) const
        {
            for (const auto &entry : _store) f(entry.second.first, entry.second.second);
        }

        /// Registered description of this configuration.
        static const variant &variant_info() { return registry::instance().build<Store>(); }

        /**
         * @brief Compares normalized projections.
         *
         * Order counts only when both stores preserve insertion order; otherwise the comparison is
         * by key set and values. A plain mapping is first wrapped in a map of its own order kind.
         *
         * The relation is symmetric and reflexive but not transitive: an unordered map equals two
         * ordered maps holding the same items in different orders, which are not equal to each other.
         */
        template <typename OtherStore>
        bool equals(const basic_ci_map<K, V, OtherStore, Fold> &other) const
        {
            if (_store.size() != other._store.size()) return false;
            if constexpr (preserves_order && basic_ci_map<K, V, OtherStore, Fold>::preserves_order)
            {
                auto it = other._store.begin();
                for (const auto &entry : _store)
                {
                    if (!(entry.first == it->first) || !(entry.second.second == it->second.second)) return false;
                    ++it;
                }
                return true;
            }
            else
            {
                for (const auto &entry : _store)
                {
                    auto it = other._store.find(entry.first);
                    if (it == other._store.end() || !(it->second.second == entry.second.second)) return false;
                }
                return true;
            }
        }

        template <typename M, std::enable_if_t<is_mapping_v<M> && !is_ci_mapping_v<M>, int> = 0>
        bool equals(const M &other) const
        {
            return equals(basic_ci_map<K, V, store_kind_for<M>, Fold>(other));
        }

        void swap(basic_ci_map &other) noexcept { _store.swap(other._store); }

    private:
        store_type _store;
    };

    template <typename K, typename V>
    using ci_map = basic_ci_map<K, V, unordered_store>;

    template <typename K, typename V>
    using ordered_ci_map = basic_ci_map<K, V, ordered_store>;

    template <typename K, typename V, typename S, typename F>
    inline void swap(basic_ci_map<K, V, S, F> &a, basic_ci_map<K, V, S, F> &b) noexcept
    {
        a.swap(b);
    }

    /// Case-insensitive copy of a plain mapping, ordered exactly when the source is.
    template <typename M, typename = std::enable_if_t<is_mapping_v<M> && !is_ci_mapping_v<M>>>
    basic_ci_map<typename M::key_type, typename M::mapped_type, store_kind_for<M>> make_ci_map(const M &source)
    {
        return basic_ci_map<typename M::key_type, typename M::mapped_type, store_kind_for<M>>(source);
    }

    template <typename K, typename V, typename SA, typename SB, typename F>
    inline bool operator==(const basic_ci_map<K, V, SA, F> &a, const basic_ci_map<K, V, SB, F> &b)
    {
        return a.equals(b);
    }

    template <typename K, typename V, typename SA, typename SB, typename F>
    inline bool operator!=(const basic_ci_map<K, V, SA, F> &a, const basic_ci_map<K, V, SB, F> &b)
    {
        return !a.equals(b);
    }

    template <typename K, typename V, typename S, typename F, typename M,
              std::enable_if_t<is_mapping_v<M> && !is_ci_mapping_v<M>, int> = 0>
    inline bool operator==(const basic_ci_map<K, V, S, F> &a, const M &b)
    {
        return a.equals(b);
    }

    template <typename K, typename V, typename S, typename F, typename M,
              std::enable_if_t<is_mapping_v<M> && !is_ci_mapping_v<M>, int> = 0>
    inline bool operator==(const M &a, const basic_ci_map<K, V, S, F> &b)
    {
        return b.equals(a);
    }

    template <typename K, typename V, typename S, typename F, typename M,
              std::enable_if_t<is_mapping_v<M> && !is_ci_mapping_v<M>, int> = 0>
    inline bool operator!=(const basic_ci_map<K, V, S, F> &a, const M &b)
    {
        return !a.equals(b);
    }

    template <typename K, typename V, typename S, typename F, typename M,
              std::enable_if_t<is_mapping_v<M> && !is_ci_mapping_v<M>, int> = 0>
    inline bool operator!=(const M &a, const basic_ci_map<K, V, S, F> &b)
    {
        return !b.equals(a);
    }
} // namespace cimap
