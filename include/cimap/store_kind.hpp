#pragma once

#include <string>
#include <type_traits>
#include "hash/hashmap.hpp"
#include "hash/ordered_hashmap.hpp"
#include "mapping_traits.hpp"

namespace cimap
{
    /// Backing store kinds. A kind names a map template through its member alias `type<K, V>`;
    /// a case-insensitive container is parameterized by the kind, never by a concrete map.
    struct unordered_store
    {
        template <typename K, typename V>
        using type = hashmap<K, V>;

        static constexpr const char *name = "ci_map";
    };

    struct ordered_store
    {
        template <typename K, typename V>
        using type = ordered_hashmap<K, V>;

        static constexpr const char *name = "ordered_ci_map";
    };

    template <typename Kind, typename K, typename V>
    using store_t = typename Kind::template type<K, V>;

    /// A kind qualifies when its store is a mutable mapping.
    template <typename Kind, typename = void>
    struct is_store_kind : std::false_type
    {
    };

    template <typename Kind>
    struct is_store_kind<Kind, std::void_t<store_t<Kind, std::string, int>>>
        : std::bool_constant<is_mapping_v<store_t<Kind, std::string, int>>>
    {
    };

    template <typename Kind>
    constexpr bool is_store_kind_v = is_store_kind<Kind>::value;

    template <typename Kind>
    struct store_kind_traits
    {
        static constexpr bool preserves_order = mapping_traits<store_t<Kind, std::string, int>>::preserves_order;
    };

    /// Kind whose order semantics match those of the mapping `M`.
    template <typename M>
    using store_kind_for = std::conditional_t<mapping_traits<M>::preserves_order, ordered_store, unordered_store>;
} // namespace cimap
