#pragma once

#include <type_traits>
#include "type_traits.hpp"

namespace cimap
{
    /// Mutable mapping capability: key/mapped types, lookup, removal, iteration, size and clear.
    /// Generic consumers (serializers, comparisons) test this instead of naming concrete types.
    template <typename T, typename = void>
    struct is_mapping : std::false_type
    {
    };

    template <typename T>
    struct is_mapping<
        T, std::void_t<typename T::key_type, typename T::mapped_type,
                       decltype(std::declval<T &>().find(std::declval<const typename T::key_type &>())),
                       decltype(std::declval<T &>().erase(std::declval<const typename T::key_type &>())),
                       decltype(std::declval<const T &>().begin()), decltype(std::declval<const T &>().end()),
                       decltype(std::declval<const T &>().size()), decltype(std::declval<T &>().clear())>>
        : std::true_type
    {
    };

    template <typename T>
    constexpr bool is_mapping_v = is_mapping<T>::value;

    /// Case-insensitive containers declare themselves with a member `is_case_insensitive` tag.
    template <typename T, typename = void>
    struct is_ci_mapping : std::false_type
    {
    };

    template <typename T>
    struct is_ci_mapping<T, std::void_t<typename T::is_case_insensitive>> : std::bool_constant<is_mapping_v<T>>
    {
    };

    template <typename T>
    constexpr bool is_ci_mapping_v = is_ci_mapping<T>::value;

    namespace internal
    {
        template <typename T, typename = void>
        struct declared_order : std::false_type
        {
        };

        template <typename T>
        struct declared_order<T, std::void_t<decltype(T::preserves_order)>> : std::bool_constant<T::preserves_order>
        {
        };
    } // namespace internal

    /// Per-mapping properties. Specialize to describe a foreign map type.
    template <typename T>
    struct mapping_traits
    {
        static constexpr bool preserves_order = internal::declared_order<T>::value;
    };
} // namespace cimap
