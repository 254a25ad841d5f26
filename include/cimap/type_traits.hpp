#pragma once

#include <iterator>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

namespace cimap
{
    template <typename... Args>
    inline constexpr bool has_args()
    {
        return sizeof...(Args) > 0;
    }

    template <typename T>
    using is_char = std::integral_constant<bool, std::is_same_v<T, char> || std::is_same_v<T, wchar_t> ||
                                                     std::is_same_v<T, char8_t> || std::is_same_v<T, char16_t> ||
                                                     std::is_same_v<T, char32_t>>;

    /// Owning text types that take part in case folding.
    template <typename T>
    struct is_text : std::false_type
    {
    };

    template <typename C, typename Tr, typename A>
    struct is_text<std::basic_string<C, Tr, A>> : is_char<C>
    {
    };

    template <typename T>
    constexpr bool is_text_v = is_text<T>::value;

    template <typename T, typename = void>
    struct is_pair_like : std::false_type
    {
    };

    template <typename T>
    struct is_pair_like<T, std::void_t<decltype(std::declval<const T &>().first),
                                       decltype(std::declval<const T &>().second)>> : std::true_type
    {
    };

    template <typename T, typename = void>
    struct is_range : std::false_type
    {
    };

    template <typename T>
    struct is_range<T, std::void_t<decltype(std::begin(std::declval<const T &>())),
                                   decltype(std::end(std::declval<const T &>()))>> : std::true_type
    {
    };

    /// Range whose elements expose `first`/`second`.
    template <typename T, typename = void>
    struct is_pair_range : std::false_type
    {
    };

    template <typename T>
    struct is_pair_range<T, std::enable_if_t<is_range<T>::value>>
        : is_pair_like<std::decay_t<decltype(*std::begin(std::declval<const T &>()))>>
    {
    };

    template <typename T>
    constexpr bool is_pair_range_v = is_pair_range<T>::value;

    template <typename T>
    struct is_shared_ptr : std::false_type
    {
    };

    template <typename T>
    struct is_shared_ptr<std::shared_ptr<T>> : std::true_type
    {
    };

    template <typename T, typename = void>
    struct has_deep_copy : std::false_type
    {
    };

    template <typename T>
    struct has_deep_copy<T, std::void_t<decltype(std::declval<const T &>().deep_copy())>>
        : std::is_convertible<decltype(std::declval<const T &>().deep_copy()), T>
    {
    };
} // namespace cimap
