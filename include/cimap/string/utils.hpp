#pragma once

#include <cstdarg>
#include <string>
#include <string_view>
#include "../api.hpp"

namespace cimap
{
    /**
     * @brief Formats a string using a format string and arguments.
     * @param format The format string.
     * @param args The arguments to format the string.
     * @return The formatted string.
     */
    CIMAP_API std::string format(const char *format, ...) noexcept __attribute__((format(printf, 1, 2)));

    CIMAP_API std::string format_va_list(const char *format, va_list args) noexcept;

    /// ASCII lowercase of a single code unit. Anything outside `A`-`Z` is returned unchanged.
    template <typename C>
    constexpr C to_lower_ascii(C c) noexcept
    {
        return (c >= C('A') && c <= C('Z')) ? C(c + ('a' - 'A')) : c;
    }

    /// Lowercase of a single wide code unit: ASCII plus the Latin-1 uppercase block
    /// (U+00C0..U+00DE without the multiplication sign U+00D7).
    template <typename C>
    constexpr C to_lower_latin1(C c) noexcept
    {
        if (c >= C(0xC0) && c <= C(0xDE) && c != C(0xD7)) return C(c + 0x20);
        return to_lower_ascii(c);
    }

    template <typename C, typename Tr, typename A>
    inline std::basic_string<C, Tr, A> to_lower(const std::basic_string<C, Tr, A> &s)
    {
        std::basic_string<C, Tr, A> out(s);
        for (auto &c : out)
        {
            if constexpr (sizeof(C) == 1)
                c = to_lower_ascii(c);
            else
                c = to_lower_latin1(c);
        }
        return out;
    }

    /// Double-quoted literal with `\\`, `\"`, `\n`, `\t`, `\r` and `\xNN` escapes.
    /// Example:
    ///   quote("say \"hi\"") -> "\"say \\\"hi\\\"\""
    CIMAP_API std::string quote(std::string_view s);

    /// Reverses `quote`. `str` points at the opening quote and is advanced past the closing one.
    /// Returns false on a malformed literal.
    CIMAP_API bool unquote(const char *&str, const char *end, std::string &out);
} // namespace cimap
