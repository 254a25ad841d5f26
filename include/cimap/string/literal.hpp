#pragma once

#include <charconv>
#include <cstdlib>
#include <ostream>
#include <string>
#include <system_error>
#include <type_traits>
#include "../pair.hpp"
#include "utils.hpp"

namespace cimap
{
    /// Types with a textual literal form: narrow strings, bool and arithmetic types.
    template <typename T>
    struct is_literal
        : std::bool_constant<std::is_same_v<T, std::string> || std::is_same_v<T, bool> || std::is_arithmetic_v<T>>
    {
    };

    template <typename F, typename S>
    struct is_literal<std::pair<F, S>> : std::bool_constant<is_literal<F>::value && is_literal<S>::value>
    {
    };

    template <typename F, typename S>
    struct is_literal<pair<F, S>> : std::bool_constant<is_literal<F>::value && is_literal<S>::value>
    {
    };

    template <typename T>
    constexpr bool is_literal_v = is_literal<T>::value;

    namespace internal
    {
        inline void skip_spaces(const char *&str, const char *end) noexcept
        {
            while (str < end && (*str == ' ' || *str == '\t' || *str == '\n' || *str == '\r')) ++str;
        }

        inline bool consume(const char *&str, const char *end, char c) noexcept
        {
            skip_spaces(str, end);
            if (str == end || *str != c) return false;
            ++str;
            return true;
        }
    } // namespace internal

    /**
     * @brief Writes the literal form of a value.
     *
     * Strings are double-quoted with escapes, bools are `true`/`false`, floating values use the
     * shortest form that reads back exactly, pairs are `(first, second)`.
     */
    template <typename T>
    void write_literal(std::ostream &os, const T &value)
    {
        static_assert(is_literal_v<T>, "type has no literal form");
        if constexpr (std::is_same_v<T, std::string>)
            os << quote(value);
        else if constexpr (std::is_same_v<T, bool>)
            os << (value ? "true" : "false");
        else if constexpr (std::is_floating_point_v<T>)
        {
            char buf[64];
            auto res = std::to_chars(buf, buf + sizeof(buf), value);
            os.write(buf, res.ptr - buf);
        }
        else if constexpr (std::is_arithmetic_v<T>)
        {
            if constexpr (sizeof(T) == 1)
                os << static_cast<int>(value);
            else
                os << value;
        }
        else
        {
            os << '(';
            write_literal(os, value.first);
            os << ", ";
            write_literal(os, value.second);
            os << ')';
        }
    }

    /// Parses a literal written by `write_literal`, advancing `str`. Returns false on malformed input.
    template <typename T>
    bool read_literal(const char *&str, const char *end, T &out)
    {
        static_assert(is_literal_v<T>, "type has no literal form");
        internal::skip_spaces(str, end);
        if (str == end) return false;
        if constexpr (std::is_same_v<T, std::string>)
            return unquote(str, end, out);
        else if constexpr (std::is_same_v<T, bool>)
        {
            std::string_view rest(str, end - str);
            if (rest.substr(0, 4) == "true")
            {
                out = true;
                str += 4;
                return true;
            }
            if (rest.substr(0, 5) == "false")
            {
                out = false;
                str += 5;
                return true;
            }
            return false;
        }
        else if constexpr (std::is_floating_point_v<T>)
        {
            auto res = std::from_chars(str, end, out);
            if (res.ec != std::errc()) return false;
            str = res.ptr;
            return true;
        }
        else if constexpr (std::is_arithmetic_v<T>)
        {
            if constexpr (sizeof(T) == 1)
            {
                int wide = 0;
                auto res = std::from_chars(str, end, wide);
                if (res.ec != std::errc()) return false;
                out = static_cast<T>(wide);
                str = res.ptr;
            }
            else
            {
                auto res = std::from_chars(str, end, out);
                if (res.ec != std::errc()) return false;
                str = res.ptr;
            }
            return true;
        }
        else
        {
            return internal::consume(str, end, '(') && read_literal(str, end, out.first) &&
                   internal::consume(str, end, ',') && read_literal(str, end, out.second) &&
                   internal::consume(str, end, ')');
        }
    }
} // namespace cimap
