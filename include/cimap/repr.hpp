#pragma once

#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include "ci_map.hpp"
#include "exception/exception.hpp"
#include "string/literal.hpp"
#include "string/utils.hpp"

namespace cimap
{
    namespace internal
    {
        template <typename T>
        void write_element(std::ostream &os, const T &value)
        {
            if constexpr (is_literal_v<T>)
                write_literal(os, value);
            else
                os << value;
        }

        template <typename Map>
        void write_body(std::ostream &os, const Map &map)
        {
            os << '{';
            bool first = true;
            for (const auto &item : map)
            {
                if (!first) os << ", ";
                first = false;
                write_element(os, item.first);
                os << ": ";
                write_element(os, item.second);
            }
            os << '}';
        }
    } // namespace internal

    /// Display form: `{"Hello": 1, "world": 2}` in iteration order.
    template <typename K, typename V, typename S, typename F>
    std::ostream &operator<<(std::ostream &os, const basic_ci_map<K, V, S, F> &map)
    {
        internal::write_body(os, map);
        return os;
    }

    /**
     * @brief Reconstructible form of a case-insensitive map.
     *
     * Example:
     *   to_repr(ci_map<std::string, int>{{"Hello", 1}}) -> `ci_map({"Hello": 1})`
     */
    template <typename K, typename V, typename S, typename F>
    std::string to_repr(const basic_ci_map<K, V, S, F> &map)
    {
        std::ostringstream os;
        os << basic_ci_map<K, V, S, F>::variant_info().name() << '(';
        internal::write_body(os, map);
        os << ')';
        return os.str();
    }

    /**
     * @brief Parses the output of `to_repr` back into a map of type `Map`.
     * @throws runtime_error when the text is malformed or names another configuration.
     */
    template <typename Map>
    Map from_repr(std::string_view text)
    {
        using key_type = typename Map::key_type;
        using mapped_type = typename Map::mapped_type;
        static_assert(is_literal_v<key_type> && is_literal_v<mapped_type>, "repr parsing needs literal types");

        const char *str = text.data();
        const char *end = str + text.size();
        const std::string &name = Map::variant_info().name();

        internal::skip_spaces(str, end);
        if (static_cast<size_t>(end - str) < name.size() || std::string_view(str, name.size()) != name)
            throw runtime_error(format("repr does not start with %s", name.c_str()));
        str += name.size();
        if (!internal::consume(str, end, '(') || !internal::consume(str, end, '{'))
            throw runtime_error("repr: expected '({'");

        Map out;
        if (!internal::consume(str, end, '}'))
        {
            while (true)
            {
                key_type key{};
                mapped_type value{};
                if (!read_literal(str, end, key)) throw runtime_error("repr: malformed key");
                if (!internal::consume(str, end, ':')) throw runtime_error("repr: expected ':'");
                if (!read_literal(str, end, value)) throw runtime_error("repr: malformed value");
                out.set(std::move(key), std::move(value));
                if (internal::consume(str, end, ',')) continue;
                if (internal::consume(str, end, '}')) break;
                throw runtime_error("repr: expected ',' or '}'");
            }
        }
        if (!internal::consume(str, end, ')')) throw runtime_error("repr: expected ')'");
        internal::skip_spaces(str, end);
        if (str != end) throw runtime_error("repr: trailing characters");
        return out;
    }
} // namespace cimap
