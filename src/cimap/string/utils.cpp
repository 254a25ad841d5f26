#include <cimap/string/utils.hpp>
#include <cstdio>
#include <vector>

namespace cimap
{
    std::string format(const char *format, ...) noexcept
    {
        va_list args;
        va_start(args, format);
        std::string result = format_va_list(format, args);
        va_end(args);
        return result;
    }

    std::string format_va_list(const char *format, va_list args) noexcept
    {
        va_list args_copy;
        va_copy(args_copy, args);
        int size = vsnprintf(nullptr, 0, format, args_copy) + 1;
        va_end(args_copy);
        if (size <= 1) return {};

        std::vector<char> buf(size);
        va_copy(args_copy, args);
        vsnprintf(buf.data(), size, format, args_copy);
        va_end(args_copy);
        return std::string(buf.data(), buf.data() + size - 1);
    }

    std::string quote(std::string_view s)
    {
        std::string out;
        out.reserve(s.size() + 2);
        out.push_back('"');
        for (char c : s)
        {
            switch (c)
            {
                case '"':
                    out += "\\\"";
                    break;
                case '\\':
                    out += "\\\\";
                    break;
                case '\n':
                    out += "\\n";
                    break;
                case '\t':
                    out += "\\t";
                    break;
                case '\r':
                    out += "\\r";
                    break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20)
                        out += format("\\x%02x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                    else
                        out.push_back(c);
                    break;
            }
        }
        out.push_back('"');
        return out;
    }

    static int hex_digit(char c) noexcept
    {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    bool unquote(const char *&str, const char *end, std::string &out)
    {
        const char *p = str;
        if (p == end || *p != '"') return false;
        ++p;
        out.clear();
        while (p != end && *p != '"')
        {
            if (*p != '\\')
            {
                out.push_back(*p++);
                continue;
            }
            if (++p == end) return false;
            switch (*p)
            {
                case '"':
                case '\\':
                    out.push_back(*p);
                    break;
                case 'n':
                    out.push_back('\n');
                    break;
                case 't':
                    out.push_back('\t');
                    break;
                case 'r':
                    out.push_back('\r');
                    break;
                case 'x':
                {
                    if (end - p < 3) return false;
                    int hi = hex_digit(p[1]), lo = hex_digit(p[2]);
                    if (hi < 0 || lo < 0) return false;
                    out.push_back(static_cast<char>(hi * 16 + lo));
                    p += 2;
                    break;
                }
                default:
                    return false;
            }
            ++p;
        }
        if (p == end) return false;
        str = p + 1;
        return true;
    }
} // namespace cimap
