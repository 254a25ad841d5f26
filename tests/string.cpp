#include <cassert>
#include <cimap/string/literal.hpp>
#include <cimap/string/refstring.hpp>
#include <cimap/string/utils.hpp>
#include <sstream>
#include <string>

void test_refstring()
{
    using namespace cimap;

    refstring str1("hello");
    assert(std::string(str1.c_str()) == "hello");
    assert(str1.size() == 5);

    // Copy
    refstring str2 = str1;
    assert(str2.c_str() == str1.c_str());

    // Assign
    refstring str3;
    assert(std::string(str3.c_str()).empty());
    str3 = str2;
    assert(str3.c_str() == str1.c_str());

    str3 = "world";
    assert(std::string(str3.c_str()) == "world");
    assert(str3.c_str() != str1.c_str());

    refstring sized("abcdef", 3);
    assert(std::string(sized.c_str()) == "abc");
}

void test_format()
{
    assert(cimap::format("%s=%d", "answer", 42) == "answer=42");
    assert(cimap::format("%s", "").empty());
    std::string long_text(1000, 'x');
    assert(cimap::format("[%s]", long_text.c_str()).size() == 1002);
}

void test_case_helpers()
{
    assert(cimap::to_lower(std::string("HeLLo 123")) == "hello 123");
    assert(cimap::to_lower(std::u32string(U"ÀÉ×")) == U"àé×");
    static_assert(cimap::to_lower_ascii('Q') == 'q');
    static_assert(cimap::to_lower_latin1(wchar_t(0xC9)) == wchar_t(0xE9));
    static_assert(cimap::to_lower_latin1(wchar_t(0xD7)) == wchar_t(0xD7));
}

void test_quote()
{
    const std::string raw = "tab\there \"quoted\" back\\slash\x01";
    std::string quoted = cimap::quote(raw);
    assert(quoted == "\"tab\\there \\\"quoted\\\" back\\\\slash\\x01\"");

    std::string out;
    const char *p = quoted.c_str();
    assert(cimap::unquote(p, quoted.c_str() + quoted.size(), out));
    assert(out == raw);
    assert(p == quoted.c_str() + quoted.size());

    const std::string bad = "\"\\q\"";
    p = bad.c_str();
    assert(!cimap::unquote(p, bad.c_str() + bad.size(), out));
}

void test_literal()
{
    std::ostringstream os;
    cimap::write_literal(os, std::pair<int, std::string>{7, "seven"});
    assert(os.str() == "(7, \"seven\")");

    std::string text = os.str();
    const char *p = text.c_str();
    std::pair<int, std::string> parsed;
    assert(cimap::read_literal(p, text.c_str() + text.size(), parsed));
    assert(parsed.first == 7 && parsed.second == "seven");

    std::ostringstream small;
    cimap::write_literal(small, static_cast<signed char>(-3));
    assert(small.str() == "-3");

    static_assert(cimap::is_literal_v<double>);
    static_assert(!cimap::is_literal_v<std::wstring>);
}

void test_string()
{
    test_refstring();
    test_format();
    test_case_helpers();
    test_quote();
    test_literal();
}
