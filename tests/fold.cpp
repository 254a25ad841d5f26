#include <cassert>
#include <cimap/fold.hpp>
#include <string>
#include <utility>

void test_fold_narrow()
{
    using cimap::fold;
    assert(fold(std::string("Hello World")) == "hello world");
    assert(fold(std::string("ABC-xyz_09")) == "abc-xyz_09");
    assert(fold(std::string()).empty());

    // Bytes outside ASCII pass through unchanged
    std::string utf8 = "\xC3\x84pfel";
    assert(fold(utf8) == "\xC3\x84pfel");

    std::string s = "MiXeD";
    assert(fold(fold(s)) == fold(s));
    assert(s == "MiXeD");
}

void test_fold_wide()
{
    using cimap::fold;
    assert(fold(std::wstring(L"HeLLo")) == L"hello");
    assert(fold(std::wstring(L"ÄPFEL")) == L"äpfel");
    assert(fold(std::wstring(L"×")) == L"×");
    assert(fold(std::u16string(u"STRASSE")) == u"strasse");
    assert(fold(std::u32string(U"Þ")) == U"þ");
}

void test_fold_identity()
{
    using cimap::fold;
    assert(fold(42) == 42);
    assert(fold(true));
    assert(fold(2.5) == 2.5);
    assert((fold(std::pair<int, int>{1, 2}) == std::pair<int, int>{1, 2}));
}

void test_fold()
{
    test_fold_narrow();
    test_fold_wide();
    test_fold_identity();
}
