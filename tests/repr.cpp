#include <cassert>
#include <cimap/repr.hpp>
#include <sstream>
#include <string>

void test_repr_format()
{
    cimap::ordered_ci_map<std::string, int> o{{"Hello", 1}, {"world", 2}};
    assert(cimap::to_repr(o) == "ordered_ci_map({\"Hello\": 1, \"world\": 2})");

    std::ostringstream os;
    os << o;
    assert(os.str() == "{\"Hello\": 1, \"world\": 2}");

    cimap::ci_map<std::string, int> empty;
    assert(cimap::to_repr(empty) == "ci_map({})");

    cimap::ordered_ci_map<std::string, std::string> quoted{{"Say", "\"hi\"\n"}};
    assert(cimap::to_repr(quoted) == "ordered_ci_map({\"Say\": \"\\\"hi\\\"\\n\"})");
}

void test_repr_round_trip()
{
    using map_t = cimap::ci_map<std::string, double>;
    map_t m{{"Pi", 3.14159}, {"tenth", 0.1}, {"Neg", -2.5}};
    map_t parsed = cimap::from_repr<map_t>(cimap::to_repr(m));
    assert(parsed == m);
    assert(parsed.find("pi")->first == "Pi");
    assert(parsed.get("TENTH") == 0.1);

    using ordered_t = cimap::ordered_ci_map<int, bool>;
    ordered_t flags{{3, true}, {1, false}};
    assert(cimap::to_repr(flags) == "ordered_ci_map({3: true, 1: false})");
    ordered_t flags_parsed = cimap::from_repr<ordered_t>(cimap::to_repr(flags));
    assert(flags_parsed == flags);
    assert(flags_parsed.begin()->first == 3);

    using text_t = cimap::ordered_ci_map<std::string, std::string>;
    text_t text{{"Path", "C:\\tmp\t"}, {"Empty", ""}};
    assert(cimap::from_repr<text_t>(cimap::to_repr(text)) == text);
}

void test_repr_malformed()
{
    using map_t = cimap::ci_map<std::string, int>;
    const char *inputs[] = {"",
                            "ordered_ci_map({})",
                            "ci_map(",
                            "ci_map({\"a\" 1})",
                            "ci_map({\"a\": x})",
                            "ci_map({\"a\": 1,})",
                            "ci_map({\"a\": 1}",
                            "ci_map({\"a\": 1}) tail",
                            "ci_map({\"unterminated: 1})"};
    for (const char *input : inputs)
    {
        bool thrown = false;
        try
        {
            (void)cimap::from_repr<map_t>(input);
        }
        catch (const cimap::runtime_error &)
        {
            thrown = true;
        }
        assert(thrown);
    }

    map_t spaced = cimap::from_repr<map_t>("  ci_map( { \"A\" : 1 , \"b\":2 } )  ");
    assert(spaced.size() == 2 && spaced.get("a") == 1);
}

void test_repr()
{
    test_repr_format();
    test_repr_round_trip();
    test_repr_malformed();
}
