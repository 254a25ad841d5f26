#include "ci_map_common.hpp"

using map_t = cimap::ordered_ci_map<std::string, int>;

void test_ordered_ci_map_order()
{
    map_t d;
    d["Hello"] = 1;
    d["world"] = 2;
    assert((keys_of(d) == std::vector<std::string>{"Hello", "world"}));

    // Re-setting keeps the position and takes the new casing
    d.set("HELLO", 3);
    assert((keys_of(d) == std::vector<std::string>{"HELLO", "world"}));

    d.set("Third", 4);
    d.erase("hello");
    d.set("hello", 5);
    assert((keys_of(d) == std::vector<std::string>{"world", "Third", "hello"}));

    std::vector<int> values(d.values().begin(), d.values().end());
    assert((values == std::vector<int>{2, 4, 5}));
}

void test_ordered_ci_map_popitem_order()
{
    map_t d{{"First", 1}, {"Second", 2}, {"Third", 3}};
    auto item = d.popitem();
    assert(item.first == "First" && item.second == 1);
    item = d.popitem();
    assert(item.first == "Second");
    assert((keys_of(d) == std::vector<std::string>{"Third"}));
}

void test_ordered_ci_map_export_order()
{
    map_t d{{"b", 1}, {"A", 2}, {"c", 3}};
    auto pairs = d.to_pairs();
    assert(pairs.size() == 3);
    assert(pairs[0].first == "b" && pairs[1].first == "A" && pairs[2].first == "c");

    auto lower = d.lower_items();
    assert(lower[1].first == "a" && lower[1].second == 2);

    auto dict = d.lower_dict();
    static_assert(cimap::mapping_traits<decltype(dict)>::preserves_order);
    assert(dict.begin()->first == "b");

    map_t copy = d.deep_copy();
    assert((keys_of(copy) == keys_of(d)));
}

void test_ordered_ci_map_many()
{
    map_t m;
    for (int i = 0; i < 500; ++i) m.set("K" + std::to_string(i), i);
    for (int i = 0; i < 500; ++i)
        if (i % 5) m.discard("k" + std::to_string(i));
    int expected = 0;
    for (const auto &item : m)
    {
        assert(item.second == expected);
        assert(item.first == "K" + std::to_string(expected));
        expected += 5;
    }
    assert(expected == 500);
}

void test_ordered_ci_map()
{
    static_assert(map_t::preserves_order);
    test_ci_capability<map_t>();
    test_ci_lookup<map_t>();
    test_ci_case_preservation<map_t>();
    test_ci_delete_contains<map_t>();
    test_ci_pop<map_t>();
    test_ci_setdefault<map_t>();
    test_ci_popitem<map_t>();
    test_ci_update<map_t>();
    test_ci_round_trip<map_t>();
    test_ci_copy<map_t>();
    test_ci_scenario_basic<map_t>();
    test_ci_non_string_keys<map_t>();
    test_ordered_ci_map_order();
    test_ordered_ci_map_popitem_order();
    test_ordered_ci_map_export_order();
    test_ordered_ci_map_many();
}
