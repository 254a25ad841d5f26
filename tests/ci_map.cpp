#include "ci_map_common.hpp"

using map_t = cimap::ci_map<std::string, int>;

void test_ci_map_scenario_pop()
{
    map_t d{{"Key", 5}};
    assert(d.pop("KEY") == 5);
    assert(d.empty());

    bool thrown = false;
    try
    {
        (void)d.pop("key");
    }
    catch (const cimap::key_not_found &)
    {
        thrown = true;
    }
    assert(thrown);
}

void test_ci_map_store()
{
    static_assert(!map_t::preserves_order);
    static_assert(std::is_same_v<map_t::store_type, cimap::hashmap<std::string, cimap::pair<std::string, int>>>);

    map_t m;
    for (int i = 0; i < 1000; ++i) m.set("Key" + std::to_string(i), i);
    assert(m.size() == 1000);
    for (int i = 0; i < 1000; ++i) assert(m.get("KEY" + std::to_string(i)) == i);
    for (int i = 0; i < 1000; i += 2) m.erase("key" + std::to_string(i));
    assert(m.size() == 500);
    for (const auto &item : m) assert(item.second % 2 == 1 && item.first.compare(0, 3, "Key") == 0);
}

void test_ci_map_wide_keys()
{
    cimap::ci_map<std::wstring, int> m;
    m.set(L"ÄPFEL", 1);
    assert(m.contains(L"äpfel"));
    assert(m.find(L"Äpfel")->first == L"ÄPFEL");
    assert(m.get_or(L"birne", 0) == 0);
}

void test_ci_map()
{
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
    test_ci_map_scenario_pop();
    test_ci_map_store();
    test_ci_map_wide_keys();
}
