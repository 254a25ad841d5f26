#include <cassert>
#include <cimap/ci_map.hpp>
#include <cimap/registry.hpp>
#include <cstring>
#include <string>
#include <unordered_map>
#include <vector>

struct std_unordered_store
{
    template <typename K, typename V>
    using type = std::unordered_map<K, V, cimap::hash<K>>;
};

struct vector_store
{
    template <typename K, typename V>
    using type = std::vector<std::pair<K, V>>;
};

struct no_alias_store
{
};

void test_registry_memoized()
{
    auto &reg = cimap::registry::instance();
    const cimap::variant &a = reg.build<cimap::unordered_store>();
    const cimap::variant &b = reg.build<cimap::unordered_store>();
    assert(&a == &b);
    assert(a.name() == "ci_map");
    assert(!a.preserves_order());
    assert(a.store_type() == std::type_index(typeid(cimap::unordered_store)));

    const cimap::variant &o = reg.build<cimap::ordered_store>();
    assert(&o == &reg.build<cimap::ordered_store>());
    assert(&o != &a);
    assert(o.name() == "ordered_ci_map");
    assert(o.preserves_order());

    assert((&cimap::ci_map<std::string, int>::variant_info() == &a));
    assert((&cimap::ordered_ci_map<std::string, int>::variant_info() == &o));
    assert((&cimap::ordered_ci_map<int, double>::variant_info() == &o));
    assert(reg.find(std::type_index(typeid(cimap::ordered_store))) == &o);
}

void test_registry_custom_store()
{
    auto &reg = cimap::registry::instance();
    const size_t before = reg.size();
    const cimap::variant &v = reg.build<std_unordered_store>("std_ci_map");
    assert(v.name() == "std_ci_map");
    assert(!v.preserves_order());
    assert(reg.size() == before + 1);

    // The name only applies on first registration
    assert(&reg.build<std_unordered_store>("other") == &v);
    assert(reg.size() == before + 1);

    using std_map_t = cimap::basic_ci_map<std::string, int, std_unordered_store>;
    std_map_t m{{"Hello", 1}};
    assert(m.get("HELLO") == 1);
    assert(&std_map_t::variant_info() == &v);
    assert((m == cimap::ci_map<std::string, int>{{"hello", 1}}));
}

template <typename Kind>
void expect_invalid_store()
{
    auto &reg = cimap::registry::instance();
    const size_t before = reg.size();
    bool thrown = false;
    try
    {
        (void)reg.build<Kind>();
    }
    catch (const cimap::invalid_backing_store &e)
    {
        thrown = true;
        assert(std::strstr(e.what(), "not a mutable mapping") != nullptr);
    }
    assert(thrown);
    assert(reg.size() == before);
}

void test_registry_invalid_store()
{
    static_assert(!cimap::is_store_kind_v<vector_store>);
    static_assert(!cimap::is_store_kind_v<no_alias_store>);
    static_assert(cimap::is_store_kind_v<std_unordered_store>);
    expect_invalid_store<vector_store>();
    expect_invalid_store<no_alias_store>();
    expect_invalid_store<int>();
}

void test_registry()
{
    test_registry_memoized();
    test_registry_custom_store();
    test_registry_invalid_store();
}
