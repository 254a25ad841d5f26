#include <cimap/hash/ordered_hashmap.hpp>
#include <vector>
#include "hashmap_common.hpp"

using ordered_t = cimap::ordered_hashmap<int, int>;

static std::vector<int> keys_of(const ordered_t &m)
{
    std::vector<int> out;
    for (const auto &kv : m) out.push_back(kv.first);
    return out;
}

void test_ordered_insertion_order()
{
    ordered_t m;
    m[3] = 30;
    m[1] = 10;
    m[2] = 20;
    assert((keys_of(m) == std::vector<int>{3, 1, 2}));

    m[1] = 11;
    m.insert_or_assign(3, 31);
    assert((keys_of(m) == std::vector<int>{3, 1, 2}));
    assert(m.at(1) == 11 && m.at(3) == 31);
    assert(m.back().first == 2);

    assert(m.erase(3) == 1);
    m[3] = 32;
    assert((keys_of(m) == std::vector<int>{1, 2, 3}));
    assert(m.back().first == 3);
}

void test_ordered_compaction()
{
    ordered_t m;
    for (int i = 0; i < 100; ++i) m[i] = i;
    for (int i = 0; i < 100; ++i)
        if (i % 3 != 0) m.erase(i);
    assert(m.size() == 34);

    int expected = 0;
    for (const auto &kv : m)
    {
        assert(kv.first == expected && kv.second == expected);
        assert(m.at(kv.first) == expected);
        expected += 3;
    }
    assert(expected == 102);

    m.erase(99);
    assert(m.back().first == 96);
}

void test_ordered_erase_iterator()
{
    ordered_t m;
    for (int i = 0; i < 20; ++i) m[i] = i;
    std::vector<int> kept;
    for (auto it = m.begin(); it != m.end();)
    {
        if (it->first % 2 == 0)
            it = m.erase(it);
        else
        {
            kept.push_back(it->first);
            ++it;
        }
    }
    assert(kept.size() == 10);
    assert((keys_of(m) == kept));

    while (!m.empty()) m.erase(m.begin());
    assert(m.begin() == m.end());
}

void test_ordered_equality()
{
    ordered_t a, b;
    a[1] = 1;
    a[2] = 2;
    b[2] = 2;
    b[1] = 1;
    assert(a != b);

    ordered_t c(a);
    assert(a == c);
}

void test_ordered_hashmap()
{
    test_hashmap_basic<ordered_t>();
    test_hashmap_many_inserts_and_reads<ordered_t>();
    test_hashmap_iteration<ordered_t>();
    test_hashmap_erase<ordered_t>();
    test_hashmap_missing_key<ordered_t>();
    test_hashmap_copy_move<ordered_t>();
    test_hashmap_string_keys<cimap::ordered_hashmap<std::string, int>>();
    test_ordered_insertion_order();
    test_ordered_compaction();
    test_ordered_erase_iterator();
    test_ordered_equality();
}
