#include <cimap/hash/hashmap.hpp>
#include "hashmap_common.hpp"

void test_hashmap_growth()
{
    cimap::hashmap<int, int> m;
    assert(m.bucket_count() == 0);
    for (int i = 0; i < 100; ++i) m[i] = i;
    assert(m.bucket_count() >= 128);
    assert(m.load_factor() <= m.max_load_factor());

    m.reserve(1000);
    assert(m.bucket_count() >= 1000);
    for (int i = 0; i < 100; ++i) assert(m.at(i) == i);
}

void test_hashmap_unordered_equality()
{
    cimap::hashmap<int, int> a, b;
    for (int i = 0; i < 50; ++i) a[i] = i;
    for (int i = 49; i >= 0; --i) b[i] = i;
    assert(a == b);
    b[0] = 1;
    assert(a != b);
}

void test_hashmap_pair_keys()
{
    cimap::hashmap<std::pair<int, int>, int> m;
    m[{1, 2}] = 3;
    m[{2, 1}] = 4;
    assert(m.size() == 2);
    assert(m.at({1, 2}) == 3);
    assert(m.at({2, 1}) == 4);
}

void test_hashmap()
{
    using container_t = cimap::hashmap<int, int>;
    test_hashmap_basic<container_t>();
    test_hashmap_many_inserts_and_reads<container_t>();
    test_hashmap_iteration<container_t>();
    test_hashmap_erase<container_t>();
    test_hashmap_missing_key<container_t>();
    test_hashmap_copy_move<container_t>();
    test_hashmap_string_keys<cimap::hashmap<std::string, int>>();
    test_hashmap_growth();
    test_hashmap_unordered_equality();
    test_hashmap_pair_keys();
}
