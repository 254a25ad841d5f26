#include <benchmark/benchmark.h>
#include <cimap/ci_map.hpp>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

/// Baseline: a plain hash map over keys folded by the caller, storing the original key beside the value.
struct manual_fold_map
{
    std::unordered_map<std::string, std::pair<std::string, int>> map;

    void set(const std::string &key, int value) { map.insert_or_assign(cimap::fold(key), std::make_pair(key, value)); }

    int get(const std::string &key) const { return map.at(cimap::fold(key)).second; }

    bool contains(const std::string &key) const { return map.find(cimap::fold(key)) != map.end(); }

    bool discard(const std::string &key) { return map.erase(cimap::fold(key)) != 0; }

    template <typename F>
    void for_each_item(F &&f) const
    {
        for (const auto &kv : map) f(kv.second.first, kv.second.second);
    }
};

template <class MapT>
struct MapName;

template <>
struct MapName<cimap::ci_map<std::string, int>>
{
    static const char *value() { return "cimap::ci_map"; }
};

template <>
struct MapName<cimap::ordered_ci_map<std::string, int>>
{
    static const char *value() { return "cimap::ordered_ci_map"; }
};

template <>
struct MapName<manual_fold_map>
{
    static const char *value() { return "std::unordered_map + fold"; }
};

static std::vector<std::string> gen_keys(size_t N, size_t len = 16, uint64_t seed = 1234567)
{
    std::vector<std::string> out;
    out.reserve(N);
    std::mt19937_64 rng(seed);
    std::uniform_int_distribution<int> dist('a', 'z');
    std::bernoulli_distribution upper(0.5);
    std::string tmp(len, 'a');
    for (size_t i = 0; i < N; ++i)
    {
        for (size_t j = 0; j < len; ++j)
        {
            char c = char(dist(rng));
            tmp[j] = upper(rng) ? char(c - ('a' - 'A')) : c;
        }
        out.push_back(tmp);
    }
    return out;
}

/// Same keys with every letter case inverted, so each lookup has to fold.
static std::vector<std::string> invert_case(const std::vector<std::string> &keys)
{
    std::vector<std::string> out(keys);
    for (auto &key : out)
        for (auto &c : key)
        {
            if (c >= 'a' && c <= 'z')
                c = char(c - ('a' - 'A'));
            else if (c >= 'A' && c <= 'Z')
                c = char(c + ('a' - 'A'));
        }
    return out;
}

template <class MapT>
static void BM_insert(benchmark::State &state)
{
    const size_t N = size_t(state.range(0));
    const auto keys = gen_keys(N);
    state.SetLabel(std::string("insert ") + MapName<MapT>::value());
    for (auto _ : state)
    {
        MapT map;
        for (size_t i = 0; i < N; ++i) map.set(keys[i], int(i));
        benchmark::DoNotOptimize(map);
    }
    state.SetItemsProcessed(int64_t(state.iterations()) * int64_t(N));
}

template <class MapT>
static void BM_find_hit(benchmark::State &state)
{
    const size_t N = size_t(state.range(0));
    const auto keys = gen_keys(N);
    const auto lookups = invert_case(keys);
    MapT map;
    for (size_t i = 0; i < N; ++i) map.set(keys[i], int(i));
    state.SetLabel(std::string("find_hit ") + MapName<MapT>::value());
    for (auto _ : state)
    {
        long long sum = 0;
        for (const auto &key : lookups) sum += map.get(key);
        benchmark::DoNotOptimize(sum);
    }
    state.SetItemsProcessed(int64_t(state.iterations()) * int64_t(N));
}

template <class MapT>
static void BM_find_miss(benchmark::State &state)
{
    const size_t N = size_t(state.range(0));
    const auto keys = gen_keys(N);
    const auto misses = gen_keys(N, 17, 7654321);
    MapT map;
    for (size_t i = 0; i < N; ++i) map.set(keys[i], int(i));
    state.SetLabel(std::string("find_miss ") + MapName<MapT>::value());
    for (auto _ : state)
    {
        size_t found = 0;
        for (const auto &key : misses) found += map.contains(key);
        benchmark::DoNotOptimize(found);
    }
    state.SetItemsProcessed(int64_t(state.iterations()) * int64_t(N));
}

template <class MapT>
static void BM_erase_half(benchmark::State &state)
{
    const size_t N = size_t(state.range(0));
    const auto keys = gen_keys(N);
    state.SetLabel(std::string("erase_half ") + MapName<MapT>::value());
    for (auto _ : state)
    {
        state.PauseTiming();
        MapT map;
        for (size_t i = 0; i < N; ++i) map.set(keys[i], int(i));
        state.ResumeTiming();
        for (size_t i = 1; i < N; i += 2) map.discard(keys[i]);
        benchmark::DoNotOptimize(map);
    }
    state.SetItemsProcessed(int64_t(state.iterations()) * int64_t(N / 2));
}

template <class MapT>
static void BM_iterate(benchmark::State &state)
{
    const size_t N = size_t(state.range(0));
    const auto keys = gen_keys(N);
    MapT map;
    for (size_t i = 0; i < N; ++i) map.set(keys[i], int(i));
    state.SetLabel(std::string("iterate ") + MapName<MapT>::value());
    for (auto _ : state)
    {
        size_t bytes = 0;
        long long sum = 0;
        map.for_each_item([&](const std::string &key, int value) {
            bytes += key.size();
            sum += value;
        });
        benchmark::DoNotOptimize(bytes);
        benchmark::DoNotOptimize(sum);
    }
    state.SetItemsProcessed(int64_t(state.iterations()) * int64_t(N));
}

#define REG_ALL_FOR(MapT)                                          \
    BENCHMARK_TEMPLATE(BM_insert, MapT)->Arg(1000)->Arg(100'000);    \
    BENCHMARK_TEMPLATE(BM_find_hit, MapT)->Arg(1000)->Arg(100'000);  \
    BENCHMARK_TEMPLATE(BM_find_miss, MapT)->Arg(1000)->Arg(100'000); \
    BENCHMARK_TEMPLATE(BM_erase_half, MapT)->Arg(1000)->Arg(100'000); \
    BENCHMARK_TEMPLATE(BM_iterate, MapT)->Arg(1000)->Arg(100'000);

using CiMap = cimap::ci_map<std::string, int>;
using OrderedCiMap = cimap::ordered_ci_map<std::string, int>;

REG_ALL_FOR(CiMap)
REG_ALL_FOR(OrderedCiMap)
REG_ALL_FOR(manual_fold_map)

BENCHMARK_MAIN();
