/// @file bench_deserialize.cpp
/// @brief Performance benchmarks for serdex.
///
/// Measured operations:
///   - Typed decoding with keys in declaration order (pure streaming)
///   - Typed decoding with keys reversed or shuffled (lookback arena)
///   - Arrays of numbers, strings and nested objects
///   - Serialization (compact, indented, to a stream)

#include <serdex/serdex.hpp>

#include <benchmark/benchmark.h>

#include <algorithm>
#include <cstdint>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <vector>

using namespace serdex;

// ═══════════════════════════════════════════════════════════════════════════════
// Mapped types
// ═══════════════════════════════════════════════════════════════════════════════

namespace bench {

struct User {
    uint32_t id;
    std::string name;
    std::string email;
    bool active;
    double score;
};
SERDEX_DEFINE_STRUCT(User, id, name, email, active, score)

struct Page {
    std::vector<User> users;
    uint32_t total;
    uint32_t page;
    std::string version;
};
SERDEX_DEFINE_STRUCT(Page, users, total, page, version)

struct Level {
    uint32_t level;
    std::optional<std::vector<Level>> child;
};
SERDEX_DEFINE_STRUCT(Level, level, child)

} // namespace bench

// ═══════════════════════════════════════════════════════════════════════════════
// Test data generators
// ═══════════════════════════════════════════════════════════════════════════════

/// One user object with its fields in @p order (indices into the field list).
static std::string user_json(int i, const std::vector<int>& order) {
    std::string fields[5] = {
        R"("id":)" + std::to_string(i),
        R"("name":"user_)" + std::to_string(i) + "\"",
        R"("email":"user)" + std::to_string(i) + "@test.com\"",
        std::string(R"("active":)") + (i % 2 == 0 ? "true" : "false"),
        R"("score":)" + std::to_string(50.0 + i * 2.5),
    };
    std::string s = "{";
    for (size_t k = 0; k < order.size(); ++k) {
        if (k > 0) s += ",";
        s += fields[order[k]];
    }
    s += "}";
    return s;
}

/// A page of @p count users. Keys are in declaration order, reversed, or
/// shuffled per user depending on @p mode (0, 1, 2).
static std::string generate_page(int count, int mode) {
    std::mt19937 rng(42);
    std::vector<int> order = {0, 1, 2, 3, 4};
    if (mode == 1) std::reverse(order.begin(), order.end());
    std::string s = mode == 0 ? R"({"users":[)" : R"({"version":"2.0","page":1,"users":[)";
    for (int i = 0; i < count; ++i) {
        if (i > 0) s += ",";
        if (mode == 2) std::shuffle(order.begin(), order.end(), rng);
        s += user_json(i, order);
    }
    s += "]";
    s += mode == 0 ? R"(,"total":)" + std::to_string(count) + R"(,"page":1,"version":"2.0"})"
                   : R"(,"total":)" + std::to_string(count) + "}";
    return s;
}

static std::string generate_int_array(int count) {
    std::string s = "[";
    for (int i = 0; i < count; ++i) {
        if (i > 0) s += ",";
        s += std::to_string(i * 7919);
    }
    s += "]";
    return s;
}

static std::string generate_float_array(int count) {
    std::mt19937 rng(7);
    std::uniform_real_distribution<double> dist(-1e6, 1e6);
    std::vector<double> v(static_cast<size_t>(count));
    for (auto& x : v) x = dist(rng);
    return json::to_str(v);
}

static std::string generate_nested(int depth) {
    std::string s;
    for (int i = 0; i < depth; ++i) {
        s += R"({"child":[)";
    }
    s += R"({"level":0,"child":null})";
    for (int i = depth; i > 0; --i) {
        s += R"(],"level":)" + std::to_string(i) + "}";
    }
    return s;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Typed decoding: key order
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_DecodeUsers(benchmark::State& state) {
    auto input = generate_page(static_cast<int>(state.range(0)), static_cast<int>(state.range(1)));
    for (auto _ : state) {
        auto page = json::from_str<bench::Page>(input);
        benchmark::DoNotOptimize(page);
    }
    state.SetBytesProcessed(state.iterations() *
                            static_cast<int64_t>(input.size()));
}
BENCHMARK(BM_DecodeUsers)
    ->ArgNames({"users", "order"})
    ->Args({20, 0})->Args({20, 1})->Args({20, 2})
    ->Args({1000, 0})->Args({1000, 1})->Args({1000, 2});

static void BM_DecodeUsersFromStream(benchmark::State& state) {
    auto input = generate_page(1000, static_cast<int>(state.range(0)));
    for (auto _ : state) {
        std::istringstream is(input);
        auto page = json::from_stream<bench::Page>(is);
        benchmark::DoNotOptimize(page);
    }
    state.SetBytesProcessed(state.iterations() *
                            static_cast<int64_t>(input.size()));
}
BENCHMARK(BM_DecodeUsersFromStream)->Arg(0)->Arg(2);

// ═══════════════════════════════════════════════════════════════════════════════
// Typed decoding: arrays and nesting
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_DecodeIntArray(benchmark::State& state) {
    auto input = generate_int_array(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        auto v = json::from_str<std::vector<int64_t>>(input);
        benchmark::DoNotOptimize(v);
    }
    state.SetBytesProcessed(state.iterations() *
                            static_cast<int64_t>(input.size()));
}
BENCHMARK(BM_DecodeIntArray)->Arg(100)->Arg(10000);

static void BM_DecodeFloatArray(benchmark::State& state) {
    auto input = generate_float_array(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        auto v = json::from_str<std::vector<double>>(input);
        benchmark::DoNotOptimize(v);
    }
    state.SetBytesProcessed(state.iterations() *
                            static_cast<int64_t>(input.size()));
}
BENCHMARK(BM_DecodeFloatArray)->Arg(1000);

static void BM_DecodeNested(benchmark::State& state) {
    // "level" follows "child" everywhere, so every level is buffered.
    auto input = generate_nested(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        auto v = json::from_str<bench::Level>(input);
        benchmark::DoNotOptimize(v);
    }
    state.SetBytesProcessed(state.iterations() *
                            static_cast<int64_t>(input.size()));
}
BENCHMARK(BM_DecodeNested)->Arg(10)->Arg(100);

// ═══════════════════════════════════════════════════════════════════════════════
// Serialization
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_SerializeUsersCompact(benchmark::State& state) {
    auto page = json::from_str<bench::Page>(generate_page(1000, 0));
    for (auto _ : state) {
        auto s = json::to_str(page);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_SerializeUsersCompact);

static void BM_SerializeUsersPretty(benchmark::State& state) {
    auto page = json::from_str<bench::Page>(generate_page(1000, 0));
    auto config = json::TextSerializerConfig::pretty();
    for (auto _ : state) {
        auto s = json::to_str(page, config);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_SerializeUsersPretty);

static void BM_SerializeUsersToStream(benchmark::State& state) {
    auto page = json::from_str<bench::Page>(generate_page(1000, 0));
    for (auto _ : state) {
        std::ostringstream os;
        json::to_stream(os, page);
        benchmark::DoNotOptimize(os);
    }
}
BENCHMARK(BM_SerializeUsersToStream);

static void BM_SerializeFloatArray(benchmark::State& state) {
    auto v = json::from_str<std::vector<double>>(generate_float_array(1000));
    for (auto _ : state) {
        auto s = json::to_str(v);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_SerializeFloatArray);
