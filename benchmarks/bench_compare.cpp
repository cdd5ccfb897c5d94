/// @file bench_compare.cpp
/// @brief Head-to-head typed decoding: serdex vs Boost.JSON vs RapidJSON
///        vs nlohmann/json vs simdjson.
///
/// Every library turns identical text into the same std::vector<Record>.
/// The DOM libraries parse first and then copy fields out; serdex decodes
/// straight into the structs.
/// Scenarios:
///   1. Records with keys in declaration order
///   2. Records with keys reversed
///   3. Serialize records (compact)

#include <benchmark/benchmark.h>

// ─── serdex ──────────────────────────────────────────────────────────────────
#include <serdex/serdex.hpp>

// ─── Boost.JSON ──────────────────────────────────────────────────────────────
#include <boost/json.hpp>

// ─── RapidJSON ───────────────────────────────────────────────────────────────
#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

// ─── nlohmann/json ───────────────────────────────────────────────────────────
#include <nlohmann/json.hpp>

// ─── simdjson ────────────────────────────────────────────────────────────────
#include <simdjson.h>

#include <algorithm>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

// ═══════════════════════════════════════════════════════════════════════════════
// Shared test data (identical for all libraries)
// ═══════════════════════════════════════════════════════════════════════════════

namespace td {

struct Record {
    int64_t id;
    std::string name;
    bool active;
    double score;
    std::vector<std::string> tags;
};
SERDEX_DEFINE_STRUCT(Record, id, name, active, score, tags)

inline std::string records_json(int count, bool reversed) {
    std::string s = "[";
    for (int i = 0; i < count; ++i) {
        if (i) s += ",";
        std::vector<std::string> f = {
            R"("id":)" + std::to_string(i),
            R"("name":"Item )" + std::to_string(i) + R"( with some longer title text")",
            std::string(R"("active":)") + (i % 3 == 0 ? "false" : "true"),
            R"("score":)" + std::to_string(9.99 + i * 0.1),
            R"("tags":["tag)" + std::to_string(i % 10) + R"(","common"])",
        };
        if (reversed) std::reverse(f.begin(), f.end());
        s += "{";
        for (size_t k = 0; k < f.size(); ++k) {
            if (k) s += ",";
            s += f[k];
        }
        s += "}";
    }
    s += "]";
    return s;
}

constexpr int kCount = 1000;

} // namespace td

// ═══════════════════════════════════════════════════════════════════════════════
// Decoders
// ═══════════════════════════════════════════════════════════════════════════════

static std::vector<td::Record> decode_boost(const std::string& in) {
    auto doc = boost::json::parse(in);
    std::vector<td::Record> out;
    for (const auto& v : doc.as_array()) {
        const auto& o = v.as_object();
        td::Record r;
        r.id = o.at("id").as_int64();
        r.name = std::string(o.at("name").as_string());
        r.active = o.at("active").as_bool();
        r.score = o.at("score").as_double();
        for (const auto& t : o.at("tags").as_array()) r.tags.emplace_back(t.as_string());
        out.push_back(std::move(r));
    }
    return out;
}

static std::vector<td::Record> decode_rapid(const std::string& in) {
    rapidjson::Document doc;
    doc.Parse(in.c_str(), in.size());
    std::vector<td::Record> out;
    for (const auto& v : doc.GetArray()) {
        td::Record r;
        r.id = v["id"].GetInt64();
        r.name = v["name"].GetString();
        r.active = v["active"].GetBool();
        r.score = v["score"].GetDouble();
        for (const auto& t : v["tags"].GetArray()) r.tags.emplace_back(t.GetString());
        out.push_back(std::move(r));
    }
    return out;
}

static std::vector<td::Record> decode_nlohmann(const std::string& in) {
    auto doc = nlohmann::json::parse(in);
    std::vector<td::Record> out;
    for (const auto& v : doc) {
        td::Record r;
        r.id = v.at("id").get<int64_t>();
        r.name = v.at("name").get<std::string>();
        r.active = v.at("active").get<bool>();
        r.score = v.at("score").get<double>();
        r.tags = v.at("tags").get<std::vector<std::string>>();
        out.push_back(std::move(r));
    }
    return out;
}

static std::vector<td::Record> decode_simdjson(simdjson::dom::parser& parser,
                                               const simdjson::padded_string& in) {
    std::vector<td::Record> out;
    for (simdjson::dom::object o : parser.parse(in).get_array()) {
        td::Record r;
        r.id = int64_t(o["id"]);
        r.name = std::string(std::string_view(o["name"]));
        r.active = bool(o["active"]);
        r.score = double(o["score"]);
        for (std::string_view t : o["tags"].get_array()) r.tags.emplace_back(t);
        out.push_back(std::move(r));
    }
    return out;
}

// ═══════════════════════════════════════════════════════════════════════════════
// 1. DECODE, KEYS IN ORDER
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_Decode_InOrder_Serdex(benchmark::State& st) {
    auto in = td::records_json(td::kCount, false);
    for (auto _ : st) {
        auto v = serdex::json::from_str<std::vector<td::Record>>(in);
        benchmark::DoNotOptimize(v);
    }
    st.SetBytesProcessed(st.iterations() * int64_t(in.size()));
}
BENCHMARK(BM_Decode_InOrder_Serdex);

static void BM_Decode_InOrder_Boost(benchmark::State& st) {
    auto in = td::records_json(td::kCount, false);
    for (auto _ : st) { auto v = decode_boost(in); benchmark::DoNotOptimize(v); }
    st.SetBytesProcessed(st.iterations() * int64_t(in.size()));
}
BENCHMARK(BM_Decode_InOrder_Boost);

static void BM_Decode_InOrder_Rapid(benchmark::State& st) {
    auto in = td::records_json(td::kCount, false);
    for (auto _ : st) { auto v = decode_rapid(in); benchmark::DoNotOptimize(v); }
    st.SetBytesProcessed(st.iterations() * int64_t(in.size()));
}
BENCHMARK(BM_Decode_InOrder_Rapid);

static void BM_Decode_InOrder_Nlohmann(benchmark::State& st) {
    auto in = td::records_json(td::kCount, false);
    for (auto _ : st) { auto v = decode_nlohmann(in); benchmark::DoNotOptimize(v); }
    st.SetBytesProcessed(st.iterations() * int64_t(in.size()));
}
BENCHMARK(BM_Decode_InOrder_Nlohmann);

static void BM_Decode_InOrder_Simdjson(benchmark::State& st) {
    auto in = td::records_json(td::kCount, false);
    simdjson::dom::parser parser;
    simdjson::padded_string padded(in);
    for (auto _ : st) { auto v = decode_simdjson(parser, padded); benchmark::DoNotOptimize(v); }
    st.SetBytesProcessed(st.iterations() * int64_t(in.size()));
}
BENCHMARK(BM_Decode_InOrder_Simdjson);

// ═══════════════════════════════════════════════════════════════════════════════
// 2. DECODE, KEYS REVERSED
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_Decode_Reversed_Serdex(benchmark::State& st) {
    auto in = td::records_json(td::kCount, true);
    for (auto _ : st) {
        auto v = serdex::json::from_str<std::vector<td::Record>>(in);
        benchmark::DoNotOptimize(v);
    }
    st.SetBytesProcessed(st.iterations() * int64_t(in.size()));
}
BENCHMARK(BM_Decode_Reversed_Serdex);

static void BM_Decode_Reversed_Boost(benchmark::State& st) {
    auto in = td::records_json(td::kCount, true);
    for (auto _ : st) { auto v = decode_boost(in); benchmark::DoNotOptimize(v); }
    st.SetBytesProcessed(st.iterations() * int64_t(in.size()));
}
BENCHMARK(BM_Decode_Reversed_Boost);

static void BM_Decode_Reversed_Rapid(benchmark::State& st) {
    auto in = td::records_json(td::kCount, true);
    for (auto _ : st) { auto v = decode_rapid(in); benchmark::DoNotOptimize(v); }
    st.SetBytesProcessed(st.iterations() * int64_t(in.size()));
}
BENCHMARK(BM_Decode_Reversed_Rapid);

static void BM_Decode_Reversed_Nlohmann(benchmark::State& st) {
    auto in = td::records_json(td::kCount, true);
    for (auto _ : st) { auto v = decode_nlohmann(in); benchmark::DoNotOptimize(v); }
    st.SetBytesProcessed(st.iterations() * int64_t(in.size()));
}
BENCHMARK(BM_Decode_Reversed_Nlohmann);

static void BM_Decode_Reversed_Simdjson(benchmark::State& st) {
    auto in = td::records_json(td::kCount, true);
    simdjson::dom::parser parser;
    simdjson::padded_string padded(in);
    for (auto _ : st) { auto v = decode_simdjson(parser, padded); benchmark::DoNotOptimize(v); }
    st.SetBytesProcessed(st.iterations() * int64_t(in.size()));
}
BENCHMARK(BM_Decode_Reversed_Simdjson);

// ═══════════════════════════════════════════════════════════════════════════════
// 3. SERIALIZE COMPACT
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_Serialize_Serdex(benchmark::State& st) {
    auto v = serdex::json::from_str<std::vector<td::Record>>(td::records_json(td::kCount, false));
    for (auto _ : st) { auto s = serdex::json::to_str(v); benchmark::DoNotOptimize(s); }
}
BENCHMARK(BM_Serialize_Serdex);

static void BM_Serialize_Boost(benchmark::State& st) {
    auto doc = boost::json::parse(td::records_json(td::kCount, false));
    for (auto _ : st) { auto s = boost::json::serialize(doc); benchmark::DoNotOptimize(s); }
}
BENCHMARK(BM_Serialize_Boost);

static void BM_Serialize_Rapid(benchmark::State& st) {
    auto in = td::records_json(td::kCount, false);
    rapidjson::Document doc;
    doc.Parse(in.c_str(), in.size());
    for (auto _ : st) {
        rapidjson::StringBuffer buf;
        rapidjson::Writer<rapidjson::StringBuffer> w(buf);
        doc.Accept(w);
        benchmark::DoNotOptimize(buf.GetString());
    }
}
BENCHMARK(BM_Serialize_Rapid);

static void BM_Serialize_Nlohmann(benchmark::State& st) {
    auto doc = nlohmann::json::parse(td::records_json(td::kCount, false));
    for (auto _ : st) { auto s = doc.dump(); benchmark::DoNotOptimize(s); }
}
BENCHMARK(BM_Serialize_Nlohmann);
