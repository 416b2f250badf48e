/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 *
 * This file is part of the TCSV library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

/**
 * @file bench_record_codec.cpp
 * @brief Throughput of RecordCodec serialize/deserialize in both column strategies.
 *
 * Measures records per second and bytes per second for a mixed-type record,
 * plus header resolution cost for wide named schemas.
 */

#include <benchmark/benchmark.h>
#include <tcsv/tcsv.h>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

using namespace tcsv;

// ============================================================================
// Setup helpers
// ============================================================================

namespace {

struct Tick {
    int64_t     timestamp = 0;
    std::string symbol;
    double      bid = 0.0;
    double      ask = 0.0;
    uint32_t    volume = 0;
    bool        halted = false;
};

// Same layout, read by header name
struct NamedTick {
    int64_t     timestamp = 0;
    std::string symbol;
    double      bid = 0.0;
    double      ask = 0.0;
    uint32_t    volume = 0;
    bool        halted = false;
};

} // namespace

template<> struct tcsv::RecordTraits<Tick> {
    static constexpr auto columns = std::make_tuple(
        column<&Tick::timestamp>("timestamp"),
        column<&Tick::symbol>("symbol"),
        column<&Tick::bid>("bid"),
        column<&Tick::ask>("ask"),
        column<&Tick::volume>("volume"),
        column<&Tick::halted>("halted"));
};

template<> struct tcsv::RecordTraits<NamedTick> {
    static constexpr bool key_as_property_name = true;
    static constexpr auto columns = std::make_tuple(
        column<&NamedTick::timestamp>("timestamp"),
        column<&NamedTick::symbol>("symbol"),
        column<&NamedTick::bid>("bid"),
        column<&NamedTick::ask>("ask"),
        column<&NamedTick::volume>("volume"),
        column<&NamedTick::halted>("halted"));
};

namespace {

template<typename T>
RecordCodec<T> buildCodec() {
    CollectingDiagnosticSink sink;
    auto schema = SchemaCompiler::compile(reflectMetadata<T>(), sink);
    if (!schema.has_value()) {
        throw std::logic_error("benchmark schema did not compile");
    }
    return RecordCodec<T>(std::move(*schema));
}

template<typename T>
std::vector<T> makeTicks(size_t count) {
    std::vector<T> ticks(count);
    for (size_t i = 0; i < count; ++i) {
        ticks[i].timestamp = 1700000000000LL + static_cast<int64_t>(i) * 250;
        ticks[i].symbol = (i % 3 == 0) ? "ACME" : (i % 3 == 1) ? "BETA, Inc." : "GAMMA";
        ticks[i].bid = 100.0 + static_cast<double>(i % 1000) * 0.01;
        ticks[i].ask = ticks[i].bid + 0.02;
        ticks[i].volume = static_cast<uint32_t>(i * 37 % 100000);
        ticks[i].halted = (i % 97) == 0;
    }
    return ticks;
}

template<typename T>
std::string writeTicks(const RecordCodec<T>& codec, const std::vector<T>& ticks) {
    CsvWriter writer;
    codec.serialize(writer, std::span<const T>(ticks));
    return writer.str();
}

} // namespace

// ============================================================================
// Serialization
// ============================================================================

template<typename T>
static void BM_Serialize(benchmark::State& state) {
    const auto codec = buildCodec<T>();
    const auto ticks = makeTicks<T>(static_cast<size_t>(state.range(0)));
    CsvWriter writer;
    for (auto _ : state) {
        writer.clear();
        codec.serialize(writer, std::span<const T>(ticks));
        benchmark::DoNotOptimize(writer.view().data());
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(writer.view().size()));
}
BENCHMARK_TEMPLATE(BM_Serialize, Tick)->Arg(1000)->Arg(100000);
BENCHMARK_TEMPLATE(BM_Serialize, NamedTick)->Arg(1000)->Arg(100000);

template<typename T>
static void BM_SerializeCursor(benchmark::State& state) {
    const auto codec = buildCodec<T>();
    const auto ticks = makeTicks<T>(static_cast<size_t>(state.range(0)));
    CsvWriter writer;
    for (auto _ : state) {
        writer.clear();
        codec.serializeRange(writer, ticks.begin(), ticks.end());
        benchmark::DoNotOptimize(writer.view().data());
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK_TEMPLATE(BM_SerializeCursor, Tick)->Arg(1000)->Arg(100000);

// ============================================================================
// Deserialization
// ============================================================================

template<typename T>
static void BM_Deserialize(benchmark::State& state) {
    const auto codec = buildCodec<T>();
    const std::string text = writeTicks(codec, makeTicks<T>(static_cast<size_t>(state.range(0))));
    for (auto _ : state) {
        CsvReader reader(text);
        auto records = codec.deserialize(reader);
        benchmark::DoNotOptimize(records.data());
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(text.size()));
}
BENCHMARK_TEMPLATE(BM_Deserialize, Tick)->Arg(1000)->Arg(100000);
BENCHMARK_TEMPLATE(BM_Deserialize, NamedTick)->Arg(1000)->Arg(100000);

template<typename T>
static void BM_DeserializeCallerBuffer(benchmark::State& state) {
    const auto codec = buildCodec<T>();
    const std::string text = writeTicks(codec, makeTicks<T>(static_cast<size_t>(state.range(0))));
    std::vector<T> buffer(static_cast<size_t>(state.range(0)));
    for (auto _ : state) {
        CsvReader reader(text);
        size_t count = codec.deserialize(reader, std::span<T>(buffer));
        benchmark::DoNotOptimize(count);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK_TEMPLATE(BM_DeserializeCallerBuffer, Tick)->Arg(1000)->Arg(100000);

// ============================================================================
// Header resolution
// ============================================================================

// Resolve a header of N distinct keys against a schema of the same N keys
static void BM_ColumnMapResolve(benchmark::State& state) {
    const size_t columns = static_cast<size_t>(state.range(0));
    ColumnMapResolver resolver;
    std::vector<std::string> keys;
    for (size_t i = 0; i < columns; ++i) {
        keys.push_back("column_" + std::to_string(i * 7919 % 100003));
        resolver.insert(keys.back(), static_cast<int>(i));
    }
    for (auto _ : state) {
        int sum = 0;
        for (const auto& key : keys) {
            sum += resolver.resolve(key);
        }
        benchmark::DoNotOptimize(sum);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_ColumnMapResolve)->Arg(8)->Arg(64)->Arg(512);
