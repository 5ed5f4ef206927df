/*
 * Copyright (c) 2026 The csvsplit authors
 *
 * This file is part of the csvsplit tool.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

/**
 * @file bench_router.cpp
 * @brief Micro-benchmarks for csvsplit using Google Benchmark
 *
 * Measures:
 * - CsvRecordReader parse throughput
 * - RowRouter end-to-end split throughput over group cardinality
 * - RowRouter route() cost with all writers already open
 *
 * Usage:
 *   bench_router [Google Benchmark flags]
 *   bench_router --benchmark_format=json --benchmark_out=results.json
 */

#include <benchmark/benchmark.h>
#include <csvsplit/csvsplit.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace csvsplit;

// ============================================================================
// Dataset generation: creates a temp CSV file with N rows over G groups
// ============================================================================

namespace {

struct BenchData {
    fs::path path;
    fs::path dir;
};

BenchData createBenchFile(size_t rows, size_t groups) {
    static size_t counter = 0;
    BenchData bd;
    bd.dir = fs::temp_directory_path() / ("csvsplit_bench_router_" + std::to_string(++counter));
    fs::create_directories(bd.dir);
    bd.path = bd.dir / "bench.csv";

    std::ofstream ofs(bd.path, std::ios::binary);
    ofs << "id,timestamp,State,temperature,status\n";
    for (size_t i = 0; i < rows; ++i) {
        ofs << i << ','
            << static_cast<double>(i) * 0.001 << ','
            << "G" << (i * 2654435761u) % groups << ','
            << 20.0 + static_cast<double>(i % 100) * 0.1 << ','
            << ((i % 10 == 0) ? "\"alarm, high\"" : "ok") << '\n';
    }
    return bd;
}

Config benchConfig(const BenchData& bd) {
    Config config;
    config.input_path = bd.path;
    config.group_column = "State";
    config.output_dir = bd.dir / "out";
    return config;
}

} // namespace

// ============================================================================
// BM_Reader_Parse: read every record, no output
// ============================================================================

static void BM_Reader_Parse(benchmark::State& state) {
    const size_t N = static_cast<size_t>(state.range(0));
    auto bd = createBenchFile(N, 16);

    for (auto _ : state) {
        CsvRecordReader reader;
        reader.open(bd.path);
        size_t count = 0;
        while (reader.readNext()) { ++count; }
        benchmark::DoNotOptimize(count);
    }

    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(N));
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(fs::file_size(bd.path)));
    fs::remove_all(bd.dir);
}
BENCHMARK(BM_Reader_Parse)->Arg(10000)->Arg(100000);

// ============================================================================
// BM_Router_Split: full run() over group cardinality
// ============================================================================

static void BM_Router_Split(benchmark::State& state) {
    const size_t N = static_cast<size_t>(state.range(0));
    const size_t G = static_cast<size_t>(state.range(1));
    auto bd = createBenchFile(N, G);
    Config config = benchConfig(bd);

    for (auto _ : state) {
        RowRouter router(config);
        auto summary = router.run();
        benchmark::DoNotOptimize(summary.rows_routed);
    }

    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(N));
    state.counters["groups"] = static_cast<double>(G);
    fs::remove_all(bd.dir);
}
BENCHMARK(BM_Router_Split)
    ->Args({100000, 1})
    ->Args({100000, 16})
    ->Args({100000, 256})
    ->Args({100000, 512})
    ->Unit(benchmark::kMillisecond);

// ============================================================================
// BM_Router_Route: in-memory records, writers warmed up
// ============================================================================

static void BM_Router_Route(benchmark::State& state) {
    const size_t G = static_cast<size_t>(state.range(0));
    BenchData bd;
    bd.dir = fs::temp_directory_path() / ("csvsplit_bench_route_" + std::to_string(G));
    fs::create_directories(bd.dir);

    std::vector<Record> records;
    records.reserve(4096);
    for (size_t i = 0; i < 4096; ++i) {
        records.push_back({std::to_string(i), "G" + std::to_string(i % G), "value|" + std::to_string(i)});
    }

    Config config = benchConfig(bd);
    RowRouter router(config);
    router.begin(Header({"id", "State", "payload"}));
    for (const auto& record : records) {
        router.route(record);
    }

    size_t i = 0;
    for (auto _ : state) {
        router.route(records[i++ & 4095]);
    }
    router.finalize();

    state.SetItemsProcessed(state.iterations());
    fs::remove_all(bd.dir);
}
BENCHMARK(BM_Router_Route)->Arg(1)->Arg(64)->Arg(512);

BENCHMARK_MAIN();
