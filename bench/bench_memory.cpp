/**
 * @file  bench/bench_memory.cpp
 * @brief Google Benchmark suite for the cache tiers and the memory facade.
 *
 * Benchmarks
 * ----------
 *   BM_InProcess_Set / Get        fallback cache, no eviction
 *   BM_InProcess_SetEvicting      every set past capacity evicts
 *   BM_Codec_EncodeEntry / Decode cache value serialisation
 *   BM_Memory_WriteBoth           SQLite upsert + cache copy
 *   BM_Memory_Read/1, /0          cached read, durable read
 *   BM_Memory_Latest              latest-pointer lookup
 *
 * Build (CMake):
 *   cmake --build build --target bench_memory
 *   ./build/bench_memory --benchmark_format=json
 *
 * The facade benchmarks use a ":memory:" SQLite database and no external
 * cache, so they measure this process only.
 */

#include "benchmark/benchmark.h"

#include "umb/cache.hpp"
#include "umb/codec.hpp"
#include "umb/config.hpp"
#include "umb/log.hpp"
#include "umb/memory.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

using namespace umb;

// ── Fixture helpers ────────────────────────────────────────────────────────────

static std::vector<std::string> make_keys(std::size_t n) {
    std::vector<std::string> keys;
    keys.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        keys.push_back("EURUSD:bar:" + std::to_string(1'700'000'000'000LL + static_cast<long long>(i)));
    }
    return keys;
}

static Entry make_bar_entry(const std::string& key) {
    Entry e;
    e.category    = Category::MarketData;
    e.key         = key;
    e.source      = Source::TradingFramework;
    e.memory_type = MemoryType::Both;
    e.payload     = make_payload({{"open", 1.0841}, {"high", 1.0852}, {"low", 1.0838},
                            {"close", 1.0849}, {"volume", 1250.0},
                            {"bar_type", "1-MINUTE-LAST"}});
    e.created_at  = now();
    e.ttl         = Seconds{3600};
    return e;
}

static std::unique_ptr<memory::UnifiedMemory> open_memory() {
    log::set_level(log::Level::Off);
    core::MemoryConfig cfg;
    cfg.db_path                     = ":memory:";
    cfg.cache.expiry_sweep_interval = std::chrono::milliseconds{0};
    cfg.retention.sweep_interval    = std::chrono::seconds{0};
    return memory::UnifiedMemory::open(cfg);
}

// ── In-process cache ───────────────────────────────────────────────────────────

static void BM_InProcess_Set(benchmark::State& state) {
    const auto n    = static_cast<std::size_t>(state.range(0));
    const auto keys = make_keys(n);
    cache::InProcessCache c(n, cache::Millis{0});
    const std::string value(256, 'x');
    std::size_t i = 0;
    for (auto _ : state) {
        benchmark::DoNotOptimize(c.set(keys[i], value, cache::Millis{60'000}, true));
        i = (i + 1) % n;
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_InProcess_Set)->RangeMultiplier(8)->Range(64, 32768);

static void BM_InProcess_Get(benchmark::State& state) {
    const auto n    = static_cast<std::size_t>(state.range(0));
    const auto keys = make_keys(n);
    cache::InProcessCache c(n, cache::Millis{0});
    for (const auto& k : keys) {
        (void)c.set(k, std::string(256, 'x'), std::nullopt, true);
    }
    std::size_t i = 0;
    for (auto _ : state) {
        auto reply = c.get(keys[i]);
        benchmark::DoNotOptimize(reply.value.data());
        i = (i + 1) % n;
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_InProcess_Get)->RangeMultiplier(8)->Range(64, 32768);

static void BM_InProcess_SetEvicting(benchmark::State& state) {
    const auto keys = make_keys(4096);
    cache::InProcessCache c(256, cache::Millis{0});
    std::size_t i = 0;
    for (auto _ : state) {
        benchmark::DoNotOptimize(c.set(keys[i], "v", std::nullopt, (i & 1u) == 0));
        i = (i + 1) % keys.size();
    }
    state.counters["evictions"] = static_cast<double>(c.stats().evictions);
}
BENCHMARK(BM_InProcess_SetEvicting);

// ── Codec ──────────────────────────────────────────────────────────────────────

static void BM_Codec_EncodeEntry(benchmark::State& state) {
    const Entry e = make_bar_entry("EURUSD:bar:1");
    for (auto _ : state) {
        auto text = codec::encode_entry(e);
        benchmark::DoNotOptimize(text.data());
    }
}
BENCHMARK(BM_Codec_EncodeEntry);

static void BM_Codec_DecodeEntry(benchmark::State& state) {
    const std::string text = codec::encode_entry(make_bar_entry("EURUSD:bar:1"));
    for (auto _ : state) {
        auto e = codec::decode_entry(text);
        benchmark::DoNotOptimize(e.has_value());
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(text.size()));
}
BENCHMARK(BM_Codec_DecodeEntry);

// ── UnifiedMemory ──────────────────────────────────────────────────────────────

static void BM_Memory_WriteBoth(benchmark::State& state) {
    auto mem = open_memory();
    if (!mem) {
        state.SkipWithError("could not open memory");
        return;
    }
    const auto keys = make_keys(1024);
    std::size_t i = 0;
    for (auto _ : state) {
        auto res = mem->write(make_bar_entry(keys[i]));
        benchmark::DoNotOptimize(res.status);
        i = (i + 1) % keys.size();
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Memory_WriteBoth)->Unit(benchmark::kMicrosecond);

static void BM_Memory_Read(benchmark::State& state) {
    const bool prefer_cache = state.range(0) != 0;
    auto mem = open_memory();
    if (!mem) {
        state.SkipWithError("could not open memory");
        return;
    }
    const auto keys = make_keys(512);
    for (const auto& k : keys) {
        (void)mem->write(make_bar_entry(k));
    }
    std::size_t i = 0;
    for (auto _ : state) {
        auto res = mem->read(Category::MarketData, keys[i], prefer_cache);
        benchmark::DoNotOptimize(res.status);
        i = (i + 1) % keys.size();
    }
    state.SetLabel(prefer_cache ? "cached" : "durable");
}
BENCHMARK(BM_Memory_Read)->Arg(1)->Arg(0)->Unit(benchmark::kMicrosecond);

static void BM_Memory_Latest(benchmark::State& state) {
    auto mem = open_memory();
    if (!mem) {
        state.SkipWithError("could not open memory");
        return;
    }
    for (const auto& k : make_keys(256)) {
        (void)mem->write(make_bar_entry(k));
    }
    for (auto _ : state) {
        auto res = mem->latest(Category::MarketData, "EURUSD:bar");
        benchmark::DoNotOptimize(res.status);
    }
}
BENCHMARK(BM_Memory_Latest)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
