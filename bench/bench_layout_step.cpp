/**
 * @file  bench/bench_layout_step.cpp
 * @brief Google Benchmark suite for the per-frame layout and ranking paths.
 *
 * Benchmarks
 * ----------
 *   BM_LayoutStep       : one physics frame for n visible bubbles
 *   BM_TopTopics        : ranking n topics and truncating to the visible cap
 *   BM_Snapshot         : full engine snapshot with 24 visible topics
 *
 * Build (CMake):
 *   cmake --build build --target bench_layout_step
 *   ./build/bench_layout_step --benchmark_format=json
 *
 * A 60 fps renderer has 16.6 ms per frame; the step must stay far below it.
 */

#include "benchmark/benchmark.h"

#include "chatviz/aggregator.hpp"
#include "chatviz/engine.hpp"
#include "chatviz/layout.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

using namespace chatviz;

// ── Fixture helpers ────────────────────────────────────────────────────────────

/// Ranking of n topics with strictly decreasing counts.
static std::vector<aggregator::RankedTopic> make_ranking(std::size_t n) {
    std::vector<aggregator::RankedTopic> out;
    out.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        aggregator::RankedTopic t{};
        t.symbol = "T" + std::to_string(i);
        t.count  = static_cast<std::uint64_t>(n - i) * 3;
        out.push_back(std::move(t));
    }
    return out;
}

// ── BM_LayoutStep ──────────────────────────────────────────────────────────────

static void BM_LayoutStep(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    layout::LayoutConfig cfg;
    cfg.max_visible = n;
    layout::BubbleLayoutSimulator sim(cfg);
    sim.sync(make_ranking(n));

    for (auto _ : state) {
        sim.step();
        benchmark::DoNotOptimize(sim.bubbles().data());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_LayoutStep)->RangeMultiplier(2)->Range(4, 128)->Unit(benchmark::kMicrosecond);

// ── BM_TopTopics ───────────────────────────────────────────────────────────────

static void BM_TopTopics(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    aggregator::EventAggregator agg;
    TimestampMs t = 0;
    for (std::size_t i = 0; i < n; ++i) {
        for (std::size_t k = 0; k <= i % 7; ++k) {
            (void)agg.on_message(MessageEvent{.topic = "T" + std::to_string(i),
                                              .text = "x", .author = "a"}, ++t);
        }
    }

    for (auto _ : state) {
        auto top = agg.top_topics(constants::MAX_VISIBLE_TOPICS);
        benchmark::DoNotOptimize(top.data());
    }
}
BENCHMARK(BM_TopTopics)->RangeMultiplier(4)->Range(16, 4096)->Unit(benchmark::kMicrosecond);

// ── BM_Snapshot ────────────────────────────────────────────────────────────────

static void BM_Snapshot(benchmark::State& state) {
    core::Engine engine;
    TimestampMs t = 0;
    for (int i = 0; i < 200; ++i) {
        (void)engine.on_message(MessageEvent{.topic = "T" + std::to_string(i % 30),
                                             .sentiment = Sentiment::Bullish,
                                             .text = "x", .author = "a"}, t += 5);
    }

    for (auto _ : state) {
        engine.advance_frame();
        auto scene = engine.snapshot(t);
        benchmark::DoNotOptimize(scene.topics.data());
    }
}
BENCHMARK(BM_Snapshot)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
