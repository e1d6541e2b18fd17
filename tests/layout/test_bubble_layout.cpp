/// @file tests/layout/test_bubble_layout.cpp
/// @brief Unit tests for BubbleLayoutSimulator.
///
/// Test categories:
///   - Size curve and force coefficients (rank monotonicity)
///   - sync(): spawn, update, destroy, visible cap, growth flag latch
///   - step(): boundary containment, speed bound, determinism
///   - set_extent() and degenerate boxes
///   - LayoutConfig::validate()

#include <gtest/gtest.h>
#include "chatviz/layout.hpp"

#include <cmath>
#include <string>
#include <vector>

using namespace chatviz;
using namespace chatviz::layout;
using chatviz::aggregator::RankedTopic;

// ─── Helpers ─────────────────────────────────────────────────────────────────

static RankedTopic ranked(std::string symbol, std::uint64_t count) {
    RankedTopic t{};
    t.symbol = std::move(symbol);
    t.count  = count;
    t.bullish_ratio = 0.5;
    t.lean   = Lean::Neutral;
    return t;
}

static std::vector<RankedTopic> ranking(std::size_t n) {
    std::vector<RankedTopic> out;
    for (std::size_t i = 0; i < n; ++i) {
        out.push_back(ranked("T" + std::to_string(i), 100 - i * 3));
    }
    return out;
}

static void expect_contained(const BubbleLayoutSimulator& sim) {
    const double m = sim.config().boundary_margin;
    for (const auto& b : sim.bubbles()) {
        EXPECT_GE(b.position.x(), b.radius + m - 1e-9) << b.symbol;
        EXPECT_LE(b.position.x(), sim.width() - b.radius - m + 1e-9) << b.symbol;
        EXPECT_GE(b.position.y(), b.radius + m - 1e-9) << b.symbol;
        EXPECT_LE(b.position.y(), sim.height() - b.radius - m + 1e-9) << b.symbol;
    }
}

// ─── Pure tuning functions ───────────────────────────────────────────────────

TEST(BubbleLayout, SizeForRatioLinearAndSqrt) {
    LayoutConfig cfg;
    EXPECT_DOUBLE_EQ(BubbleLayoutSimulator::size_for_ratio(0.0, cfg), 45.0);
    EXPECT_DOUBLE_EQ(BubbleLayoutSimulator::size_for_ratio(1.0, cfg), 140.0);
    EXPECT_DOUBLE_EQ(BubbleLayoutSimulator::size_for_ratio(0.5, cfg), 92.5);
    EXPECT_DOUBLE_EQ(BubbleLayoutSimulator::size_for_ratio(7.0, cfg), 140.0);

    cfg.size_curve = SizeCurve::Sqrt;
    EXPECT_DOUBLE_EQ(BubbleLayoutSimulator::size_for_ratio(0.25, cfg), 45.0 + 0.5 * 95.0);
}

TEST(BubbleLayout, HigherRankNeverSmallerOrWeakerPull) {
    LayoutConfig cfg;
    for (double lo = 0.0; lo <= 1.0; lo += 0.05) {
        for (double hi = lo; hi <= 1.0; hi += 0.05) {
            EXPECT_GE(BubbleLayoutSimulator::size_for_ratio(hi, cfg),
                      BubbleLayoutSimulator::size_for_ratio(lo, cfg));
            EXPECT_GE(BubbleLayoutSimulator::center_pull_coefficient(hi, cfg),
                      BubbleLayoutSimulator::center_pull_coefficient(lo, cfg));
            EXPECT_LE(BubbleLayoutSimulator::orbit_coefficient(hi, cfg),
                      BubbleLayoutSimulator::orbit_coefficient(lo, cfg));
            EXPECT_LE(BubbleLayoutSimulator::drift_coefficient(hi, cfg),
                      BubbleLayoutSimulator::drift_coefficient(lo, cfg));
        }
    }
}

TEST(BubbleLayout, CoefficientValues) {
    LayoutConfig cfg;
    EXPECT_DOUBLE_EQ(BubbleLayoutSimulator::center_pull_coefficient(1.0, cfg),
                     0.00004 * 2.5 * 0.3);
    EXPECT_DOUBLE_EQ(BubbleLayoutSimulator::orbit_coefficient(0.0, cfg), 0.015);
    EXPECT_DOUBLE_EQ(BubbleLayoutSimulator::drift_coefficient(1.0, cfg), 0.0125);
}

// ─── sync ────────────────────────────────────────────────────────────────────

TEST(BubbleLayout, SyncSpawnsNearCenterInsideBox) {
    BubbleLayoutSimulator sim;
    const auto r = ranking(5);
    sim.sync(r);

    ASSERT_EQ(sim.size(), 5u);
    for (const auto& b : sim.bubbles()) {
        const double d = (b.position - sim.center()).norm();
        EXPECT_LE(d, 130.0 + 1e-9);
        EXPECT_TRUE(b.just_updated);
        EXPECT_LE(std::abs(b.velocity.x()), 0.075);
        EXPECT_LE(std::abs(b.velocity.y()), 0.075);
    }
    expect_contained(sim);
}

TEST(BubbleLayout, SyncSetsRadiusFromCountRatio) {
    BubbleLayoutSimulator sim;
    std::vector<RankedTopic> r{ranked("AAPL", 10), ranked("TSLA", 5)};
    sim.sync(r);
    EXPECT_DOUBLE_EQ(sim.bubble("AAPL")->radius, 70.0);
    EXPECT_DOUBLE_EQ(sim.bubble("TSLA")->radius, 92.5 / 2.0);
    EXPECT_DOUBLE_EQ(sim.bubble("AAPL")->mass, 10.0);
    EXPECT_DOUBLE_EQ(sim.max_mass(), 10.0);
}

TEST(BubbleLayout, ResyncUpdatesKeepsPositionAndFlagsGrowth) {
    BubbleLayoutSimulator sim;
    std::vector<RankedTopic> r{ranked("AAPL", 4), ranked("TSLA", 2)};
    sim.sync(r);
    sim.acknowledge_updates();
    const Vec2 before = sim.bubble("AAPL")->position;

    r[1].count = 3;
    sim.sync(r);
    EXPECT_FALSE(sim.bubble("AAPL")->just_updated);
    EXPECT_TRUE(sim.bubble("TSLA")->just_updated);
    EXPECT_DOUBLE_EQ(sim.bubble("AAPL")->position.x(), before.x());
    EXPECT_DOUBLE_EQ(sim.bubble("AAPL")->position.y(), before.y());
}

TEST(BubbleLayout, GrowthFlagLatchesUntilAcknowledged) {
    BubbleLayoutSimulator sim;
    std::vector<RankedTopic> r{ranked("AAPL", 4), ranked("TSLA", 2)};
    sim.sync(r);
    sim.acknowledge_updates();
    EXPECT_FALSE(sim.bubble("AAPL")->just_updated);

    r[0].count = 5;
    sim.sync(r);
    ASSERT_TRUE(sim.bubble("AAPL")->just_updated);

    // A sync driven by another topic leaves the pending flag alone.
    r[1].count = 3;
    sim.sync(r);
    sim.step();
    EXPECT_TRUE(sim.bubble("AAPL")->just_updated);
    EXPECT_TRUE(sim.bubble("TSLA")->just_updated);

    sim.acknowledge_updates();
    EXPECT_FALSE(sim.bubble("AAPL")->just_updated);
    EXPECT_FALSE(sim.bubble("TSLA")->just_updated);
}

TEST(BubbleLayout, SyncDestroysDroppedTopics) {
    BubbleLayoutSimulator sim;
    sim.sync(ranking(4));
    std::vector<RankedTopic> r{ranked("T1", 50)};
    sim.sync(r);
    ASSERT_EQ(sim.size(), 1u);
    EXPECT_EQ(sim.bubble("T0"), nullptr);
    EXPECT_NE(sim.bubble("T1"), nullptr);
}

TEST(BubbleLayout, SyncHonoursVisibleCap) {
    BubbleLayoutSimulator sim;
    sim.sync(ranking(30));
    EXPECT_EQ(sim.size(), constants::MAX_VISIBLE_TOPICS);
    EXPECT_EQ(sim.bubble("T24"), nullptr);
}

TEST(BubbleLayout, EmptyMaxMassIsOne) {
    BubbleLayoutSimulator sim;
    EXPECT_DOUBLE_EQ(sim.max_mass(), 1.0);
    sim.step();   // no-op on empty
    EXPECT_TRUE(sim.empty());
}

// ─── step ────────────────────────────────────────────────────────────────────

TEST(BubbleLayout, StaysInsideBoxForManyFrames) {
    BubbleLayoutSimulator sim;
    sim.sync(ranking(24));
    for (int f = 0; f < 600; ++f) {
        sim.step();
        if (f % 50 == 0) {
            expect_contained(sim);
        }
    }
    expect_contained(sim);
}

TEST(BubbleLayout, SpeedBoundedAfterStep) {
    BubbleLayoutSimulator sim;
    sim.sync(ranking(24));
    for (int f = 0; f < 200; ++f) {
        sim.step();
        for (const auto& b : sim.bubbles()) {
            EXPECT_LE(b.velocity.norm(), sim.config().max_velocity + 1e-9);
        }
    }
}

TEST(BubbleLayout, MotionNeverFreezes) {
    BubbleLayoutSimulator sim;
    sim.sync(ranking(3));
    for (int f = 0; f < 500; ++f) sim.step();
    const Vec2 before = sim.bubbles()[2].position;
    sim.step();
    EXPECT_GT((sim.bubbles()[2].position - before).norm(), 0.0);
}

TEST(BubbleLayout, DeterministicForSeed) {
    BubbleLayoutSimulator a, b;
    a.sync(ranking(8));
    b.sync(ranking(8));
    for (int f = 0; f < 100; ++f) {
        a.step();
        b.step();
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        EXPECT_DOUBLE_EQ(a.bubbles()[i].position.x(), b.bubbles()[i].position.x());
        EXPECT_DOUBLE_EQ(a.bubbles()[i].position.y(), b.bubbles()[i].position.y());
    }
}

TEST(BubbleLayout, OverlappingPairIsPushedApart) {
    LayoutConfig cfg;
    cfg.drift_strength   = 0.0;
    cfg.orbit_tendency   = 0.0;
    cfg.gravity_strength = 0.0;
    cfg.mass_attraction  = 0.0;
    cfg.spawn_distance_min = 10.0;
    cfg.spawn_distance_max = 10.0;
    BubbleLayoutSimulator sim(cfg);
    std::vector<RankedTopic> r{ranked("A", 10), ranked("B", 10)};
    sim.sync(r);

    const double d0 = (sim.bubbles()[0].position - sim.bubbles()[1].position).norm();
    const double touch = sim.bubbles()[0].radius + sim.bubbles()[1].radius + cfg.collision_padding;
    ASSERT_LT(d0, touch);
    for (int f = 0; f < 30; ++f) sim.step();
    const double d1 = (sim.bubbles()[0].position - sim.bubbles()[1].position).norm();
    EXPECT_GT(d1, d0);
}

// ─── Extent ──────────────────────────────────────────────────────────────────

TEST(BubbleLayout, ShrinkingExtentReclamps) {
    BubbleLayoutSimulator sim;
    sim.sync(ranking(10));
    sim.set_extent(300.0, 320.0);
    EXPECT_DOUBLE_EQ(sim.width(), 300.0);
    expect_contained(sim);
}

TEST(BubbleLayout, BoxSmallerThanBubblePinsToMidline) {
    BubbleLayoutSimulator sim;
    std::vector<RankedTopic> r{ranked("BIG", 10)};
    sim.sync(r);
    sim.set_extent(100.0, 600.0);   // diameter 140 + margins > 100
    EXPECT_DOUBLE_EQ(sim.bubble("BIG")->position.x(), 50.0);
    sim.step();
    EXPECT_DOUBLE_EQ(sim.bubble("BIG")->position.x(), 50.0);
}

TEST(BubbleLayout, InvalidExtentIgnored) {
    BubbleLayoutSimulator sim;
    sim.set_extent(-1.0, 200.0);
    EXPECT_DOUBLE_EQ(sim.width(), 400.0);
}

TEST(BubbleLayout, ClearDestroysAll) {
    BubbleLayoutSimulator sim;
    sim.sync(ranking(3));
    sim.clear();
    EXPECT_TRUE(sim.empty());
}

// ─── Config ──────────────────────────────────────────────────────────────────

TEST(LayoutConfig, DefaultsAreValid) {
    EXPECT_FALSE(LayoutConfig{}.validate().has_value());
}

TEST(LayoutConfig, RejectsBadValues) {
    LayoutConfig c;
    c.min_size = 200.0;
    EXPECT_TRUE(c.validate().has_value());

    c = LayoutConfig{};
    c.damping = 1.5;
    EXPECT_TRUE(c.validate().has_value());

    c = LayoutConfig{};
    c.width = 0.0;
    EXPECT_TRUE(c.validate().has_value());
}
