#pragma once

/// @file include/chatviz/engine.hpp
/// @brief Scene Engine: per-session owner of all chatviz state.
///
/// # Module: Engine
///
/// ## Responsibility
/// Wire the components of one chat session together:
///   ChatEvent → EventAggregator ─┬─ topic change ─▶ BubbleLayoutSimulator
///                                └─ vibe ────────▶ VibePacer ─▶ released list
///                                                            └▶ RisingVibeField
/// and expose a consistent `SceneSnapshot` to the renderer.
///
/// ## Usage
/// ```cpp
/// Engine engine;
/// engine.handle(MessageEvent{.topic = "AAPL", .text = "to the moon"}, now);
/// // host loop
/// engine.tick(now);            // timers: question sweep, vibe drip
/// engine.advance_frame();      // once per animation frame
/// auto scene = engine.snapshot(now);
/// ```
///
/// ## Triggers
/// Three kinds of calls mutate state: events (`handle`), timers (`tick`) and
/// animation frames (`advance_frame`). The engine is single-threaded; each
/// call runs to completion. `next_deadline` tells a host event loop when the
/// next timer is due.
///
/// ## Guarantees
/// - No exceptions escape event handling; invalid input yields an IngestStatus.
/// - `reset` returns the engine to a clean state with no pending timers.

#include "chatviz/aggregator.hpp"
#include "chatviz/constants.hpp"
#include "chatviz/events.hpp"
#include "chatviz/layout.hpp"
#include "chatviz/pacer.hpp"
#include "chatviz/rising_vibes.hpp"
#include "chatviz/types.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace chatviz::core {

// ─── EngineConfig ────────────────────────────────────────────────────────────

/// Configuration of one engine instance.
struct EngineConfig {
    aggregator::AggregatorConfig aggregator{};
    pacer::PacerConfig           pacer{};
    layout::LayoutConfig         layout{};
    layout::RiseConfig           rise{};

    /// Interval of the periodic question sweep.
    TimestampMs question_sweep_interval_ms = constants::QUESTION_SWEEP_INTERVAL_MS;

    /// If true, log per-event diagnostics at debug level.
    bool verbose = false;

    /// # Returns
    /// `nullopt` when every section is valid, otherwise the first problem.
    [[nodiscard]] std::optional<std::string> validate() const;
};

// ─── SceneSnapshot ───────────────────────────────────────────────────────────

/// A visible topic joined with its physics state.
struct TopicView {
    aggregator::RankedTopic topic;
    double                  x;
    double                  y;
    double                  radius;
    Rgb                     color;
    bool                    just_updated;
};

/// Everything the renderer needs for one frame.
struct SceneSnapshot {
    TimestampMs                                at;
    std::vector<TopicView>                     topics;     ///< rank order
    std::vector<aggregator::QuestionEntry>     questions;  ///< non-expired
    std::vector<aggregator::PulseEntry>        pulses;     ///< newest first
    std::vector<ReleasedVibe>                  vibes;      ///< oldest first
    std::vector<layout::RisingVibeSample>      rising;
    double                                     velocity;
    VelocityBand                               band;
    std::size_t                                queued_vibes;
    double                                     estimated_batch_interval_ms;
};

// ─── Engine ──────────────────────────────────────────────────────────────────

class Engine {
public:
    using VibeListener = std::function<void(const ReleasedVibe&)>;

    /// Construct with optional configuration. Sections that fail validation
    /// are replaced by their defaults (a warning is logged).
    explicit Engine(EngineConfig config = EngineConfig{});

    // ── Events ───────────────────────────────────────────────────────────────

    /// Dispatch any inbound event.
    IngestStatus handle(const ChatEvent& event, TimestampMs now);

    IngestStatus on_message(const MessageEvent& e, TimestampMs now);
    IngestStatus on_vibe(const VibeEvent& e, TimestampMs now);
    IngestStatus on_pulse(const PulseEvent& e, TimestampMs now);

    // ── Timers and frames ────────────────────────────────────────────────────

    /// Run every timer due at `now`: the question sweep and the vibe drip.
    ///
    /// # Returns
    /// Number of vibes released by this call (0 or 1).
    std::size_t tick(TimestampMs now);

    /// Advance the bubble simulation by one frame.
    void advance_frame();

    /// Earliest time at which `tick` has work to do, or `nullopt` when no
    /// timer is armed (pacer idle and no questions to expire).
    [[nodiscard]] std::optional<TimestampMs> next_deadline() const noexcept;

    // ── Read side ────────────────────────────────────────────────────────────

    /// Consistent view of the scene at `now`. Bubble `just_updated` flags are
    /// consumed: a growth is reported by the first snapshot after it only.
    [[nodiscard]] SceneSnapshot snapshot(TimestampMs now);

    /// Invoked once per released vibe, in release order.
    void set_vibe_listener(VibeListener listener) { vibe_listener_ = std::move(listener); }

    /// Resize the bubble layout region.
    void set_extent(double width, double height);

    /// Tear down all session state and stop timers.
    void reset();

    [[nodiscard]] const aggregator::EventAggregator& aggregate() const noexcept { return aggregator_; }
    [[nodiscard]] const pacer::VibePacer& drip() const noexcept { return pacer_; }
    [[nodiscard]] const layout::BubbleLayoutSimulator& simulator() const noexcept { return layout_; }
    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

private:
    /// Push the current top-N ranking into the simulator.
    void resync_layout();

    EngineConfig                   config_;
    aggregator::EventAggregator    aggregator_;
    pacer::VibePacer               pacer_;
    layout::BubbleLayoutSimulator  layout_;
    layout::RisingVibeField        rising_;
    std::optional<TimestampMs>     last_sweep_;
    VibeListener                   vibe_listener_;
};

} // namespace chatviz::core
