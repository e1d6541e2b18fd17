#pragma once

/// @file include/chatviz/pacer.hpp
/// @brief VibePacer: adaptive drip scheduler for vibe events.
///
/// # Module: Pacer
///
/// ## Responsibility
/// Turn bursty vibe batches from the upstream classifier into a steady,
/// organic trickle whose cadence follows the observed batch rhythm.
///
/// ## State Machine
/// ```
///            enqueue (from Idle)                 tick, queue empty
///   Idle ───────────────────────▶ Pending(t) ─────────────────────▶ Idle
///                                  │    ▲
///                                  └────┘ tick at ≥ t: release front,
///                                          Pending(now + delay)
/// ```
/// There is never more than one pending fire time. Enqueue while Pending is a
/// no-op for the loop; only the queue grows.
///
/// ## Batch Estimate
/// A push into an empty queue starts a new batch. When a previous batch start
/// exists the estimate becomes `0.3·estimate + 0.7·(now − last_start)`.
///
/// ## Drip Delay
///   remaining   = queue_len + 1
///   until_next  = max(estimate − (now − last_start), 5000)
///   delay       = until_next / remaining · 1/max(1, 1 + 0.5·rate) · jitter
///   delay      ∈ [300, 5000] ms after clamping
///
/// When the estimate is large relative to the queue the delay saturates at
/// the 5000 ms ceiling; the drip then runs at a constant 5 s cadence.
///
/// ## Guarantees
/// - Strict FIFO, exactly once; items are never dropped.
/// - A non-empty queue drains with at most MAX_DRIP_DELAY_MS per item.

#include "chatviz/types.hpp"
#include "chatviz/constants.hpp"
#include "chatviz/events.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <random>

namespace chatviz::pacer {

// ─── PacerConfig ─────────────────────────────────────────────────────────────

struct PacerConfig {
    double      initial_batch_interval_ms = constants::INITIAL_BATCH_INTERVAL_MS;
    double      min_delay_ms              = constants::MIN_DRIP_DELAY_MS;
    double      max_delay_ms              = constants::MAX_DRIP_DELAY_MS;
    TimestampMs kick_delay_ms             = constants::DRIP_KICK_DELAY_MS;
    /// Seed of the jitter generator; equal seeds replay identical cadences.
    std::uint64_t seed = 0x5eed'cafeULL;
};

// ─── DripInputs ──────────────────────────────────────────────────────────────

/// Everything the delay formula depends on, for pure evaluation.
struct DripInputs {
    std::size_t queue_length;              ///< items still queued after the pop
    double      estimated_batch_interval_ms;
    double      ms_since_batch_start;
    double      current_rate;              ///< messages per second
};

// ─── VibePacer ───────────────────────────────────────────────────────────────

class VibePacer {
public:
    /// Loop state: Idle, or Pending with the time of the next drip.
    enum class LoopState { Idle, Pending };

    explicit VibePacer(PacerConfig config = PacerConfig{});

    /// Queue a vibe at `now` and start the loop if it is idle.
    ///
    /// # Returns
    /// `true` if this call moved the loop from Idle to Pending.
    bool enqueue(const VibeEvent& vibe, TimestampMs now);

    /// Fire the loop if a drip is due at `now`.
    ///
    /// # Arguments
    /// * `now`: current time
    /// * `current_rate`: chat rate in msg/s from the velocity tracker
    ///
    /// # Returns
    /// - the released vibe when a drip fired
    /// - `nullopt` when idle, not yet due, or the queue was empty (the loop
    ///   is then Idle)
    [[nodiscard]] std::optional<ReleasedVibe> tick(TimestampMs now, double current_rate);

    /// Stop the loop without touching the queue. A later enqueue restarts it.
    void cancel() noexcept;

    /// Stop the loop, drop queued items and reset the batch estimate.
    void clear() noexcept;

    [[nodiscard]] LoopState state() const noexcept { return state_; }

    /// Fire time of the pending drip, or `nullopt` when idle.
    [[nodiscard]] std::optional<TimestampMs> next_fire_time() const noexcept;

    [[nodiscard]] std::size_t queue_length() const noexcept { return queue_.size(); }

    [[nodiscard]] const std::deque<QueuedVibe>& queue() const noexcept { return queue_; }

    [[nodiscard]] double estimated_batch_interval_ms() const noexcept { return estimate_ms_; }

    [[nodiscard]] std::optional<TimestampMs> last_batch_start() const noexcept { return last_batch_start_; }

    /// Delay of the most recently scheduled drip (after clamping).
    [[nodiscard]] std::optional<double> last_delay_ms() const noexcept { return last_delay_ms_; }

    /// Evaluate the drip-delay formula for `inputs` with a given jitter factor,
    /// clamped to [min_delay, max_delay].
    [[nodiscard]] static double
    compute_delay(const DripInputs& inputs, double jitter,
                  double min_delay_ms = constants::MIN_DRIP_DELAY_MS,
                  double max_delay_ms = constants::MAX_DRIP_DELAY_MS) noexcept;

    /// Rate-dependent delay multiplier 1 / max(1, 1 + 0.5·rate).
    [[nodiscard]] static double velocity_multiplier(double current_rate) noexcept;

private:
    PacerConfig                            config_;
    std::deque<QueuedVibe>                 queue_;
    double                                 estimate_ms_;
    std::optional<TimestampMs>             last_batch_start_;
    LoopState                              state_ = LoopState::Idle;
    TimestampMs                            next_fire_ = 0;
    std::optional<double>                  last_delay_ms_;
    std::mt19937_64                        rng_;
    std::uniform_real_distribution<double> jitter_{constants::DRIP_JITTER_MIN,
                                                   constants::DRIP_JITTER_MAX};
};

/// Convert LoopState to a human-readable string.
[[nodiscard]] const char* to_string(VibePacer::LoopState s) noexcept;

} // namespace chatviz::pacer
