#pragma once

/// @file include/chatviz/velocity.hpp
/// @brief VelocityTracker: sliding-window chat rate estimator.
///
/// # Module: Velocity
///
/// ## Responsibility
/// Record the arrival time of every accepted chat message and report the
/// instantaneous rate in messages per second over the trailing window.
///
/// ## Window Semantics
/// The window is half-open: on a query at `now`, an event at `t` counts iff
/// `now − t < VELOCITY_WINDOW_MS`. Events at 0,1,2,3,4 s queried at 5 s give
/// four events (the one at 0 s is exactly 5 s old and excluded), rate 0.8.
///
/// ## Guarantees
/// - Pull-based: pruning happens on query, there is no background task.
/// - Bands are a pure function of the rate with no hysteresis.

#include "chatviz/types.hpp"
#include "chatviz/constants.hpp"

#include <cstddef>
#include <deque>

namespace chatviz::velocity {

/// Sliding-window event-rate estimator.
class VelocityTracker {
public:
    /// Construct with a window length in milliseconds (must be > 0; values
    /// ≤ 0 fall back to the default window).
    explicit VelocityTracker(TimestampMs window_ms = constants::VELOCITY_WINDOW_MS) noexcept;

    /// Record one event at `now`.
    void record_event(TimestampMs now);

    /// Discard events outside the window and return events per second.
    [[nodiscard]] double current_rate(TimestampMs now) noexcept;

    /// Number of timestamps currently retained (before pruning).
    [[nodiscard]] std::size_t retained() const noexcept { return events_.size(); }

    /// Drop all recorded events.
    void clear() noexcept;

    /// Classify a rate into a display band.
    [[nodiscard]] static VelocityBand classify(double rate) noexcept;

private:
    TimestampMs             window_ms_;
    std::deque<TimestampMs> events_;
};

} // namespace chatviz::velocity
