/// @file src/velocity/velocity_tracker.cpp
/// @brief VelocityTracker: sliding-window chat rate estimator.

#include "chatviz/velocity.hpp"

#include <algorithm>

namespace chatviz::velocity {

VelocityTracker::VelocityTracker(TimestampMs window_ms) noexcept
    : window_ms_(window_ms > 0 ? window_ms : constants::VELOCITY_WINDOW_MS)
{}

void VelocityTracker::record_event(TimestampMs now) {
    events_.push_back(now);
}

double VelocityTracker::current_rate(TimestampMs now) noexcept {
    // Half-open window: keep t with now − t < window. Arrival order is not
    // assumed; every entry is tested.
    std::erase_if(events_, [&](TimestampMs t) { return now - t >= window_ms_; });

    const double window_s = static_cast<double>(window_ms_) / 1000.0;
    return static_cast<double>(events_.size()) / window_s;
}

void VelocityTracker::clear() noexcept {
    events_.clear();
}

VelocityBand VelocityTracker::classify(double rate) noexcept {
    if (rate >= constants::VELOCITY_HYPE)   return VelocityBand::Hype;
    if (rate >= constants::VELOCITY_BUSY)   return VelocityBand::Busy;
    if (rate >= constants::VELOCITY_ACTIVE) return VelocityBand::Active;
    return VelocityBand::Quiet;
}

} // namespace chatviz::velocity
