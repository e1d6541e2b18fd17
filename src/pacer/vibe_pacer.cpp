/// @file src/pacer/vibe_pacer.cpp
/// @brief VibePacer: batch-rhythm estimation and drip scheduling.
///
/// See include/chatviz/pacer.hpp for the state machine and delay formula.

#include "chatviz/pacer.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <utility>

namespace chatviz::pacer {

VibePacer::VibePacer(PacerConfig config)
    : config_(config)
    , estimate_ms_(config.initial_batch_interval_ms)
    , rng_(config.seed)
{}

// ─── enqueue ─────────────────────────────────────────────────────────────────

bool VibePacer::enqueue(const VibeEvent& vibe, TimestampMs now) {
    // Callers validate first; a kind-less vibe is a programming error here.
    const VibeKind kind = vibe.kind.value_or(VibeKind::Funny);

    if (queue_.empty()) {
        if (last_batch_start_) {
            const double sample = static_cast<double>(now - *last_batch_start_);
            estimate_ms_ = estimate_ms_ * (1.0 - constants::BATCH_EWMA_WEIGHT)
                         + sample * constants::BATCH_EWMA_WEIGHT;
            spdlog::debug("pacer: new batch after {} ms, estimate {:.0f} ms",
                          now - *last_batch_start_, estimate_ms_);
        }
        last_batch_start_ = now;
    }

    queue_.push_back(QueuedVibe{.text = vibe.text, .kind = kind, .queued_at = now});

    if (state_ == LoopState::Pending) {
        return false;
    }
    state_     = LoopState::Pending;
    next_fire_ = now + config_.kick_delay_ms;
    return true;
}

// ─── tick ────────────────────────────────────────────────────────────────────

std::optional<ReleasedVibe> VibePacer::tick(TimestampMs now, double current_rate) {
    if (state_ == LoopState::Idle || now < next_fire_) {
        return std::nullopt;
    }
    if (queue_.empty()) {
        state_ = LoopState::Idle;
        return std::nullopt;
    }

    QueuedVibe item = std::move(queue_.front());
    queue_.pop_front();

    const double since_start = last_batch_start_
        ? static_cast<double>(now - *last_batch_start_)
        : 0.0;
    const DripInputs inputs{
        .queue_length                = queue_.size(),
        .estimated_batch_interval_ms = estimate_ms_,
        .ms_since_batch_start        = since_start,
        .current_rate                = current_rate,
    };
    const double delay = compute_delay(inputs, jitter_(rng_),
                                       config_.min_delay_ms, config_.max_delay_ms);

    last_delay_ms_ = delay;
    next_fire_     = now + static_cast<TimestampMs>(std::llround(delay));

    spdlog::trace("pacer: released '{}', {} queued, next in {:.0f} ms",
                  item.text, queue_.size(), delay);

    return ReleasedVibe{.text = std::move(item.text), .kind = item.kind, .released_at = now};
}

// ─── Loop control ────────────────────────────────────────────────────────────

void VibePacer::cancel() noexcept {
    state_     = LoopState::Idle;
    next_fire_ = 0;
}

void VibePacer::clear() noexcept {
    cancel();
    queue_.clear();
    estimate_ms_ = config_.initial_batch_interval_ms;
    last_batch_start_.reset();
    last_delay_ms_.reset();
}

std::optional<TimestampMs> VibePacer::next_fire_time() const noexcept {
    if (state_ == LoopState::Idle) {
        return std::nullopt;
    }
    return next_fire_;
}

// ─── Delay formula ───────────────────────────────────────────────────────────

double VibePacer::velocity_multiplier(double current_rate) noexcept {
    if (!std::isfinite(current_rate)) {
        return 1.0;
    }
    return 1.0 / std::max(1.0, 1.0 + constants::DRIP_VELOCITY_GAIN * current_rate);
}

double VibePacer::compute_delay(const DripInputs& inputs, double jitter,
                                double min_delay_ms, double max_delay_ms) noexcept {
    const double remaining = static_cast<double>(inputs.queue_length) + 1.0;
    const double until_next = std::max(
        inputs.estimated_batch_interval_ms - inputs.ms_since_batch_start,
        constants::MIN_TIME_UNTIL_NEXT_BATCH_MS);

    double delay = until_next / remaining * velocity_multiplier(inputs.current_rate) * jitter;
    if (!std::isfinite(delay)) {
        delay = max_delay_ms;
    }
    return std::clamp(delay, min_delay_ms, max_delay_ms);
}

const char* to_string(VibePacer::LoopState s) noexcept {
    switch (s) {
        case VibePacer::LoopState::Idle:    return "idle";
        case VibePacer::LoopState::Pending: return "pending";
    }
    return "unknown";
}

} // namespace chatviz::pacer
