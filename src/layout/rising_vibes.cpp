/// @file src/layout/rising_vibes.cpp
/// @brief RisingVibeField: per-vibe rise, wobble and fade.

#include "chatviz/rising_vibes.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <utility>

namespace chatviz::layout {

namespace {

constexpr double START_Y_PCT = 100.0;
constexpr double TRAVEL_PCT  = 120.0;   // 100 % down to −20 %
constexpr double FADE_IN_Y   = 80.0;
constexpr double FADE_OUT_Y  = 15.0;

} // anonymous namespace

RisingVibeField::RisingVibeField(RiseConfig config)
    : config_(config)
    , rng_(config.seed)
{}

void RisingVibeField::spawn(const ReleasedVibe& vibe) {
    prune(vibe.released_at);
    Riser r{
        .text          = vibe.text,
        .kind          = vibe.kind,
        .x_pct         = config_.x_min_pct + unit_(rng_) * config_.x_span_pct,
        .wobble_offset = unit_(rng_) * 2.0 * std::numbers::pi,
        .wobble_speed  = config_.wobble_speed_min + unit_(rng_) * config_.wobble_speed_span,
        .scale         = config_.scale_min + unit_(rng_) * config_.scale_span,
        .start         = vibe.released_at,
        .duration_s    = config_.duration_min_s + unit_(rng_) * config_.duration_span_s,
    };
    risers_.push_back(std::move(r));
}

void RisingVibeField::prune(TimestampMs now) {
    std::erase_if(risers_, [&](const Riser& r) {
        const double elapsed_s = static_cast<double>(now - r.start) / 1000.0;
        return r.duration_s <= 0.0 || elapsed_s / r.duration_s >= 1.0;
    });
}

std::vector<RisingVibeSample> RisingVibeField::sample(TimestampMs now) {
    prune(now);

    std::vector<RisingVibeSample> out;
    out.reserve(risers_.size());
    for (const auto& r : risers_) {
        // Not yet started (sampled before its release time): hold at the bottom.
        const double elapsed_s = std::max(0.0, static_cast<double>(now - r.start) / 1000.0);
        const double progress  = elapsed_s / r.duration_s;
        const double y = START_Y_PCT - progress * TRAVEL_PCT;
        const double x = r.x_pct
                       + std::sin(elapsed_s * r.wobble_speed + r.wobble_offset)
                       * config_.wobble_amplitude;
        out.push_back(RisingVibeSample{
            .text    = r.text,
            .kind    = r.kind,
            .x_pct   = x,
            .y_pct   = y,
            .opacity = opacity_at(y),
            .scale   = r.scale,
        });
    }
    return out;
}

double RisingVibeField::opacity_at(double y_pct) noexcept {
    if (y_pct > FADE_IN_Y) {
        return std::clamp((START_Y_PCT - y_pct) / (START_Y_PCT - FADE_IN_Y), 0.0, 1.0);
    }
    if (y_pct < FADE_OUT_Y) {
        return std::max(0.0, y_pct / FADE_OUT_Y);
    }
    return 1.0;
}

} // namespace chatviz::layout
