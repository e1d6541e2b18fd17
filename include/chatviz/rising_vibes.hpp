#pragma once

/// @file include/chatviz/rising_vibes.hpp
/// @brief RisingVibeField: rise animation state for released vibes.
///
/// Each released vibe floats from the bottom of its panel to above the top
/// over 10–15 s with a gentle horizontal wobble, fading in at the bottom and
/// out near the top. Coordinates are percentages of the panel (y = 100 is the
/// bottom edge, y = −20 is the exit line).

#include "chatviz/types.hpp"
#include "chatviz/events.hpp"

#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace chatviz::layout {

struct RiseConfig {
    double        x_min_pct         = 10.0;
    double        x_span_pct        = 70.0;
    double        duration_min_s    = 10.0;
    double        duration_span_s   = 5.0;
    double        wobble_amplitude  = 3.0;
    double        wobble_speed_min  = 0.5;
    double        wobble_speed_span = 1.0;
    double        scale_min         = 0.85;
    double        scale_span        = 0.3;
    std::uint64_t seed              = 0x0f10a7ULL;
};

/// Renderer-facing sample of one rising vibe.
struct RisingVibeSample {
    std::string text;
    VibeKind    kind;
    double      x_pct;
    double      y_pct;
    double      opacity;
    double      scale;
};

class RisingVibeField {
public:
    explicit RisingVibeField(RiseConfig config = RiseConfig{});

    /// Start the rise of a released vibe at its release time. Elements whose
    /// rise completed before that time are removed first.
    void spawn(const ReleasedVibe& vibe);

    /// Positions at `now`; elements whose rise has completed are removed.
    [[nodiscard]] std::vector<RisingVibeSample> sample(TimestampMs now);

    [[nodiscard]] std::size_t size() const noexcept { return risers_.size(); }

    void clear() noexcept { risers_.clear(); }

    /// Opacity for a vertical position: fade in over (80,100], out below 15.
    [[nodiscard]] static double opacity_at(double y_pct) noexcept;

private:
    /// Remove elements whose rise has completed at `now`.
    void prune(TimestampMs now);

    struct Riser {
        std::string text;
        VibeKind    kind;
        double      x_pct;
        double      wobble_offset;
        double      wobble_speed;
        double      scale;
        TimestampMs start;
        double      duration_s;
    };

    RiseConfig                             config_;
    std::vector<Riser>                     risers_;
    std::mt19937_64                        rng_;
    std::uniform_real_distribution<double> unit_{0.0, 1.0};
};

} // namespace chatviz::layout
