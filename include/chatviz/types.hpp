#pragma once

/// @file include/chatviz/types.hpp
/// @brief Shared primitive types for the chatviz scene engine.
///
/// Every module includes this file. It defines the time base, the Eigen
/// vector alias used by the layout simulator, and the closed enumerations
/// (sentiment, vibe kind, velocity band, topic lean) that cross module
/// boundaries.

#include <Eigen/Dense>

#include <cstdint>
#include <string_view>

namespace chatviz {

// ─── Time ────────────────────────────────────────────────────────────────────

/// Wall-clock or simulated time in milliseconds. All engine operations take
/// `now` explicitly; the engine never reads a clock of its own.
using TimestampMs = std::int64_t;

// ─── Linear Algebra Aliases ──────────────────────────────────────────────────

/// A point or direction in the 2D layout plane, in layout units (pixels).
using Vec2 = Eigen::Vector2d;

// ─── Closed Enumerations ─────────────────────────────────────────────────────

/// Sentiment label attached to a topic mention by the upstream classifier.
enum class Sentiment : std::uint8_t {
    Bullish,
    Bearish,
    Neutral,
};

/// Qualitative reaction tag carried by a vibe event.
enum class VibeKind : std::uint8_t {
    Funny,
    Uplifting,
};

/// Display classification of the chat message rate.
enum class VelocityBand : std::uint8_t {
    Quiet,   ///< rate < 0.5 msg/s
    Active,  ///< 0.5 ≤ rate < 2
    Busy,    ///< 2 ≤ rate < 4
    Hype,    ///< rate ≥ 4
};

/// Overall sentiment lean of a topic derived from its bullish/bearish tally.
enum class Lean : std::uint8_t {
    Neutral,    ///< no bullish or bearish mentions yet
    Bullish,
    Bearish,
    Contested,  ///< minority side exceeds half of the majority side
};

// ─── Colour ──────────────────────────────────────────────────────────────────

/// Packed 0xRRGGBB colour suggested to the renderer for an entity.
struct Rgb {
    std::uint32_t value;

    friend constexpr bool operator==(Rgb a, Rgb b) noexcept { return a.value == b.value; }
};

// ─── String Conversions ──────────────────────────────────────────────────────

[[nodiscard]] std::string_view to_string(Sentiment s) noexcept;
[[nodiscard]] std::string_view to_string(VibeKind k) noexcept;
[[nodiscard]] std::string_view to_string(VelocityBand b) noexcept;
[[nodiscard]] std::string_view to_string(Lean l) noexcept;

/// Renderer colour for a topic lean.
[[nodiscard]] Rgb color_for(Lean l) noexcept;

/// Renderer colour for a vibe kind.
[[nodiscard]] Rgb color_for(VibeKind k) noexcept;

} // namespace chatviz
