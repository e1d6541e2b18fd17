#pragma once

#include <cstddef>
#include <cstdint>

/// @file include/chatviz/constants.hpp
/// @brief Collection caps, time windows and pacing bounds for chatviz.
///
/// Physics tuning lives in `LayoutConfig` (see layout.hpp) so it can be
/// injected per simulator; the values here are the fixed contract of the
/// aggregation and pacing layers.

namespace chatviz::constants {

// ─── Collection Caps ─────────────────────────────────────────────────────────

/// Maximum number of topics laid out by the bubble simulator.
static constexpr std::size_t MAX_VISIBLE_TOPICS = 24;

/// Maximum number of live question entries.
static constexpr std::size_t MAX_QUESTIONS = 8;

/// Maximum number of pulse summaries kept (newest first).
static constexpr std::size_t MAX_PULSES = 7;

/// Maximum number of released vibes kept (oldest dropped).
static constexpr std::size_t MAX_RELEASED_VIBES = 16;

/// Length of the per-topic recent comment ring.
static constexpr std::size_t RECENT_COMMENTS = 5;

/// Characters of question text used as the de-duplication key when the
/// question carries no topic.
static constexpr std::size_t QUESTION_KEY_PREFIX = 30;

/// Count at which a topic bubble is flagged for a highlight glow.
static constexpr std::uint64_t GLOW_COUNT_THRESHOLD = 10;

// ─── Time Windows (ms) ───────────────────────────────────────────────────────

/// Question time-to-live. Entries aged ≥ this are swept and hidden.
static constexpr std::int64_t QUESTION_TTL_MS = 30'000;

/// Interval of the periodic question sweep.
static constexpr std::int64_t QUESTION_SWEEP_INTERVAL_MS = 5'000;

/// Sliding window of the velocity estimator.
static constexpr std::int64_t VELOCITY_WINDOW_MS = 5'000;

// ─── Velocity Bands (msg/s) ──────────────────────────────────────────────────

static constexpr double VELOCITY_ACTIVE = 0.5;
static constexpr double VELOCITY_BUSY   = 2.0;
static constexpr double VELOCITY_HYPE   = 4.0;

// ─── Vibe Pacing ─────────────────────────────────────────────────────────────

/// Initial estimate of the upstream vibe batch interval.
static constexpr double INITIAL_BATCH_INTERVAL_MS = 30'000.0;

/// Weight of the fresh sample in the batch-interval EWMA.
static constexpr double BATCH_EWMA_WEIGHT = 0.7;

/// Floor on the assumed time until the next batch.
static constexpr double MIN_TIME_UNTIL_NEXT_BATCH_MS = 5'000.0;

/// Drip delay bounds.
static constexpr double MIN_DRIP_DELAY_MS = 300.0;
static constexpr double MAX_DRIP_DELAY_MS = 5'000.0;

/// Delay before the first drip after the loop starts from idle.
static constexpr std::int64_t DRIP_KICK_DELAY_MS = 200;

/// Jitter range applied to every drip delay.
static constexpr double DRIP_JITTER_MIN = 0.85;
static constexpr double DRIP_JITTER_MAX = 1.15;

/// Rate sensitivity of the drip delay: multiplier = 1 / max(1, 1 + k·rate).
static constexpr double DRIP_VELOCITY_GAIN = 0.5;

// ─── Numerical Tolerances ────────────────────────────────────────────────────

/// General floating-point comparison epsilon.
static constexpr double FLOAT_EPSILON = 1e-12;

} // namespace chatviz::constants
