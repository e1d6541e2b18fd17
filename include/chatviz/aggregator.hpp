#pragma once

/// @file include/chatviz/aggregator.hpp
/// @brief EventAggregator: bounded, rank-ordered chat state.
///
/// # Module: Aggregator
///
/// ## Responsibility
/// Own the four aggregate collections of a session and the rules for
/// inserting, merging and evicting into each:
///
/// | Collection      | Identity        | Merge             | Eviction              |
/// |-----------------|-----------------|-------------------|-----------------------|
/// | topics          | symbol          | count/tally/ring  | never (session-long)  |
/// | questions       | topic or prefix | count, last-write | TTL sweep + cap (old) |
/// | pulses          | none            | none              | cap, newest kept      |
/// | released vibes  | none            | none              | cap, newest kept      |
///
/// The aggregator also owns the VelocityTracker: every accepted message is
/// recorded there, whether or not it carries a topic.
///
/// ## Guarantees
/// - Rejected events never mutate state.
/// - No operation throws for valid-but-unusual input (e.g. unknown sentiment).
/// - `top_topics` is a stable ranking: count descending, then first-seen order.

#include "chatviz/types.hpp"
#include "chatviz/constants.hpp"
#include "chatviz/events.hpp"
#include "chatviz/velocity.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace chatviz::aggregator {

// ─── AggregatorConfig ────────────────────────────────────────────────────────

/// Caps and windows of the aggregate collections.
struct AggregatorConfig {
    std::size_t max_questions      = constants::MAX_QUESTIONS;
    TimestampMs question_ttl_ms    = constants::QUESTION_TTL_MS;
    std::size_t max_pulses         = constants::MAX_PULSES;
    std::size_t max_released_vibes = constants::MAX_RELEASED_VIBES;
    std::size_t recent_comments    = constants::RECENT_COMMENTS;
    TimestampMs velocity_window_ms = constants::VELOCITY_WINDOW_MS;
};

// ─── Topic State ─────────────────────────────────────────────────────────────

/// One entry of a topic's recent-comment ring.
struct Comment {
    std::string text;
    Sentiment   sentiment;
};

/// Cumulative sentiment tally of a topic.
struct SentimentTally {
    std::uint64_t bullish = 0;
    std::uint64_t bearish = 0;
    std::uint64_t neutral = 0;

    /// bullish / (bullish + bearish), or 0.5 when neither has been seen.
    [[nodiscard]] double bullish_ratio() const noexcept;

    /// True when the minority side exceeds half of the majority side.
    [[nodiscard]] bool contested() const noexcept;

    /// Overall lean used for colouring.
    [[nodiscard]] Lean lean() const noexcept;
};

/// Aggregate state of one topic for the whole session.
struct TopicState {
    std::uint64_t       count = 0;
    SentimentTally      sentiment;
    TimestampMs         last_update = 0;
    std::deque<Comment> recent_comments;  ///< oldest first, bounded
    std::uint64_t       first_seen = 0;   ///< insertion sequence number
};

/// Read-only projection of a topic returned by `top_topics`.
struct RankedTopic {
    std::string          symbol;
    std::uint64_t        count;
    SentimentTally       sentiment;
    double               bullish_ratio;
    bool                 contested;
    Lean                 lean;
    bool                 glow;  ///< count ≥ GLOW_COUNT_THRESHOLD
    std::vector<Comment> recent_comments;
};

// ─── Questions, Pulses ───────────────────────────────────────────────────────

/// A de-duplicated audience question.
struct QuestionEntry {
    std::string   key;    ///< topic, or text prefix when no topic
    std::string   topic;  ///< display label ("GENERAL" when no topic)
    std::string   text;
    std::string   author;
    std::uint64_t count;
    TimestampMs   time;   ///< last seen
};

/// An immutable AI summary.
struct PulseEntry {
    std::string                summary;
    std::string                mood;
    std::optional<std::string> top_ticker;
    TimestampMs                time;
};

// ─── EventAggregator ─────────────────────────────────────────────────────────

/// Owner of topics, questions, pulses, released vibes and the rate estimator.
class EventAggregator {
public:
    explicit EventAggregator(AggregatorConfig config = AggregatorConfig{});

    // ── Ingest ───────────────────────────────────────────────────────────────

    /// Apply a message event at `now`.
    ///
    /// # Returns
    /// - `Accepted` after updating topic/question state and the velocity window
    /// - `MissingText` without mutating anything
    [[nodiscard]] IngestStatus on_message(const MessageEvent& e, TimestampMs now);

    /// Validate a vibe event. Accepted vibes are queued by the caller's pacer;
    /// the aggregator only stores them once released (`push_released_vibe`).
    [[nodiscard]] IngestStatus on_vibe(const VibeEvent& e) const noexcept;

    /// Insert a pulse at the front, truncating to the cap.
    [[nodiscard]] IngestStatus on_pulse(const PulseEvent& e, TimestampMs now);

    /// Append a released vibe, dropping the oldest beyond the cap.
    void push_released_vibe(ReleasedVibe v);

    /// Remove questions aged ≥ TTL. Returns the number removed.
    std::size_t sweep_expired_questions(TimestampMs now);

    // ── Queries ──────────────────────────────────────────────────────────────

    /// Topics by count descending, ties by first-seen order, at most `n`.
    [[nodiscard]] std::vector<RankedTopic> top_topics(std::size_t n) const;

    /// Aggregate state of a topic, or nullptr if never mentioned.
    [[nodiscard]] const TopicState* topic(std::string_view symbol) const;

    /// Number of distinct topics seen this session.
    [[nodiscard]] std::size_t topic_count() const noexcept { return topics_.size(); }

    /// Questions younger than the TTL at `now`, oldest insertion first.
    [[nodiscard]] std::vector<QuestionEntry> active_questions(TimestampMs now) const;

    /// All retained questions, including expired ones not yet swept.
    [[nodiscard]] const std::deque<QuestionEntry>& questions() const noexcept { return questions_; }

    /// Pulses, newest first.
    [[nodiscard]] const std::deque<PulseEntry>& pulses() const noexcept { return pulses_; }

    /// Released vibes, oldest first.
    [[nodiscard]] const std::deque<ReleasedVibe>& released_vibes() const noexcept { return vibes_; }

    /// Current message rate (prunes the velocity window).
    [[nodiscard]] double current_rate(TimestampMs now) noexcept { return velocity_.current_rate(now); }

    [[nodiscard]] const AggregatorConfig& config() const noexcept { return config_; }

    /// Drop all state (session end).
    void clear() noexcept;

    /// Question de-duplication key: the topic when present, otherwise the
    /// first QUESTION_KEY_PREFIX code points of the text.
    [[nodiscard]] static std::string
    question_key(const std::optional<std::string>& topic, std::string_view text);

private:
    void apply_topic(const std::string& symbol, const MessageEvent& e,
                     Sentiment sentiment, TimestampMs now);
    void apply_question(const MessageEvent& e, TimestampMs now);

    AggregatorConfig                            config_;
    std::unordered_map<std::string, TopicState> topics_;
    std::vector<std::string>                    topic_order_;  ///< first-seen order
    std::deque<QuestionEntry>                   questions_;
    std::deque<PulseEntry>                      pulses_;
    std::deque<ReleasedVibe>                    vibes_;
    velocity::VelocityTracker                   velocity_;
};

} // namespace chatviz::aggregator
