#pragma once

/// @file include/chatviz/events.hpp
/// @brief Inbound event contract of the chatviz engine.
///
/// # Module: Events
///
/// ## Responsibility
/// Define the three typed payloads produced by the upstream classifier and the
/// closed `ChatEvent` variant that carries them into the engine. Wire labels
/// (sentiment, vibe kind) are normalised here so that no "unknown" value ever
/// reaches aggregate state.
///
/// ## Validation Rules
///   - MessageEvent: `text` must be non-empty. An empty `topic` is treated as
///     absent. A missing or unrecognised sentiment is stored as Neutral.
///   - VibeEvent:    `kind` must be recognised and `text` non-empty.
///   - PulseEvent:   `summary` must be non-empty. An empty `top_ticker` is
///     treated as absent.
///
/// ## Guarantees
/// - All functions are `noexcept`; invalid input yields an `IngestStatus`
///   rejection code, never an exception.

#include "chatviz/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace chatviz {

// ─── Payloads ────────────────────────────────────────────────────────────────

/// A classified chat line.
struct MessageEvent {
    std::optional<std::string> topic;      ///< Ticker/topic symbol, if any
    std::optional<Sentiment>   sentiment;  ///< nullopt = absent or unrecognised
    std::string                text;       ///< Raw message text (required)
    std::string                author;     ///< Display name of the sender
    bool                       is_question = false;
};

/// A short qualitative reaction selected by the upstream vibe pass.
struct VibeEvent {
    std::optional<VibeKind> kind;  ///< nullopt = unrecognised (rejected)
    std::string             text;
};

/// A periodic AI summary of recent chat.
struct PulseEvent {
    std::string                summary;
    std::string                mood;
    std::optional<std::string> top_ticker;
};

/// Closed set of inbound event kinds.
using ChatEvent = std::variant<MessageEvent, VibeEvent, PulseEvent>;

// ─── Vibe Items ──────────────────────────────────────────────────────────────

/// A vibe waiting in the pacer queue.
struct QueuedVibe {
    std::string text;
    VibeKind    kind;
    TimestampMs queued_at;
};

/// A vibe released to the consumer by the pacer.
struct ReleasedVibe {
    std::string text;
    VibeKind    kind;
    TimestampMs released_at;
};

// ─── IngestStatus ────────────────────────────────────────────────────────────

/// Outcome of offering an event to the engine.
enum class IngestStatus {
    Accepted,
    MissingText,      ///< message or vibe without text
    MissingSummary,   ///< pulse without summary
    UnknownVibeKind,  ///< vibe kind absent or unrecognised
};

/// Convert IngestStatus to a human-readable string.
[[nodiscard]] const char* to_string(IngestStatus s) noexcept;

// ─── Wire Label Parsing ──────────────────────────────────────────────────────

/// Parse a sentiment label ("bullish", "bearish", "neutral"; case-insensitive).
///
/// # Returns
/// The sentiment, or `nullopt` for any other label. Callers store `nullopt`
/// as Neutral.
[[nodiscard]] std::optional<Sentiment> parse_sentiment(std::string_view label) noexcept;

/// Parse a vibe kind label ("funny", "uplifting"; case-insensitive).
[[nodiscard]] std::optional<VibeKind> parse_vibe_kind(std::string_view label) noexcept;

// ─── Validation ──────────────────────────────────────────────────────────────

[[nodiscard]] IngestStatus validate(const MessageEvent& e) noexcept;
[[nodiscard]] IngestStatus validate(const VibeEvent& e) noexcept;
[[nodiscard]] IngestStatus validate(const PulseEvent& e) noexcept;

/// Dispatch to the validator of the held alternative.
[[nodiscard]] IngestStatus validate(const ChatEvent& e) noexcept;

} // namespace chatviz
