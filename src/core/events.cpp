/// @file src/core/events.cpp
/// @brief Event validation, wire-label parsing and enum conversions.

#include "chatviz/events.hpp"
#include "chatviz/types.hpp"

#include <algorithm>
#include <cctype>

namespace chatviz {

// ─── Internal helpers ────────────────────────────────────────────────────────

namespace {

/// ASCII case-insensitive equality; labels on the wire are plain ASCII.
[[nodiscard]] bool iequals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    return std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
        return std::tolower(static_cast<unsigned char>(x)) ==
               std::tolower(static_cast<unsigned char>(y));
    });
}

/// Strip surrounding ASCII whitespace.
[[nodiscard]] std::string_view trim(std::string_view s) noexcept {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

} // anonymous namespace

// ─── Enum strings ────────────────────────────────────────────────────────────

std::string_view to_string(Sentiment s) noexcept {
    switch (s) {
        case Sentiment::Bullish: return "bullish";
        case Sentiment::Bearish: return "bearish";
        case Sentiment::Neutral: return "neutral";
    }
    return "neutral";
}

std::string_view to_string(VibeKind k) noexcept {
    switch (k) {
        case VibeKind::Funny:     return "funny";
        case VibeKind::Uplifting: return "uplifting";
    }
    return "funny";
}

std::string_view to_string(VelocityBand b) noexcept {
    switch (b) {
        case VelocityBand::Quiet:  return "quiet";
        case VelocityBand::Active: return "active";
        case VelocityBand::Busy:   return "busy";
        case VelocityBand::Hype:   return "hype";
    }
    return "quiet";
}

std::string_view to_string(Lean l) noexcept {
    switch (l) {
        case Lean::Neutral:   return "neutral";
        case Lean::Bullish:   return "bullish";
        case Lean::Bearish:   return "bearish";
        case Lean::Contested: return "contested";
    }
    return "neutral";
}

const char* to_string(IngestStatus s) noexcept {
    switch (s) {
        case IngestStatus::Accepted:        return "accepted";
        case IngestStatus::MissingText:     return "missing text";
        case IngestStatus::MissingSummary:  return "missing summary";
        case IngestStatus::UnknownVibeKind: return "unknown vibe kind";
    }
    return "unknown";
}

// ─── Colours ─────────────────────────────────────────────────────────────────

Rgb color_for(Lean l) noexcept {
    switch (l) {
        case Lean::Bullish:   return Rgb{0x22c55e};
        case Lean::Bearish:   return Rgb{0xef4444};
        case Lean::Contested: return Rgb{0xf59e0b};
        case Lean::Neutral:   return Rgb{0x64748b};
    }
    return Rgb{0x64748b};
}

Rgb color_for(VibeKind k) noexcept {
    return k == VibeKind::Funny ? Rgb{0x9333ea} : Rgb{0xec4899};
}

// ─── Wire labels ─────────────────────────────────────────────────────────────

std::optional<Sentiment> parse_sentiment(std::string_view label) noexcept {
    const auto t = trim(label);
    if (iequals(t, "bullish")) return Sentiment::Bullish;
    if (iequals(t, "bearish")) return Sentiment::Bearish;
    if (iequals(t, "neutral")) return Sentiment::Neutral;
    return std::nullopt;
}

std::optional<VibeKind> parse_vibe_kind(std::string_view label) noexcept {
    const auto t = trim(label);
    if (iequals(t, "funny"))     return VibeKind::Funny;
    if (iequals(t, "uplifting")) return VibeKind::Uplifting;
    return std::nullopt;
}

// ─── Validation ──────────────────────────────────────────────────────────────

IngestStatus validate(const MessageEvent& e) noexcept {
    if (e.text.empty()) {
        return IngestStatus::MissingText;
    }
    return IngestStatus::Accepted;
}

IngestStatus validate(const VibeEvent& e) noexcept {
    if (!e.kind) {
        return IngestStatus::UnknownVibeKind;
    }
    if (e.text.empty()) {
        return IngestStatus::MissingText;
    }
    return IngestStatus::Accepted;
}

IngestStatus validate(const PulseEvent& e) noexcept {
    if (e.summary.empty()) {
        return IngestStatus::MissingSummary;
    }
    return IngestStatus::Accepted;
}

IngestStatus validate(const ChatEvent& e) noexcept {
    return std::visit([](const auto& payload) { return validate(payload); }, e);
}

} // namespace chatviz
