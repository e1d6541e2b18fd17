/// @file src/core/event_log.cpp
/// @brief Tab-separated chat event log loader.

#include "chatviz/event_log.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <charconv>
#include <fstream>
#include <sstream>
#include <string>

namespace chatviz::core {

namespace {

constexpr std::string_view ABSENT = "-";

/// Split `line` into exactly `n` tab-separated fields; the last field takes
/// the remainder of the line, tabs included.
///
/// # Returns
/// `false` if the line has fewer than `n` fields.
[[nodiscard]] bool split_fields(std::string_view line, std::size_t n,
                                std::vector<std::string_view>& out) noexcept {
    out.clear();
    while (out.size() + 1 < n) {
        const auto tab = line.find('\t');
        if (tab == std::string_view::npos) {
            return false;
        }
        out.push_back(line.substr(0, tab));
        line.remove_prefix(tab + 1);
    }
    out.push_back(line);
    return true;
}

[[nodiscard]] std::optional<TimestampMs> parse_timestamp(std::string_view s) noexcept {
    TimestampMs t = 0;
    const auto* first = s.data();
    const auto* last  = s.data() + s.size();
    const auto [ptr, ec] = std::from_chars(first, last, t);
    if (ec != std::errc{} || ptr != last || s.empty()) {
        return std::nullopt;
    }
    return t;
}

[[nodiscard]] std::optional<std::string> optional_field(std::string_view s) {
    if (s == ABSENT || s.empty()) {
        return std::nullopt;
    }
    return std::string(s);
}

} // anonymous namespace

// ── EventLog::parse_line ──────────────────────────────────────────────────────

std::optional<TimedEvent> EventLog::parse_line(std::string_view line) noexcept {
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }
    if (line.empty() || line.front() == '#') {
        return std::nullopt;
    }

    std::vector<std::string_view> head;
    if (!split_fields(line, 3, head)) {
        return std::nullopt;
    }
    const auto at = parse_timestamp(head[0]);
    if (!at) {
        return std::nullopt;
    }
    const std::string_view kind = head[1];
    const std::string_view rest = head[2];

    std::vector<std::string_view> f;

    if (kind == "message") {
        // topic, sentiment, author, question flag, text
        if (!split_fields(rest, 5, f)) return std::nullopt;
        if (f[3] != "q" && f[3] != ABSENT) return std::nullopt;
        MessageEvent m{
            .topic       = optional_field(f[0]),
            .sentiment   = parse_sentiment(f[1]),
            .text        = std::string(f[4]),
            .author      = std::string(f[2]),
            .is_question = f[3] == "q",
        };
        return TimedEvent{.at = *at, .event = std::move(m)};
    }

    if (kind == "vibe") {
        // kind, text
        if (!split_fields(rest, 2, f)) return std::nullopt;
        VibeEvent v{
            .kind = parse_vibe_kind(f[0]),
            .text = std::string(f[1]),
        };
        return TimedEvent{.at = *at, .event = std::move(v)};
    }

    if (kind == "pulse") {
        // mood, ticker, summary
        if (!split_fields(rest, 3, f)) return std::nullopt;
        PulseEvent p{
            .summary    = std::string(f[2]),
            .mood       = std::string(f[0]),
            .top_ticker = optional_field(f[1]),
        };
        return TimedEvent{.at = *at, .event = std::move(p)};
    }

    return std::nullopt;
}

// ── EventLog::parse_string ────────────────────────────────────────────────────

std::vector<TimedEvent> EventLog::parse_string(std::string_view content) noexcept {
    std::vector<TimedEvent> events;
    std::size_t late   = 0;
    TimestampMs latest = 0;
    while (!content.empty()) {
        const auto nl = content.find('\n');
        const auto line = content.substr(0, nl);
        if (auto ev = parse_line(line)) {
            if (!events.empty() && ev->at < latest) {
                ++late;
            }
            latest = events.empty() ? ev->at : std::max(latest, ev->at);
            events.push_back(std::move(*ev));
        }
        if (nl == std::string_view::npos) {
            break;
        }
        content.remove_prefix(nl + 1);
    }

    if (late > 0) {
        spdlog::warn("event log: {} line(s) out of timestamp order; replaying in time order",
                     late);
        std::stable_sort(events.begin(), events.end(),
                         [](const TimedEvent& a, const TimedEvent& b) { return a.at < b.at; });
    }
    return events;
}

// ── EventLog::load ────────────────────────────────────────────────────────────

std::optional<std::vector<TimedEvent>> EventLog::load(const std::string& filepath) noexcept {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    return parse_string(contents.str());
}

} // namespace chatviz::core
