#pragma once

/// @file include/chatviz/event_log.hpp
/// @brief Loader for recorded chat event logs.
///
/// # Module: EventLog
///
/// ## Responsibility
/// Parse a tab-separated, timestamped log of classified chat events so a
/// session can be replayed through an Engine. Malformed lines are skipped;
/// the loader never crashes on bad input.
///
/// ## Format
/// One event per line; blank lines and lines starting with `#` are ignored.
/// `-` marks an absent optional field. The last field is free text and may
/// contain anything except a newline.
/// ```
/// <t_ms>	message	<topic|->	<sentiment>	<author>	<q|->	<text>
/// <t_ms>	vibe	<funny|uplifting>	<text>
/// <t_ms>	pulse	<mood>	<top_ticker|->	<summary>
/// ```
///
/// ## Guarantees
/// - Never throws; returns `nullopt` on unrecoverable errors
/// - Events come back in timestamp order. Lines with equal timestamps keep
///   file order; a line earlier than one before it is moved into place and
///   reported with a warning

#include "chatviz/events.hpp"
#include "chatviz/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chatviz::core {

/// An event with its arrival time.
struct TimedEvent {
    TimestampMs at;
    ChatEvent   event;
};

class EventLog {
public:
    /// Load events from a log file on disk.
    ///
    /// # Returns
    /// - `nullopt` if the file cannot be opened
    /// - Events of every well-formed line, in timestamp order
    [[nodiscard]] static std::optional<std::vector<TimedEvent>>
    load(const std::string& filepath) noexcept;

    /// Parse events from log text (useful for testing and stdin), stably
    /// sorted by timestamp.
    [[nodiscard]] static std::vector<TimedEvent>
    parse_string(std::string_view content) noexcept;

    /// Parse a single line.
    ///
    /// # Returns
    /// `nullopt` for comments, blank lines and malformed lines.
    [[nodiscard]] static std::optional<TimedEvent>
    parse_line(std::string_view line) noexcept;
};

} // namespace chatviz::core
