#pragma once

/// @file src/aggregator/utf8.hpp
/// @brief Code-point aware truncation of UTF-8 text.

#include <cstddef>
#include <string_view>

namespace chatviz::aggregator::detail {

/// Return the longest prefix of `text` holding at most `max_code_points`
/// UTF-8 code points. A truncated multi-byte sequence is never emitted;
/// invalid lead bytes count as one code point each.
[[nodiscard]] inline std::string_view
utf8_prefix(std::string_view text, std::size_t max_code_points) noexcept {
    std::size_t pos = 0;
    std::size_t cps = 0;
    while (pos < text.size() && cps < max_code_points) {
        const auto lead = static_cast<unsigned char>(text[pos]);
        std::size_t len = 1;
        if      ((lead & 0xE0u) == 0xC0u) len = 2;
        else if ((lead & 0xF0u) == 0xE0u) len = 3;
        else if ((lead & 0xF8u) == 0xF0u) len = 4;

        if (pos + len > text.size()) {
            break;  // incomplete trailing sequence
        }
        pos += len;
        ++cps;
    }
    return text.substr(0, pos);
}

} // namespace chatviz::aggregator::detail
