#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace termcoord::text_width {

// Columns taken by one code point (0, 1 or 2)
auto char_width(char32_t code_point) -> std::size_t;

// Columns taken by UTF-8 text, skipping ANSI escape sequences
auto display_width(std::string_view text) -> std::size_t;

// Cut text so it fits in width columns. Escape sequences are copied
// through without counting; a wide character that would straddle the
// limit is dropped.
auto truncate_to_width(std::string_view text, std::size_t width) -> std::string;

auto contains_escape(std::string_view text) -> bool;

// Remove CSI sequences and carriage returns
auto strip_escapes(std::string_view text) -> std::string;

} // namespace termcoord::text_width
