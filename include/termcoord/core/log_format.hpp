#pragma once

#include "termcoord/types.hpp"
#include "termcoord/ui/ansi.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace termcoord::log_format {

// Two-column tag printed in front of a record
auto level_tag(const LogRecord& record) -> std::string_view;

// One string per physical line, without trailing newlines. Continuation
// lines of a multi-line message are aligned under the first line's text.
auto format_record(const LogRecord& record, const ansi::Colors& colors) -> std::vector<std::string>;

// "!] text" lines followed by the "-: " input marker (no trailing newline)
auto format_prompt(std::string_view text, const ansi::Colors& colors) -> std::string;

} // namespace termcoord::log_format
