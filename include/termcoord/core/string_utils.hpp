#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace termcoord {

class StringUtils {
public:
    // Split on '\n'; a trailing newline does not produce an empty last line
    static auto split_lines(std::string_view text) -> std::vector<std::string>;

    // Remove trailing "\r" and "\n" characters from an input line
    static auto strip_line_ending(std::string_view line) -> std::string;

    static auto trim(std::string_view text) -> std::string;
    static auto to_lowercase(std::string_view text) -> std::string;
};

} // namespace termcoord
