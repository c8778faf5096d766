#pragma once

#include <string_view>

namespace termcoord::ansi {

struct Colors {
    std::string_view reset;
    std::string_view yellow;
    std::string_view red;
    std::string_view gray;
    std::string_view magenta;
    std::string_view cyan;
    std::string_view green;
};

inline constexpr Colors COLOR{
    .reset = "\x1b[0m",
    .yellow = "\x1b[1;33m",
    .red = "\x1b[1;31m",
    .gray = "\x1b[1;30m",
    .magenta = "\x1b[1;35m",
    .cyan = "\x1b[1;36m",
    .green = "\x1b[1;32m",
};

inline constexpr Colors NO_COLOR{};

constexpr auto colors(bool use_color) -> Colors { return use_color ? COLOR : NO_COLOR; }

inline constexpr std::string_view ESCAPE = "\x1b";
inline constexpr std::string_view CURSOR_UP = "\x1b[1A";
inline constexpr std::string_view ERASE_LINE = "\x1b[2K";

} // namespace termcoord::ansi
