#pragma once

#include "termcoord/types.hpp"
#include <chrono>
#include <cstddef>
#include <optional>
#include <string_view>

namespace termcoord {

struct OutputConfig {
    PrintLevel print_level = PrintLevel::NORMAL;
    ColorLevel color = ColorLevel::AUTO;
    std::optional<PromptLevel> prompt;           // unset: decided from the CI variable
    std::optional<Severity> log_threshold;       // unset: derived from print_level
    std::chrono::milliseconds min_render_interval{100};
    std::optional<std::size_t> max_bars;         // unset: derived from terminal height
    bool animate = true;                         // background spinner ticker
    std::chrono::milliseconds tick_interval{100};
};

inline constexpr std::size_t FALLBACK_MAX_BARS = 8;

// Net count of -v minus -q flags decides the level
auto print_level_from_flags(int verbose_count, int quiet_count) -> PrintLevel;

// "qq", "q", "v" and "vv"; anything else is NORMAL
auto print_level_from_string(std::string_view text) -> PrintLevel;

auto color_level_from_string(std::string_view text) -> std::optional<ColorLevel>;

// CI=true or CI=1 turns an unset prompt level into NO
auto resolve_prompt_level(std::optional<PromptLevel> configured, const char* ci_value)
    -> PromptLevel;

// A log variable naming a severity lower than the flag-derived threshold wins
auto resolve_threshold(PrintLevel level, const char* log_value) -> Severity;

// Fill the unset fields of config from CI and TERMCOORD_LOG
auto apply_environment(OutputConfig config) -> OutputConfig;

auto default_max_bars(const TerminalCapabilities& caps) -> std::size_t;

} // namespace termcoord
