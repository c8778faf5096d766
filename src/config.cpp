#include "termcoord/config.hpp"
#include "termcoord/core/log_filter.hpp"
#include "termcoord/core/string_utils.hpp"
#include <cstdlib>

namespace termcoord {

auto print_level_from_flags(int verbose_count, int quiet_count) -> PrintLevel {
    int net = verbose_count - quiet_count;
    if (net <= -2) return PrintLevel::QUIET_QUIET;
    if (net == -1) return PrintLevel::QUIET;
    if (net == 0) return PrintLevel::NORMAL;
    if (net == 1) return PrintLevel::VERBOSE;
    return PrintLevel::VERBOSE_VERBOSE;
}

auto print_level_from_string(std::string_view text) -> PrintLevel {
    if (text == "qq") return PrintLevel::QUIET_QUIET;
    if (text == "q") return PrintLevel::QUIET;
    if (text == "v") return PrintLevel::VERBOSE;
    if (text == "vv") return PrintLevel::VERBOSE_VERBOSE;
    return PrintLevel::NORMAL;
}

auto color_level_from_string(std::string_view text) -> std::optional<ColorLevel> {
    auto value = StringUtils::to_lowercase(StringUtils::trim(text));
    if (value == "always") return ColorLevel::ALWAYS;
    if (value == "never") return ColorLevel::NEVER;
    if (value == "auto") return ColorLevel::AUTO;
    return std::nullopt;
}

auto resolve_prompt_level(std::optional<PromptLevel> configured, const char* ci_value)
    -> PromptLevel {
    if (configured) {
        return *configured;
    }
    if (ci_value) {
        auto value = StringUtils::to_lowercase(StringUtils::trim(ci_value));
        if (value == "true" || value == "1") {
            return PromptLevel::NO;
        }
    }
    return PromptLevel::INTERACTIVE;
}

auto resolve_threshold(PrintLevel level, const char* log_value) -> Severity {
    auto base = severity_threshold(level);
    if (!log_value || *log_value == '\0') {
        return base;
    }
    auto requested = parse_severity(log_value);
    if (requested && static_cast<int>(*requested) < static_cast<int>(base)) {
        return *requested;
    }
    return base;
}

auto apply_environment(OutputConfig config) -> OutputConfig {
    config.prompt = resolve_prompt_level(config.prompt, std::getenv("CI"));
    if (!config.log_threshold) {
        config.log_threshold = resolve_threshold(config.print_level, std::getenv("TERMCOORD_LOG"));
    }
    return config;
}

auto default_max_bars(const TerminalCapabilities& caps) -> std::size_t {
    if (!caps.height) {
        return FALLBACK_MAX_BARS;
    }
    // half the screen, keeping two rows for the prompt and the overflow line
    std::size_t half = *caps.height / 2;
    return half > 2 ? half - 2 : 1;
}

} // namespace termcoord
