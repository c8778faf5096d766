#include "termcoord/core/log_filter.hpp"
#include "termcoord/core/string_utils.hpp"

namespace termcoord {

auto should_emit(Severity record, std::optional<Severity> configured) -> bool {
    return static_cast<int>(record) >= static_cast<int>(configured.value_or(DEFAULT_THRESHOLD));
}

auto severity_threshold(PrintLevel level) -> Severity {
    switch (level) {
    case PrintLevel::QUIET_QUIET:
        return Severity::ERROR;
    case PrintLevel::QUIET:
        return Severity::WARN;
    case PrintLevel::NORMAL:
        return Severity::INFO;
    case PrintLevel::VERBOSE:
        return Severity::DEBUG;
    case PrintLevel::VERBOSE_VERBOSE:
        return Severity::TRACE;
    }
    return DEFAULT_THRESHOLD;
}

auto severity_name(Severity severity) -> std::string_view {
    switch (severity) {
    case Severity::TRACE:
        return "trace";
    case Severity::DEBUG:
        return "debug";
    case Severity::INFO:
        return "info";
    case Severity::WARN:
        return "warn";
    case Severity::ERROR:
        return "error";
    }
    return "info";
}

auto parse_severity(std::string_view text) -> std::optional<Severity> {
    auto name = StringUtils::to_lowercase(StringUtils::trim(text));
    if (name == "trace") return Severity::TRACE;
    if (name == "debug") return Severity::DEBUG;
    if (name == "info") return Severity::INFO;
    if (name == "warn" || name == "warning") return Severity::WARN;
    if (name == "error") return Severity::ERROR;
    return std::nullopt;
}

LogFilter::LogFilter(std::optional<Severity> threshold)
    : threshold_(threshold.value_or(DEFAULT_THRESHOLD)) {}

auto LogFilter::enabled(Severity record) const -> bool {
    return should_emit(record, threshold_.load(std::memory_order_relaxed));
}

auto LogFilter::threshold() const -> Severity { return threshold_.load(std::memory_order_relaxed); }

auto LogFilter::set_threshold(Severity threshold) -> void {
    threshold_.store(threshold, std::memory_order_relaxed);
}

} // namespace termcoord
