#pragma once

#include "termcoord/types.hpp"
#include <atomic>
#include <optional>
#include <string_view>

namespace termcoord {

inline constexpr Severity DEFAULT_THRESHOLD = Severity::INFO;

// True iff record >= configured; an unset configured level means INFO
auto should_emit(Severity record, std::optional<Severity> configured) -> bool;

auto severity_threshold(PrintLevel level) -> Severity;
auto severity_name(Severity severity) -> std::string_view;
auto parse_severity(std::string_view text) -> std::optional<Severity>;

// Process-wide threshold shared by every log call path. Set once at
// startup; set_threshold exists for tests.
class LogFilter {
public:
    explicit LogFilter(std::optional<Severity> threshold = std::nullopt);

    auto enabled(Severity record) const -> bool;
    auto threshold() const -> Severity;
    auto set_threshold(Severity threshold) -> void;

private:
    std::atomic<Severity> threshold_;
};

} // namespace termcoord
