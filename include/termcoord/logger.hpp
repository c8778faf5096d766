#pragma once

#include "termcoord/output_coordinator.hpp"
#include "termcoord/types.hpp"
#include <fmt/format.h>
#include <string>
#include <string_view>
#include <utility>

namespace termcoord {

// Name shown as [name] in every record the calling thread emits
auto set_thread_print_name(std::string name) -> void;
auto clear_thread_print_name() -> void;
auto thread_print_name() -> const std::string&;

// fmt-style front end of the coordinator. Filtered records are never
// formatted.
class Logger {
public:
    explicit Logger(OutputCoordinator& coordinator);

    template <typename... Args>
    auto trace(fmt::format_string<Args...> format, Args&&... args) -> void {
        log(Severity::TRACE, LogKind::NORMAL, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    auto debug(fmt::format_string<Args...> format, Args&&... args) -> void {
        log(Severity::DEBUG, LogKind::NORMAL, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    auto info(fmt::format_string<Args...> format, Args&&... args) -> void {
        log(Severity::INFO, LogKind::NORMAL, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    auto warn(fmt::format_string<Args...> format, Args&&... args) -> void {
        log(Severity::WARN, LogKind::NORMAL, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    auto error(fmt::format_string<Args...> format, Args&&... args) -> void {
        log(Severity::ERROR, LogKind::NORMAL, format, std::forward<Args>(args)...);
    }

    // Shown at every level except the quietest
    template <typename... Args>
    auto print(fmt::format_string<Args...> format, Args&&... args) -> void {
        log(Severity::WARN, LogKind::PRINT, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    auto hint(fmt::format_string<Args...> format, Args&&... args) -> void {
        log(Severity::WARN, LogKind::HINT, format, std::forward<Args>(args)...);
    }

    auto enabled(Severity severity) const -> bool { return coordinator_.enabled(severity); }

    // Unformatted entry point
    auto write(Severity severity, LogKind kind, std::string message) -> void;

private:
    template <typename... Args>
    auto log(Severity severity, LogKind kind, fmt::format_string<Args...> format, Args&&... args)
        -> void {
        if (!coordinator_.enabled(severity)) {
            return;
        }
        write(severity, kind, fmt::format(format, std::forward<Args>(args)...));
    }

    OutputCoordinator& coordinator_;
};

} // namespace termcoord
