#include "termcoord/logger.hpp"

namespace termcoord {

namespace {
thread_local std::string t_print_name;
}

auto set_thread_print_name(std::string name) -> void { t_print_name = std::move(name); }

auto clear_thread_print_name() -> void { t_print_name.clear(); }

auto thread_print_name() -> const std::string& { return t_print_name; }

Logger::Logger(OutputCoordinator& coordinator) : coordinator_(coordinator) {}

auto Logger::write(Severity severity, LogKind kind, std::string message) -> void {
    coordinator_.emit_log(LogRecord{.severity = severity,
                                    .kind = kind,
                                    .message = std::move(message),
                                    .thread_name = t_print_name});
}

} // namespace termcoord
