#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>

namespace termcoord {

// Severity of a log record, lowest first
enum class Severity {
    TRACE,
    DEBUG,
    INFO,
    WARN,
    ERROR
};

// How a record is tagged on screen
enum class LogKind {
    NORMAL,  // tag follows severity (*] D] I] W] E])
    HINT,    // H]
    PRINT    // ::
};

struct LogRecord {
    Severity severity = Severity::INFO;
    LogKind kind = LogKind::NORMAL;
    std::string message;
    std::string thread_name;  // empty: no [name] segment
};

// Print level settable with -v and -q flags
enum class PrintLevel {
    QUIET_QUIET,
    QUIET,
    NORMAL,
    VERBOSE,
    VERBOSE_VERBOSE
};

// Color level settable with --color
enum class ColorLevel {
    ALWAYS,
    NEVER,
    AUTO
};

// Prompt level set with --yes, --interactive and --non-interactive
enum class PromptLevel {
    INTERACTIVE,  // show prompts
    YES,          // answer yes/no prompts with yes, show the rest
    NO            // refuse every prompt
};

struct TerminalSize {
    unsigned width = 0;
    unsigned height = 0;
};

struct TerminalCapabilities {
    bool is_interactive = false;
    bool supports_ansi = false;
    bool supports_color = false;
    std::optional<unsigned> width;
    std::optional<unsigned> height;
};

// Rendering strategy, chosen once from the capabilities
enum class RenderMode {
    INTERACTIVE_ANSI,   // redraw bars in place with cursor movement
    INTERACTIVE_PLAIN,  // terminal without escape support: milestone lines
    NON_INTERACTIVE     // pipe or file: silent tracking, final lines only
};

using ProgressId = std::uint64_t;

enum class ProgressOutcome {
    ACTIVE,
    DONE,
    INTERRUPTED
};

struct ProgressOptions {
    std::string label;
    std::optional<std::uint64_t> total;  // unset: indeterminate spinner
    bool show_percentage = true;
    bool display_bytes = false;
    bool keep = true;                    // print a done line when finished
    bool finish_on_total = true;
    std::optional<std::string> done_message;
    std::optional<std::string> interrupted_message;
    bool show_eta = true;                // bounded bars only, once progress was made
    std::optional<ProgressId> parent;    // drawn under this bar while it is active
    std::size_t max_display_children = std::numeric_limits<std::size_t>::max();
};

struct ProgressState {
    ProgressId id = 0;
    std::uint64_t order = 0;
    ProgressOptions options;
    std::string message;
    std::uint64_t position = 0;
    bool finished = false;
    ProgressOutcome outcome = ProgressOutcome::ACTIVE;
    unsigned last_milestone = 0;  // percent, multiple of 25
    std::chrono::steady_clock::time_point started;  // registration or last reset

    auto bounded() const -> bool { return options.total.has_value(); }
    auto complete() const -> bool { return bounded() && position >= *options.total; }
};

enum class PromptState {
    IDLE,
    PROMPTING
};

enum class PromptStatus {
    ANSWERED,
    NO_INPUT,     // input stream closed before a line was read
    NOT_ALLOWED   // prompting disabled by PromptLevel::NO
};

struct PromptResult {
    PromptStatus status = PromptStatus::NO_INPUT;
    std::string text;

    auto answered() const -> bool { return status == PromptStatus::ANSWERED; }
};

} // namespace termcoord
