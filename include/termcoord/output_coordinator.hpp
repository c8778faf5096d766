#pragma once

#include "termcoord/config.hpp"
#include "termcoord/core/progress_registry.hpp"
#include "termcoord/interfaces.hpp"
#include "termcoord/types.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace termcoord {

namespace detail {
struct CoordinatorCore;
}

// Caller-side handle of one progress indicator. Single writer: only the
// thread that owns the handle mutates it. Dropping an unfinished handle
// interrupts the bar (or marks it done when it already reached its total).
class ProgressHandle {
public:
    ProgressHandle() = default;
    ~ProgressHandle();

    ProgressHandle(ProgressHandle&& other) noexcept;
    auto operator=(ProgressHandle&& other) noexcept -> ProgressHandle&;
    ProgressHandle(const ProgressHandle&) = delete;
    auto operator=(const ProgressHandle&) -> ProgressHandle& = delete;

    // Every operation throws std::logic_error on an empty handle or once the
    // owning coordinator has been shut down or destroyed
    auto advance(std::uint64_t delta = 1) -> void;
    auto set_position(std::uint64_t position) -> void;
    auto reset() -> void;
    auto set_total(std::uint64_t total) -> void;
    auto set_label(std::string label) -> void;
    auto set_message(std::string message) -> void;
    auto finish() -> void;

    auto id() const -> ProgressId { return id_; }
    auto is_finished() const -> bool;

private:
    friend class OutputCoordinator;
    ProgressHandle(std::weak_ptr<detail::CoordinatorCore> core, ProgressId id);

    auto core() const -> std::shared_ptr<detail::CoordinatorCore>;
    auto release() noexcept -> void;

    std::weak_ptr<detail::CoordinatorCore> core_;
    ProgressId id_ = 0;
};

// One in-flight prompt. Holds the coordinator's exclusive section from
// begin_prompt until end_prompt or destruction, so it must stay on the
// thread that created it. Destroying an open session restores the display
// as a cancelled prompt.
class PromptSession {
public:
    ~PromptSession();
    PromptSession(PromptSession&& other) noexcept;
    auto operator=(PromptSession&&) -> PromptSession& = delete;
    PromptSession(const PromptSession&) = delete;
    auto operator=(const PromptSession&) -> PromptSession& = delete;

    auto read_line() -> std::optional<std::string>;
    auto read_password() -> std::optional<std::string>;

    auto active() const -> bool { return lock_.owns_lock(); }
    auto text() const -> const std::string& { return text_; }
    // Progress lines that were on screen when the prompt started
    auto saved_display_lines() const -> std::size_t { return saved_display_lines_; }

private:
    friend class OutputCoordinator;
    PromptSession(std::shared_ptr<detail::CoordinatorCore> core, std::unique_lock<std::mutex> lock,
                  std::string text, std::size_t saved_display_lines);

    std::shared_ptr<detail::CoordinatorCore> core_;
    std::unique_lock<std::mutex> lock_;
    std::string text_;
    std::size_t saved_display_lines_ = 0;
};

// Serializes every write to the terminal: log records, progress redraws and
// prompts are totally ordered by one exclusive section. Construct one per
// process and pass it by reference to whatever needs to print.
//
// Threads that log or advance bars while a prompt is open block until the
// prompt resolves; nothing is dropped.
class OutputCoordinator {
public:
    using ClockFn = ProgressRegistry::ClockFn;

    explicit OutputCoordinator(std::unique_ptr<ITerminalDevice> device, OutputConfig config = {},
                               ClockFn clock = {});
    ~OutputCoordinator();

    OutputCoordinator(const OutputCoordinator&) = delete;
    auto operator=(const OutputCoordinator&) -> OutputCoordinator& = delete;

    auto capabilities() const -> const TerminalCapabilities&;
    auto render_mode() const -> RenderMode;
    auto config() const -> const OutputConfig&;
    auto prompt_level() const -> PromptLevel;
    auto colors_enabled() const -> bool;

    // Log filter check; cheap and lock free
    auto enabled(Severity severity) const -> bool;
    auto threshold() const -> Severity;
    auto set_threshold(Severity threshold) -> void;

    auto emit_log(const LogRecord& record) -> void;

    // Redraw the progress frame if the render interval has elapsed
    auto tick_render() -> void;

    auto create_progress(ProgressOptions options) -> ProgressHandle;
    // Bar drawn under parent while parent is active; throws std::logic_error
    // when parent is empty or belongs to another coordinator. The child keeps
    // its own lifecycle and moves to the top level once parent finishes.
    auto create_child(const ProgressHandle& parent, ProgressOptions options) -> ProgressHandle;

    // Registry-style entry points; throw std::logic_error when the handle
    // belongs to another coordinator
    auto advance(ProgressHandle& handle, std::uint64_t delta) -> void;
    auto set_label(ProgressHandle& handle, std::string label) -> void;
    auto finish(ProgressHandle& handle) -> void;
    auto snapshot(const ProgressHandle& handle) const -> std::optional<ProgressState>;
    auto active_progress_count() const -> std::size_t;

    // Blocks until no other prompt is open, then keeps the exclusive
    // section until end_prompt
    auto begin_prompt(std::string_view text) -> PromptSession;
    // input == nullopt means the prompt was cancelled
    auto end_prompt(PromptSession& session, const std::optional<std::string>& input) -> void;
    auto prompt_state() const -> PromptState;

    // Lines currently occupied by the progress frame
    auto display_lines() const -> std::size_t;
    auto degraded() const -> bool;

    // Final forced render of every remaining bar; idempotent
    auto shutdown() -> void;

private:
    auto check_owner(const ProgressHandle& handle) const -> void;

    std::shared_ptr<detail::CoordinatorCore> core_;
};

} // namespace termcoord
