#include "termcoord/output_coordinator.hpp"
#include "termcoord/core/capabilities.hpp"
#include "termcoord/core/log_filter.hpp"
#include "termcoord/core/log_format.hpp"
#include "termcoord/core/progress_format.hpp"
#include "termcoord/core/text_width.hpp"
#include "termcoord/ui/ansi.hpp"
#include "termcoord/ui/render_surface.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <stdexcept>
#include <thread>

namespace termcoord {

namespace detail {

inline constexpr std::size_t FALLBACK_WIDTH = 80;

struct CoordinatorCore {
    CoordinatorCore(std::unique_ptr<ITerminalDevice> terminal, OutputConfig cfg,
                    ProgressRegistry::ClockFn clock);

    std::unique_ptr<ITerminalDevice> device;
    OutputConfig config;
    TerminalCapabilities caps;
    RenderMode mode;
    ansi::Colors colors;
    PromptLevel prompt_level;
    std::size_t width;
    std::size_t max_bars;
    LogFilter filter;

    // Exclusive section: surface, registry and display state change together
    std::mutex mutex;
    RenderSurface surface;
    ProgressRegistry registry;
    std::size_t displayed_lines = 0;
    bool shut_down = false;
    std::atomic<bool> prompting{false};

    std::mutex ticker_mutex;
    std::condition_variable ticker_cv;
    std::thread ticker;
    bool ticker_stop = false;

    // Require mutex
    auto bars_visible() const -> bool { return config.print_level != PrintLevel::QUIET_QUIET; }
    auto show_final(const ProgressState& state) const -> bool;
    auto check_open() const -> void;
    auto clear_frame() -> void;
    auto draw_frame() -> void;
    auto commit() -> void;
    auto render(bool force) -> void;
    auto write_log(const LogRecord& record) -> void;
    auto close_prompt(bool answered) -> void;

    template <typename Mutation>
    auto mutate(Mutation&& mutation) -> void {
        std::lock_guard<std::mutex> lock(mutex);
        check_open();
        bool finished = mutation(registry);
        render(finished);
    }

    // Take mutex themselves
    auto tick() -> void;
    auto drop(ProgressId id) noexcept -> void;
    auto shutdown() -> void;

    auto start_ticker() -> void;
    auto stop_ticker() -> void;
    auto ticker_loop() -> void;
};

CoordinatorCore::CoordinatorCore(std::unique_ptr<ITerminalDevice> terminal, OutputConfig cfg,
                                 ProgressRegistry::ClockFn clock)
    : device(std::move(terminal)),
      config(std::move(cfg)),
      caps(CapabilityDetector(*device).detect()),
      mode(select_render_mode(caps)),
      colors(ansi::colors(use_color(config.color, mode, caps))),
      prompt_level(resolve_prompt_level(config.prompt, nullptr)),
      width(caps.width.value_or(FALLBACK_WIDTH)),
      max_bars(std::max<std::size_t>(1, config.max_bars.value_or(default_max_bars(caps)))),
      filter(config.log_threshold.value_or(severity_threshold(config.print_level))),
      surface(*device, mode),
      registry(std::move(clock)) {
    registry.set_milestones_enabled(mode == RenderMode::INTERACTIVE_PLAIN && bars_visible());
}

auto CoordinatorCore::show_final(const ProgressState& state) const -> bool {
    if (state.outcome == ProgressOutcome::INTERRUPTED) {
        return config.print_level > PrintLevel::QUIET_QUIET;
    }
    return state.options.keep && config.print_level >= PrintLevel::NORMAL;
}

auto CoordinatorCore::check_open() const -> void {
    if (shut_down) {
        throw std::logic_error("progress handle used after output coordinator shutdown");
    }
}

auto CoordinatorCore::clear_frame() -> void {
    surface.clear_lines(displayed_lines);
    displayed_lines = 0;
}

auto CoordinatorCore::draw_frame() -> void {
    if (!surface.can_redraw() || !bars_visible()) {
        return;
    }
    auto lines = registry.compute_frame(width, max_bars, colors);
    for (const auto& line : lines) {
        surface.write_line(text_width::truncate_to_width(line, width));
    }
    displayed_lines = lines.size();
}

auto CoordinatorCore::commit() -> void {
    if (!surface.flush()) {
        // the frame may or may not be on screen; never erase blindly again
        displayed_lines = 0;
    }
}

auto CoordinatorCore::render(bool force) -> void {
    if (!force && !registry.has_finished() && !registry.has_milestones() &&
        !registry.should_render_now(config.min_render_interval)) {
        return;
    }
    auto finished = registry.take_finished();
    auto milestones = registry.take_milestones();
    registry.mark_rendered();

    if (surface.degraded()) {
        return;
    }

    if (surface.can_redraw() && bars_visible()) {
        registry.advance_tick();
        clear_frame();
        for (const auto& state : finished) {
            if (show_final(state)) {
                surface.write_line(progress_format::format_final_line(state, colors));
            }
        }
        draw_frame();
    } else {
        for (const auto& line : milestones) {
            surface.write_line(line);
        }
        for (const auto& state : finished) {
            if (show_final(state)) {
                surface.write_line(progress_format::format_final_line(state, colors));
            }
        }
    }
    commit();
}

auto CoordinatorCore::write_log(const LogRecord& record) -> void {
    auto lines = log_format::format_record(record, colors);
    clear_frame();
    for (const auto& line : lines) {
        surface.write_line(line);
    }
    draw_frame();
    commit();
}

auto CoordinatorCore::close_prompt(bool answered) -> void {
    // the terminal echoed the user's newline only for an answered prompt
    if (!answered || !caps.is_interactive) {
        surface.write_raw("\n");
    }
    draw_frame();
    commit();
    prompting = false;
}

auto CoordinatorCore::tick() -> void {
    std::lock_guard<std::mutex> lock(mutex);
    if (shut_down || (registry.empty() && !registry.has_finished())) {
        return;
    }
    render(false);
}

auto CoordinatorCore::drop(ProgressId id) noexcept -> void {
    std::lock_guard<std::mutex> lock(mutex);
    if (shut_down) {
        return;
    }
    if (registry.release(id)) {
        render(true);
    }
}

auto CoordinatorCore::shutdown() -> void {
    stop_ticker();
    std::lock_guard<std::mutex> lock(mutex);
    if (shut_down) {
        return;
    }
    for (auto id : registry.active_ids()) {
        registry.release(id);
    }
    render(true);
    shut_down = true;
}

auto CoordinatorCore::start_ticker() -> void {
    std::lock_guard<std::mutex> lock(ticker_mutex);
    if (ticker.joinable() || ticker_stop) {
        return;
    }
    ticker = std::thread([this] { ticker_loop(); });
}

auto CoordinatorCore::stop_ticker() -> void {
    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(ticker_mutex);
        ticker_stop = true;
        worker = std::move(ticker);
    }
    ticker_cv.notify_all();
    if (worker.joinable()) {
        worker.join();
    }
}

auto CoordinatorCore::ticker_loop() -> void {
    std::unique_lock<std::mutex> lock(ticker_mutex);
    while (!ticker_stop) {
        ticker_cv.wait_for(lock, config.tick_interval, [this] { return ticker_stop; });
        if (ticker_stop) {
            break;
        }
        lock.unlock();
        tick();
        lock.lock();
    }
}

} // namespace detail

// ProgressHandle

ProgressHandle::ProgressHandle(std::weak_ptr<detail::CoordinatorCore> core, ProgressId id)
    : core_(std::move(core)), id_(id) {}

ProgressHandle::~ProgressHandle() { release(); }

ProgressHandle::ProgressHandle(ProgressHandle&& other) noexcept
    : core_(std::move(other.core_)), id_(other.id_) {
    other.core_.reset();
    other.id_ = 0;
}

auto ProgressHandle::operator=(ProgressHandle&& other) noexcept -> ProgressHandle& {
    if (this != &other) {
        release();
        core_ = std::move(other.core_);
        id_ = other.id_;
        other.core_.reset();
        other.id_ = 0;
    }
    return *this;
}

auto ProgressHandle::core() const -> std::shared_ptr<detail::CoordinatorCore> {
    if (id_ == 0) {
        throw std::logic_error("empty progress handle");
    }
    auto core = core_.lock();
    if (!core) {
        throw std::logic_error("progress handle used after its output coordinator was destroyed");
    }
    return core;
}

auto ProgressHandle::release() noexcept -> void {
    auto core = core_.lock();
    core_.reset();
    if (core && id_ != 0) {
        core->drop(id_);
    }
    id_ = 0;
}

auto ProgressHandle::advance(std::uint64_t delta) -> void {
    auto id = id_;
    core()->mutate([id, delta](ProgressRegistry& registry) { return registry.advance(id, delta); });
}

auto ProgressHandle::set_position(std::uint64_t position) -> void {
    auto id = id_;
    core()->mutate(
        [id, position](ProgressRegistry& registry) { return registry.set_position(id, position); });
}

auto ProgressHandle::reset() -> void {
    auto id = id_;
    core()->mutate([id](ProgressRegistry& registry) {
        registry.reset(id);
        return false;
    });
}

auto ProgressHandle::set_total(std::uint64_t total) -> void {
    auto id = id_;
    core()->mutate([id, total](ProgressRegistry& registry) { return registry.set_total(id, total); });
}

auto ProgressHandle::set_label(std::string label) -> void {
    auto id = id_;
    core()->mutate([id, &label](ProgressRegistry& registry) {
        registry.set_label(id, std::move(label));
        return false;
    });
}

auto ProgressHandle::set_message(std::string message) -> void {
    auto id = id_;
    core()->mutate([id, &message](ProgressRegistry& registry) {
        registry.set_message(id, std::move(message));
        return false;
    });
}

auto ProgressHandle::finish() -> void {
    auto id = id_;
    core()->mutate([id](ProgressRegistry& registry) { return registry.finish(id); });
}

auto ProgressHandle::is_finished() const -> bool {
    auto c = core();
    std::lock_guard<std::mutex> lock(c->mutex);
    return c->registry.is_finished(id_);
}

// PromptSession

PromptSession::PromptSession(std::shared_ptr<detail::CoordinatorCore> core,
                             std::unique_lock<std::mutex> lock, std::string text,
                             std::size_t saved_display_lines)
    : core_(std::move(core)),
      lock_(std::move(lock)),
      text_(std::move(text)),
      saved_display_lines_(saved_display_lines) {}

PromptSession::PromptSession(PromptSession&& other) noexcept
    : core_(std::move(other.core_)),
      lock_(std::move(other.lock_)),
      text_(std::move(other.text_)),
      saved_display_lines_(other.saved_display_lines_) {}

PromptSession::~PromptSession() {
    if (core_ && lock_.owns_lock()) {
        core_->close_prompt(false);
        lock_.unlock();
    }
}

auto PromptSession::read_line() -> std::optional<std::string> {
    if (!active()) {
        throw std::logic_error("read from a closed prompt session");
    }
    return core_->device->read_line(true);
}

auto PromptSession::read_password() -> std::optional<std::string> {
    if (!active()) {
        throw std::logic_error("read from a closed prompt session");
    }
    return core_->device->read_line(false);
}

// OutputCoordinator

OutputCoordinator::OutputCoordinator(std::unique_ptr<ITerminalDevice> device, OutputConfig config,
                                     ClockFn clock)
    : core_(std::make_shared<detail::CoordinatorCore>(std::move(device), std::move(config),
                                                      std::move(clock))) {}

OutputCoordinator::~OutputCoordinator() { shutdown(); }

auto OutputCoordinator::capabilities() const -> const TerminalCapabilities& { return core_->caps; }

auto OutputCoordinator::render_mode() const -> RenderMode { return core_->mode; }

auto OutputCoordinator::config() const -> const OutputConfig& { return core_->config; }

auto OutputCoordinator::prompt_level() const -> PromptLevel { return core_->prompt_level; }

auto OutputCoordinator::colors_enabled() const -> bool { return !core_->colors.reset.empty(); }

auto OutputCoordinator::enabled(Severity severity) const -> bool {
    return core_->filter.enabled(severity);
}

auto OutputCoordinator::threshold() const -> Severity { return core_->filter.threshold(); }

auto OutputCoordinator::set_threshold(Severity threshold) -> void {
    core_->filter.set_threshold(threshold);
}

auto OutputCoordinator::emit_log(const LogRecord& record) -> void {
    // filtered records never enter the exclusive section
    if (!core_->filter.enabled(record.severity)) {
        return;
    }
    std::lock_guard<std::mutex> lock(core_->mutex);
    core_->write_log(record);
}

auto OutputCoordinator::tick_render() -> void { core_->tick(); }

auto OutputCoordinator::create_progress(ProgressOptions options) -> ProgressHandle {
    ProgressId id = 0;
    {
        std::lock_guard<std::mutex> lock(core_->mutex);
        core_->check_open();
        id = core_->registry.register_indicator(std::move(options));
    }
    if (core_->config.animate && core_->mode == RenderMode::INTERACTIVE_ANSI &&
        core_->bars_visible()) {
        core_->start_ticker();
    }
    return ProgressHandle(core_, id);
}

auto OutputCoordinator::create_child(const ProgressHandle& parent, ProgressOptions options)
    -> ProgressHandle {
    check_owner(parent);
    options.parent = parent.id();
    return create_progress(std::move(options));
}

auto OutputCoordinator::check_owner(const ProgressHandle& handle) const -> void {
    if (handle.core_.lock() != core_) {
        throw std::logic_error("progress handle belongs to a different output coordinator");
    }
}

auto OutputCoordinator::advance(ProgressHandle& handle, std::uint64_t delta) -> void {
    check_owner(handle);
    handle.advance(delta);
}

auto OutputCoordinator::set_label(ProgressHandle& handle, std::string label) -> void {
    check_owner(handle);
    handle.set_label(std::move(label));
}

auto OutputCoordinator::finish(ProgressHandle& handle) -> void {
    check_owner(handle);
    handle.finish();
}

auto OutputCoordinator::snapshot(const ProgressHandle& handle) const
    -> std::optional<ProgressState> {
    check_owner(handle);
    std::lock_guard<std::mutex> lock(core_->mutex);
    if (const auto* state = core_->registry.find(handle.id())) {
        return *state;
    }
    return std::nullopt;
}

auto OutputCoordinator::active_progress_count() const -> std::size_t {
    std::lock_guard<std::mutex> lock(core_->mutex);
    return core_->registry.active_count();
}

auto OutputCoordinator::begin_prompt(std::string_view text) -> PromptSession {
    std::unique_lock<std::mutex> lock(core_->mutex);
    auto saved = core_->displayed_lines;
    core_->clear_frame();
    core_->surface.write_raw(log_format::format_prompt(text, core_->colors));
    core_->commit();
    core_->prompting = true;
    return PromptSession(core_, std::move(lock), std::string(text), saved);
}

auto OutputCoordinator::end_prompt(PromptSession& session, const std::optional<std::string>& input)
    -> void {
    if (session.core_ != core_) {
        throw std::logic_error("prompt session belongs to a different output coordinator");
    }
    if (!session.active()) {
        return;
    }
    core_->close_prompt(input.has_value());
    session.lock_.unlock();
}

auto OutputCoordinator::prompt_state() const -> PromptState {
    return core_->prompting ? PromptState::PROMPTING : PromptState::IDLE;
}

auto OutputCoordinator::display_lines() const -> std::size_t {
    std::lock_guard<std::mutex> lock(core_->mutex);
    return core_->displayed_lines;
}

auto OutputCoordinator::degraded() const -> bool {
    std::lock_guard<std::mutex> lock(core_->mutex);
    return core_->surface.degraded();
}

auto OutputCoordinator::shutdown() -> void { core_->shutdown(); }

} // namespace termcoord
