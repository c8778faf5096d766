#pragma once

#include "termcoord/types.hpp"
#include "termcoord/ui/ansi.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace termcoord {

// Active progress indicators plus the render clock. Not synchronized:
// every call happens inside the coordinator's exclusive section.
class ProgressRegistry {
public:
    using TimePoint = std::chrono::steady_clock::time_point;
    using ClockFn = std::function<TimePoint()>;

    explicit ProgressRegistry(ClockFn clock = {});

    // options.parent must name an id this registry issued (std::logic_error
    // otherwise); a parent that already finished leaves the new bar top level
    auto register_indicator(ProgressOptions options) -> ProgressId;

    // Each mutator is a no-op on a finished id and throws std::logic_error
    // on an id this registry never issued. advance and set_position return
    // true when the bar just reached its total and finish_on_total is set.
    auto advance(ProgressId id, std::uint64_t delta) -> bool;
    auto set_position(ProgressId id, std::uint64_t position) -> bool;
    auto reset(ProgressId id) -> void;
    auto set_total(ProgressId id, std::uint64_t total) -> bool;
    auto set_label(ProgressId id, std::string label) -> void;
    auto set_message(ProgressId id, std::string message) -> void;

    // Idempotent; true only for the call that finished the bar
    auto finish(ProgressId id) -> bool;
    auto interrupt(ProgressId id) -> bool;
    // Dropped handle: done when a bounded bar reached its total, else interrupted
    auto release(ProgressId id) -> bool;

    auto find(ProgressId id) const -> const ProgressState*;
    auto is_finished(ProgressId id) const -> bool;
    auto active_ids() const -> std::vector<ProgressId>;
    auto active_count() const -> std::size_t { return active_.size(); }
    auto empty() const -> bool { return active_.empty(); }

    // Display lines in creation order, children under their parent; at most
    // max_bars top-level bars, then an overflow line counting every hidden bar
    auto compute_frame(std::size_t width, std::size_t max_bars, const ansi::Colors& colors) const
        -> std::vector<std::string>;

    // Finished bars waiting for their final line, in finish order
    auto take_finished() -> std::vector<ProgressState>;
    auto has_finished() const -> bool { return !finished_.empty(); }

    // Plain milestone lines queued since the last call
    auto take_milestones() -> std::vector<std::string>;
    auto has_milestones() const -> bool { return !milestones_.empty(); }
    auto set_milestones_enabled(bool enabled) -> void { milestones_enabled_ = enabled; }

    auto should_render_now(std::chrono::milliseconds min_interval) const -> bool;
    auto mark_rendered() -> void;

    // Seconds left at the bar's average rate; nullopt before any progress,
    // at completion, for unbounded bars, or when show_eta is off
    auto estimate_remaining(const ProgressState& state) const -> std::optional<double>;

    auto tick() const -> std::uint64_t { return tick_; }
    auto advance_tick() -> void { ++tick_; }

private:
    using ChildMap = std::map<ProgressId, std::vector<const ProgressState*>>;

    auto append_children(const ProgressState& parent, const ChildMap& children,
                         std::string& hierarchy, std::size_t width, const ansi::Colors& colors,
                         std::vector<std::string>& lines) const -> void;
    auto lookup(ProgressId id) -> ProgressState*;
    auto after_move(ProgressState& state) -> bool;
    auto complete_bar(ProgressId id, ProgressOutcome outcome) -> bool;

    ClockFn clock_;
    std::map<ProgressId, ProgressState> active_;
    std::vector<ProgressState> finished_;
    std::vector<std::string> milestones_;
    ProgressId next_id_ = 1;
    std::uint64_t next_order_ = 0;
    std::uint64_t tick_ = 0;
    std::optional<TimePoint> last_render_;
    bool milestones_enabled_ = false;
};

} // namespace termcoord
