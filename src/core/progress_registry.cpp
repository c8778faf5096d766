#include "termcoord/core/progress_registry.hpp"
#include "termcoord/core/progress_format.hpp"
#include <algorithm>
#include <limits>
#include <stdexcept>

namespace termcoord {

namespace {

// position <= total; never overflows for any total
auto percent_of(std::uint64_t position, std::uint64_t total) -> unsigned {
    if (total <= std::numeric_limits<std::uint64_t>::max() / 100) {
        return static_cast<unsigned>(position * 100 / total);
    }
    return static_cast<unsigned>(position / (total / 100));
}

auto subtree_size(ProgressId id,
                  const std::map<ProgressId, std::vector<const ProgressState*>>& children)
    -> std::size_t {
    std::size_t size = 1;
    if (auto it = children.find(id); it != children.end()) {
        for (const auto* child : it->second) {
            size += subtree_size(child->id, children);
        }
    }
    return size;
}

} // namespace

ProgressRegistry::ProgressRegistry(ClockFn clock) : clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return std::chrono::steady_clock::now(); };
    }
}

auto ProgressRegistry::register_indicator(ProgressOptions options) -> ProgressId {
    if (options.parent && !lookup(*options.parent)) {
        options.parent.reset();
    }
    ProgressState state;
    state.id = next_id_++;
    state.order = next_order_++;
    state.options = std::move(options);
    state.started = clock_();
    auto id = state.id;
    active_.emplace(id, std::move(state));
    return id;
}

auto ProgressRegistry::lookup(ProgressId id) -> ProgressState* {
    if (id == 0 || id >= next_id_) {
        throw std::logic_error("progress id " + std::to_string(id) +
                               " was not issued by this registry");
    }
    auto it = active_.find(id);
    return it == active_.end() ? nullptr : &it->second;
}

auto ProgressRegistry::after_move(ProgressState& state) -> bool {
    if (!state.bounded()) {
        return false;
    }
    auto total = *state.options.total;
    state.position = std::min(state.position, total);

    if (milestones_enabled_ && total > 0) {
        auto milestone = percent_of(state.position, total) / 25 * 25;
        if (milestone > state.last_milestone && milestone < 100) {
            state.last_milestone = milestone;
            milestones_.push_back(progress_format::format_milestone_line(state, milestone));
        }
    }

    if (state.options.finish_on_total && state.complete()) {
        return complete_bar(state.id, ProgressOutcome::DONE);
    }
    return false;
}

auto ProgressRegistry::advance(ProgressId id, std::uint64_t delta) -> bool {
    auto* state = lookup(id);
    if (!state) {
        return false;
    }
    constexpr auto max = std::numeric_limits<std::uint64_t>::max();
    state->position = delta > max - state->position ? max : state->position + delta;
    return after_move(*state);
}

auto ProgressRegistry::set_position(ProgressId id, std::uint64_t position) -> bool {
    auto* state = lookup(id);
    if (!state) {
        return false;
    }
    state->position = std::max(state->position, position);
    return after_move(*state);
}

auto ProgressRegistry::reset(ProgressId id) -> void {
    if (auto* state = lookup(id)) {
        state->position = 0;
        state->last_milestone = 0;
        state->started = clock_();
    }
}

auto ProgressRegistry::set_total(ProgressId id, std::uint64_t total) -> bool {
    auto* state = lookup(id);
    if (!state) {
        return false;
    }
    state->options.total = total;
    return after_move(*state);
}

auto ProgressRegistry::set_label(ProgressId id, std::string label) -> void {
    if (auto* state = lookup(id)) {
        state->options.label = std::move(label);
    }
}

auto ProgressRegistry::set_message(ProgressId id, std::string message) -> void {
    if (auto* state = lookup(id)) {
        state->message = std::move(message);
    }
}

auto ProgressRegistry::complete_bar(ProgressId id, ProgressOutcome outcome) -> bool {
    auto it = active_.find(id);
    if (it == active_.end()) {
        return false;
    }
    auto state = std::move(it->second);
    active_.erase(it);
    state.finished = true;
    state.outcome = outcome;
    finished_.push_back(std::move(state));
    return true;
}

auto ProgressRegistry::finish(ProgressId id) -> bool {
    if (!lookup(id)) {
        return false;
    }
    return complete_bar(id, ProgressOutcome::DONE);
}

auto ProgressRegistry::interrupt(ProgressId id) -> bool {
    if (!lookup(id)) {
        return false;
    }
    return complete_bar(id, ProgressOutcome::INTERRUPTED);
}

auto ProgressRegistry::release(ProgressId id) -> bool {
    auto* state = lookup(id);
    if (!state) {
        return false;
    }
    return complete_bar(id, state->complete() ? ProgressOutcome::DONE : ProgressOutcome::INTERRUPTED);
}

auto ProgressRegistry::find(ProgressId id) const -> const ProgressState* {
    auto it = active_.find(id);
    return it == active_.end() ? nullptr : &it->second;
}

auto ProgressRegistry::is_finished(ProgressId id) const -> bool {
    return id != 0 && id < next_id_ && active_.find(id) == active_.end();
}

auto ProgressRegistry::active_ids() const -> std::vector<ProgressId> {
    std::vector<ProgressId> ids;
    ids.reserve(active_.size());
    for (const auto& [id, state] : active_) {
        ids.push_back(id);
    }
    return ids;
}

auto ProgressRegistry::estimate_remaining(const ProgressState& state) const
    -> std::optional<double> {
    if (!state.options.show_eta || !state.bounded() || state.position == 0 || state.complete()) {
        return std::nullopt;
    }
    auto elapsed = std::chrono::duration<double>(clock_() - state.started).count();
    if (elapsed <= 0) {
        return std::nullopt;
    }
    auto remaining = static_cast<double>(*state.options.total - state.position);
    return elapsed * remaining / static_cast<double>(state.position);
}

auto ProgressRegistry::append_children(const ProgressState& parent, const ChildMap& children,
                                       std::string& hierarchy, std::size_t width,
                                       const ansi::Colors& colors,
                                       std::vector<std::string>& lines) const -> void {
    auto it = children.find(parent.id);
    if (it == children.end()) {
        return;
    }
    const auto& kids = it->second;
    auto displayed = std::min(kids.size(), parent.options.max_display_children);
    bool overflow = kids.size() > displayed;

    for (std::size_t i = 0; i < displayed; ++i) {
        const auto& child = *kids[i];
        bool last = i + 1 == displayed && !overflow;
        auto mark = hierarchy.size();
        lines.push_back(progress_format::format_child_line(
            child, hierarchy + (last ? "└ " : "├ "), width, colors, estimate_remaining(child)));
        hierarchy += last ? "  " : "│ ";
        append_children(child, children, hierarchy, width, colors, lines);
        hierarchy.resize(mark);
    }
    if (overflow) {
        lines.push_back(progress_format::format_child_overflow_line(
            hierarchy + "└ ", kids.size() - displayed, colors));
    }
}

auto ProgressRegistry::compute_frame(std::size_t width, std::size_t max_bars,
                                     const ansi::Colors& colors) const -> std::vector<std::string> {
    ChildMap children;
    std::vector<const ProgressState*> roots;
    for (const auto& [id, state] : active_) {
        const auto& parent = state.options.parent;
        if (parent && active_.count(*parent)) {
            children[*parent].push_back(&state);
        } else {
            roots.push_back(&state);
        }
    }

    std::vector<std::string> lines;
    std::size_t shown = 0;
    std::size_t hidden = 0;
    std::string hierarchy;
    for (const auto* root : roots) {
        if (shown == max_bars) {
            hidden += subtree_size(root->id, children);
            continue;
        }
        lines.push_back(progress_format::format_frame_line(*root, width, tick_, colors,
                                                           estimate_remaining(*root)));
        append_children(*root, children, hierarchy, width, colors, lines);
        ++shown;
    }
    if (hidden > 0) {
        lines.push_back(progress_format::format_overflow_line(hidden, colors));
    }
    return lines;
}

auto ProgressRegistry::take_finished() -> std::vector<ProgressState> {
    std::vector<ProgressState> out;
    out.swap(finished_);
    return out;
}

auto ProgressRegistry::take_milestones() -> std::vector<std::string> {
    std::vector<std::string> out;
    out.swap(milestones_);
    return out;
}

auto ProgressRegistry::should_render_now(std::chrono::milliseconds min_interval) const -> bool {
    if (!last_render_) {
        return true;
    }
    return clock_() - *last_render_ >= min_interval;
}

auto ProgressRegistry::mark_rendered() -> void { last_render_ = clock_(); }

} // namespace termcoord
