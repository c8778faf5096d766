#include "termcoord/core/progress_format.hpp"
#include "termcoord/core/text_width.hpp"
#include <fmt/format.h>
#include <cstdio>

namespace termcoord::progress_format {

namespace {

auto single_line(std::string_view text) -> std::string {
    std::string out(text);
    for (auto& c : out) {
        auto byte = static_cast<unsigned char>(c);
        if (byte < 0x20 || byte == 0x7F) {
            c = ' ';
        }
    }
    return out;
}

auto step_text(const ProgressState& state) -> std::string {
    auto total = state.options.total.value_or(0);
    if (state.options.display_bytes) {
        return format_bytes(state.position) + " / " + format_bytes(total);
    }
    return std::to_string(state.position) + "/" + std::to_string(total);
}

// "label: <tail>" with the separator only when both sides exist
auto join_label(std::string_view label, std::string_view tail) -> std::string {
    std::string out(label);
    if (!label.empty() && !tail.empty()) {
        out += ": ";
    }
    out += tail;
    return out;
}

} // namespace

auto spinner_glyph(std::uint64_t tick) -> std::string_view { return SPINNER[tick % SPINNER.size()]; }

auto format_bytes(std::uint64_t bytes) -> std::string {
    struct Unit {
        std::uint64_t size;
        char suffix;
    };
    static constexpr std::array<Unit, 4> units = {
        Unit{1'000'000'000'000ULL, 'T'}, Unit{1'000'000'000ULL, 'G'}, Unit{1'000'000ULL, 'M'},
        Unit{1'000ULL, 'k'}};
    for (const auto& unit : units) {
        if (bytes >= unit.size) {
            auto whole = bytes / unit.size;
            auto tenth = (bytes % unit.size) * 10 / unit.size;
            return std::to_string(whole) + "." + std::to_string(tenth) + unit.suffix;
        }
    }
    return std::to_string(bytes) + "B";
}

auto format_percentage(std::uint64_t current, std::uint64_t total) -> std::string {
    if (total == 0 || current >= total) {
        return "100%";
    }
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%.2f%%",
                  static_cast<double>(current) * 100.0 / static_cast<double>(total));
    return buffer;
}

auto format_eta(double seconds) -> std::string { return fmt::format("ETA {:.2f}s", seconds); }

auto format_body(const ProgressState& state, std::size_t width, std::optional<double> eta)
    -> std::string {
    switch (width) {
    case 0:
        return "";
    case 1:
        return ".";
    case 2:
        return "..";
    case 3:
        return "...";
    case 4:
        return "[..]";
    default:
        break;
    }

    std::string out;
    if (state.bounded()) {
        auto steps = step_text(state);
        if (steps.size() + 2 > width) {
            return "[" + std::string(width - 2, '.') + "]";
        }
        out += "[" + steps + "]";
    }

    std::string tail;
    if (state.bounded() && state.options.show_percentage) {
        tail += format_percentage(state.position, *state.options.total);
    }
    if (eta) {
        if (!tail.empty()) {
            tail += ' ';
        }
        tail += format_eta(*eta);
    }
    if (!state.message.empty()) {
        if (!tail.empty()) {
            tail += ' ';
        }
        tail += single_line(state.message);
    }

    auto rest = join_label(single_line(state.options.label), tail);
    if (!out.empty() && !rest.empty()) {
        out += ' ';
    }
    out += rest;
    return text_width::truncate_to_width(out, width);
}

auto format_frame_line(const ProgressState& state, std::size_t width, std::uint64_t tick,
                       const ansi::Colors& colors, std::optional<double> eta) -> std::string {
    std::string line;
    line += colors.yellow;
    if (width >= 2) {
        line += spinner_glyph(tick);
        line += ']';
        line += format_body(state, width - 2, eta);
    }
    line += colors.reset;
    return line;
}

auto format_child_line(const ProgressState& state, std::string_view prefix, std::size_t width,
                       const ansi::Colors& colors, std::optional<double> eta) -> std::string {
    auto used = 2 + text_width::display_width(prefix);
    std::string line;
    line += colors.yellow;
    if (width >= used) {
        line += ". ";
        line += prefix;
        line += format_body(state, width - used, eta);
    }
    line += colors.reset;
    return line;
}

auto format_final_line(const ProgressState& state, const ansi::Colors& colors) -> std::string {
    bool done = state.outcome == ProgressOutcome::DONE;
    std::string word = done ? state.options.done_message.value_or("done")
                            : state.options.interrupted_message.value_or("interrupted");

    std::string line;
    line += done ? colors.green : colors.yellow;
    if (state.bounded()) {
        line += "[" + step_text(state) + "]";
        if (!state.options.label.empty() || !word.empty()) {
            line += ' ';
        }
    }
    line += join_label(single_line(state.options.label), word);
    line += colors.reset;
    return line;
}

auto format_milestone_line(const ProgressState& state, unsigned percent) -> std::string {
    std::string line = "[" + step_text(state) + "] ";
    line += join_label(single_line(state.options.label), std::to_string(percent) + "%");
    return line;
}

auto format_overflow_line(std::size_t hidden, const ansi::Colors& colors) -> std::string {
    std::string line;
    line += colors.yellow;
    line += "  ... and " + std::to_string(hidden) + " more";
    line += colors.reset;
    return line;
}

auto format_child_overflow_line(std::string_view prefix, std::size_t hidden,
                                const ansi::Colors& colors) -> std::string {
    std::string line;
    line += colors.yellow;
    line += ". ";
    line += prefix;
    line += "... and " + std::to_string(hidden) + " more";
    line += colors.reset;
    return line;
}

} // namespace termcoord::progress_format
