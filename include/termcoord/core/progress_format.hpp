#pragma once

#include "termcoord/types.hpp"
#include "termcoord/ui/ansi.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace termcoord::progress_format {

inline constexpr std::array<std::string_view, 6> SPINNER = {
    "⠋", "⠙", "⠸", "⠴", "⠦", "⠇"};

// Keyed off the render tick, never the wall clock
auto spinner_glyph(std::uint64_t tick) -> std::string_view;

// 1.5k, 3.0M, 512B
auto format_bytes(std::uint64_t bytes) -> std::string;

// "100%" exactly at completion, otherwise two decimals
auto format_percentage(std::uint64_t current, std::uint64_t total) -> std::string;

// "ETA 32.35s"
auto format_eta(double seconds) -> std::string;

// "[3/10] build: 30.00% ETA 1.50s message", fitted to width columns. Control
// characters in the label and message render as spaces so the body stays on
// one terminal row.
auto format_body(const ProgressState& state, std::size_t width,
                 std::optional<double> eta = std::nullopt) -> std::string;

// Animated frame line: spinner, "]", then the body
auto format_frame_line(const ProgressState& state, std::size_t width, std::uint64_t tick,
                       const ansi::Colors& colors, std::optional<double> eta = std::nullopt)
    -> std::string;

// Child bar drawn under its parent: ". ", the tree prefix ("├ ", "│ └ "), the body
auto format_child_line(const ProgressState& state, std::string_view prefix, std::size_t width,
                       const ansi::Colors& colors, std::optional<double> eta = std::nullopt)
    -> std::string;

// Line printed once when a bar leaves the registry: "[10/10] build: done"
auto format_final_line(const ProgressState& state, const ansi::Colors& colors) -> std::string;

// Plain line for a crossed 25/50/75 percent boundary
auto format_milestone_line(const ProgressState& state, unsigned percent) -> std::string;

auto format_overflow_line(std::size_t hidden, const ansi::Colors& colors) -> std::string;

// ". │ └ ... and 3 more" under a parent showing max_display_children children
auto format_child_overflow_line(std::string_view prefix, std::size_t hidden,
                                const ansi::Colors& colors) -> std::string;

} // namespace termcoord::progress_format
