#pragma once

#include "termcoord/interfaces.hpp"
#include "termcoord/types.hpp"
#include <cstddef>
#include <string>
#include <string_view>

namespace termcoord {

// The terminal's single cursor. Bytes are batched and reach the device in
// one write per flush(). Every call must be made from inside the
// coordinator's exclusive section.
class RenderSurface {
public:
    RenderSurface(ITerminalDevice& device, RenderMode mode);

    RenderSurface(const RenderSurface&) = delete;
    auto operator=(const RenderSurface&) -> RenderSurface& = delete;

    // Erase the count lines above the cursor. No-op outside
    // INTERACTIVE_ANSI and once degraded.
    auto clear_lines(std::size_t count) -> void;
    auto write_line(std::string_view text) -> void;
    auto write_raw(std::string_view text) -> void;

    // False on a failed write; the first failure degrades the surface for good
    auto flush() -> bool;

    auto degraded() const -> bool { return degraded_; }
    auto mode() const -> RenderMode { return mode_; }
    auto can_redraw() const -> bool { return mode_ == RenderMode::INTERACTIVE_ANSI && !degraded_; }
    auto pending() const -> std::string_view { return buffer_; }

private:
    ITerminalDevice& device_;
    RenderMode mode_;
    std::string buffer_;
    bool degraded_ = false;
};

} // namespace termcoord
