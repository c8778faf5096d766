#include "termcoord/ui/render_surface.hpp"
#include "termcoord/ui/ansi.hpp"

namespace termcoord {

RenderSurface::RenderSurface(ITerminalDevice& device, RenderMode mode)
    : device_(device), mode_(mode) {}

auto RenderSurface::clear_lines(std::size_t count) -> void {
    if (count == 0 || !can_redraw()) {
        return;
    }
    for (std::size_t i = 0; i < count; ++i) {
        buffer_ += ansi::CURSOR_UP;
        buffer_ += ansi::ERASE_LINE;
    }
    buffer_ += '\r';
}

auto RenderSurface::write_line(std::string_view text) -> void {
    buffer_ += text;
    buffer_ += '\n';
}

auto RenderSurface::write_raw(std::string_view text) -> void { buffer_ += text; }

auto RenderSurface::flush() -> bool {
    if (buffer_.empty()) {
        return !degraded_;
    }
    bool ok = device_.write(buffer_);
    buffer_.clear();
    if (!ok) {
        degraded_ = true;
    }
    return ok;
}

} // namespace termcoord
