#include "termcoord/core/capabilities.hpp"
#include <algorithm>

namespace termcoord {

auto probe_capabilities(ITerminalDevice& device) -> TerminalCapabilities {
    TerminalCapabilities caps;
    caps.is_interactive = device.is_terminal();
    if (!caps.is_interactive) {
        return caps;
    }

    auto term = device.term_name();
    caps.supports_ansi = !term.empty() && term != "dumb";
    caps.supports_color = caps.supports_ansi && device.supports_color();

    if (auto size = device.size()) {
        if (size->width > 0) {
            caps.width = std::min(size->width, MAX_TERMINAL_EXTENT);
        }
        if (size->height > 0) {
            caps.height = std::min(size->height, MAX_TERMINAL_EXTENT);
        }
    }
    return caps;
}

auto select_render_mode(const TerminalCapabilities& caps) -> RenderMode {
    if (!caps.is_interactive) {
        return RenderMode::NON_INTERACTIVE;
    }
    return caps.supports_ansi ? RenderMode::INTERACTIVE_ANSI : RenderMode::INTERACTIVE_PLAIN;
}

auto use_color(ColorLevel level, RenderMode mode, const TerminalCapabilities& caps) -> bool {
    if (mode == RenderMode::NON_INTERACTIVE) {
        return false;
    }
    switch (level) {
    case ColorLevel::ALWAYS:
        return true;
    case ColorLevel::NEVER:
        return false;
    case ColorLevel::AUTO:
        return caps.supports_color;
    }
    return false;
}

CapabilityDetector::CapabilityDetector(ITerminalDevice& device) : device_(device) {}

auto CapabilityDetector::detect() -> TerminalCapabilities {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!cached_) {
        cached_ = probe_capabilities(device_);
    }
    return *cached_;
}

auto CapabilityDetector::refresh() -> TerminalCapabilities {
    std::lock_guard<std::mutex> lock(mutex_);
    cached_ = probe_capabilities(device_);
    return *cached_;
}

} // namespace termcoord
