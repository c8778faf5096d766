#pragma once

#include "termcoord/interfaces.hpp"
#include "termcoord/types.hpp"
#include <mutex>
#include <optional>

namespace termcoord {

inline constexpr unsigned MAX_TERMINAL_EXTENT = 400;

// One read-only query of the device. Missing capabilities degrade to
// non-interactive; there is no error path.
auto probe_capabilities(ITerminalDevice& device) -> TerminalCapabilities;

auto select_render_mode(const TerminalCapabilities& caps) -> RenderMode;

// Colors never reach a non-interactive stream, whatever the level says
auto use_color(ColorLevel level, RenderMode mode, const TerminalCapabilities& caps) -> bool;

// Caches the first probe for the detector's lifetime
class CapabilityDetector {
public:
    explicit CapabilityDetector(ITerminalDevice& device);

    auto detect() -> TerminalCapabilities;
    auto refresh() -> TerminalCapabilities;

private:
    ITerminalDevice& device_;
    std::mutex mutex_;
    std::optional<TerminalCapabilities> cached_;
};

} // namespace termcoord
