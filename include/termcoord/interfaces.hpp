#pragma once

#include "termcoord/types.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace termcoord {

// The OS terminal as seen by the coordinator. Implementations do no
// buffering of their own; RenderSurface batches bytes before write().
class ITerminalDevice {
public:
    virtual ~ITerminalDevice() = default;
    virtual auto write(std::string_view bytes) -> bool = 0;
    // nullopt when the input stream is closed
    virtual auto read_line(bool echo) -> std::optional<std::string> = 0;
    virtual auto is_terminal() -> bool = 0;
    virtual auto term_name() -> std::string = 0;
    virtual auto size() -> std::optional<TerminalSize> = 0;
    virtual auto supports_color() -> bool = 0;
};

} // namespace termcoord
