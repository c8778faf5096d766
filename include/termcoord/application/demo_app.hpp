#pragma once

#include "termcoord/config.hpp"
#include "termcoord/interfaces.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace termcoord {

struct CliOptions {
    OutputConfig output;
    std::size_t bars = 3;                     // concurrent worker bars
    std::uint64_t steps = 40;                 // steps per bar
    std::chrono::milliseconds step_delay{50};
    bool ask = true;                          // yes/no question at the end
    bool show_help = false;
    std::string error;                        // non-empty: invalid command line
};

auto parse_args(const std::vector<std::string>& args) -> CliOptions;
auto usage() -> std::string;

// Workers advancing bars and logging concurrently, then one question
class DemoApp {
private:
    std::unique_ptr<ITerminalDevice> terminal_;

public:
    explicit DemoApp(std::unique_ptr<ITerminalDevice> terminal);

    auto run(const CliOptions& options) -> int;
};

} // namespace termcoord
