#pragma once

#include "termcoord/output_coordinator.hpp"
#include "termcoord/types.hpp"
#include <optional>
#include <string_view>

namespace termcoord {

// Interactive questions routed through the coordinator, so bars and log
// lines from other threads never interleave with the prompt.
class PromptController {
public:
    explicit PromptController(OutputCoordinator& coordinator);

    auto prompt(std::string_view text) -> PromptResult;
    // Terminal echo is off while the line is read
    auto prompt_password(std::string_view text) -> PromptResult;
    // Asks again until the answer is y, yes, n or no. nullopt when input
    // ends or prompting is not allowed.
    auto yesno(std::string_view text) -> std::optional<bool>;

    auto state() const -> PromptState;

private:
    auto ask(std::string_view text, bool echo) -> PromptResult;
    auto refuse(std::string_view text) -> PromptResult;

    OutputCoordinator& coordinator_;
};

} // namespace termcoord
