#include "termcoord/prompt_controller.hpp"
#include "termcoord/core/string_utils.hpp"
#include <string>

namespace termcoord {

PromptController::PromptController(OutputCoordinator& coordinator) : coordinator_(coordinator) {}

auto PromptController::refuse(std::string_view text) -> PromptResult {
    coordinator_.emit_log(LogRecord{
        .severity = Severity::ERROR,
        .kind = LogKind::NORMAL,
        .message = "prompt not allowed in non-interactive mode: " + std::string(text),
        .thread_name = {}});
    return PromptResult{.status = PromptStatus::NOT_ALLOWED, .text = {}};
}

auto PromptController::ask(std::string_view text, bool echo) -> PromptResult {
    if (coordinator_.prompt_level() == PromptLevel::NO) {
        return refuse(text);
    }

    auto session = coordinator_.begin_prompt(text);
    auto input = echo ? session.read_line() : session.read_password();
    coordinator_.end_prompt(session, input);

    if (!input) {
        return PromptResult{.status = PromptStatus::NO_INPUT, .text = {}};
    }
    return PromptResult{.status = PromptStatus::ANSWERED,
                        .text = StringUtils::strip_line_ending(*input)};
}

auto PromptController::prompt(std::string_view text) -> PromptResult { return ask(text, true); }

auto PromptController::prompt_password(std::string_view text) -> PromptResult {
    return ask(text, false);
}

auto PromptController::yesno(std::string_view text) -> std::optional<bool> {
    switch (coordinator_.prompt_level()) {
    case PromptLevel::YES:
        return true;
    case PromptLevel::NO:
        refuse(text);
        return std::nullopt;
    case PromptLevel::INTERACTIVE:
        break;
    }

    auto question = std::string(text) + " [y/n]";
    while (true) {
        auto result = ask(question, true);
        if (!result.answered()) {
            return std::nullopt;
        }
        auto answer = StringUtils::to_lowercase(StringUtils::trim(result.text));
        if (answer == "y" || answer == "yes") {
            return true;
        }
        if (answer == "n" || answer == "no") {
            return false;
        }
    }
}

auto PromptController::state() const -> PromptState { return coordinator_.prompt_state(); }

} // namespace termcoord
