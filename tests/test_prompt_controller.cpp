#include "termcoord/prompt_controller.hpp"
#include "termcoord/core/progress_format.hpp"
#include "termcoord/ui/ansi.hpp"
#include "fakes/fake_terminal.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <thread>

namespace termcoord {

using fakes::FakeTerminalState;

class PromptControllerTest : public ::testing::Test {
protected:
    auto make(std::shared_ptr<FakeTerminalState> state,
              PromptLevel level = PromptLevel::INTERACTIVE) -> std::unique_ptr<OutputCoordinator> {
        OutputConfig config;
        config.color = ColorLevel::NEVER;
        config.prompt = level;
        config.animate = false;
        return std::make_unique<OutputCoordinator>(std::make_unique<fakes::FakeTerminal>(state),
                                                   config, clock_.fn());
    }

    static auto erase_one() -> std::string {
        return std::string(ansi::CURSOR_UP) + std::string(ansi::ERASE_LINE) + "\r";
    }

    fakes::FakeClock clock_;
};

TEST_F(PromptControllerTest, PromptClearsFrameAndRestoresIt)
{
    auto state = FakeTerminalState::ansi();
    auto coordinator = make(state);
    auto handle = coordinator->create_progress(ProgressOptions{.label = "build", .total = 10});
    handle.advance(3);
    state->clear();
    state->push_input("alice\n");

    PromptController prompts(*coordinator);
    auto result = prompts.prompt("Name?");

    EXPECT_EQ(result.status, PromptStatus::ANSWERED);
    EXPECT_EQ(result.text, "alice");
    auto frame = std::string(progress_format::spinner_glyph(1)) + "][3/10] build: 30.00%\n";
    EXPECT_EQ(state->text(), erase_one() + "!] Name?\n-: " + frame);
    EXPECT_EQ(coordinator->display_lines(), 1);
    EXPECT_EQ(prompts.state(), PromptState::IDLE);
}

TEST_F(PromptControllerTest, PasswordReadsWithoutEcho)
{
    auto state = FakeTerminalState::ansi();
    auto coordinator = make(state);
    state->push_input("hunter2");

    PromptController prompts(*coordinator);
    auto result = prompts.prompt_password("Password:");
    EXPECT_EQ(result.text, "hunter2");
    ASSERT_EQ(state->read_echo.size(), 1);
    EXPECT_FALSE(state->read_echo[0]);
}

TEST_F(PromptControllerTest, EndOfInputIsNoInput)
{
    auto state = FakeTerminalState::ansi();
    auto coordinator = make(state);

    PromptController prompts(*coordinator);
    auto result = prompts.prompt("Name?");
    EXPECT_EQ(result.status, PromptStatus::NO_INPUT);
    EXPECT_FALSE(result.answered());
    EXPECT_EQ(state->text(), "!] Name?\n-: \n");
}

TEST_F(PromptControllerTest, PipedOutputGetsNewlineAfterAnswer)
{
    auto state = FakeTerminalState::pipe();
    auto coordinator = make(state);
    state->push_input("bob");

    PromptController prompts(*coordinator);
    EXPECT_EQ(prompts.prompt("Name?").text, "bob");
    EXPECT_EQ(state->text(), "!] Name?\n-: \n");
}

TEST_F(PromptControllerTest, MultiLinePromptIsIndented)
{
    auto state = FakeTerminalState::pipe();
    auto coordinator = make(state);
    state->push_input("ok");

    PromptController prompts(*coordinator);
    prompts.prompt("Overwrite these files?\na.txt\nb.txt");
    EXPECT_EQ(state->text(), "!] Overwrite these files?\n   a.txt\n   b.txt\n-: \n");
}

TEST_F(PromptControllerTest, YesNoAsksAgainUntilValid)
{
    auto state = FakeTerminalState::ansi();
    auto coordinator = make(state);
    state->push_input("maybe");
    state->push_input(" Y ");

    PromptController prompts(*coordinator);
    EXPECT_EQ(prompts.yesno("Continue?"), true);
    EXPECT_EQ(state->read_echo.size(), 2);

    auto text = state->text();
    auto first = text.find("!] Continue? [y/n]");
    ASSERT_NE(first, std::string::npos);
    EXPECT_NE(text.find("!] Continue? [y/n]", first + 1), std::string::npos);
}

TEST_F(PromptControllerTest, YesNoAcceptsNo)
{
    auto state = FakeTerminalState::ansi();
    auto coordinator = make(state);
    state->push_input("NO");

    PromptController prompts(*coordinator);
    EXPECT_EQ(prompts.yesno("Delete?"), false);
}

TEST_F(PromptControllerTest, YesNoEndOfInputIsNoAnswer)
{
    auto state = FakeTerminalState::ansi();
    auto coordinator = make(state);

    PromptController prompts(*coordinator);
    EXPECT_FALSE(prompts.yesno("Continue?").has_value());
}

TEST_F(PromptControllerTest, YesLevelAnswersWithoutAsking)
{
    auto state = FakeTerminalState::ansi();
    auto coordinator = make(state, PromptLevel::YES);

    PromptController prompts(*coordinator);
    EXPECT_EQ(prompts.yesno("Continue?"), true);
    EXPECT_TRUE(state->read_echo.empty());
    EXPECT_EQ(state->write_count(), 0);
}

TEST_F(PromptControllerTest, NoLevelRefusesAndLogs)
{
    auto state = FakeTerminalState::pipe();
    auto coordinator = make(state, PromptLevel::NO);

    PromptController prompts(*coordinator);
    auto result = prompts.prompt("Name?");
    EXPECT_EQ(result.status, PromptStatus::NOT_ALLOWED);
    EXPECT_FALSE(prompts.yesno("Continue?").has_value());
    EXPECT_TRUE(state->read_echo.empty());
    EXPECT_EQ(state->text(),
              "E] prompt not allowed in non-interactive mode: Name?\n"
              "E] prompt not allowed in non-interactive mode: Continue?\n");
}

TEST_F(PromptControllerTest, SessionReportsPromptingState)
{
    auto state = FakeTerminalState::ansi();
    auto coordinator = make(state);
    state->push_input("x");

    auto session = coordinator->begin_prompt("Name?");
    EXPECT_TRUE(session.active());
    EXPECT_EQ(session.text(), "Name?");
    EXPECT_EQ(coordinator->prompt_state(), PromptState::PROMPTING);

    auto input = session.read_line();
    coordinator->end_prompt(session, input);
    EXPECT_FALSE(session.active());
    EXPECT_EQ(coordinator->prompt_state(), PromptState::IDLE);
    EXPECT_THROW(session.read_line(), std::logic_error);

    coordinator->end_prompt(session, input);
}

TEST_F(PromptControllerTest, AbandonedSessionRestoresDisplay)
{
    auto state = FakeTerminalState::ansi();
    auto coordinator = make(state);
    auto first = coordinator->create_progress(ProgressOptions{.label = "a", .total = 10});
    auto second = coordinator->create_progress(ProgressOptions{.label = "b", .total = 10});
    first.advance();
    EXPECT_EQ(coordinator->display_lines(), 2);

    {
        auto session = coordinator->begin_prompt("Name?");
        EXPECT_EQ(session.saved_display_lines(), 2);
        EXPECT_EQ(coordinator->prompt_state(), PromptState::PROMPTING);
    }
    EXPECT_EQ(coordinator->prompt_state(), PromptState::IDLE);
    EXPECT_EQ(coordinator->display_lines(), 2);
}

TEST_F(PromptControllerTest, OtherThreadsWaitForThePrompt)
{
    auto state = FakeTerminalState::pipe();
    auto coordinator = make(state);
    state->push_input("done");

    std::atomic<bool> logged{false};
    auto session = coordinator->begin_prompt("Name?");
    std::thread logger([&] {
        coordinator->emit_log(LogRecord{.severity = Severity::WARN, .message = "from worker"});
        logged = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(logged.load());

    coordinator->end_prompt(session, session.read_line());
    logger.join();
    EXPECT_TRUE(logged.load());
    EXPECT_EQ(state->text(), "!] Name?\n-: \nW] from worker\n");
}

} // namespace termcoord
