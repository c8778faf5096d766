#include "termcoord/application/demo_app.hpp"
#include "fakes/fake_terminal.hpp"
#include <gtest/gtest.h>

namespace termcoord {

using fakes::FakeTerminalState;

TEST(ParseArgsTest, Defaults)
{
    auto options = parse_args({});
    EXPECT_TRUE(options.error.empty());
    EXPECT_EQ(options.output.print_level, PrintLevel::NORMAL);
    EXPECT_EQ(options.output.color, ColorLevel::AUTO);
    EXPECT_FALSE(options.output.prompt.has_value());
    EXPECT_EQ(options.bars, 3);
    EXPECT_TRUE(options.ask);
}

TEST(ParseArgsTest, VerbosityFlagsAccumulate)
{
    EXPECT_EQ(parse_args({"-v"}).output.print_level, PrintLevel::VERBOSE);
    EXPECT_EQ(parse_args({"-vv"}).output.print_level, PrintLevel::VERBOSE_VERBOSE);
    EXPECT_EQ(parse_args({"-v", "-v"}).output.print_level, PrintLevel::VERBOSE_VERBOSE);
    EXPECT_EQ(parse_args({"-qq"}).output.print_level, PrintLevel::QUIET_QUIET);
    EXPECT_EQ(parse_args({"-q", "-v"}).output.print_level, PrintLevel::NORMAL);
}

TEST(ParseArgsTest, PromptAndColorOptions)
{
    auto options = parse_args({"--color", "never", "--yes"});
    EXPECT_EQ(options.output.color, ColorLevel::NEVER);
    EXPECT_EQ(options.output.prompt, PromptLevel::YES);

    EXPECT_EQ(parse_args({"--non-interactive"}).output.prompt, PromptLevel::NO);
    EXPECT_EQ(parse_args({"--interactive"}).output.prompt, PromptLevel::INTERACTIVE);
}

TEST(ParseArgsTest, NumericOptions)
{
    auto options = parse_args({"--bars", "5", "--steps", "7", "--delay", "0", "--no-ask"});
    EXPECT_TRUE(options.error.empty());
    EXPECT_EQ(options.bars, 5);
    EXPECT_EQ(options.steps, 7);
    EXPECT_EQ(options.step_delay.count(), 0);
    EXPECT_FALSE(options.ask);
}

TEST(ParseArgsTest, InvalidInputIsReported)
{
    EXPECT_FALSE(parse_args({"--bars", "many"}).error.empty());
    EXPECT_FALSE(parse_args({"--color", "purple"}).error.empty());
    EXPECT_FALSE(parse_args({"--frobnicate"}).error.empty());
    EXPECT_EQ(parse_args({"--frobnicate"}).error, "unknown option: --frobnicate");
    EXPECT_TRUE(parse_args({"--help"}).show_help);
    EXPECT_NE(usage().find("--non-interactive"), std::string::npos);
}

TEST(ParseArgsTest, TrailingOptionWithoutValue)
{
    EXPECT_EQ(parse_args({"--color"}).error, "missing value for --color");
    EXPECT_EQ(parse_args({"-v", "--bars"}).error, "missing value for --bars");
    EXPECT_EQ(parse_args({"--steps"}).error, "missing value for --steps");
    EXPECT_EQ(parse_args({"--yes", "--delay"}).error, "missing value for --delay");
}

class DemoAppTest : public ::testing::Test {
protected:
    auto options(std::vector<std::string> args) -> CliOptions {
        args.insert(args.end(), {"--bars", "2", "--steps", "4", "--delay", "0", "--no-animate"});
        auto parsed = parse_args(args);
        EXPECT_TRUE(parsed.error.empty()) << parsed.error;
        return parsed;
    }

    std::shared_ptr<FakeTerminalState> state_ = FakeTerminalState::pipe();
};

TEST_F(DemoAppTest, RunsWorkersToCompletion)
{
    DemoApp app(std::make_unique<fakes::FakeTerminal>(state_));
    EXPECT_EQ(app.run(options({"--no-ask", "--interactive"})), 0);

    auto text = state_->text();
    EXPECT_NE(text.find("[4/4] task 1: done\n"), std::string::npos);
    EXPECT_NE(text.find("[4/4] task 2: done\n"), std::string::npos);
    EXPECT_NE(text.find("I][worker-1] halfway through task 1\n"), std::string::npos);
    EXPECT_EQ(text.find("waiting for workers"), std::string::npos);
    EXPECT_EQ(text.find('\x1b'), std::string::npos);
}

TEST_F(DemoAppTest, YesAnswersTheQuestion)
{
    DemoApp app(std::make_unique<fakes::FakeTerminal>(state_));
    EXPECT_EQ(app.run(options({"--yes"})), 0);
    EXPECT_NE(state_->text().find(":: 2 tasks completed, 8 steps\n"), std::string::npos);
    EXPECT_TRUE(state_->read_echo.empty());
}

TEST_F(DemoAppTest, RefusedQuestionIsLogged)
{
    DemoApp app(std::make_unique<fakes::FakeTerminal>(state_));
    EXPECT_EQ(app.run(options({"--non-interactive"})), 0);

    auto text = state_->text();
    EXPECT_NE(text.find("E] prompt not allowed in non-interactive mode: Show a summary?\n"),
              std::string::npos);
    EXPECT_NE(text.find("W] no answer, skipping the summary\n"), std::string::npos);
}

TEST_F(DemoAppTest, AnsweredQuestionIsRead)
{
    state_->push_input("n");
    DemoApp app(std::make_unique<fakes::FakeTerminal>(state_));
    EXPECT_EQ(app.run(options({"--interactive"})), 0);

    auto text = state_->text();
    EXPECT_NE(text.find("!] Show a summary? [y/n]\n-: \n"), std::string::npos);
    EXPECT_EQ(text.find("tasks completed"), std::string::npos);
}

TEST_F(DemoAppTest, BrokenOutputIsAFailure)
{
    state_->set_fail_writes(true);
    DemoApp app(std::make_unique<fakes::FakeTerminal>(state_));
    EXPECT_EQ(app.run(options({"--no-ask", "--interactive"})), 1);
}

} // namespace termcoord
