#include "termcoord/core/capabilities.hpp"
#include "fakes/fake_terminal.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace termcoord {

using ::testing::Return;

class CapabilitiesTest : public ::testing::Test {
protected:
    fakes::MockTerminalDevice device_;
};

TEST_F(CapabilitiesTest, PipeIsNonInteractive)
{
    EXPECT_CALL(device_, is_terminal()).WillOnce(Return(false));
    EXPECT_CALL(device_, term_name()).Times(0);

    auto caps = probe_capabilities(device_);
    EXPECT_FALSE(caps.is_interactive);
    EXPECT_FALSE(caps.supports_ansi);
    EXPECT_FALSE(caps.supports_color);
    EXPECT_FALSE(caps.width.has_value());
    EXPECT_EQ(select_render_mode(caps), RenderMode::NON_INTERACTIVE);
}

TEST_F(CapabilitiesTest, ColorTerminal)
{
    EXPECT_CALL(device_, is_terminal()).WillOnce(Return(true));
    EXPECT_CALL(device_, term_name()).WillOnce(Return("xterm-256color"));
    EXPECT_CALL(device_, supports_color()).WillOnce(Return(true));
    EXPECT_CALL(device_, size()).WillOnce(Return(TerminalSize{120, 40}));

    auto caps = probe_capabilities(device_);
    EXPECT_TRUE(caps.is_interactive);
    EXPECT_TRUE(caps.supports_ansi);
    EXPECT_TRUE(caps.supports_color);
    EXPECT_EQ(caps.width, 120u);
    EXPECT_EQ(caps.height, 40u);
    EXPECT_EQ(select_render_mode(caps), RenderMode::INTERACTIVE_ANSI);
}

TEST_F(CapabilitiesTest, DumbTerminalHasNoAnsi)
{
    EXPECT_CALL(device_, is_terminal()).WillOnce(Return(true));
    EXPECT_CALL(device_, term_name()).WillOnce(Return("dumb"));
    EXPECT_CALL(device_, supports_color()).Times(0);
    EXPECT_CALL(device_, size()).WillOnce(Return(TerminalSize{80, 24}));

    auto caps = probe_capabilities(device_);
    EXPECT_FALSE(caps.supports_ansi);
    EXPECT_FALSE(caps.supports_color);
    EXPECT_EQ(select_render_mode(caps), RenderMode::INTERACTIVE_PLAIN);
}

TEST_F(CapabilitiesTest, EmptyTermHasNoAnsi)
{
    EXPECT_CALL(device_, is_terminal()).WillOnce(Return(true));
    EXPECT_CALL(device_, term_name()).WillOnce(Return(""));
    EXPECT_CALL(device_, size()).WillOnce(Return(std::nullopt));

    auto caps = probe_capabilities(device_);
    EXPECT_FALSE(caps.supports_ansi);
    EXPECT_FALSE(caps.width.has_value());
    EXPECT_FALSE(caps.height.has_value());
}

TEST_F(CapabilitiesTest, ExtentIsCapped)
{
    EXPECT_CALL(device_, is_terminal()).WillOnce(Return(true));
    EXPECT_CALL(device_, term_name()).WillOnce(Return("xterm"));
    EXPECT_CALL(device_, supports_color()).WillOnce(Return(false));
    EXPECT_CALL(device_, size()).WillOnce(Return(TerminalSize{1000, 0}));

    auto caps = probe_capabilities(device_);
    EXPECT_EQ(caps.width, MAX_TERMINAL_EXTENT);
    EXPECT_FALSE(caps.height.has_value());
}

TEST_F(CapabilitiesTest, DetectorCachesUntilRefresh)
{
    EXPECT_CALL(device_, is_terminal()).Times(2).WillRepeatedly(Return(false));

    CapabilityDetector detector(device_);
    detector.detect();
    detector.detect();
    detector.refresh();
}

TEST(ColorDecisionTest, NeverColorsNonInteractiveOutput)
{
    TerminalCapabilities caps;
    EXPECT_FALSE(use_color(ColorLevel::ALWAYS, RenderMode::NON_INTERACTIVE, caps));
}

TEST(ColorDecisionTest, AutoFollowsTerminal)
{
    TerminalCapabilities caps{.is_interactive = true, .supports_ansi = true, .supports_color = true};
    EXPECT_TRUE(use_color(ColorLevel::AUTO, RenderMode::INTERACTIVE_ANSI, caps));
    EXPECT_FALSE(use_color(ColorLevel::NEVER, RenderMode::INTERACTIVE_ANSI, caps));

    caps.supports_color = false;
    EXPECT_FALSE(use_color(ColorLevel::AUTO, RenderMode::INTERACTIVE_ANSI, caps));
    EXPECT_TRUE(use_color(ColorLevel::ALWAYS, RenderMode::INTERACTIVE_PLAIN, caps));
}

} // namespace termcoord
