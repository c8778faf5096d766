#include "termcoord/io/posix_terminal.hpp"
#include <gtest/gtest.h>
#include <array>
#include <cstdlib>
#include <string>
#include <unistd.h>

namespace termcoord {

class PosixTerminalTest : public ::testing::Test {
protected:
    void SetUp() override { ASSERT_EQ(::pipe(fds_.data()), 0); }

    void TearDown() override {
        for (auto fd : fds_) {
            if (fd >= 0) {
                ::close(fd);
            }
        }
    }

    auto read_back(std::size_t count) -> std::string {
        std::string out(count, '\0');
        auto got = ::read(fds_[0], out.data(), count);
        out.resize(got > 0 ? static_cast<std::size_t>(got) : 0);
        return out;
    }

    std::array<int, 2> fds_{-1, -1};
};

TEST_F(PosixTerminalTest, WritesAllBytes)
{
    PosixTerminal terminal(fds_[1]);
    EXPECT_TRUE(terminal.write("W] hello\n"));
    EXPECT_EQ(read_back(9), "W] hello\n");
}

TEST_F(PosixTerminalTest, PipeIsNotATerminal)
{
    PosixTerminal terminal(fds_[1]);
    EXPECT_FALSE(terminal.is_terminal());
}

TEST_F(PosixTerminalTest, ClosedReaderIsAFailedWrite)
{
    PosixTerminal terminal(fds_[1]);
    ::close(fds_[0]);
    fds_[0] = -1;
    EXPECT_FALSE(terminal.write("nobody listens\n"));
}

TEST_F(PosixTerminalTest, BadDescriptorIsAFailedWrite)
{
    PosixTerminal terminal(-1);
    EXPECT_FALSE(terminal.write("x"));
    EXPECT_TRUE(terminal.write(""));
}

TEST_F(PosixTerminalTest, TermNameComesFromEnvironment)
{
    PosixTerminal terminal(fds_[1]);
    ::setenv("TERM", "dumb", 1);
    EXPECT_EQ(terminal.term_name(), "dumb");
    ::unsetenv("TERM");
    EXPECT_EQ(terminal.term_name(), "");
}

} // namespace termcoord
