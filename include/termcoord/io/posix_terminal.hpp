#pragma once

#include "termcoord/interfaces.hpp"
#include <csignal>
#include <cstdio>
#include <termios.h>
#include <unistd.h>

namespace termcoord {

class PosixTerminal : public ITerminalDevice {
private:
    int output_fd_;
    FILE* tty_file_ = nullptr;          // /dev/tty for piped input support
    bool use_tty_ = false;
    void (*previous_sigpipe_)(int) = SIG_DFL;

    // Static state for signal handling while echo is off
    static struct termios* s_original_termios_;
    static int s_input_fd_;
    static void restore_terminal_on_signal(int sig);

public:
    explicit PosixTerminal(int output_fd = STDOUT_FILENO);
    ~PosixTerminal() override;

    // Delete copy operations to prevent double cleanup
    PosixTerminal(const PosixTerminal&) = delete;
    auto operator=(const PosixTerminal&) -> PosixTerminal& = delete;

    // ITerminalDevice interface
    auto write(std::string_view bytes) -> bool override;
    auto read_line(bool echo) -> std::optional<std::string> override;
    auto is_terminal() -> bool override;
    auto term_name() -> std::string override;
    auto size() -> std::optional<TerminalSize> override;
    auto supports_color() -> bool override;

private:
    auto input_file() -> FILE*;
    auto read_raw_line(FILE* input) -> std::optional<std::string>;
};

} // namespace termcoord
