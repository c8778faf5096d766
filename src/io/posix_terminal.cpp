#include "termcoord/io/posix_terminal.hpp"
#include "termcoord/core/string_utils.hpp"

#include <ftxui/screen/terminal.hpp>

#include <cerrno>
#include <cstdlib>

namespace termcoord {

// Static members for signal handling
struct termios* PosixTerminal::s_original_termios_ = nullptr;
int PosixTerminal::s_input_fd_ = -1;

PosixTerminal::PosixTerminal(int output_fd) : output_fd_(output_fd) {
    // Prompts still reach the user when stdin is a pipe
    if (!isatty(STDIN_FILENO)) {
        tty_file_ = fopen("/dev/tty", "r");
        if (tty_file_) {
            setbuf(tty_file_, nullptr);
            use_tty_ = true;
        }
    }
    // A closed reader must surface as a failed write, not kill the process
    previous_sigpipe_ = std::signal(SIGPIPE, SIG_IGN);
    if (previous_sigpipe_ == SIG_ERR) {
        previous_sigpipe_ = SIG_DFL;
    }
}

PosixTerminal::~PosixTerminal() {
    std::signal(SIGPIPE, previous_sigpipe_);
    if (tty_file_) {
        fclose(tty_file_);
        tty_file_ = nullptr;
        use_tty_ = false;
    }
}

auto PosixTerminal::write(std::string_view bytes) -> bool {
    const char* data = bytes.data();
    size_t remaining = bytes.size();
    while (remaining > 0) {
        ssize_t written = ::write(output_fd_, data, remaining);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false; // EPIPE, EBADF, EIO ...
        }
        data += written;
        remaining -= static_cast<size_t>(written);
    }
    return true;
}

auto PosixTerminal::read_line(bool echo) -> std::optional<std::string> {
    FILE* input = input_file();
    int fd = fileno(input);

    if (echo || !isatty(fd)) {
        return read_raw_line(input);
    }

    struct termios original{};
    if (tcgetattr(fd, &original) != 0) {
        return read_raw_line(input);
    }

    s_original_termios_ = &original;
    s_input_fd_ = fd;
    auto previous_int = std::signal(SIGINT, restore_terminal_on_signal);
    auto previous_term = std::signal(SIGTERM, restore_terminal_on_signal);

    struct termios hidden = original;
    hidden.c_lflag &= ~ECHO;
    hidden.c_lflag |= ECHONL;
    tcsetattr(fd, TCSAFLUSH, &hidden);

    auto line = read_raw_line(input);

    tcsetattr(fd, TCSAFLUSH, &original);
    std::signal(SIGINT, previous_int == SIG_ERR ? SIG_DFL : previous_int);
    std::signal(SIGTERM, previous_term == SIG_ERR ? SIG_DFL : previous_term);
    s_original_termios_ = nullptr;
    s_input_fd_ = -1;

    return line;
}

auto PosixTerminal::is_terminal() -> bool { return isatty(output_fd_) != 0; }

auto PosixTerminal::term_name() -> std::string {
    const char* term = std::getenv("TERM");
    return term ? term : "";
}

auto PosixTerminal::size() -> std::optional<TerminalSize> {
    auto dimensions = ftxui::Terminal::Size();
    if (dimensions.dimx <= 0 || dimensions.dimy <= 0) {
        return std::nullopt;
    }
    return TerminalSize{static_cast<unsigned>(dimensions.dimx),
                        static_cast<unsigned>(dimensions.dimy)};
}

auto PosixTerminal::supports_color() -> bool {
    return ftxui::Terminal::ColorSupport() != ftxui::Terminal::Color::Palette1;
}

auto PosixTerminal::input_file() -> FILE* { return use_tty_ ? tty_file_ : stdin; }

auto PosixTerminal::read_raw_line(FILE* input) -> std::optional<std::string> {
    std::string line;
    int ch;
    bool got_any = false;
    while ((ch = fgetc(input)) != EOF) {
        got_any = true;
        if (ch == '\n') {
            break;
        }
        line += static_cast<char>(ch);
    }
    if (!got_any) {
        return std::nullopt;
    }
    return StringUtils::strip_line_ending(line);
}

void PosixTerminal::restore_terminal_on_signal(int sig) {
    if (s_original_termios_ && s_input_fd_ >= 0) {
        tcsetattr(s_input_fd_, TCSAFLUSH, s_original_termios_);
    }
    std::signal(sig, SIG_DFL); // Restore default handler
    std::raise(sig);           // Re-raise signal
}

} // namespace termcoord
