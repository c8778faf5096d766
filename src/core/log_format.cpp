#include "termcoord/core/log_format.hpp"
#include "termcoord/core/string_utils.hpp"
#include "termcoord/core/text_width.hpp"

namespace termcoord::log_format {

namespace {

struct Palette {
    std::string_view tag;
    std::string_view bracket;
    std::string_view text;
};

auto palette_for(const LogRecord& record, const ansi::Colors& colors) -> Palette {
    switch (record.kind) {
    case LogKind::HINT:
        return {colors.cyan, colors.gray, colors.yellow};
    case LogKind::PRINT:
        return {colors.gray, colors.gray, colors.reset};
    case LogKind::NORMAL:
        break;
    }
    switch (record.severity) {
    case Severity::TRACE:
        return {colors.magenta, colors.magenta, colors.magenta};
    case Severity::DEBUG:
        return {colors.gray, colors.gray, colors.cyan};
    case Severity::INFO:
        return {colors.green, colors.gray, colors.reset};
    case Severity::WARN:
        return {colors.yellow, colors.yellow, colors.yellow};
    case Severity::ERROR:
        return {colors.red, colors.red, colors.red};
    }
    return {colors.reset, colors.reset, colors.reset};
}

} // namespace

auto level_tag(const LogRecord& record) -> std::string_view {
    switch (record.kind) {
    case LogKind::HINT:
        return "H]";
    case LogKind::PRINT:
        return "::";
    case LogKind::NORMAL:
        break;
    }
    switch (record.severity) {
    case Severity::TRACE:
        return "*]";
    case Severity::DEBUG:
        return "D]";
    case Severity::INFO:
        return "I]";
    case Severity::WARN:
        return "W]";
    case Severity::ERROR:
        return "E]";
    }
    return "I]";
}

auto format_record(const LogRecord& record, const ansi::Colors& colors) -> std::vector<std::string> {
    auto palette = palette_for(record, colors);
    auto tag = level_tag(record);

    std::string head;
    head += palette.tag;
    head += tag.substr(0, 1);
    head += palette.bracket;
    head += tag.substr(1);
    std::size_t prefix_width = tag.size();
    if (!record.thread_name.empty()) {
        head += colors.magenta;
        head += '[';
        head += record.thread_name;
        head += ']';
        prefix_width += text_width::display_width(record.thread_name) + 2;
    }

    auto message_lines = StringUtils::split_lines(record.message);
    std::vector<std::string> lines;
    lines.reserve(message_lines.size());

    std::string first = head;
    first += palette.text;
    if (!message_lines.front().empty()) {
        first += ' ';
        first += message_lines.front();
    }
    first += colors.reset;
    lines.push_back(std::move(first));

    std::string indent(prefix_width + 1, ' ');
    for (std::size_t i = 1; i < message_lines.size(); ++i) {
        std::string line;
        line += palette.text;
        line += indent;
        line += message_lines[i];
        line += colors.reset;
        lines.push_back(std::move(line));
    }
    return lines;
}

auto format_prompt(std::string_view text, const ansi::Colors& colors) -> std::string {
    auto prompt_lines = StringUtils::split_lines(text);
    std::string out;
    out += colors.cyan;
    out += "!]";
    out += colors.reset;
    if (!prompt_lines.front().empty()) {
        out += ' ';
        out += prompt_lines.front();
    }
    for (std::size_t i = 1; i < prompt_lines.size(); ++i) {
        out += "\n   ";
        out += prompt_lines[i];
    }
    out += '\n';
    out += colors.cyan;
    out += "-:";
    out += colors.reset;
    out += ' ';
    return out;
}

} // namespace termcoord::log_format
