#include "termcoord/core/text_width.hpp"
#include <ftxui/screen/string.hpp>

namespace termcoord::text_width {

namespace {

struct Decoded {
    char32_t code_point;
    std::size_t length;
};

auto decode(std::string_view text, std::size_t pos) -> Decoded {
    auto lead = static_cast<unsigned char>(text[pos]);
    std::size_t length = 1;
    char32_t code_point = lead;
    if (lead >= 0xF0) {
        length = 4;
        code_point = lead & 0x07;
    } else if (lead >= 0xE0) {
        length = 3;
        code_point = lead & 0x0F;
    } else if (lead >= 0xC0) {
        length = 2;
        code_point = lead & 0x1F;
    } else if (lead >= 0x80) {
        return {0xFFFD, 1}; // stray continuation byte
    }
    if (pos + length > text.size()) {
        return {0xFFFD, 1};
    }
    for (std::size_t i = 1; i < length; ++i) {
        auto next = static_cast<unsigned char>(text[pos + i]);
        if ((next & 0xC0) != 0x80) {
            return {0xFFFD, 1};
        }
        code_point = (code_point << 6) | (next & 0x3F);
    }
    return {code_point, length};
}

auto encode(char32_t code_point) -> std::string {
    std::string out;
    if (code_point < 0x80) {
        out += static_cast<char>(code_point);
    } else if (code_point < 0x800) {
        out += static_cast<char>(0xC0 | (code_point >> 6));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    } else if (code_point < 0x10000) {
        out += static_cast<char>(0xE0 | (code_point >> 12));
        out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (code_point >> 18));
        out += static_cast<char>(0x80 | ((code_point >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    }
    return out;
}

// Length of the escape sequence starting at pos (text[pos] == ESC)
auto escape_length(std::string_view text, std::size_t pos) -> std::size_t {
    std::size_t i = pos + 1;
    if (i >= text.size()) {
        return 1;
    }
    if (text[i] != '[') {
        return 2;
    }
    ++i;
    while (i < text.size()) {
        auto c = static_cast<unsigned char>(text[i]);
        ++i;
        if (c >= 0x40 && c <= 0x7E) {
            break;
        }
    }
    return i - pos;
}

} // namespace

auto char_width(char32_t cp) -> std::size_t {
    auto width = ftxui::string_width(encode(cp));
    return width > 0 ? static_cast<std::size_t>(width) : 0;
}

auto display_width(std::string_view text) -> std::size_t {
    std::size_t width = 0;
    std::size_t pos = 0;
    while (pos < text.size()) {
        if (text[pos] == '\x1b') {
            pos += escape_length(text, pos);
            continue;
        }
        auto decoded = decode(text, pos);
        width += char_width(decoded.code_point);
        pos += decoded.length;
    }
    return width;
}

auto truncate_to_width(std::string_view text, std::size_t width) -> std::string {
    std::string result;
    result.reserve(text.size());
    std::size_t used = 0;
    std::size_t pos = 0;
    bool full = false;
    while (pos < text.size()) {
        if (text[pos] == '\x1b') {
            // escape sequences survive truncation so colors still get reset
            auto length = escape_length(text, pos);
            result.append(text.substr(pos, length));
            pos += length;
            continue;
        }
        auto decoded = decode(text, pos);
        pos += decoded.length;
        if (full) {
            continue;
        }
        auto w = char_width(decoded.code_point);
        if (used + w > width) {
            full = true;
            continue;
        }
        used += w;
        result.append(text.substr(pos - decoded.length, decoded.length));
    }
    return result;
}

auto contains_escape(std::string_view text) -> bool {
    return text.find('\x1b') != std::string_view::npos;
}

auto strip_escapes(std::string_view text) -> std::string {
    std::string result;
    std::size_t pos = 0;
    while (pos < text.size()) {
        if (text[pos] == '\x1b') {
            pos += escape_length(text, pos);
        } else if (text[pos] == '\r') {
            ++pos;
        } else {
            result.push_back(text[pos]);
            ++pos;
        }
    }
    return result;
}

} // namespace termcoord::text_width
