#include "pepcheck/core/text_utils.hpp"
#include <algorithm>

namespace pepcheck {

namespace {

auto is_space(char c) -> bool {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

} // namespace

auto leading_indentation(std::string_view line, std::string_view indent_chars) -> std::string {
    auto first = line.find_first_not_of(indent_chars);
    if (first == std::string_view::npos) {
        return std::string(line);
    }
    return std::string(line.substr(0, first));
}

auto rstrip_newlines(std::string_view line) -> std::string {
    auto last = line.find_last_not_of("\n\r\f");
    if (last == std::string_view::npos) {
        return "";
    }
    return std::string(line.substr(0, last + 1));
}

auto line_ending(std::string_view line) -> std::string {
    return std::string(line.substr(rstrip_newlines(line).size()));
}

auto rstrip(std::string_view text) -> std::string {
    size_t end = text.size();
    while (end > 0 && is_space(text[end - 1])) {
        --end;
    }
    return std::string(text.substr(0, end));
}

auto strip(std::string_view text) -> std::string {
    size_t begin = 0;
    while (begin < text.size() && is_space(text[begin])) {
        ++begin;
    }
    return rstrip(text.substr(begin));
}

auto is_blank(std::string_view text) -> bool {
    return std::all_of(text.begin(), text.end(), is_space);
}

auto indentation_level(std::string_view indentation) -> int {
    int result = 0;
    for (char c : indentation) {
        if (c == '\t') {
            result = result / 8 * 8 + 8;
        } else if (c == ' ') {
            ++result;
        } else {
            break;
        }
    }
    return result;
}

auto mute_string(std::string_view text) -> std::string {
    if (text.size() < 2) {
        return std::string(text);
    }

    size_t start = 1;
    size_t end = text.size() - 1;

    // String modifiers (e.g. u or r)
    if (text.back() == '"') {
        start += text.find('"');
    } else if (text.back() == '\'') {
        start += text.find('\'');
    }

    // Triple quotes
    if (text.ends_with("\"\"\"") || text.ends_with("'''")) {
        start += 2;
        end -= 2;
    }

    if (start >= end) {
        return std::string(text);
    }

    std::string result(text);
    std::fill(result.begin() + static_cast<std::ptrdiff_t>(start),
              result.begin() + static_cast<std::ptrdiff_t>(end), 'x');
    return result;
}

auto utf8_length(std::string_view text) -> std::optional<size_t> {
    size_t count = 0;
    size_t pos = 0;
    while (pos < text.size()) {
        auto lead = static_cast<unsigned char>(text[pos]);
        size_t width = 0;
        if (lead < 0x80) {
            width = 1;
        } else if ((lead & 0xE0) == 0xC0 && lead >= 0xC2) {
            width = 2;
        } else if ((lead & 0xF0) == 0xE0) {
            width = 3;
        } else if ((lead & 0xF8) == 0xF0 && lead <= 0xF4) {
            width = 4;
        } else {
            return std::nullopt;
        }

        if (pos + width > text.size()) {
            return std::nullopt;
        }
        for (size_t i = 1; i < width; ++i) {
            if ((static_cast<unsigned char>(text[pos + i]) & 0xC0) != 0x80) {
                return std::nullopt;
            }
        }

        pos += width;
        ++count;
    }
    return count;
}

auto split_lines(std::string_view text) -> std::vector<std::string> {
    std::vector<std::string> lines;
    size_t begin = 0;
    size_t pos = 0;
    while (pos < text.size()) {
        if (text[pos] == '\n') {
            lines.emplace_back(text.substr(begin, pos + 1 - begin));
            begin = pos + 1;
        } else if (text[pos] == '\r') {
            size_t stop = (pos + 1 < text.size() && text[pos + 1] == '\n') ? pos + 2 : pos + 1;
            lines.emplace_back(text.substr(begin, stop - begin));
            begin = stop;
            pos = stop - 1;
        }
        ++pos;
    }
    if (begin < text.size()) {
        lines.emplace_back(text.substr(begin));
    }
    return lines;
}

auto starts_with_any(std::string_view code, const std::vector<std::string>& prefixes) -> bool {
    return std::any_of(prefixes.begin(), prefixes.end(),
                       [code](const std::string& prefix) { return code.starts_with(prefix); });
}

} // namespace pepcheck
