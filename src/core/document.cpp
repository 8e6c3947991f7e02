#include "pepcheck/core/document.hpp"
#include "pepcheck/core/text_utils.hpp"

namespace pepcheck {

auto most_common_indent_char(const std::vector<std::string>& lines) -> char {
    size_t spaces = 0;
    size_t tabs = 0;
    for (const auto& line : lines) {
        for (char c : leading_indentation(line)) {
            if (c == ' ') {
                ++spaces;
            } else {
                ++tabs;
            }
        }
    }
    return tabs > spaces ? '\t' : ' ';
}

auto most_common_line_ending(const std::vector<std::string>& lines) -> std::optional<LineEnding> {
    size_t lf = 0;
    size_t crlf = 0;
    size_t cr = 0;
    for (const auto& line : lines) {
        if (line.ends_with("\r\n")) {
            ++crlf;
        } else if (line.ends_with('\n')) {
            ++lf;
        } else if (line.ends_with('\r')) {
            ++cr;
        }
    }

    if (lf == 0 && crlf == 0 && cr == 0) {
        return std::nullopt;
    }
    if (lf >= crlf && lf >= cr) {
        return LineEnding::LF;
    }
    if (crlf >= cr) {
        return LineEnding::CRLF;
    }
    return LineEnding::CR;
}

Document::Document(std::vector<std::string> lines)
    : lines_(std::move(lines)), indent_char_(most_common_indent_char(lines_)),
      line_ending_(most_common_line_ending(lines_)) {}

auto Document::line(int row) const -> const std::string& {
    static const std::string empty;
    if (row < 1 || static_cast<size_t>(row) > lines_.size()) {
        return empty;
    }
    return lines_[static_cast<size_t>(row) - 1];
}

} // namespace pepcheck
