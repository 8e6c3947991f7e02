#pragma once

#include "pepcheck/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace pepcheck {

// Which indentation character occurs most across the leading whitespace of
// all lines. Ties prefer a space.
auto most_common_indent_char(const std::vector<std::string>& lines) -> char;

// Which terminator occurs most. Lines without a terminator do not vote;
// nullopt when nothing voted. Ties prefer LF, then CRLF.
auto most_common_line_ending(const std::vector<std::string>& lines) -> std::optional<LineEnding>;

// Immutable view of one source file
class Document {
public:
    explicit Document(std::vector<std::string> lines);

    auto lines() const -> const std::vector<std::string>& { return lines_; }
    auto line_count() const -> size_t { return lines_.size(); }
    auto indent_char() const -> char { return indent_char_; }
    auto line_ending() const -> std::optional<LineEnding> { return line_ending_; }

    // 1-based access; empty string outside the file
    auto line(int row) const -> const std::string&;

private:
    std::vector<std::string> lines_;
    char indent_char_;
    std::optional<LineEnding> line_ending_;
};

} // namespace pepcheck
