#include "pepcheck/engine/line_splitter.hpp"
#include "pepcheck/core/errors.hpp"
#include "pepcheck/core/text_utils.hpp"
#include <algorithm>

namespace pepcheck {

namespace {

auto is_bracket(const Token& token, std::string_view brackets) -> bool {
    return token.kind == TokenKind::OP && token.text.size() == 1 &&
           brackets.find(token.text[0]) != std::string_view::npos;
}

} // namespace

LogicalLineSplitter::LogicalLineSplitter(const Document& document) : document_(document) {}

auto LogicalLineSplitter::feed(const Token& token) -> std::optional<LogicalLine> {
    tokens_.push_back(token);

    if (is_bracket(token, OPEN_PARENS)) {
        ++depth_;
    } else if (is_bracket(token, CLOSE_PARENS)) {
        if (depth_ == 0) {
            throw StructuralError("unmatched '" + token.text + "'", token.start);
        }
        --depth_;
    }

    switch (token.kind) {
    case TokenKind::NEWLINE: {
        if (depth_ > 0) {
            break;
        }
        auto line = build_logical_line(tokens_, document_);
        if (line) {
            line->line_number = token.start.row;
            line->blank_lines = blank_lines_;
            line->blank_lines_before_comment = blank_lines_before_comment_;
        }
        blank_lines_ = 0;
        blank_lines_before_comment_ = 0;
        reset();
        return line;
    }
    case TokenKind::NL:
        if (depth_ == 0) {
            if (tokens_.size() <= 1) {
                ++blank_lines_;  // The physical line holds only this token
            }
            reset();
        }
        break;
    case TokenKind::COMMENT: {
        auto before = std::string_view(token.line).substr(
            0, std::min(static_cast<size_t>(token.start.col), token.line.size()));
        if (is_blank(before)) {
            // A standalone comment does not break up a run of blank lines
            blank_lines_before_comment_ = std::max(blank_lines_, blank_lines_before_comment_);
            blank_lines_ = 0;
        }
        // Some tokenizers end a comment-only line without an NL token
        if (token.text.ends_with('\n') && depth_ == 0) {
            reset();
        }
        break;
    }
    default:
        break;
    }
    return std::nullopt;
}

auto LogicalLineSplitter::finish(const Token& end_marker) -> void {
    if (depth_ > 0) {
        throw StructuralError("EOF in multi-line statement", end_marker.start);
    }
    auto open = std::find_if(tokens_.begin(), tokens_.end(), [](const Token& token) {
        return !is_skipped_in_logical_line(token.kind);
    });
    if (open != tokens_.end()) {
        throw StructuralError("unterminated statement at end of input", open->start);
    }
    reset();
}

auto LogicalLineSplitter::reset() -> void {
    tokens_.clear();
}

} // namespace pepcheck
