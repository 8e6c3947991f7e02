#include "pepcheck/core/logical_line.hpp"
#include "pepcheck/core/text_utils.hpp"
#include <algorithm>

namespace pepcheck {

namespace {

auto is_open_paren(char c) -> bool {
    return c != '\0' && OPEN_PARENS.find(c) != std::string_view::npos;
}

auto is_close_paren_text(const std::string& text) -> bool {
    return text.empty() || (text.size() == 1 && CLOSE_PARENS.find(text[0]) != std::string_view::npos);
}

} // namespace

auto PhysicalLine::location_for(const Column& column) const -> Position {
    if (const auto* position = std::get_if<Position>(&column)) {
        return *position;
    }
    if (const auto* offset = std::get_if<size_t>(&column)) {
        return {line_number, static_cast<int>(*offset)};
    }
    return {line_number, 0};
}

auto LogicalLine::location_for(const Column& column) const -> Position {
    if (const auto* position = std::get_if<Position>(&column)) {
        return *position;
    }

    const auto* offset = std::get_if<size_t>(&column);
    if (offset == nullptr) {
        return {line_number, 0};
    }
    if (mapping.empty()) {
        return {line_number, static_cast<int>(*offset)};
    }

    // Offsets inside the indentation fall back to the first token
    const OffsetMapping* anchor = &mapping.front();
    for (const auto& entry : mapping) {
        if (entry.offset > *offset) {
            break;
        }
        anchor = &entry;
    }

    auto delta = static_cast<int>(*offset) - static_cast<int>(anchor->offset);
    return {anchor->start.row, anchor->start.col + delta};
}

auto LogicalLine::from_text(std::string text, int line_number) -> LogicalLine {
    LogicalLine line;
    auto indentation = leading_indentation(text);
    line.indent_level = indentation_level(indentation);
    line.dedented_text = text.substr(indentation.size());
    line.text = std::move(text);
    line.line_number = line_number;
    return line;
}

auto is_skipped_in_logical_line(TokenKind kind) -> bool {
    switch (kind) {
    case TokenKind::COMMENT:
    case TokenKind::NL:
    case TokenKind::INDENT:
    case TokenKind::DEDENT:
    case TokenKind::NEWLINE:
    case TokenKind::ENDMARKER:
        return true;
    default:
        return false;
    }
}

auto build_logical_line(std::span<const Token> tokens, const Document& document)
    -> std::optional<LogicalLine> {
    std::string logical;
    std::vector<OffsetMapping> mapping;
    const Token* previous = nullptr;

    for (const auto& token : tokens) {
        if (is_skipped_in_logical_line(token.kind)) {
            continue;
        }

        auto text = token.kind == TokenKind::STRING ? mute_string(token.text) : token.text;

        if (previous != nullptr) {
            auto [end_row, end_col] = previous->end;
            auto [start_row, start_col] = token.start;
            const auto& end_line = document.line(end_row);

            if (end_row != start_row) {
                // Different row: one space, except inside empty bracket pairs
                char prev_char = (end_col > 0 && static_cast<size_t>(end_col) <= end_line.size())
                                     ? end_line[static_cast<size_t>(end_col) - 1]
                                     : '\0';
                if (prev_char == ',' || (!is_open_paren(prev_char) && !is_close_paren_text(text))) {
                    logical += ' ';
                }
            } else if (end_col != start_col) {
                // Same row: keep the original whitespace verbatim
                auto from = std::min(static_cast<size_t>(end_col), end_line.size());
                auto to = std::min(static_cast<size_t>(start_col), end_line.size());
                if (to > from) {
                    logical += end_line.substr(from, to - from);
                }
            }
        }

        mapping.push_back(OffsetMapping{.offset = logical.size(), .start = token.start});
        logical += text;
        previous = &token;
    }

    if (mapping.empty()) {
        return std::nullopt;
    }

    const auto& first_line = document.line(mapping.front().start.row);
    auto indent = first_line.substr(
        0, std::min(static_cast<size_t>(mapping.front().start.col), first_line.size()));
    for (auto& entry : mapping) {
        entry.offset += indent.size();
    }

    LogicalLine line;
    line.indent_level = indentation_level(indent);
    line.dedented_text = logical;
    line.text = indent + logical;
    line.tokens.assign(tokens.begin(), tokens.end());
    line.mapping = std::move(mapping);
    return line;
}

} // namespace pepcheck
