#pragma once

#include "pepcheck/core/diagnostic.hpp"
#include "pepcheck/core/document.hpp"
#include "pepcheck/types.hpp"
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace pepcheck {

// One raw line of the file, terminator included
struct PhysicalLine {
    std::string text;
    int line_number{};

    auto location_for(const Column& column) const -> Position;
};

// Offset into LogicalLine::text where a token's contribution begins
struct OffsetMapping {
    size_t offset{};
    Position start;  // Where that token starts in the file

    auto operator==(const OffsetMapping& other) const -> bool = default;
};

// One statement, possibly spanning several physical lines:
// - leading indentation of its first line, then the tokens
// - string contents muted, comments removed
// - line breaks between tokens collapsed to a single space
struct LogicalLine {
    std::string text;
    std::string dedented_text;
    int line_number{};   // Row of the NEWLINE token that ended the statement
    int indent_level{};
    size_t blank_lines{};
    size_t blank_lines_before_comment{};
    std::vector<Token> tokens;
    std::vector<OffsetMapping> mapping;

    auto indent_width() const -> size_t { return text.size() - dedented_text.size(); }

    // Resolve a checker column to an absolute (row, column):
    // offsets go through the last mapping entry at or before them
    auto location_for(const Column& column) const -> Position;

    // Text-only line without tokens, offsets resolve on line_number
    static auto from_text(std::string text, int line_number = 1) -> LogicalLine;
};

// Token kinds that never contribute text to a logical line
auto is_skipped_in_logical_line(TokenKind kind) -> bool;

// Build the logical line for one statement's tokens. nullopt when no token
// contributes text (e.g. a buffer of INDENT/NEWLINE only).
auto build_logical_line(std::span<const Token> tokens, const Document& document)
    -> std::optional<LogicalLine>;

} // namespace pepcheck
