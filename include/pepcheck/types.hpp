#pragma once

#include <compare>
#include <string>

namespace pepcheck {

// Row is 1-based, column is 0-based (tokenizer convention)
struct Position {
    int row{};
    int col{};

    auto operator<=>(const Position& other) const = default;
};

enum class TokenKind {
    NAME,
    NUMBER,
    OP,
    STRING,
    COMMENT,
    NEWLINE,     // Ends a logical line
    NL,          // Non-logical line break (blank line, inside brackets)
    INDENT,
    DEDENT,
    ENDMARKER,
    ERRORTOKEN   // Lexically invalid character, e.g. a backtick
};

struct Token {
    TokenKind kind{TokenKind::ERRORTOKEN};
    std::string text;
    Position start;
    Position end;
    std::string line;  // Physical line(s) the token was read from

    auto operator==(const Token& other) const -> bool = default;
};

// Line terminator styles
enum class LineEnding {
    LF,     // Unix/Linux/macOS
    CRLF,   // Windows
    CR      // Classic Mac
};

enum class LineKind {
    PHYSICAL,
    LOGICAL
};

auto token_kind_name(TokenKind kind) -> const char*;
auto line_ending_text(LineEnding ending) -> const char*;

} // namespace pepcheck
