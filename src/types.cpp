#include "pepcheck/types.hpp"

namespace pepcheck {

auto token_kind_name(TokenKind kind) -> const char* {
    switch (kind) {
    case TokenKind::NAME: return "NAME";
    case TokenKind::NUMBER: return "NUMBER";
    case TokenKind::OP: return "OP";
    case TokenKind::STRING: return "STRING";
    case TokenKind::COMMENT: return "COMMENT";
    case TokenKind::NEWLINE: return "NEWLINE";
    case TokenKind::NL: return "NL";
    case TokenKind::INDENT: return "INDENT";
    case TokenKind::DEDENT: return "DEDENT";
    case TokenKind::ENDMARKER: return "ENDMARKER";
    case TokenKind::ERRORTOKEN: return "ERRORTOKEN";
    }
    return "UNKNOWN";
}

auto line_ending_text(LineEnding ending) -> const char* {
    switch (ending) {
    case LineEnding::LF: return "\n";
    case LineEnding::CRLF: return "\r\n";
    case LineEnding::CR: return "\r";
    }
    return "\n";
}

} // namespace pepcheck
