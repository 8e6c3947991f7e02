#include "pepcheck/parsers/python_tokenizer.hpp"
#include "pepcheck/core/errors.hpp"
#include "pepcheck/core/text_utils.hpp"
#include <array>
#include <cctype>

namespace pepcheck {

namespace {

constexpr std::array<std::string_view, 5> THREE_CHAR_OPERATORS{"**=", ">>=", "<<=", "//=", "..."};

// "<>" is deliberately absent: it is read as '<' followed by '>'
constexpr std::array<std::string_view, 19> TWO_CHAR_OPERATORS{
    "**", "//", "<<", ">>", "<=", ">=", "==", "!=", "->", "+=",
    "-=", "*=", "/=", "%=", "&=", "|=", "^=", "@=", ":="};

constexpr std::string_view ONE_CHAR_OPERATORS = "+-*/%&|^~<>=.,:;@()[]{}";

enum class StringScan {
    CLOSED,
    CONTINUED,    // Runs on into the next physical line
    UNTERMINATED
};

auto is_identifier_start(char c) -> bool {
    auto byte = static_cast<unsigned char>(c);
    return std::isalpha(byte) != 0 || c == '_' || byte >= 0x80;
}

auto is_identifier_char(char c) -> bool {
    auto byte = static_cast<unsigned char>(c);
    return std::isalnum(byte) != 0 || c == '_' || byte >= 0x80;
}

auto is_digit(char c) -> bool {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

auto is_line_break(std::string_view rest) -> bool {
    return rest == "\n" || rest == "\r\n" || rest == "\r";
}

auto has_terminator(std::string_view line) -> bool {
    return !line.empty() && (line.back() == '\n' || line.back() == '\r');
}

auto is_string_prefix(std::string_view word) -> bool {
    if (word.empty() || word.size() > 2) {
        return false;
    }
    for (char c : word) {
        if (std::string_view("rRuUbBfF").find(c) == std::string_view::npos) {
            return false;
        }
    }
    return true;
}

// Scan a string body starting at `from` for `delimiter`, honouring escapes.
// On CLOSED, `end` is the index just past the closing delimiter.
auto scan_string_body(std::string_view line, size_t from, std::string_view delimiter, size_t& end)
    -> StringScan {
    bool triple = delimiter.size() == 3;
    size_t i = from;
    while (i < line.size()) {
        char c = line[i];
        if (c == '\\') {
            if (!triple && is_line_break(line.substr(i + 1))) {
                return StringScan::CONTINUED;
            }
            i += 2;
            continue;
        }
        if (line.substr(i, delimiter.size()) == delimiter) {
            end = i + delimiter.size();
            return StringScan::CLOSED;
        }
        if (!triple && (c == '\n' || c == '\r')) {
            return StringScan::UNTERMINATED;
        }
        ++i;
    }
    return triple ? StringScan::CONTINUED : StringScan::UNTERMINATED;
}

auto scan_number(std::string_view line, size_t pos) -> size_t {
    size_t i = pos;
    if (line[i] == '0' && i + 1 < line.size() &&
        std::string_view("xXoObB").find(line[i + 1]) != std::string_view::npos) {
        i += 2;
        while (i < line.size() && is_identifier_char(line[i])) {
            ++i;
        }
        return i;
    }

    while (i < line.size() && (is_digit(line[i]) || line[i] == '_')) {
        ++i;
    }
    if (i < line.size() && line[i] == '.') {
        ++i;
        while (i < line.size() && (is_digit(line[i]) || line[i] == '_')) {
            ++i;
        }
    }
    if (i < line.size() && (line[i] == 'e' || line[i] == 'E')) {
        size_t j = i + 1;
        if (j < line.size() && (line[j] == '+' || line[j] == '-')) {
            ++j;
        }
        if (j < line.size() && is_digit(line[j])) {
            i = j;
            while (i < line.size() && is_digit(line[i])) {
                ++i;
            }
        }
    }
    if (i < line.size() && std::string_view("jJlL").find(line[i]) != std::string_view::npos) {
        ++i;
    }
    return i;
}

} // namespace

PythonTokenizer::PythonTokenizer(LineReader readline) : readline_(std::move(readline)) {}

auto PythonTokenizer::next_token() -> Token {
    while (pending_.empty()) {
        if (finished_) {
            return end_marker_;
        }
        auto line = readline_();
        if (line.empty()) {
            process_end_of_input();
        } else {
            process_line(line);
        }
    }

    auto token = std::move(pending_.front());
    pending_.pop_front();
    return token;
}

auto PythonTokenizer::tokenize(std::string_view source) -> std::vector<Token> {
    auto lines = split_lines(source);
    size_t index = 0;
    PythonTokenizer tokenizer([&lines, &index]() -> std::string {
        return index < lines.size() ? lines[index++] : std::string();
    });

    std::vector<Token> tokens;
    while (true) {
        tokens.push_back(tokenizer.next_token());
        if (tokens.back().kind == TokenKind::ENDMARKER) {
            break;
        }
    }
    return tokens;
}

auto PythonTokenizer::factory() -> TokenizerFactory {
    return [](LineReader readline) -> std::unique_ptr<ITokenizer> {
        return std::make_unique<PythonTokenizer>(std::move(readline));
    };
}

auto PythonTokenizer::emit(TokenKind kind, std::string text, Position start, Position end,
                           const std::string& line) -> void {
    pending_.push_back(Token{.kind = kind,
                             .text = std::move(text),
                             .start = start,
                             .end = end,
                             .line = line});
}

auto PythonTokenizer::process_end_of_input() -> void {
    if (in_string_) {
        throw StructuralError("EOF in multi-line string", string_start_);
    }
    if (paren_depth_ > 0 || continued_) {
        throw StructuralError("EOF in multi-line statement", Position{row_, 0});
    }

    Position eof{row_ + 1, 0};
    const std::string empty;
    while (indents_.size() > 1) {
        indents_.pop_back();
        emit(TokenKind::DEDENT, "", eof, eof, empty);
    }

    end_marker_ = Token{.kind = TokenKind::ENDMARKER, .text = "", .start = eof, .end = eof, .line = ""};
    pending_.push_back(end_marker_);
    finished_ = true;
}

auto PythonTokenizer::continue_string(const std::string& line, size_t& pos) -> bool {
    size_t end = 0;
    switch (scan_string_body(line, 0, string_delimiter_, end)) {
    case StringScan::CLOSED:
        string_text_ += line.substr(0, end);
        string_lines_ += line;
        emit(TokenKind::STRING, std::move(string_text_), string_start_,
             Position{row_, static_cast<int>(end)}, string_lines_);
        in_string_ = false;
        string_text_.clear();
        string_lines_.clear();
        pos = end;
        return true;
    case StringScan::CONTINUED:
        string_text_ += line;
        string_lines_ += line;
        return false;
    case StringScan::UNTERMINATED:
        // A continued single-quoted string must close on a later line
        throw StructuralError("EOL while scanning string literal", string_start_);
    }
    return false;
}

// Measures indentation at the start of a new statement. Returns false when
// the line is blank or holds only a comment; its tokens are already emitted.
auto PythonTokenizer::process_indentation(const std::string& line, size_t& pos) -> bool {
    int column = 0;
    while (pos < line.size()) {
        if (line[pos] == ' ') {
            ++column;
        } else if (line[pos] == '\t') {
            column = (column / 8 + 1) * 8;
        } else if (line[pos] == '\f') {
            column = 0;
        } else {
            break;
        }
        ++pos;
    }

    auto width = static_cast<int>(line.size());
    auto here = Position{row_, static_cast<int>(pos)};

    // Whitespace-only last line without a terminator
    if (pos == line.size()) {
        emit(TokenKind::NL, "", here, here, line);
        return false;
    }

    if (line[pos] == '#') {
        auto comment = rstrip_newlines(std::string_view(line).substr(pos));
        auto nl_pos = static_cast<int>(pos + comment.size());
        emit(TokenKind::COMMENT, comment, here, Position{row_, nl_pos}, line);
        emit(TokenKind::NL, line.substr(static_cast<size_t>(nl_pos)), Position{row_, nl_pos},
             Position{row_, width}, line);
        return false;
    }
    if (line[pos] == '\n' || line[pos] == '\r') {
        emit(TokenKind::NL, line.substr(pos), here, Position{row_, width}, line);
        return false;
    }

    if (column > indents_.back()) {
        indents_.push_back(column);
        emit(TokenKind::INDENT, line.substr(0, pos), Position{row_, 0}, here, line);
    }
    while (column < indents_.back()) {
        indents_.pop_back();
        emit(TokenKind::DEDENT, "", here, here, line);
    }
    if (column != indents_.back()) {
        // Dedent to a level that was never opened: adopt it silently
        indents_.push_back(column);
    }
    return true;
}

auto PythonTokenizer::scan_string(const std::string& line, size_t start, size_t quote_pos,
                                  size_t& pos) -> void {
    char quote = line[quote_pos];
    std::string triple(3, quote);
    bool is_triple = line.compare(quote_pos, 3, triple) == 0;
    std::string delimiter = is_triple ? triple : std::string(1, quote);

    size_t end = 0;
    auto result = scan_string_body(line, quote_pos + delimiter.size(), delimiter, end);
    auto start_position = Position{row_, static_cast<int>(start)};

    switch (result) {
    case StringScan::CLOSED:
        emit(TokenKind::STRING, line.substr(start, end - start), start_position,
             Position{row_, static_cast<int>(end)}, line);
        pos = end;
        return;
    case StringScan::CONTINUED:
        in_string_ = true;
        string_delimiter_ = delimiter;
        string_text_ = line.substr(start);
        string_lines_ = line;
        string_start_ = start_position;
        pos = line.size();
        return;
    case StringScan::UNTERMINATED:
        if (quote_pos > start) {
            emit(TokenKind::NAME, line.substr(start, quote_pos - start), start_position,
                 Position{row_, static_cast<int>(quote_pos)}, line);
        }
        emit(TokenKind::ERRORTOKEN, std::string(1, quote), Position{row_, static_cast<int>(quote_pos)},
             Position{row_, static_cast<int>(quote_pos + 1)}, line);
        pos = quote_pos + 1;
        return;
    }
}

auto PythonTokenizer::scan_operator(const std::string& line, size_t& pos) -> void {
    auto rest = std::string_view(line).substr(pos);
    auto start = Position{row_, static_cast<int>(pos)};

    auto emit_operator = [&](std::string_view op) {
        pos += op.size();
        emit(TokenKind::OP, std::string(op), start, Position{row_, static_cast<int>(pos)}, line);
        if (op.size() == 1 && OPEN_PARENS.find(op[0]) != std::string_view::npos) {
            ++paren_depth_;
        } else if (op.size() == 1 && CLOSE_PARENS.find(op[0]) != std::string_view::npos) {
            --paren_depth_;
        }
    };

    for (auto op : THREE_CHAR_OPERATORS) {
        if (rest.starts_with(op)) {
            emit_operator(op);
            return;
        }
    }
    for (auto op : TWO_CHAR_OPERATORS) {
        if (rest.starts_with(op)) {
            emit_operator(op);
            return;
        }
    }
    if (ONE_CHAR_OPERATORS.find(rest[0]) != std::string_view::npos) {
        emit_operator(rest.substr(0, 1));
        return;
    }

    // Backticks and other characters outside the grammar
    ++pos;
    emit(TokenKind::ERRORTOKEN, std::string(1, rest[0]), start, Position{row_, static_cast<int>(pos)},
         line);
}

auto PythonTokenizer::process_line(const std::string& line) -> void {
    ++row_;
    size_t pos = 0;
    bool has_code = false;

    if (in_string_) {
        if (!continue_string(line, pos)) {
            return;
        }
        has_code = true;
    } else if (paren_depth_ == 0 && !continued_) {
        if (!process_indentation(line, pos)) {
            return;
        }
    } else {
        continued_ = false;
    }

    while (pos < line.size()) {
        char c = line[pos];
        if (c == ' ' || c == '\t' || c == '\f') {
            ++pos;
            continue;
        }

        size_t start = pos;
        auto start_position = Position{row_, static_cast<int>(start)};

        if (is_digit(c) || (c == '.' && pos + 1 < line.size() && is_digit(line[pos + 1]))) {
            pos = scan_number(line, pos);
            emit(TokenKind::NUMBER, line.substr(start, pos - start), start_position,
                 Position{row_, static_cast<int>(pos)}, line);
            has_code = true;
        } else if (is_identifier_start(c)) {
            while (pos < line.size() && is_identifier_char(line[pos])) {
                ++pos;
            }
            auto word = std::string_view(line).substr(start, pos - start);
            if (pos < line.size() && (line[pos] == '\'' || line[pos] == '"') && is_string_prefix(word)) {
                scan_string(line, start, pos, pos);
            } else {
                emit(TokenKind::NAME, std::string(word), start_position,
                     Position{row_, static_cast<int>(pos)}, line);
            }
            has_code = true;
        } else if (c == '\'' || c == '"') {
            scan_string(line, start, pos, pos);
            has_code = true;
        } else if (c == '#') {
            auto comment = rstrip_newlines(std::string_view(line).substr(pos));
            pos += comment.size();
            emit(TokenKind::COMMENT, comment, start_position, Position{row_, static_cast<int>(pos)},
                 line);
        } else if (c == '\\' && is_line_break(std::string_view(line).substr(pos + 1))) {
            continued_ = true;
            pos = line.size();
        } else if (c == '\n' || c == '\r') {
            auto kind = paren_depth_ > 0 ? TokenKind::NL : TokenKind::NEWLINE;
            emit(kind, line.substr(pos), start_position,
                 Position{row_, static_cast<int>(line.size())}, line);
            pos = line.size();
        } else {
            scan_operator(line, pos);
            has_code = true;
        }
    }

    // The last line of the file has no terminator: close the statement anyway
    if (!has_terminator(line) && has_code && paren_depth_ <= 0 && !continued_ && !in_string_) {
        auto end = Position{row_, static_cast<int>(line.size())};
        emit(TokenKind::NEWLINE, "", end, end, line);
    }
}

} // namespace pepcheck
