#pragma once

#include "pepcheck/interfaces.hpp"
#include "pepcheck/types.hpp"
#include <deque>
#include <string>
#include <string_view>
#include <vector>

namespace pepcheck {

// Pull-based tokenizer for Python source. Physical lines are requested from
// the LineReader one at a time, only when no token is pending, so a reader
// with side effects (physical line checks) runs interleaved with tokenizing.
class PythonTokenizer : public ITokenizer {
public:
    explicit PythonTokenizer(LineReader readline);

    auto next_token() -> Token override;

    // Tokenize a whole source text, ENDMARKER included
    static auto tokenize(std::string_view source) -> std::vector<Token>;

    static auto factory() -> TokenizerFactory;

private:
    auto process_line(const std::string& line) -> void;
    auto process_end_of_input() -> void;
    auto process_indentation(const std::string& line, size_t& pos) -> bool;
    auto continue_string(const std::string& line, size_t& pos) -> bool;
    auto scan_string(const std::string& line, size_t start, size_t quote_pos, size_t& pos) -> void;
    auto scan_operator(const std::string& line, size_t& pos) -> void;
    auto emit(TokenKind kind, std::string text, Position start, Position end, const std::string& line)
        -> void;

    LineReader readline_;
    std::deque<Token> pending_;
    std::vector<int> indents_{0};
    int row_ = 0;
    int paren_depth_ = 0;
    bool continued_ = false;
    bool finished_ = false;
    Token end_marker_;

    // String literal that spans lines
    bool in_string_ = false;
    std::string string_delimiter_;
    std::string string_text_;
    std::string string_lines_;
    Position string_start_;
};

} // namespace pepcheck
