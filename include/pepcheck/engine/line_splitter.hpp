#pragma once

#include "pepcheck/core/document.hpp"
#include "pepcheck/core/logical_line.hpp"
#include "pepcheck/types.hpp"
#include <optional>
#include <vector>

namespace pepcheck {

// Groups a token stream into statements and keeps the blank line
// bookkeeping that the blank line rules depend on.
class LogicalLineSplitter {
public:
    explicit LogicalLineSplitter(const Document& document);

    // Returns the finished logical line when `token` closes a statement.
    // Throws StructuralError on a closing bracket without an opening one.
    auto feed(const Token& token) -> std::optional<LogicalLine>;

    // End of input. Throws StructuralError when a statement is still open.
    auto finish(const Token& end_marker) -> void;

    auto depth() const -> int { return depth_; }
    auto blank_lines() const -> size_t { return blank_lines_; }
    auto blank_lines_before_comment() const -> size_t { return blank_lines_before_comment_; }

private:
    auto reset() -> void;

    const Document& document_;
    std::vector<Token> tokens_;
    int depth_ = 0;
    size_t blank_lines_ = 0;
    size_t blank_lines_before_comment_ = 0;
};

} // namespace pepcheck
