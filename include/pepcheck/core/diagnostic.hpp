#pragma once

#include "pepcheck/types.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace pepcheck {

// Where a checker says the problem is:
//   monostate - no column, start of the line
//   size_t    - offset into the checked line's text
//   Position  - already resolved row/column (token coordinates)
using Column = std::variant<std::monostate, size_t, Position>;

// Values interpolated into the message template
struct DiagnosticContext {
    std::optional<char> character;  // {char}
    std::optional<size_t> count;     // {count}

    auto operator==(const DiagnosticContext& other) const -> bool = default;
};

// Result of a single checker on a single line
struct Finding {
    std::string code;
    Column column;
    DiagnosticContext context;
};

// A finding resolved to an absolute location in the file
struct Diagnostic {
    std::string code;
    int row{};
    int column{};   // 0-based
    DiagnosticContext context;
    LineKind origin{LineKind::PHYSICAL};
    std::string checker;

    auto message() const -> std::string;
    auto description() const -> std::string;  // "CODE message"

    auto operator==(const Diagnostic& other) const -> bool = default;
};

// Message template for a code, e.g. "whitespace after {char}".
// Empty for unknown codes.
auto message_template(std::string_view code) -> std::string_view;

auto render_message(std::string_view code, const DiagnosticContext& context) -> std::string;

} // namespace pepcheck
