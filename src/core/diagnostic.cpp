#include "pepcheck/core/diagnostic.hpp"
#include <array>
#include <utility>

namespace pepcheck {

namespace {

constexpr std::array<std::pair<std::string_view, std::string_view>, 36> MESSAGE_TEMPLATES{{
    {"E101", "indentation contains mixed spaces and tabs"},
    {"E111", "indentation is not a multiple of four"},
    {"E112", "expected an indented block"},
    {"E113", "unexpected indentation"},
    {"E201", "whitespace after {char}"},
    {"E202", "whitespace before {char}"},
    {"E203", "whitespace before {char}"},
    {"E211", "whitespace before {char}"},
    {"E221", "multiple spaces before operator"},
    {"E222", "multiple spaces after operator"},
    {"E223", "tab before operator"},
    {"E224", "tab after operator"},
    {"E225", "missing whitespace around operator"},
    {"E231", "missing whitespace after {char}"},
    {"E241", "multiple spaces after {char}"},
    {"E242", "tab after {char}"},
    {"E251", "no spaces around keyword / parameter equals"},
    {"E261", "at least two spaces before inline comment"},
    {"E262", "inline comment should start with '# '"},
    {"E301", "expected 1 blank line, found 0"},
    {"E302", "expected 2 blank lines, found {count}"},
    {"E303", "too many blank lines ({count})"},
    {"E304", "blank lines found after function decorator"},
    {"E401", "multiple imports on one line"},
    {"E501", "line too long ({count} characters)"},
    {"E701", "multiple statements on one line (colon)"},
    {"E702", "multiple statements on one line (semicolon)"},
    {"W191", "indentation contains tabs"},
    {"W291", "trailing whitespace"},
    {"W292", "no newline at end of file"},
    {"W293", "blank line contains whitespace"},
    {"W391", "blank line at end of file"},
    {"W601", ".has_key() is deprecated, use 'in'"},
    {"W602", "deprecated form of raising exception"},
    {"W603", "'<>' is deprecated, use '!='"},
    {"W604", "backticks are deprecated, use 'repr()'"},
}};

auto replace_all(std::string text, std::string_view placeholder, const std::string& value)
    -> std::string {
    size_t pos = 0;
    while ((pos = text.find(placeholder, pos)) != std::string::npos) {
        text.replace(pos, placeholder.size(), value);
        pos += value.size();
    }
    return text;
}

// Python-style repr of a single character: '(' or '\t'
auto quoted_character(char c) -> std::string {
    if (c == '\t') {
        return "'\\t'";
    }
    if (c == '\'') {
        return "\"'\"";
    }
    return std::string("'") + c + "'";
}

} // namespace

auto message_template(std::string_view code) -> std::string_view {
    for (const auto& [known_code, text] : MESSAGE_TEMPLATES) {
        if (known_code == code) {
            return text;
        }
    }
    return {};
}

auto render_message(std::string_view code, const DiagnosticContext& context) -> std::string {
    std::string message(message_template(code));
    if (context.character) {
        message = replace_all(std::move(message), "{char}", quoted_character(*context.character));
    }
    if (context.count) {
        message = replace_all(std::move(message), "{count}", std::to_string(*context.count));
    }
    return message;
}

auto Diagnostic::message() const -> std::string {
    return render_message(code, context);
}

auto Diagnostic::description() const -> std::string {
    return code + " " + message();
}

} // namespace pepcheck
