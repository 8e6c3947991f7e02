#include "pepcheck/checks/logical_checks.hpp"
#include "pepcheck/core/text_utils.hpp"
#include <algorithm>
#include <array>
#include <regex>
#include <string>

namespace pepcheck::checks {

namespace {

// Python 2 and 3 keywords plus print, without the constants True/False/None
constexpr std::array<std::string_view, 34> KEYWORDS{
    "and",    "as",     "assert", "async",  "await",  "break",    "class",  "continue", "def",
    "del",    "elif",   "else",   "except", "exec",   "finally",  "for",    "from",     "global",
    "if",     "import", "in",     "is",     "lambda", "nonlocal", "not",    "or",       "pass",
    "print",  "raise",  "return", "try",    "while",  "with",     "yield"};

constexpr std::array<std::string_view, 27> BINARY_OPERATORS{
    "**=", "*=", "+=", "-=", "!=", "<>", "%=", "^=", "&=", "|=", "==", "/=", "//=", "<=",
    ">=",  "<<=", ">>=", "%", "^",  "&",  "|",  "=",  "/",  "//", "<",  ">",  "<<"};

constexpr std::array<std::string_view, 5> UNARY_OPERATORS{">>", "**", "*", "+", "-"};

template<size_t N>
auto contains(const std::array<std::string_view, N>& values, std::string_view value) -> bool {
    return std::find(values.begin(), values.end(), value) != values.end();
}

auto is_operator(std::string_view op) -> bool {
    return is_binary_operator(op) || is_unary_operator(op);
}

auto is_close_paren(std::string_view text) -> bool {
    return text.size() == 1 && CLOSE_PARENS.find(text[0]) != std::string_view::npos;
}

// Offset into the dedented text, reported against the full text
auto at(const LogicalLine& line, size_t offset) -> Column {
    return line.indent_width() + offset;
}

auto is_layout_token(TokenKind kind) -> bool {
    return kind == TokenKind::INDENT || kind == TokenKind::DEDENT;
}

} // namespace

auto is_keyword(std::string_view word) -> bool {
    return contains(KEYWORDS, word);
}

auto is_binary_operator(std::string_view op) -> bool {
    return contains(BINARY_OPERATORS, op);
}

auto is_unary_operator(std::string_view op) -> bool {
    return contains(UNARY_OPERATORS, op);
}

auto blank_lines(const LogicalContext& context) -> std::optional<Finding> {
    static const std::regex docstring(R"re(u?r?["'])re");

    const auto& line = context.line;
    const auto* previous = context.previous;
    if (line.line_number == 1 || previous == nullptr) {
        return std::nullopt;  // No blank lines expected before the first line
    }

    auto max_blank_lines = std::max(line.blank_lines, line.blank_lines_before_comment);
    const auto& text = line.dedented_text;

    if (previous->dedented_text.starts_with('@')) {
        if (max_blank_lines > 0) {
            return Finding{.code = "E304"};
        }
        return std::nullopt;
    }
    if (max_blank_lines > 2 || (line.indent_level > 0 && max_blank_lines == 2)) {
        return Finding{.code = "E303", .context = {.count = max_blank_lines}};
    }
    if (text.starts_with("def ") || text.starts_with("class ") || text.starts_with('@')) {
        if (line.indent_level > 0) {
            bool opens_block = previous->indent_level < line.indent_level;
            bool after_docstring = std::regex_search(previous->dedented_text, docstring,
                                                     std::regex_constants::match_continuous);
            if (max_blank_lines == 0 && !opens_block && !after_docstring) {
                return Finding{.code = "E301"};
            }
        } else if (max_blank_lines != 2) {
            return Finding{.code = "E302", .context = {.count = max_blank_lines}};
        }
    }
    return std::nullopt;
}

auto extraneous_whitespace(const LogicalContext& context) -> std::optional<Finding> {
    static const std::regex pattern(R"re([\[({] | [\]}),;:])re");

    const auto& text = context.line.dedented_text;
    for (auto it = std::sregex_iterator(text.begin(), text.end(), pattern);
         it != std::sregex_iterator(); ++it) {
        auto matched = it->str();
        auto found = static_cast<size_t>(it->position());
        char c = strip(matched).front();

        if (matched.front() != ' ' && OPEN_PARENS.find(c) != std::string_view::npos) {
            return Finding{.code = "E201", .column = at(context.line, found + 1),
                           .context = {.character = c}};
        }
        if (matched.front() == ' ' && (found == 0 || text[found - 1] != ',')) {
            if (CLOSE_PARENS.find(c) != std::string_view::npos) {
                return Finding{.code = "E202", .column = at(context.line, found),
                               .context = {.character = c}};
            }
            return Finding{.code = "E203", .column = at(context.line, found),
                           .context = {.character = c}};
        }
    }
    return std::nullopt;
}

auto missing_whitespace_after_separator(const LogicalContext& context) -> std::optional<Finding> {
    const auto& text = context.line.dedented_text;
    for (size_t index = 0; index + 1 < text.size(); ++index) {
        char c = text[index];
        char next = text[index + 1];
        if (std::string_view(",;:").find(c) == std::string_view::npos ||
            INDENTATION_WHITESPACE.find(next) != std::string_view::npos) {
            continue;
        }

        auto before = std::string_view(text).substr(0, index);
        if (c == ':' && std::count(before.begin(), before.end(), '[') >
                            std::count(before.begin(), before.end(), ']')) {
            continue;  // Slice
        }
        if (c == ',' && next == ')') {
            continue;  // One-element tuple: (3,)
        }
        return Finding{.code = "E231", .column = at(context.line, index),
                       .context = {.character = c}};
    }
    return std::nullopt;
}

auto indentation(const LogicalContext& context) -> std::optional<Finding> {
    const auto& line = context.line;
    if (context.document.indent_char() == ' ' && line.indent_level % 4 != 0) {
        return Finding{.code = "E111"};
    }

    const auto* previous = context.previous;
    if (previous == nullptr) {
        return std::nullopt;
    }

    bool indent_expected = rstrip(previous->text).ends_with(':');
    if (indent_expected && line.indent_level <= previous->indent_level) {
        return Finding{.code = "E112"};
    }
    if (!indent_expected && line.indent_level > previous->indent_level) {
        return Finding{.code = "E113"};
    }
    return std::nullopt;
}

auto whitespace_before_parameters(const LogicalContext& context) -> std::optional<Finding> {
    std::vector<const Token*> tokens;
    for (const auto& token : context.line.tokens) {
        if (!is_layout_token(token.kind)) {
            tokens.push_back(&token);
        }
    }
    if (tokens.empty()) {
        return std::nullopt;
    }

    for (size_t index = 1; index < tokens.size(); ++index) {
        const auto& previous = *tokens[index - 1];
        const auto& token = *tokens[index];
        bool opens_parameters = token.kind == TokenKind::OP && (token.text == "(" || token.text == "[");
        bool after_callable = previous.kind == TokenKind::NAME || is_close_paren(previous.text);
        // "class A (B):" is tolerated
        bool class_bases = index >= 2 && tokens[index - 2]->text == "class";

        if (opens_parameters && token.start != previous.end && after_callable && !class_bases &&
            !is_keyword(previous.text)) {
            return Finding{.code = "E211", .column = previous.end,
                           .context = {.character = token.text.front()}};
        }
    }
    return std::nullopt;
}

auto whitespace_around_operator(const LogicalContext& context) -> std::optional<Finding> {
    static const std::regex pattern(R"re(([^\w\s]*)\s*(\t|  )\s*([^\w\s]*))re");

    const auto& text = context.line.dedented_text;
    for (auto it = std::sregex_iterator(text.begin(), text.end(), pattern);
         it != std::sregex_iterator(); ++it) {
        const auto& match = *it;
        bool tab = match.str(2).find('\t') != std::string::npos;
        auto offset = static_cast<size_t>(match.position(2));

        if (is_operator(match.str(1))) {
            return Finding{.code = tab ? "E224" : "E222", .column = at(context.line, offset)};
        }
        if (is_operator(match.str(3))) {
            return Finding{.code = tab ? "E223" : "E221", .column = at(context.line, offset)};
        }
    }
    return std::nullopt;
}

auto missing_whitespace_around_operator(const LogicalContext& context) -> std::optional<Finding> {
    int parens = 0;
    bool need_space = false;
    TokenKind previous_kind = TokenKind::OP;
    std::string_view previous_text;
    std::optional<Position> previous_end;

    for (const auto& token : context.line.tokens) {
        // Backticks arrive as ERRORTOKEN
        if (token.kind == TokenKind::NL || token.kind == TokenKind::NEWLINE ||
            token.kind == TokenKind::COMMENT || token.kind == TokenKind::ERRORTOKEN ||
            is_layout_token(token.kind)) {
            continue;
        }

        const auto& text = token.text;
        if (text == "(" || text == "lambda") {
            ++parens;
        } else if (text == ")") {
            --parens;
        }

        if (need_space) {
            if (token.start != previous_end) {
                need_space = false;
            } else if (text == ">" && previous_text == "<") {
                // "<>" read as two adjacent tokens
            } else {
                return Finding{.code = "E225", .column = *previous_end};
            }
        } else if (token.kind == TokenKind::OP && previous_end) {
            if (text == "=" && parens > 0) {
                // Keyword argument or default: foo(bar=None)
            } else if (is_binary_operator(text)) {
                need_space = true;
            } else if (is_unary_operator(text)) {
                // Unary -1, +x and argument unpacking foo(*args, **kwargs)
                if (previous_kind == TokenKind::OP) {
                    need_space = is_close_paren(previous_text);
                } else if (previous_kind == TokenKind::NAME) {
                    need_space = !is_keyword(previous_text);
                } else {
                    need_space = true;
                }
            }
            if (need_space && token.start == *previous_end) {
                return Finding{.code = "E225", .column = *previous_end};
            }
        }

        previous_kind = token.kind;
        previous_text = text;
        previous_end = token.end;
    }
    return std::nullopt;
}

auto whitespace_around_comma(const LogicalContext& context) -> std::optional<Finding> {
    const auto& text = context.line.dedented_text;
    for (char separator : std::string_view(",;:")) {
        auto found = text.find(std::string(1, separator) + "  ");
        if (found != std::string::npos) {
            return Finding{.code = "E241", .column = at(context.line, found + 1),
                           .context = {.character = separator}};
        }
        found = text.find(std::string(1, separator) + "\t");
        if (found != std::string::npos) {
            return Finding{.code = "E242", .column = at(context.line, found + 1),
                           .context = {.character = separator}};
        }
    }
    return std::nullopt;
}

auto whitespace_around_named_parameter_equals(const LogicalContext& context)
    -> std::optional<Finding> {
    static const std::regex pattern(R"re([()]|\s=[^=]|[^=!<>]=\s)re");

    int parens = 0;
    const auto& text = context.line.dedented_text;
    for (auto it = std::sregex_iterator(text.begin(), text.end(), pattern);
         it != std::sregex_iterator(); ++it) {
        auto matched = it->str();
        if (parens > 0 && matched.size() == 3) {
            return Finding{.code = "E251",
                           .column = at(context.line, static_cast<size_t>(it->position()))};
        }
        if (matched == "(") {
            ++parens;
        } else if (matched == ")") {
            --parens;
        }
    }
    return std::nullopt;
}

auto whitespace_around_inline_comment(const LogicalContext& context) -> std::optional<Finding> {
    Position previous_end{0, 0};
    for (const auto& token : context.line.tokens) {
        if (token.kind == TokenKind::NL) {
            continue;
        }
        if (token.kind != TokenKind::COMMENT) {
            previous_end = token.end;
            continue;
        }

        // Block comments are not inline comments
        auto before = std::string_view(token.line).substr(
            0, std::min(static_cast<size_t>(token.start.col), token.line.size()));
        if (is_blank(before)) {
            continue;
        }

        const auto& text = token.text;
        if (text.size() > 1 && (text.starts_with("#  ") || !text.starts_with("# "))) {
            return Finding{.code = "E262", .column = token.start};
        }
        if (previous_end.row == token.start.row && token.start.col < previous_end.col + 2) {
            return Finding{.code = "E261", .column = previous_end};
        }
    }
    return std::nullopt;
}

auto imports_on_separate_lines(const LogicalContext& context) -> std::optional<Finding> {
    const auto& text = context.line.dedented_text;
    if (!text.starts_with("import ")) {
        return std::nullopt;
    }
    auto found = text.find(',');
    if (found == std::string::npos) {
        return std::nullopt;
    }
    return Finding{.code = "E401", .column = at(context.line, found)};
}

auto compound_statements(const LogicalContext& context) -> std::optional<Finding> {
    static const std::regex lambda(R"re(\blambda\b)re");

    const auto& text = context.line.dedented_text;
    auto found = text.find(':');
    if (found != std::string::npos && found + 1 < text.size()) {
        auto before = text.substr(0, found);
        auto count = [&before](char c) { return std::count(before.begin(), before.end(), c); };
        if (count('{') <= count('}') &&   // {'a': 1}
            count('[') <= count(']') &&   // [1:2]
            !std::regex_search(before, lambda)) {
            return Finding{.code = "E701", .column = at(context.line, found)};
        }
    }

    found = text.find(';');
    if (found != std::string::npos) {
        return Finding{.code = "E702", .column = at(context.line, found)};
    }
    return std::nullopt;
}

auto deprecated_has_key(const LogicalContext& context) -> std::optional<Finding> {
    auto found = context.line.dedented_text.find(".has_key(");
    if (found == std::string::npos) {
        return std::nullopt;
    }
    return Finding{.code = "W601", .column = at(context.line, found)};
}

auto deprecated_raise_comma(const LogicalContext& context) -> std::optional<Finding> {
    static const std::regex pattern(R"re(raise\s+\w+\s*(,))re");

    std::smatch match;
    const auto& text = context.line.dedented_text;
    if (!std::regex_search(text, match, pattern, std::regex_constants::match_continuous)) {
        return std::nullopt;
    }
    return Finding{.code = "W602", .column = at(context.line, static_cast<size_t>(match.position(1)))};
}

auto deprecated_not_equal(const LogicalContext& context) -> std::optional<Finding> {
    auto found = context.line.dedented_text.find("<>");
    if (found == std::string::npos) {
        return std::nullopt;
    }
    return Finding{.code = "W603", .column = at(context.line, found)};
}

auto deprecated_backticks(const LogicalContext& context) -> std::optional<Finding> {
    auto found = context.line.dedented_text.find('`');
    if (found == std::string::npos) {
        return std::nullopt;
    }
    return Finding{.code = "W604", .column = at(context.line, found)};
}

auto register_logical_checks(CheckerRegistry& registry) -> void {
    registry.add_logical({
        .name = "blank_lines",
        .codes = {"E301", "E302", "E303", "E304"},
        .documentation =
            "Separate top-level function and class definitions with two blank lines.\n"
            "\n"
            "Method definitions inside a class are separated by a single blank line.\n"
            "\n"
            "Extra blank lines may be used (sparingly) to separate groups of related\n"
            "functions. Blank lines may be omitted between a bunch of related\n"
            "one-liners (e.g. a set of dummy implementations).\n"
            "\n"
            "Use blank lines in functions, sparingly, to indicate logical sections.",
        .examples = {"Okay: def a():\\n    pass\\n\\n\\ndef b():\\n    pass",
                     "Okay: def a():\\n    pass\\n\\n\\n# Foo\\n# Bar\\n\\ndef b():\\n    pass",
                     "E301: class Foo:\\n    b = 0\\n    def bar():\\n        pass",
                     "E302: def a():\\n    pass\\n\\ndef b(n):\\n    pass",
                     "E303: def a():\\n    pass\\n\\n\\n\\ndef b(n):\\n    pass",
                     "E303: def a():\\n\\n\\n\\n    pass",
                     "E304: @decorator\\n\\ndef a():\\n    pass"},
        .requirements = {.previous_line = true},
        .check = blank_lines,
    });

    registry.add_logical({
        .name = "extraneous_whitespace",
        .codes = {"E201", "E202", "E203"},
        .documentation =
            "Avoid extraneous whitespace in the following situations:\n"
            "\n"
            "- Immediately inside parentheses, brackets or braces.\n"
            "\n"
            "- Immediately before a comma, semicolon, or colon.",
        .examples = {"Okay: spam(ham[1], {eggs: 2})",
                     "E201: spam( ham[1], {eggs: 2})",
                     "E201: spam(ham[ 1], {eggs: 2})",
                     "E201: spam(ham[1], { eggs: 2})",
                     "E202: spam(ham[1], {eggs: 2} )",
                     "E202: spam(ham[1 ], {eggs: 2})",
                     "E202: spam(ham[1], {eggs: 2 })",
                     "E203: if x == 4: print x, y; x, y = y , x",
                     "E203: if x == 4: print x, y ; x, y = y, x",
                     "E203: if x == 4 : print x, y; x, y = y, x"},
        .check = extraneous_whitespace,
    });

    registry.add_logical({
        .name = "missing_whitespace_after_separator",
        .codes = {"E231"},
        .documentation = "Each comma, semicolon or colon should be followed by whitespace.",
        .examples = {"Okay: [a, b]", "Okay: (3,)", "Okay: a[1:4]", "Okay: a[:4]", "Okay: a[1:]",
                     "Okay: a[1:4:2]", "E231: ['a','b']", "E231: foo(bar,baz)"},
        .check = missing_whitespace_after_separator,
    });

    registry.add_logical({
        .name = "indentation",
        .codes = {"E111", "E112", "E113"},
        .documentation =
            "Use 4 spaces per indentation level.\n"
            "\n"
            "For really old code that you don't want to mess up, you can continue to\n"
            "use 8-space tabs.",
        .examples = {"Okay: a = 1", "Okay: if a == 0:\\n    a = 1", "E111:   a = 1",
                     "Okay: for item in items:\\n    pass", "E112: for item in items:\\npass",
                     "Okay: a = 1\\nb = 2", "E113: a = 1\\n    b = 2"},
        .check = indentation,
    });

    registry.add_logical({
        .name = "whitespace_before_parameters",
        .codes = {"E211"},
        .documentation =
            "Avoid extraneous whitespace in the following situations:\n"
            "\n"
            "- Immediately before the open parenthesis that starts the argument\n"
            "  list of a function call.\n"
            "\n"
            "- Immediately before the open parenthesis that starts an indexing or\n"
            "  slicing.",
        .examples = {"Okay: spam(1)", "E211: spam (1)", "Okay: dict['key'] = list[index]",
                     "E211: dict ['key'] = list[index]", "E211: dict['key'] = list [index]"},
        .requirements = {.tokens = true},
        .check = whitespace_before_parameters,
    });

    registry.add_logical({
        .name = "whitespace_around_operator",
        .codes = {"E221", "E222", "E223", "E224"},
        .documentation =
            "Avoid extraneous whitespace in the following situations:\n"
            "\n"
            "- More than one space around an assignment (or other) operator to\n"
            "  align it with another.",
        .examples = {"Okay: a = 12 + 3", "E221: a = 4  + 5", "E222: a = 4 +  5",
                     "E223: a = 4\\t+ 5", "E224: a = 4 +\\t5"},
        .check = whitespace_around_operator,
    });

    registry.add_logical({
        .name = "missing_whitespace_around_operator",
        .codes = {"E225"},
        .documentation =
            "- Always surround these binary operators with a single space on\n"
            "  either side: assignment (=), augmented assignment (+=, -= etc.),\n"
            "  comparisons (==, <, >, !=, <>, <=, >=, in, not in, is, is not),\n"
            "  Booleans (and, or, not).\n"
            "\n"
            "- Use spaces around arithmetic operators.",
        .examples = {"Okay: i = i + 1",
                     "Okay: submitted += 1",
                     "Okay: x = x * 2 - 1",
                     "Okay: hypot2 = x * x + y * y",
                     "Okay: c = (a + b) * (a - b)",
                     "Okay: foo(bar, key='word', *args, **kwargs)",
                     "Okay: baz(**kwargs)",
                     "Okay: negative = -1",
                     "Okay: spam(-1)",
                     "Okay: alpha[:-i]",
                     "Okay: if not -5 < x < +5:\\n    pass",
                     "Okay: lambda *args, **kw: (args, kw)",
                     "E225: i=i+1",
                     "E225: submitted +=1",
                     "E225: x = x*2 - 1",
                     "E225: hypot2 = x*x + y*y",
                     "E225: c = (a+b) * (a-b)",
                     "E225: c = alpha -4",
                     "E225: z = x **y"},
        .requirements = {.tokens = true},
        .check = missing_whitespace_around_operator,
    });

    registry.add_logical({
        .name = "whitespace_around_comma",
        .codes = {"E241", "E242"},
        .documentation =
            "Avoid extraneous whitespace in the following situations:\n"
            "\n"
            "- More than one space around an assignment (or other) operator to\n"
            "  align it with another.\n"
            "\n"
            "This is also applied around commas. Disabled by default.",
        .examples = {"Okay: a = (1, 2)", "E241: a = (1,  2)", "E242: a = (1,\\t2)"},
        .check = whitespace_around_comma,
    });

    registry.add_logical({
        .name = "whitespace_around_named_parameter_equals",
        .codes = {"E251"},
        .documentation =
            "Don't use spaces around the '=' sign when used to indicate a\n"
            "keyword argument or a default parameter value.",
        .examples = {"Okay: def complex(real, imag=0.0):\\n    pass",
                     "Okay: return magic(r=real, i=imag)",
                     "Okay: boolean(a == b)",
                     "Okay: boolean(a != b)",
                     "Okay: boolean(a <= b)",
                     "Okay: boolean(a >= b)",
                     "E251: def complex(real, imag = 0.0):\\n    pass",
                     "E251: return magic(r = real, i = imag)"},
        .check = whitespace_around_named_parameter_equals,
    });

    registry.add_logical({
        .name = "whitespace_around_inline_comment",
        .codes = {"E261", "E262"},
        .documentation =
            "Separate inline comments by at least two spaces.\n"
            "\n"
            "An inline comment is a comment on the same line as a statement. Inline\n"
            "comments should be separated by at least two spaces from the statement.\n"
            "They should start with a # and a single space.",
        .examples = {"Okay: x = x + 1  # Increment x", "Okay: x = x + 1    # Increment x",
                     "E261: x = x + 1 # Increment x", "E262: x = x + 1  #Increment x",
                     "E262: x = x + 1  #  Increment x"},
        .requirements = {.tokens = true},
        .check = whitespace_around_inline_comment,
    });

    registry.add_logical({
        .name = "imports_on_separate_lines",
        .codes = {"E401"},
        .documentation = "Imports should usually be on separate lines.",
        .examples = {"Okay: import os\\nimport sys", "E401: import sys, os",
                     "Okay: from subprocess import Popen, PIPE", "Okay: from myclas import MyClass",
                     "Okay: from foo.bar.yourclass import YourClass", "Okay: import myclass",
                     "Okay: import foo.bar.yourclass"},
        .check = imports_on_separate_lines,
    });

    registry.add_logical({
        .name = "compound_statements",
        .codes = {"E701", "E702"},
        .documentation =
            "Compound statements (multiple statements on the same line) are\n"
            "generally discouraged.\n"
            "\n"
            "While sometimes it's okay to put an if/for/while with a small body\n"
            "on the same line, never do this for multi-clause statements. Also\n"
            "avoid folding such long lines!",
        .examples = {"Okay: if foo == 'blah':\\n    do_blah_thing()",
                     "Okay: do_one()",
                     "E701: if foo == 'blah': do_blah_thing()",
                     "E701: for x in lst: total += x",
                     "E701: while t < 10: t = delay()",
                     "E701: try: something()",
                     "E701: if foo == 'blah': one(); two(); three()",
                     "E702: do_one(); do_two(); do_three()"},
        .check = compound_statements,
    });

    registry.add_logical({
        .name = "deprecated_has_key",
        .codes = {"W601"},
        .documentation =
            "The {}.has_key() method will be removed in the future version of\n"
            "Python. Use the 'in' operation instead.",
        .examples = {"Okay: if 'b' in d:\\n    pass", "W601: {'A': 3}.has_key('A')"},
        .check = deprecated_has_key,
    });

    registry.add_logical({
        .name = "deprecated_raise_comma",
        .codes = {"W602"},
        .documentation =
            "When raising an exception, use \"raise ValueError('message')\"\n"
            "instead of the older form \"raise ValueError, 'message'\".\n"
            "\n"
            "The paren-using form is preferred because when the exception arguments\n"
            "are long or include string formatting, you don't need to use line\n"
            "continuation characters thanks to the containing parentheses. The older\n"
            "form will be removed in Python 3000.",
        .examples = {"Okay: raise ValueError('message')", "W602: raise ValueError, 'message'"},
        .check = deprecated_raise_comma,
    });

    registry.add_logical({
        .name = "deprecated_not_equal",
        .codes = {"W603"},
        .documentation =
            "!= can also be written <>, but this is an obsolete usage kept for\n"
            "backwards compatibility only. New code should always use !=.",
        .examples = {"Okay: a != b", "W603: a <> b"},
        .check = deprecated_not_equal,
    });

    registry.add_logical({
        .name = "deprecated_backticks",
        .codes = {"W604"},
        .documentation = "Backticks are removed in Python 3000. Use repr() instead.",
        .examples = {"Okay: print(repr({}))", "W604: print `{}`"},
        .check = deprecated_backticks,
    });
}

} // namespace pepcheck::checks
