#include "pepcheck/checks/physical_checks.hpp"
#include "pepcheck/core/text_utils.hpp"

namespace pepcheck::checks {

auto tabs_or_spaces(const PhysicalContext& context) -> std::optional<Finding> {
    auto indent = leading_indentation(context.line.text);
    for (size_t offset = 0; offset < indent.size(); ++offset) {
        if (indent[offset] != context.document.indent_char()) {
            return Finding{.code = "E101", .column = offset};
        }
    }
    return std::nullopt;
}

auto tabs_obsolete(const PhysicalContext& context) -> std::optional<Finding> {
    auto indent = leading_indentation(context.line.text);
    auto column = indent.find('\t');
    if (column == std::string::npos) {
        return std::nullopt;
    }
    return Finding{.code = "W191", .column = column};
}

auto trailing_whitespace(const PhysicalContext& context) -> std::optional<Finding> {
    auto without_newlines = rstrip_newlines(context.line.text);
    auto without_spaces = rstrip(without_newlines);
    if (without_newlines == without_spaces) {
        return std::nullopt;
    }
    if (without_spaces.empty()) {
        return Finding{.code = "W293"};
    }
    return Finding{.code = "W291", .column = without_spaces.size()};
}

auto trailing_blank_lines(const PhysicalContext& context) -> std::optional<Finding> {
    if (is_blank(context.line.text) &&
        static_cast<size_t>(context.line.line_number) == context.document.line_count()) {
        return Finding{.code = "W391"};
    }
    return std::nullopt;
}

auto missing_newline(const PhysicalContext& context) -> std::optional<Finding> {
    if (!line_ending(context.line.text).empty()) {
        return std::nullopt;
    }
    return Finding{.code = "W292", .column = context.line.text.size()};
}

auto maximum_line_length(const PhysicalContext& context) -> std::optional<Finding> {
    auto stripped = rstrip(context.line.text);
    auto limit = context.config.max_line_length;
    auto length = stripped.size();
    if (length > limit) {
        // Multi-byte characters count once; invalid UTF-8 keeps the byte count
        length = utf8_length(stripped).value_or(length);
    }
    if (length <= limit) {
        return std::nullopt;
    }
    return Finding{.code = "E501", .column = limit, .context = {.count = length}};
}

auto fix_trailing_whitespace(const PhysicalContext& context) -> std::string {
    const auto& text = context.line.text;
    return rstrip(text) + line_ending(text);
}

auto fix_missing_newline(const PhysicalContext& context) -> std::string {
    const auto& text = context.line.text;
    if (!missing_newline(context)) {
        return text;
    }
    auto ending = context.document.line_ending().value_or(LineEnding::LF);
    return text + line_ending_text(ending);
}

auto register_physical_checks(CheckerRegistry& registry) -> void {
    registry.add_physical({
        .name = "tabs_or_spaces",
        .codes = {"E101"},
        .documentation =
            "Never mix tabs and spaces.\n"
            "\n"
            "The most popular way of indenting Python is with spaces only. The\n"
            "second-most popular way is with tabs only. Code indented with a mixture\n"
            "of tabs and spaces should be converted to using spaces exclusively. When\n"
            "invoking the Python command line interpreter with the -t option, it issues\n"
            "warnings about code that illegally mixes tabs and spaces. When using -tt\n"
            "these warnings become errors. These options are highly recommended!",
        .examples = {"Okay: if a == 0:\\n        a = 1\\n        b = 1",
                     "E101: if a == 0:\\n        a = 1\\n\\tb = 1"},
        .check = tabs_or_spaces,
    });

    registry.add_physical({
        .name = "tabs_obsolete",
        .codes = {"W191"},
        .documentation =
            "For new projects, spaces-only are strongly recommended over tabs. Most\n"
            "editors have features that make this easy to do.",
        .examples = {"Okay: if True:\\n    return", "W191: if True:\\n\\treturn"},
        .check = tabs_obsolete,
    });

    registry.add_physical({
        .name = "trailing_whitespace",
        .codes = {"W291", "W293"},
        .documentation =
            "Trailing whitespace is superfluous.\n"
            "\n"
            "The warning returned varies on whether the line itself is blank, for\n"
            "easier filtering for those who want to indent their blank lines.",
        .examples = {"Okay: spam(1)", "W291: spam(1)\\s",
                     "W293: class Foo(object):\\n    \\n    bang = 12"},
        .check = trailing_whitespace,
        .fix = fix_trailing_whitespace,
    });

    registry.add_physical({
        .name = "trailing_blank_lines",
        .codes = {"W391"},
        .documentation = "Trailing blank lines are superfluous.",
        .examples = {"Okay: spam(1)", "W391: spam(1)\\n"},
        .check = trailing_blank_lines,
    });

    registry.add_physical({
        .name = "missing_newline",
        .codes = {"W292"},
        .documentation = "The last line should have a newline.",
        .examples = {"Okay: spam(1)"},
        .check = missing_newline,
        .fix = fix_missing_newline,
    });

    registry.add_physical({
        .name = "maximum_line_length",
        .codes = {"E501"},
        .documentation =
            "Limit all lines to a maximum of 79 characters.\n"
            "\n"
            "There are still many devices around that are limited to 80 character\n"
            "lines; plus, limiting windows to 80 characters makes it possible to have\n"
            "several windows side-by-side. The default wrapping on such devices looks\n"
            "ugly. Therefore, please limit all lines to a maximum of 79 characters.\n"
            "For flowing long blocks of text (docstrings or comments), limiting the\n"
            "length to 72 characters is recommended.",
        .examples = {"Okay: spam(1)"},
        .check = maximum_line_length,
    });
}

} // namespace pepcheck::checks
