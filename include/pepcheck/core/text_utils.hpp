#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pepcheck {

inline constexpr std::string_view INDENTATION_WHITESPACE = " \t";
inline constexpr std::string_view OPEN_PARENS = "([{";
inline constexpr std::string_view CLOSE_PARENS = ")]}";

// Leading run of indentation characters (spaces and tabs by default)
auto leading_indentation(std::string_view line,
                         std::string_view indent_chars = INDENTATION_WHITESPACE) -> std::string;

// Remove trailing \n, \r and form feed characters
auto rstrip_newlines(std::string_view line) -> std::string;

// The terminator that rstrip_newlines would remove ("" when there is none)
auto line_ending(std::string_view line) -> std::string;

auto rstrip(std::string_view text) -> std::string;
auto strip(std::string_view text) -> std::string;
auto is_blank(std::string_view text) -> bool;

// Amount of indentation, tabs expanded to the next multiple of 8
auto indentation_level(std::string_view indentation) -> int;

// Replace string literal contents with 'x' to prevent syntax matching.
// Prefix letters and quote delimiters are kept, length is preserved.
auto mute_string(std::string_view text) -> std::string;

// Number of UTF-8 code points, nullopt when the bytes are not valid UTF-8
auto utf8_length(std::string_view text) -> std::optional<size_t>;

// Split source text into lines, each keeping its terminator
auto split_lines(std::string_view text) -> std::vector<std::string>;

auto starts_with_any(std::string_view code, const std::vector<std::string>& prefixes) -> bool;

} // namespace pepcheck
