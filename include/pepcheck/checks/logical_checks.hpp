#pragma once

#include "pepcheck/checks/checker_registry.hpp"
#include <optional>
#include <string_view>

namespace pepcheck::checks {

// Keywords after which an operator is unary and '(' does not start a call
auto is_keyword(std::string_view word) -> bool;
auto is_binary_operator(std::string_view op) -> bool;
auto is_unary_operator(std::string_view op) -> bool;

// Rules evaluated once per logical line (pure). Text rules look at the
// dedented text and report offsets into the full text.
auto blank_lines(const LogicalContext& context) -> std::optional<Finding>;
auto extraneous_whitespace(const LogicalContext& context) -> std::optional<Finding>;
auto missing_whitespace_after_separator(const LogicalContext& context) -> std::optional<Finding>;
auto indentation(const LogicalContext& context) -> std::optional<Finding>;
auto whitespace_before_parameters(const LogicalContext& context) -> std::optional<Finding>;
auto whitespace_around_operator(const LogicalContext& context) -> std::optional<Finding>;
auto missing_whitespace_around_operator(const LogicalContext& context) -> std::optional<Finding>;
auto whitespace_around_comma(const LogicalContext& context) -> std::optional<Finding>;
auto whitespace_around_named_parameter_equals(const LogicalContext& context)
    -> std::optional<Finding>;
auto whitespace_around_inline_comment(const LogicalContext& context) -> std::optional<Finding>;
auto imports_on_separate_lines(const LogicalContext& context) -> std::optional<Finding>;
auto compound_statements(const LogicalContext& context) -> std::optional<Finding>;
auto deprecated_has_key(const LogicalContext& context) -> std::optional<Finding>;
auto deprecated_raise_comma(const LogicalContext& context) -> std::optional<Finding>;
auto deprecated_not_equal(const LogicalContext& context) -> std::optional<Finding>;
auto deprecated_backticks(const LogicalContext& context) -> std::optional<Finding>;

auto register_logical_checks(CheckerRegistry& registry) -> void;

} // namespace pepcheck::checks
