#pragma once

#include "pepcheck/checks/checker_registry.hpp"
#include <optional>
#include <string>

namespace pepcheck::checks {

// Rules evaluated once per raw line (pure)
auto tabs_or_spaces(const PhysicalContext& context) -> std::optional<Finding>;
auto tabs_obsolete(const PhysicalContext& context) -> std::optional<Finding>;
auto trailing_whitespace(const PhysicalContext& context) -> std::optional<Finding>;
auto trailing_blank_lines(const PhysicalContext& context) -> std::optional<Finding>;
auto missing_newline(const PhysicalContext& context) -> std::optional<Finding>;
auto maximum_line_length(const PhysicalContext& context) -> std::optional<Finding>;

// Whitespace-only fixes, the returned line keeps (or gains) its terminator
auto fix_trailing_whitespace(const PhysicalContext& context) -> std::string;
auto fix_missing_newline(const PhysicalContext& context) -> std::string;

auto register_physical_checks(CheckerRegistry& registry) -> void;

} // namespace pepcheck::checks
