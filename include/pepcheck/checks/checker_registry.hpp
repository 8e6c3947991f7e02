#pragma once

#include "pepcheck/core/config.hpp"
#include "pepcheck/core/diagnostic.hpp"
#include "pepcheck/core/document.hpp"
#include "pepcheck/core/logical_line.hpp"
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pepcheck {

// Everything a physical line checker may look at
struct PhysicalContext {
    const PhysicalLine& line;
    const Document& document;
    const CheckerConfig& config;
};

// Everything a logical line checker may look at
struct LogicalContext {
    const LogicalLine& line;
    const LogicalLine* previous;  // nullptr for the first statement
    const Document& document;
    const CheckerConfig& config;
};

// State a checker cannot run without. The orchestrator skips the checker
// (no diagnostic) when a requirement is not met.
struct Requirements {
    bool tokens = false;
    bool previous_line = false;
};

using PhysicalCheck = std::function<std::optional<Finding>(const PhysicalContext&)>;
using PhysicalFix = std::function<std::string(const PhysicalContext&)>;
using LogicalCheck = std::function<std::optional<Finding>(const LogicalContext&)>;

struct PhysicalChecker {
    std::string name;
    std::vector<std::string> codes;
    std::string documentation;
    std::vector<std::string> examples;  // "Okay: ..." or "E101: ...", \n \t \s escaped
    PhysicalCheck check;
    PhysicalFix fix;  // Empty when the rule has no whitespace-only fix
};

struct LogicalChecker {
    std::string name;
    std::vector<std::string> codes;
    std::string documentation;
    std::vector<std::string> examples;
    Requirements requirements;
    LogicalCheck check;
};

// A decoded example: expected code ("Okay" for none) and the source lines
struct CheckerExample {
    std::string code;
    std::vector<std::string> lines;
};

auto parse_example(std::string_view example) -> std::optional<CheckerExample>;

// Ordered, explicitly assembled set of checkers
class CheckerRegistry {
public:
    // Built-in rule set, assembled once
    static auto standard() -> const CheckerRegistry&;

    auto add_physical(PhysicalChecker checker) -> CheckerRegistry&;
    auto add_logical(LogicalChecker checker) -> CheckerRegistry&;

    auto physical() const -> const std::vector<PhysicalChecker>& { return physical_; }
    auto logical() const -> const std::vector<LogicalChecker>& { return logical_; }

    // Documentation of the checker that emits `code`, empty if none does
    auto documentation_for(std::string_view code) const -> std::string_view;

private:
    std::vector<PhysicalChecker> physical_;
    std::vector<LogicalChecker> logical_;
};

} // namespace pepcheck
