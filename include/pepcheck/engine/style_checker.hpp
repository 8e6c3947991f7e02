#pragma once

#include "pepcheck/checks/checker_registry.hpp"
#include "pepcheck/core/config.hpp"
#include "pepcheck/core/diagnostic_sink.hpp"
#include "pepcheck/core/document.hpp"
#include "pepcheck/core/logical_line.hpp"
#include "pepcheck/interfaces.hpp"
#include "pepcheck/parsers/python_tokenizer.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace pepcheck {

// Per-run counters, reset by every check_all()
struct RunStatistics {
    size_t physical_lines{};
    size_t logical_lines{};
    size_t diagnostics{};
    size_t suppressed{};  // Found but dropped by ignore/select

    auto operator==(const RunStatistics& other) const -> bool = default;
};

// Checks one file: drives the tokenizer, runs the physical checkers as each
// line is read and the logical checkers as each statement closes.
// The registry must outlive the checker.
class StyleChecker {
public:
    explicit StyleChecker(std::vector<std::string> lines, CheckerConfig config = {},
                          const CheckerRegistry& registry = CheckerRegistry::standard(),
                          TokenizerFactory tokenizer_factory = PythonTokenizer::factory());

    static auto from_source(std::string_view source, CheckerConfig config = {}) -> StyleChecker;

    // Throws StructuralError on a malformed token stream; diagnostics found
    // up to that point stay available through results()
    auto check_all() -> const DiagnosticSink&;

    // Lines with every whitespace-only physical fix applied
    auto autofix() const -> std::vector<std::string>;

    auto results() const -> const DiagnosticSink& { return results_; }
    auto statistics() const -> const RunStatistics& { return statistics_; }
    auto document() const -> const Document& { return document_; }
    auto config() const -> const CheckerConfig& { return config_; }
    auto documentation_for(std::string_view code) const -> std::string_view;

private:
    auto readline_check_physical() -> std::string;
    auto check_physical(const PhysicalLine& line) -> void;
    auto check_logical(const LogicalLine& line, const LogicalLine* previous) -> void;
    auto record(const Finding& finding, Position location, LineKind origin,
                const std::string& checker) -> void;

    Document document_;
    CheckerConfig config_;
    const CheckerRegistry* registry_;
    TokenizerFactory tokenizer_factory_;
    DiagnosticSink results_;
    RunStatistics statistics_;
    size_t cursor_ = 0;  // Lines handed to the tokenizer so far
};

} // namespace pepcheck
