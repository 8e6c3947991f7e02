#pragma once

#include "pepcheck/core/diagnostic.hpp"
#include <map>
#include <set>
#include <string>
#include <tuple>
#include <vector>

namespace pepcheck {

// Ordered collection of the diagnostics found in one file
class DiagnosticSink {
public:
    // Returns false when an identical diagnostic (code, row, column) exists
    auto add(Diagnostic diagnostic) -> bool;
    auto clear() -> void;

    auto diagnostics() const -> const std::vector<Diagnostic>& { return diagnostics_; }
    auto size() const -> size_t { return diagnostics_.size(); }
    auto empty() const -> bool { return diagnostics_.empty(); }

    auto contains_code(const std::string& code) const -> bool;
    auto ignoring(const std::set<std::string>& codes) const -> std::vector<Diagnostic>;

    // First occurrence of every code, in file order
    auto first_per_code() const -> std::vector<Diagnostic>;
    auto count_by_code() const -> std::map<std::string, size_t>;

private:
    std::vector<Diagnostic> diagnostics_;
    std::set<std::tuple<std::string, int, int>> seen_;
};

} // namespace pepcheck
