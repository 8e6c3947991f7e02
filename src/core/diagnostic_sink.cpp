#include "pepcheck/core/diagnostic_sink.hpp"
#include <algorithm>
#include <iterator>
#include <tuple>

namespace pepcheck {

auto DiagnosticSink::add(Diagnostic diagnostic) -> bool {
    auto key = std::make_tuple(diagnostic.code, diagnostic.row, diagnostic.column);
    if (!seen_.insert(std::move(key)).second) {
        return false;
    }
    diagnostics_.push_back(std::move(diagnostic));
    return true;
}

auto DiagnosticSink::clear() -> void {
    diagnostics_.clear();
    seen_.clear();
}

auto DiagnosticSink::contains_code(const std::string& code) const -> bool {
    return std::any_of(diagnostics_.begin(), diagnostics_.end(),
                       [&code](const Diagnostic& d) { return d.code == code; });
}

auto DiagnosticSink::ignoring(const std::set<std::string>& codes) const
    -> std::vector<Diagnostic> {
    std::vector<Diagnostic> result;
    std::copy_if(diagnostics_.begin(), diagnostics_.end(), std::back_inserter(result),
                 [&codes](const Diagnostic& d) { return !codes.contains(d.code); });
    return result;
}

auto DiagnosticSink::first_per_code() const -> std::vector<Diagnostic> {
    std::vector<Diagnostic> result;
    std::set<std::string> reported;
    for (const auto& diagnostic : diagnostics_) {
        if (reported.insert(diagnostic.code).second) {
            result.push_back(diagnostic);
        }
    }
    return result;
}

auto DiagnosticSink::count_by_code() const -> std::map<std::string, size_t> {
    std::map<std::string, size_t> counts;
    for (const auto& diagnostic : diagnostics_) {
        ++counts[diagnostic.code];
    }
    return counts;
}

} // namespace pepcheck
