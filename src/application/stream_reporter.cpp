#include "pepcheck/application/stream_reporter.hpp"
#include "pepcheck/core/text_utils.hpp"
#include <iomanip>
#include <sstream>

namespace pepcheck {

auto format_location(const ReportEntry& entry) -> std::string {
    const auto& diagnostic = entry.diagnostic;
    return entry.path + ":" + std::to_string(diagnostic.row) + ":" +
           std::to_string(diagnostic.column + 1) + ":";
}

// Tabs before the column are kept so the caret lines up in a terminal
auto caret_line(const std::string& source_line, int column) -> std::string {
    std::string caret;
    for (int i = 0; i < column; ++i) {
        auto index = static_cast<size_t>(i);
        caret += (index < source_line.size() && source_line[index] == '\t') ? '\t' : ' ';
    }
    return caret + "^";
}

StreamReporter::StreamReporter(std::ostream& out, std::ostream& err) : out_(out), err_(err) {}

auto StreamReporter::report(const ReportEntry& entry) -> void {
    out_ << format_location(entry) << " " << entry.diagnostic.description() << '\n';

    if (!entry.source_line.empty()) {
        out_ << rstrip_newlines(entry.source_line) << '\n';
        out_ << caret_line(entry.source_line, entry.diagnostic.column) << '\n';
    }
    if (!entry.documentation.empty()) {
        std::istringstream lines(entry.documentation);
        std::string line;
        while (std::getline(lines, line)) {
            out_ << "    " << line << '\n';
        }
    }
}

auto StreamReporter::report_file(const std::string& path) -> void {
    out_ << path << '\n';
}

auto StreamReporter::report_error(const std::string& path, const std::string& message) -> void {
    err_ << "Error: " << path << ": " << message << '\n';
}

auto StreamReporter::report_statistics(const std::vector<CodeStatistic>& statistics) -> void {
    for (const auto& statistic : statistics) {
        out_ << std::left << std::setw(7) << statistic.count << " " << statistic.code << " "
             << statistic.message << '\n';
    }
}

auto StreamReporter::report_count(size_t total) -> void {
    out_ << total << '\n';
}

} // namespace pepcheck
