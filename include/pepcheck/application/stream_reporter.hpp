#pragma once

#include "pepcheck/interfaces.hpp"
#include <ostream>

namespace pepcheck {

// Plain "path:row:col: CODE message" lines, 1-based column
class StreamReporter : public IReporter {
public:
    StreamReporter(std::ostream& out, std::ostream& err);

    auto report(const ReportEntry& entry) -> void override;
    auto report_file(const std::string& path) -> void override;
    auto report_error(const std::string& path, const std::string& message) -> void override;
    auto report_statistics(const std::vector<CodeStatistic>& statistics) -> void override;
    auto report_count(size_t total) -> void override;

private:
    std::ostream& out_;
    std::ostream& err_;
};

// Shared by the reporters
auto format_location(const ReportEntry& entry) -> std::string;
auto caret_line(const std::string& source_line, int column) -> std::string;

} // namespace pepcheck
