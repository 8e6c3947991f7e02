#pragma once

#include "pepcheck/interfaces.hpp"

#include <ftxui/dom/elements.hpp>

#include <ostream>

namespace pepcheck {

// Colored terminal output rendered with FTXUI
class FtxuiReporter : public IReporter {
public:
    explicit FtxuiReporter(std::ostream& out);

    auto report(const ReportEntry& entry) -> void override;
    auto report_file(const std::string& path) -> void override;
    auto report_error(const std::string& path, const std::string& message) -> void override;
    auto report_statistics(const std::vector<CodeStatistic>& statistics) -> void override;
    auto report_count(size_t total) -> void override;

private:
    auto print(ftxui::Element element) -> void;
    static auto compose_entry(const ReportEntry& entry) -> ftxui::Element;

    std::ostream& out_;
};

} // namespace pepcheck
