#include "pepcheck/ui/ftxui_reporter.hpp"
#include "pepcheck/application/stream_reporter.hpp"
#include "pepcheck/core/text_utils.hpp"

#include <ftxui/screen/screen.hpp>

#include <iostream>
#include <sstream>

namespace pepcheck {

namespace {

auto code_color(const std::string& code) -> ftxui::Color {
    return code.starts_with('W') ? ftxui::Color::Yellow : ftxui::Color::Red;
}

// FTXUI renders a tab as a single cell
auto expand_tabs(const std::string& text) -> std::string {
    std::string expanded;
    for (char c : text) {
        if (c == '\t') {
            expanded += std::string(8 - expanded.size() % 8, ' ');
        } else {
            expanded += c;
        }
    }
    return expanded;
}

} // namespace

FtxuiReporter::FtxuiReporter(std::ostream& out) : out_(out) {}

auto FtxuiReporter::print(ftxui::Element element) -> void {
    auto screen = ftxui::Screen::Create(ftxui::Dimension::Full(), ftxui::Dimension::Fit(element));
    ftxui::Render(screen, element);
    out_ << screen.ToString() << '\n' << std::flush;
}

auto FtxuiReporter::compose_entry(const ReportEntry& entry) -> ftxui::Element {
    using namespace ftxui;

    const auto& diagnostic = entry.diagnostic;
    Elements rows = {
        hbox({
            text(format_location(entry)) | bold,
            text(" "),
            text(diagnostic.code) | bold | color(code_color(diagnostic.code)),
            text(" " + diagnostic.message()),
        }),
    };

    if (!entry.source_line.empty()) {
        auto source = expand_tabs(rstrip_newlines(entry.source_line));
        auto caret = expand_tabs(caret_line(entry.source_line, diagnostic.column));
        rows.push_back(text(source));
        rows.push_back(text(caret) | color(Color::Cyan));
    }

    if (!entry.documentation.empty()) {
        Elements documentation;
        std::istringstream lines(entry.documentation);
        std::string line;
        while (std::getline(lines, line)) {
            documentation.push_back(text(line) | dim);
        }
        rows.push_back(vbox(std::move(documentation)) | borderLight);
    }
    return vbox(std::move(rows));
}

auto FtxuiReporter::report(const ReportEntry& entry) -> void {
    print(compose_entry(entry));
}

auto FtxuiReporter::report_file(const std::string& path) -> void {
    print(ftxui::text(path) | ftxui::bold);
}

auto FtxuiReporter::report_error(const std::string& path, const std::string& message) -> void {
    std::cerr << "Error: " << path << ": " << message << '\n';
}

auto FtxuiReporter::report_statistics(const std::vector<CodeStatistic>& statistics) -> void {
    using namespace ftxui;

    if (statistics.empty()) {
        return;
    }

    Elements counts;
    Elements codes;
    Elements messages;
    for (const auto& statistic : statistics) {
        counts.push_back(text(std::to_string(statistic.count)) | align_right);
        codes.push_back(text(statistic.code) | bold | color(code_color(statistic.code)));
        messages.push_back(text(statistic.message));
    }

    print(vbox({
        text("Statistics") | bold,
        separator(),
        hbox({
            vbox(std::move(counts)),
            text("  "),
            vbox(std::move(codes)),
            text("  "),
            vbox(std::move(messages)),
        }),
    }) | border);
}

auto FtxuiReporter::report_count(size_t total) -> void {
    auto summary = ftxui::text(std::to_string(total) + " errors and warnings") | ftxui::bold;
    print(total == 0 ? summary | ftxui::color(ftxui::Color::Green)
                     : summary | ftxui::color(ftxui::Color::Red));
}

} // namespace pepcheck
