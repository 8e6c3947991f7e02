#include "pepcheck/application/pepcheck_app.hpp"
#include "pepcheck/core/errors.hpp"
#include "pepcheck/engine/style_checker.hpp"
#include <cctype>
#include <optional>
#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>

namespace pepcheck {

namespace {

// "--name=value" or "--name value"
auto option_value(const std::vector<std::string>& args, size_t& i, std::string_view name)
    -> std::optional<std::string> {
    const auto& arg = args[i];
    if (arg == name) {
        if (i + 1 >= args.size()) {
            throw std::invalid_argument("Option " + std::string(name) + " requires a value");
        }
        return args[++i];
    }
    if (arg.starts_with(std::string(name) + "=")) {
        return arg.substr(name.size() + 1);
    }
    return std::nullopt;
}

auto parse_line_length(const std::string& value) -> size_t {
    size_t parsed = 0;
    size_t length = 0;
    // stoul skips whitespace and wraps a minus sign
    if (value.empty() || std::isdigit(static_cast<unsigned char>(value.front())) == 0) {
        throw std::invalid_argument("Invalid --max-line-length: " + value);
    }
    try {
        length = std::stoul(value, &parsed);
    } catch (const std::logic_error&) {
        throw std::invalid_argument("Invalid --max-line-length: " + value);
    }
    if (parsed != value.size() || length == 0) {
        throw std::invalid_argument("Invalid --max-line-length: " + value);
    }
    return length;
}

} // namespace

auto split_list(std::string_view value) -> std::vector<std::string> {
    std::vector<std::string> items;
    std::stringstream stream{std::string(value)};
    std::string item;
    while (std::getline(stream, item, ',')) {
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

auto usage() -> std::string {
    return "Usage: pepcheck [options] input ...\n"
           "\n"
           "Check Python source code formatting, according to PEP 8.\n"
           "\n"
           "Options:\n"
           "  -h, --help              Show this help\n"
           "      --version           Show the version and exit\n"
           "  -q, --quiet             Report only file names\n"
           "  -r, --repeat            Show all occurrences of the same error\n"
           "      --exclude=patterns  Exclude files or directories which match these\n"
           "                          comma separated patterns (default: .svn,CVS,.bzr,.hg,.git)\n"
           "      --filename=patterns When parsing directories, only check filenames\n"
           "                          matching these comma separated patterns (default: *.py)\n"
           "      --select=errors     Select errors and warnings (e.g. E,W6)\n"
           "      --ignore=errors     Skip errors and warnings (e.g. E4,W)\n"
           "      --max-line-length=n Maximum allowed line length (default: 79)\n"
           "      --show-source       Show source code for each error\n"
           "      --show-pep8         Show text of PEP 8 for each error\n"
           "      --statistics        Count errors and warnings\n"
           "      --count             Print total number of errors and warnings\n"
           "      --fix               Fix trailing whitespace and missing final newlines\n"
           "      --dry-run           With --fix, only list the files that would change\n";
}

auto parse_args(const std::vector<std::string>& args) -> Config {
    Config config;
    std::optional<std::vector<std::string>> ignore;
    std::optional<std::vector<std::string>> select;

    for (size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];
        if (arg == "-h" || arg == "--help") {
            config.show_help = true;
        } else if (arg == "--version") {
            config.show_version = true;
        } else if (arg == "-q" || arg == "--quiet") {
            config.quiet = true;
        } else if (arg == "-r" || arg == "--repeat") {
            config.repeat = true;
        } else if (arg == "--show-source") {
            config.show_source = true;
        } else if (arg == "--show-pep8") {
            config.show_pep8 = true;
        } else if (arg == "--statistics") {
            config.statistics = true;
        } else if (arg == "--count") {
            config.count = true;
        } else if (arg == "--fix") {
            config.fix = true;
        } else if (arg == "--dry-run") {
            config.dry_run = true;
        } else if (auto value = option_value(args, i, "--exclude")) {
            config.exclude = split_list(*value);
        } else if (auto value = option_value(args, i, "--filename")) {
            config.filename = split_list(*value);
        } else if (auto value = option_value(args, i, "--select")) {
            select = split_list(*value);
        } else if (auto value = option_value(args, i, "--ignore")) {
            ignore = split_list(*value);
        } else if (auto value = option_value(args, i, "--max-line-length")) {
            config.checker.max_line_length = parse_line_length(*value);
        } else if (arg.starts_with("-") && arg.size() > 1) {
            throw std::invalid_argument("Unknown option: " + arg);
        } else {
            config.paths.push_back(arg);
        }
    }

    if (ignore) {
        config.checker.ignore = *ignore;
    } else if (select) {
        config.checker.ignore = {""};  // Only the selected codes
    }
    if (select) {
        config.checker.select = *select;
    }

    if (config.paths.empty() && !config.show_help && !config.show_version) {
        throw std::invalid_argument("No input files or directories given");
    }
    return config;
}

PepcheckApp::PepcheckApp(std::unique_ptr<IFileSystem> filesystem, std::unique_ptr<IReporter> reporter)
    : filesystem_(std::move(filesystem)), reporter_(std::move(reporter)) {}

auto PepcheckApp::run(const Config& config) -> int {
    std::vector<std::string> files;
    bool failed = false;

    for (const auto& path : config.paths) {
        if (!filesystem_->exists(path)) {
            reporter_->report_error(path, "No such file or directory");
            failed = true;
        } else if (filesystem_->is_directory(path)) {
            auto found = filesystem_->list_files(path, config.filename, config.exclude);
            files.insert(files.end(), found.begin(), found.end());
        } else {
            files.push_back(path);
        }
    }

    std::vector<Diagnostic> all_diagnostics;
    size_t reported = 0;
    for (const auto& path : files) {
        auto outcome = check_file(path, config);
        reported += outcome.reported;
        failed = failed || outcome.failed;
        all_diagnostics.insert(all_diagnostics.end(), outcome.diagnostics.begin(),
                               outcome.diagnostics.end());
    }

    if (config.statistics) {
        show_statistics(all_diagnostics);
    }
    if (config.count) {
        reporter_->report_count(all_diagnostics.size());
    }
    return (reported > 0 || failed) ? 1 : 0;
}

auto PepcheckApp::check_file(const std::string& path, const Config& config) -> FileOutcome {
    FileOutcome outcome;

    std::vector<std::string> lines;
    try {
        lines = filesystem_->read_lines(path);
    } catch (const std::runtime_error& e) {
        reporter_->report_error(path, e.what());
        outcome.failed = true;
        return outcome;
    }

    StyleChecker checker(std::move(lines), config.checker);
    try {
        checker.check_all();
    } catch (const StructuralError& e) {
        // Keep what was found before the stream broke
        reporter_->report_error(path, std::string(e.what()) + " at line " +
                                          std::to_string(e.position().row));
        outcome.failed = true;
    }

    const auto& results = checker.results();
    outcome.diagnostics = results.diagnostics();
    auto shown = config.repeat ? results.diagnostics() : results.first_per_code();
    outcome.reported = shown.size();

    if (config.quiet) {
        if (!shown.empty()) {
            reporter_->report_file(path);
        }
    } else {
        for (const auto& diagnostic : shown) {
            reporter_->report(ReportEntry{
                .path = path,
                .diagnostic = diagnostic,
                .source_line = config.show_source ? checker.document().line(diagnostic.row) : "",
                .documentation =
                    config.show_pep8 ? std::string(checker.documentation_for(diagnostic.code)) : "",
            });
        }
    }

    if (config.fix && !outcome.failed) {
        if (!apply_fixes(path, checker.document().lines(), checker.autofix(), config)) {
            outcome.failed = true;
        }
    }
    return outcome;
}

auto PepcheckApp::apply_fixes(const std::string& path, const std::vector<std::string>& original,
                              const std::vector<std::string>& fixed, const Config& config) -> bool {
    if (fixed == original) {
        return true;
    }
    if (config.dry_run) {
        std::cout << "Would fix " << path << "\n";
        return true;
    }
    if (!filesystem_->write_lines_atomic(fixed, path)) {
        std::cerr << "Error: Failed to write " << path << '\n';
        return false;
    }
    if (!config.quiet) {
        std::cout << "Fixed " << path << "\n";
    }
    return true;
}

auto PepcheckApp::show_statistics(const std::vector<Diagnostic>& diagnostics) -> void {
    std::map<std::string, CodeStatistic> by_code;
    for (const auto& diagnostic : diagnostics) {
        auto [it, inserted] = by_code.try_emplace(diagnostic.code);
        if (inserted) {
            it->second.code = diagnostic.code;
            it->second.message = diagnostic.message();
        }
        ++it->second.count;
    }

    std::vector<CodeStatistic> statistics;
    for (auto& [code, statistic] : by_code) {
        statistics.push_back(std::move(statistic));
    }
    reporter_->report_statistics(statistics);
}

} // namespace pepcheck
