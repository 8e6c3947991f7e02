#pragma once

#include "pepcheck/core/config.hpp"
#include "pepcheck/interfaces.hpp"
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace pepcheck {

inline constexpr std::string_view VERSION = "0.5.1";

struct Config {
    std::vector<std::string> paths;
    std::vector<std::string> exclude{".svn", "CVS", ".bzr", ".hg", ".git"};
    std::vector<std::string> filename{"*.py"};
    CheckerConfig checker;
    bool repeat = false;        // Report every occurrence, not only the first per file
    bool show_source = false;
    bool show_pep8 = false;
    bool statistics = false;
    bool count = false;
    bool quiet = false;         // Only the names of offending files
    bool fix = false;
    bool dry_run = false;
    bool show_help = false;
    bool show_version = false;
};

// Throws std::invalid_argument on an unknown option or a bad value
auto parse_args(const std::vector<std::string>& args) -> Config;
auto usage() -> std::string;

// Splits "E1,W2" into {"E1", "W2"}, dropping empty items
auto split_list(std::string_view value) -> std::vector<std::string>;

class PepcheckApp {
private:
    std::unique_ptr<IFileSystem> filesystem_;
    std::unique_ptr<IReporter> reporter_;

public:
    PepcheckApp(std::unique_ptr<IFileSystem> filesystem, std::unique_ptr<IReporter> reporter);

    // 1 when anything was reported or a file could not be checked, else 0
    auto run(const Config& config) -> int;

private:
    struct FileOutcome {
        std::vector<Diagnostic> diagnostics;  // Everything recorded, in file order
        size_t reported{};
        bool failed = false;
    };

    auto check_file(const std::string& path, const Config& config) -> FileOutcome;
    auto apply_fixes(const std::string& path, const std::vector<std::string>& original,
                     const std::vector<std::string>& fixed, const Config& config) -> bool;
    auto show_statistics(const std::vector<Diagnostic>& diagnostics) -> void;
};

} // namespace pepcheck
