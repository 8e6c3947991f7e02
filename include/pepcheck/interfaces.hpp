#pragma once

#include "pepcheck/core/diagnostic.hpp"
#include "pepcheck/types.hpp"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace pepcheck {

// Returns the next physical line with its terminator, "" at end of input
using LineReader = std::function<std::string()>;

// One diagnostic as handed to a reporter
struct ReportEntry {
    std::string path;
    Diagnostic diagnostic;
    std::string source_line;
    std::string documentation;  // Text of the checker that fired
};

struct CodeStatistic {
    std::string code;
    size_t count{};
    std::string message;  // Message of the first occurrence
};

// Abstract interfaces for dependency injection
class ITokenizer {
public:
    virtual ~ITokenizer() = default;
    // Forward-only; keeps returning ENDMARKER once the input is exhausted
    virtual auto next_token() -> Token = 0;
};

using TokenizerFactory = std::function<std::unique_ptr<ITokenizer>(LineReader)>;

class IFileSystem {
public:
    virtual ~IFileSystem() = default;
    virtual auto read_lines(const std::string& path) -> std::vector<std::string> = 0;
    virtual auto write_lines_atomic(const std::vector<std::string>& lines, const std::string& path)
        -> bool = 0;
    virtual auto exists(const std::string& path) -> bool = 0;
    virtual auto is_directory(const std::string& path) -> bool = 0;
    virtual auto list_files(const std::string& root, const std::vector<std::string>& include,
                            const std::vector<std::string>& exclude) -> std::vector<std::string> = 0;
};

class IReporter {
public:
    virtual ~IReporter() = default;
    virtual auto report(const ReportEntry& entry) -> void = 0;
    virtual auto report_file(const std::string& path) -> void = 0;  // Quiet mode
    virtual auto report_error(const std::string& path, const std::string& message) -> void = 0;
    virtual auto report_statistics(const std::vector<CodeStatistic>& statistics) -> void = 0;
    virtual auto report_count(size_t total) -> void = 0;
};

} // namespace pepcheck
