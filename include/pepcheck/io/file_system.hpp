#pragma once

#include "pepcheck/interfaces.hpp"
#include <string>
#include <vector>

namespace pepcheck {

class FileSystem : public IFileSystem {
public:
    // Lines keep their terminators. Throws std::runtime_error when unreadable.
    auto read_lines(const std::string& path) -> std::vector<std::string> override;
    auto write_lines_atomic(const std::vector<std::string>& lines, const std::string& path)
        -> bool override;
    auto exists(const std::string& path) -> bool override;
    auto is_directory(const std::string& path) -> bool override;

    // Files below `root` whose name matches an include pattern, sorted.
    // Files and directories whose name matches an exclude pattern are skipped.
    auto list_files(const std::string& root, const std::vector<std::string>& include,
                    const std::vector<std::string>& exclude) -> std::vector<std::string> override;
};

// fnmatch(3) against any of the patterns
auto matches_any(const std::string& name, const std::vector<std::string>& patterns) -> bool;

} // namespace pepcheck
