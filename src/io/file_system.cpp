#include "pepcheck/io/file_system.hpp"
#include "pepcheck/core/text_utils.hpp"
#include <algorithm>
#include <filesystem>
#include <fnmatch.h>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace pepcheck {

auto matches_any(const std::string& name, const std::vector<std::string>& patterns) -> bool {
    return std::any_of(patterns.begin(), patterns.end(), [&name](const std::string& pattern) {
        return fnmatch(pattern.c_str(), name.c_str(), 0) == 0;
    });
}

auto FileSystem::read_lines(const std::string& path) -> std::vector<std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw std::runtime_error("Cannot read file: " + path);
    }
    return split_lines(buffer.str());
}

auto FileSystem::write_lines_atomic(const std::vector<std::string>& lines, const std::string& path)
    -> bool {
    std::string temp_path = path + ".tmp";
    try {
        {
            std::ofstream file(temp_path, std::ios::binary);
            if (!file.is_open()) {
                return false;
            }
            // Lines carry their own terminators
            for (const auto& line : lines) {
                file << line;
            }
            if (file.fail()) {
                return false;
            }
        }

        std::filesystem::rename(temp_path, path);
        return true;

    } catch (const std::filesystem::filesystem_error&) {
        std::error_code ignored;
        std::filesystem::remove(temp_path, ignored);
        return false;
    }
}

auto FileSystem::exists(const std::string& path) -> bool {
    return std::filesystem::exists(path);
}

auto FileSystem::is_directory(const std::string& path) -> bool {
    return std::filesystem::is_directory(path);
}

auto FileSystem::list_files(const std::string& root, const std::vector<std::string>& include,
                            const std::vector<std::string>& exclude) -> std::vector<std::string> {
    namespace fs = std::filesystem;

    std::vector<std::string> files;
    for (auto it = fs::recursive_directory_iterator(root); it != fs::recursive_directory_iterator();
         ++it) {
        auto name = it->path().filename().string();
        if (matches_any(name, exclude)) {
            if (it->is_directory()) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (it->is_regular_file() && (include.empty() || matches_any(name, include))) {
            files.push_back(it->path().string());
        }
    }

    std::sort(files.begin(), files.end());
    return files;
}

} // namespace pepcheck
