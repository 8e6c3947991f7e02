#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace pepcheck {

inline constexpr size_t DEFAULT_MAX_LINE_LENGTH = 79;

// Shared, read-only settings consumed by the checkers and the orchestrator
struct CheckerConfig {
    size_t max_line_length = DEFAULT_MAX_LINE_LENGTH;
    std::vector<std::string> ignore = default_ignore();  // Code prefixes
    std::vector<std::string> select;                     // Overrides ignore

    // Suppressed iff it starts with an ignored prefix and no selected prefix
    auto is_ignored(std::string_view code) const -> bool;

    static auto default_ignore() -> std::vector<std::string> { return {"E24", "W191"}; }
};

} // namespace pepcheck
