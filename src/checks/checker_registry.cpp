#include "pepcheck/checks/checker_registry.hpp"
#include "pepcheck/checks/logical_checks.hpp"
#include "pepcheck/checks/physical_checks.hpp"
#include <algorithm>

namespace pepcheck {

namespace {

template<typename Checker>
auto emits(const Checker& checker, std::string_view code) -> bool {
    return std::find(checker.codes.begin(), checker.codes.end(), code) != checker.codes.end();
}

auto unescape(std::string_view text) -> std::string {
    std::string result;
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\\' && i + 1 < text.size()) {
            switch (text[i + 1]) {
            case 'n': result += '\n'; ++i; continue;
            case 't': result += '\t'; ++i; continue;
            case 's': result += ' '; ++i; continue;
            default: break;
            }
        }
        result += text[i];
    }
    return result;
}

} // namespace

auto parse_example(std::string_view example) -> std::optional<CheckerExample> {
    auto separator = example.find(": ");
    if (separator == std::string_view::npos) {
        return std::nullopt;
    }

    CheckerExample parsed;
    parsed.code = std::string(example.substr(0, separator));

    auto source = unescape(example.substr(separator + 2));
    size_t begin = 0;
    while (begin <= source.size()) {
        auto end = source.find('\n', begin);
        if (end == std::string::npos) {
            parsed.lines.push_back(source.substr(begin) + "\n");
            break;
        }
        parsed.lines.push_back(source.substr(begin, end - begin + 1));
        begin = end + 1;
    }
    return parsed;
}

auto CheckerRegistry::standard() -> const CheckerRegistry& {
    static const CheckerRegistry registry = [] {
        CheckerRegistry built;
        checks::register_physical_checks(built);
        checks::register_logical_checks(built);
        return built;
    }();
    return registry;
}

auto CheckerRegistry::add_physical(PhysicalChecker checker) -> CheckerRegistry& {
    physical_.push_back(std::move(checker));
    return *this;
}

auto CheckerRegistry::add_logical(LogicalChecker checker) -> CheckerRegistry& {
    logical_.push_back(std::move(checker));
    return *this;
}

auto CheckerRegistry::documentation_for(std::string_view code) const -> std::string_view {
    for (const auto& checker : physical_) {
        if (emits(checker, code)) {
            return checker.documentation;
        }
    }
    for (const auto& checker : logical_) {
        if (emits(checker, code)) {
            return checker.documentation;
        }
    }
    return {};
}

} // namespace pepcheck
