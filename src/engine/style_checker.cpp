#include "pepcheck/engine/style_checker.hpp"
#include "pepcheck/core/text_utils.hpp"
#include "pepcheck/engine/line_splitter.hpp"
#include <algorithm>
#include <optional>

namespace pepcheck {

StyleChecker::StyleChecker(std::vector<std::string> lines, CheckerConfig config,
                           const CheckerRegistry& registry, TokenizerFactory tokenizer_factory)
    : document_(std::move(lines)), config_(std::move(config)), registry_(&registry),
      tokenizer_factory_(std::move(tokenizer_factory)) {}

auto StyleChecker::from_source(std::string_view source, CheckerConfig config) -> StyleChecker {
    return StyleChecker(split_lines(source), std::move(config));
}

auto StyleChecker::check_all() -> const DiagnosticSink& {
    results_.clear();
    statistics_ = {};
    cursor_ = 0;

    auto tokenizer = tokenizer_factory_([this]() { return readline_check_physical(); });
    LogicalLineSplitter splitter(document_);
    std::optional<LogicalLine> previous;

    while (true) {
        auto token = tokenizer->next_token();
        if (token.kind == TokenKind::ENDMARKER) {
            splitter.finish(token);
            break;
        }
        auto line = splitter.feed(token);
        if (!line) {
            continue;
        }
        ++statistics_.logical_lines;
        check_logical(*line, previous ? &*previous : nullptr);
        previous = std::move(line);
    }
    return results_;
}

auto StyleChecker::autofix() const -> std::vector<std::string> {
    std::vector<std::string> fixed_lines;
    fixed_lines.reserve(document_.line_count());

    int line_number = 0;
    for (const auto& line : document_.lines()) {
        ++line_number;
        auto fixed = line;
        for (const auto& checker : registry_->physical()) {
            bool enabled = std::any_of(checker.codes.begin(), checker.codes.end(),
                                       [this](const std::string& code) { return !config_.is_ignored(code); });
            if (!checker.fix || !enabled) {
                continue;
            }
            PhysicalLine physical{.text = fixed, .line_number = line_number};
            fixed = checker.fix(PhysicalContext{.line = physical, .document = document_, .config = config_});
        }
        fixed_lines.push_back(std::move(fixed));
    }
    return fixed_lines;
}

auto StyleChecker::documentation_for(std::string_view code) const -> std::string_view {
    return registry_->documentation_for(code);
}

auto StyleChecker::readline_check_physical() -> std::string {
    if (cursor_ >= document_.line_count()) {
        return "";
    }
    const auto& text = document_.lines()[cursor_++];
    ++statistics_.physical_lines;
    check_physical(PhysicalLine{.text = text, .line_number = static_cast<int>(cursor_)});
    return text;
}

auto StyleChecker::check_physical(const PhysicalLine& line) -> void {
    PhysicalContext context{.line = line, .document = document_, .config = config_};
    for (const auto& checker : registry_->physical()) {
        if (auto finding = checker.check(context)) {
            record(*finding, line.location_for(finding->column), LineKind::PHYSICAL, checker.name);
        }
    }
}

auto StyleChecker::check_logical(const LogicalLine& line, const LogicalLine* previous) -> void {
    LogicalContext context{.line = line, .previous = previous, .document = document_, .config = config_};
    for (const auto& checker : registry_->logical()) {
        const auto& requirements = checker.requirements;
        if ((requirements.tokens && line.tokens.empty()) ||
            (requirements.previous_line && previous == nullptr)) {
            continue;
        }
        if (auto finding = checker.check(context)) {
            record(*finding, line.location_for(finding->column), LineKind::LOGICAL, checker.name);
        }
    }
}

auto StyleChecker::record(const Finding& finding, Position location, LineKind origin,
                          const std::string& checker) -> void {
    if (config_.is_ignored(finding.code)) {
        ++statistics_.suppressed;
        return;
    }
    bool added = results_.add(Diagnostic{.code = finding.code,
                                         .row = location.row,
                                         .column = location.col,
                                         .context = finding.context,
                                         .origin = origin,
                                         .checker = checker});
    if (added) {
        ++statistics_.diagnostics;
    }
}

} // namespace pepcheck
