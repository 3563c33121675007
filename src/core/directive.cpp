#include "lintignore/core/directive.hpp"
#include "lintignore/string_utils.hpp"
#include <algorithm>
#include <iterator>

namespace lintignore {

namespace {

auto same_target(const Target& a, const Target& b) -> bool {
    if (!StringUtils::iequals(a.analyzer, b.analyzer)) {
        return false;
    }
    if (a.rule.has_value() != b.rule.has_value()) {
        return false;
    }
    return !a.rule || StringUtils::iequals(*a.rule, *b.rule);
}

auto has_target(const std::vector<Target>& targets, const Target& target) -> bool {
    return std::ranges::any_of(targets, [&target](const Target& other) {
        return same_target(target, other);
    });
}

} // namespace

auto targets_cover(const std::vector<Target>& targets, const RuleId& rule_id) -> bool {
    if (targets.empty()) {
        return true;
    }

    return std::ranges::any_of(targets, [&rule_id](const Target& target) {
        if (!StringUtils::iequals(target.analyzer, rule_id.analyzer)) {
            return false;
        }
        if (!target.rule) {
            return true;  // Every rule of this analyzer
        }
        return rule_id.rule.has_value() && StringUtils::iequals(*target.rule, *rule_id.rule);
    });
}

auto stop_closes(const std::vector<Target>& stop_targets, const std::vector<Target>& start_targets)
    -> bool {
    if (stop_targets.empty()) {
        return true;
    }
    return std::ranges::any_of(stop_targets, [&start_targets](const Target& target) {
        return has_target(start_targets, target);
    });
}

auto targets_left_open(const std::vector<Target>& stop_targets,
                       const std::vector<Target>& start_targets) -> std::vector<Target> {
    if (stop_targets.empty()) {
        return {};
    }
    std::vector<Target> remaining;
    std::ranges::copy_if(start_targets, std::back_inserter(remaining),
                         [&stop_targets](const Target& target) {
                             return !has_target(stop_targets, target);
                         });
    return remaining;
}

auto interval_range(const IgnoreInterval& interval, const FileIdentity& file) -> Range {
    size_t end_line = interval.end_line.value_or(kEndOfFile);
    return Range{.start = Position{.line = interval.start_line, .column = 0},
                 .stop = Position{.line = end_line, .column = kEndOfFile},
                 .file = file};
}

auto to_string(DirectiveKind kind) -> std::string {
    switch (kind) {
    case DirectiveKind::START:
        return "START";
    case DirectiveKind::STOP:
        return "STOP";
    case DirectiveKind::INLINE:
        return "INLINE";
    }
    return "INLINE";
}

auto kind_from_string(const std::string& text) -> std::optional<DirectiveKind> {
    if (text == "START") return DirectiveKind::START;
    if (text == "STOP") return DirectiveKind::STOP;
    if (text == "INLINE") return DirectiveKind::INLINE;
    return std::nullopt;
}

auto format_targets(const std::vector<Target>& targets) -> std::string {
    if (targets.empty()) {
        return "all";
    }

    std::string result;
    for (const auto& target : targets) {
        if (!result.empty()) {
            result += " ";
        }
        result += target.analyzer;
        if (target.rule) {
            result += "(" + *target.rule + ")";
        }
    }
    return result;
}

} // namespace lintignore
