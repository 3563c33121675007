#pragma once

#include "lintignore/core/position.hpp"
#include <optional>
#include <string>
#include <vector>

namespace lintignore {

// Inline ignore directive kinds
enum class DirectiveKind {
    START,   // start ignoring X  - opens a region until a matching STOP or end of file
    STOP,    // stop ignoring X   - closes it
    INLINE   // ignore X          - this line only
};

struct Target {
    std::string analyzer;               // e.g. "flake8"
    std::optional<std::string> rule;    // e.g. "E501"; none = every rule of the analyzer

    auto operator==(const Target& other) const -> bool = default;
};

// An empty target list suppresses everything
struct Directive {
    DirectiveKind kind = DirectiveKind::INLINE;
    std::vector<Target> targets;

    auto operator==(const Directive& other) const -> bool = default;
};

// What a diagnostic belongs to
struct RuleId {
    std::string analyzer;
    std::optional<std::string> rule;
};

// Resolved suppression region. end_line is empty while no matching STOP is known.
struct IgnoreInterval {
    DirectiveKind origin = DirectiveKind::INLINE;  // START or INLINE
    size_t start_line{};
    std::optional<size_t> end_line;
    std::vector<Target> targets;

    auto operator==(const IgnoreInterval& other) const -> bool = default;
};

auto targets_cover(const std::vector<Target>& targets, const RuleId& rule_id) -> bool;

// A STOP ends a START for every target the two share; a bare STOP ends all of them
auto stop_closes(const std::vector<Target>& stop_targets, const std::vector<Target>& start_targets)
    -> bool;

// START targets still suppressed after the STOP. Empty means nothing is left open.
auto targets_left_open(const std::vector<Target>& stop_targets,
                       const std::vector<Target>& start_targets) -> std::vector<Target>;

auto interval_range(const IgnoreInterval& interval, const FileIdentity& file) -> Range;

auto to_string(DirectiveKind kind) -> std::string;
auto kind_from_string(const std::string& text) -> std::optional<DirectiveKind>;

// "flake8(E501) pylint", or "all" for an empty list
auto format_targets(const std::vector<Target>& targets) -> std::string;

} // namespace lintignore
