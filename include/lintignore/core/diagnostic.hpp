#pragma once

#include "lintignore/core/directive.hpp"
#include "lintignore/core/position.hpp"
#include <optional>
#include <string>

namespace lintignore {

// A finding produced by an analysis pass
struct Diagnostic {
    FileIdentity file;
    Range affected_code;                // whole_file_range() when there is no location
    std::string analyzer;               // e.g. "flake8"
    std::optional<std::string> rule;    // e.g. "E501"
    std::string severity = "warning";
    std::string message;

    auto operator==(const Diagnostic& other) const -> bool = default;
};

auto rule_id(const Diagnostic& diagnostic) -> RuleId;

// Unique key: "file:line:column:analyzer(rule)"
auto diagnostic_key(const Diagnostic& diagnostic) -> std::string;

// Renders in the form accepted by DiagnosticParser
auto format_diagnostic(const Diagnostic& diagnostic) -> std::string;

} // namespace lintignore
