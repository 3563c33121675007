#include "lintignore/core/diagnostic.hpp"
#include <sstream>

namespace lintignore {

namespace {

auto format_rule(const Diagnostic& diagnostic) -> std::string {
    std::string result = diagnostic.analyzer;
    if (diagnostic.rule) {
        result += "(" + *diagnostic.rule + ")";
    }
    return result;
}

} // namespace

auto rule_id(const Diagnostic& diagnostic) -> RuleId {
    return RuleId{.analyzer = diagnostic.analyzer, .rule = diagnostic.rule};
}

auto diagnostic_key(const Diagnostic& diagnostic) -> std::string {
    std::ostringstream oss;
    oss << diagnostic.file << ":" << diagnostic.affected_code.start.line << ":"
        << diagnostic.affected_code.start.column << ":" << format_rule(diagnostic);
    return oss.str();
}

auto format_diagnostic(const Diagnostic& diagnostic) -> std::string {
    std::ostringstream oss;
    const auto& code = diagnostic.affected_code;
    oss << diagnostic.file;

    if (!is_whole_file(code)) {
        oss << ":" << code.start.line << ":" << code.start.column;
        if (code.stop != code.start) {
            oss << "-" << code.stop.line << ":" << code.stop.column;
        }
    }

    oss << ": " << diagnostic.severity << ": " << diagnostic.message << " ["
        << format_rule(diagnostic) << "]";
    return oss.str();
}

} // namespace lintignore
