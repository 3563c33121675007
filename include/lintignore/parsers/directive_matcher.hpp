#pragma once

#include "lintignore/core/directive.hpp"
#include "lintignore/interfaces.hpp"
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace lintignore {

// Flat target-list grammar, case-insensitive:
//   [start|stop] ignor(e|ing) <identifier[(qualifier)]>...
// The keyword must begin the line or follow whitespace or comment punctuation.
class DirectiveMatcher : public IDirectiveMatcher {
public:
    auto match(const std::string& line) const -> std::optional<Directive> override;

    // Exposed for tests: target extraction from the text after the keyword
    static auto parse_targets(const std::string& text) -> std::optional<std::vector<Target>>;

private:
    // Only the keyword goes through the regex; the rest of a line can be arbitrarily long
    static inline const std::regex directive_pattern_{
        R"((?:^|[\s#/*;!\-])(?:(start|stop)[ \t]{1,64})?ignor(?:e|ing)(?=[\s:]|$))",
        std::regex::ECMAScript | std::regex::icase};
};

} // namespace lintignore
