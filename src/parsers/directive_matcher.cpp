#include "lintignore/parsers/directive_matcher.hpp"
#include "lintignore/string_utils.hpp"
#include <algorithm>
#include <cctype>

namespace lintignore {

namespace {

auto is_identifier_start(char c) -> bool {
    return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_';
}

auto is_identifier_char(char c) -> bool {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' || c == '.' || c == '-';
}

} // namespace

auto DirectiveMatcher::match(const std::string& line) const -> std::optional<Directive> {
    // Drop the carriage return of CRLF input
    const std::string text = !line.empty() && line.back() == '\r' ? line.substr(0, line.size() - 1)
                                                                   : line;
    std::smatch match;
    if (!std::regex_search(text, match, directive_pattern_)) {
        return std::nullopt;
    }

    auto targets = parse_targets(match.suffix().str());
    if (!targets) {
        return std::nullopt;  // Malformed target list, not a directive
    }

    Directive directive{.kind = DirectiveKind::INLINE, .targets = std::move(*targets)};
    if (match[1].matched) {
        directive.kind = StringUtils::iequals(match[1].str(), "start") ? DirectiveKind::START
                                                                       : DirectiveKind::STOP;
    }
    return directive;
}

auto DirectiveMatcher::parse_targets(const std::string& text) -> std::optional<std::vector<Target>> {
    // An unterminated or stray parenthesis anywhere makes the whole list unusable
    int depth = 0;
    for (char c : text) {
        if (c == '(') {
            ++depth;
        } else if (c == ')') {
            if (--depth < 0) {
                return std::nullopt;
            }
        }
    }
    if (depth != 0) {
        return std::nullopt;
    }

    std::vector<Target> targets;
    bool wildcard = false;

    size_t pos = 0;
    while (pos < text.size()) {
        if (!is_identifier_start(text[pos])) {
            ++pos;
            continue;
        }

        size_t end = pos + 1;
        while (end < text.size() && is_identifier_char(text[end])) {
            ++end;
        }
        Target target{.analyzer = text.substr(pos, end - pos), .rule = std::nullopt};
        pos = end;

        // Qualifier directly after the name, without nested parentheses
        if (pos < text.size() && text[pos] == '(') {
            size_t close = text.find_first_of("()", pos + 1);
            if (close != std::string::npos && text[close] == ')') {
                auto qualifier = StringUtils::trim(text.substr(pos + 1, close - pos - 1));
                if (!qualifier.empty()) {
                    target.rule = std::move(qualifier);
                }
                pos = close + 1;
            }
        }

        if (!target.rule && StringUtils::iequals(target.analyzer, "all")) {
            wildcard = true;
            continue;
        }

        bool duplicate = std::ranges::find(targets, target) != targets.end();
        if (!duplicate) {
            targets.push_back(std::move(target));
        }
    }

    if (wildcard) {
        targets.clear();  // "all" suppresses every analyzer
    }
    return targets;
}

} // namespace lintignore
