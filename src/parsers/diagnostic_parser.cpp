#include "lintignore/parsers/diagnostic_parser.hpp"
#include "lintignore/string_utils.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace lintignore {

namespace {

constexpr size_t kMaxFieldsLength = 256;
constexpr size_t kMaxSourceLength = 256;

// "message [analyzer(rule)]" -> head "message ", source "analyzer(rule)"
auto split_source(const std::string& line) -> std::optional<std::pair<std::string, std::string>> {
    if (line.empty() || line.back() != ']') {
        return std::nullopt;
    }
    auto open = line.rfind('[');
    if (open == std::string::npos) {
        return std::nullopt;
    }
    auto source = line.substr(open + 1, line.size() - open - 2);
    if (source.empty() || source.size() > kMaxSourceLength
        || source.find(']') != std::string::npos) {
        return std::nullopt;
    }
    return std::make_pair(line.substr(0, open), std::move(source));
}

auto ends_with_line_number(const std::string& path) -> bool {
    auto colon = path.rfind(':');
    if (colon == std::string::npos || colon + 1 == path.size()) {
        return false;
    }
    return std::all_of(path.begin() + static_cast<std::ptrdiff_t>(colon) + 1, path.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

} // namespace

auto DiagnosticParser::parse_diagnostics(const std::string& analyzer_output)
    -> std::vector<Diagnostic> {
    std::vector<Diagnostic> diagnostics;
    std::istringstream iss(analyzer_output);
    std::string line;

    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        auto parts = split_source(line);
        if (!parts) {
            continue;
        }
        const auto& [head, source] = *parts;

        if (auto diagnostic = parse_located(head, source)) {
            diagnostics.push_back(std::move(*diagnostic));
        } else if (auto whole = parse_whole_file(head, source)) {
            diagnostics.push_back(std::move(*whole));
        }
    }

    return diagnostics;
}

auto DiagnosticParser::find_fields(const std::string& head, const std::regex& pattern,
                                   std::string& window, std::smatch& match) -> size_t {
    // The path is never empty, so the search starts at the second character
    for (size_t colon = head.find(':', 1); colon != std::string::npos;
         colon = head.find(':', colon + 1)) {
        window = head.substr(colon, kMaxFieldsLength);
        if (std::regex_search(window, match, pattern)) {
            return colon;
        }
    }
    return std::string::npos;
}

auto DiagnosticParser::parse_located(const std::string& head, const std::string& source)
    -> std::optional<Diagnostic> {
    std::string window;
    std::smatch match;
    auto colon = find_fields(head, located_pattern_, window, match);
    if (colon == std::string::npos) {
        return std::nullopt;
    }

    try {
        Position start{.line = static_cast<size_t>(std::stoul(match[1].str())),
                       .column = static_cast<size_t>(std::stoul(match[2].str()))};
        Position stop = start;
        if (match[3].matched) {
            stop = Position{.line = static_cast<size_t>(std::stoul(match[3].str())),
                            .column = static_cast<size_t>(std::stoul(match[4].str()))};
        }
        if (start.line == 0 || stop < start) {
            return std::nullopt;
        }

        auto path = head.substr(0, colon);
        Diagnostic diagnostic{.file = path,
                              .affected_code = make_range(path, start, stop),
                              .analyzer = {},
                              .rule = std::nullopt,
                              .severity = match[5].str(),
                              .message = StringUtils::trim(head.substr(colon + static_cast<size_t>(match.length(0))))};
        if (!parse_source(source, diagnostic)) {
            return std::nullopt;
        }
        return diagnostic;
    } catch (const std::exception&) {
        // Invalid number format, skip this line
        return std::nullopt;
    }
}

auto DiagnosticParser::parse_whole_file(const std::string& head, const std::string& source)
    -> std::optional<Diagnostic> {
    std::string window;
    std::smatch match;
    auto colon = find_fields(head, whole_file_pattern_, window, match);
    if (colon == std::string::npos) {
        return std::nullopt;
    }

    // "path:12: ..." is a located line we could not read, not a file named "path:12"
    auto path = head.substr(0, colon);
    if (ends_with_line_number(path)) {
        return std::nullopt;
    }

    Diagnostic diagnostic{.file = path,
                          .affected_code = whole_file_range(),
                          .analyzer = {},
                          .rule = std::nullopt,
                          .severity = match[1].str(),
                          .message = StringUtils::trim(head.substr(colon + static_cast<size_t>(match.length(0))))};
    if (!parse_source(source, diagnostic)) {
        return std::nullopt;
    }
    return diagnostic;
}

auto DiagnosticParser::parse_source(const std::string& text, Diagnostic& diagnostic) -> bool {
    std::smatch match;
    if (!std::regex_match(text, match, source_pattern_)) {
        return false;
    }

    diagnostic.analyzer = match[1].str();
    if (match[2].matched) {
        auto rule = StringUtils::trim(match[2].str());
        if (!rule.empty()) {
            diagnostic.rule = std::move(rule);
        }
    }
    return true;
}

} // namespace lintignore
