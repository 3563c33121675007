#pragma once

#include "lintignore/core/diagnostic.hpp"
#include "lintignore/interfaces.hpp"
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace lintignore {

// Reads analyzer output, one finding per line:
//   path:line:col: severity: message [analyzer(rule)]
//   path:line:col-endline:endcol: severity: message [analyzer]
//   path: severity: message [analyzer]          (whole file)
class DiagnosticParser : public IDiagnosticParser {
public:
    auto parse_diagnostics(const std::string& analyzer_output) -> std::vector<Diagnostic> override;

private:
    auto parse_located(const std::string& head, const std::string& source)
        -> std::optional<Diagnostic>;
    auto parse_whole_file(const std::string& head, const std::string& source)
        -> std::optional<Diagnostic>;
    static auto parse_source(const std::string& text, Diagnostic& diagnostic) -> bool;

    // Finds the first ':' in head where pattern matches. The match refers to window.
    static auto find_fields(const std::string& head, const std::regex& pattern, std::string& window,
                            std::smatch& match) -> size_t;

    // Regexes only ever see short pieces of a line; messages can be arbitrarily long
    static inline const std::regex located_pattern_{
        R"(^:(\d+):(\d+)(?:-(\d+):(\d+))?:\s+(\w+):\s+)"};
    static inline const std::regex whole_file_pattern_{R"(^:\s+(\w+):\s+)"};
    static inline const std::regex source_pattern_{
        R"(^\s*([A-Za-z_][A-Za-z0-9_.\-]*)(?:\(([^()]+)\))?\s*$)"};
};

} // namespace lintignore
