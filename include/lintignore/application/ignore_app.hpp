#pragma once

#include "lintignore/application/filter.hpp"
#include "lintignore/interfaces.hpp"
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>

namespace lintignore {

struct Config {
    std::string input_file = "-";           // stdin by default
    std::string cache_dir = ".lintignore-cache";
    bool use_cache = true;
    bool show_suppressed = false;           // Also print what was dropped
    bool show_summary = false;
    int summary_width = 60;
};

// Exit codes
inline constexpr int kExitClean = 0;        // Nothing left to report
inline constexpr int kExitFindings = 1;     // Diagnostics remain after suppression
inline constexpr int kExitError = 2;        // Bad input

class IgnoreApp {
private:
    std::unique_ptr<IFileAccessor> accessor_;
    std::unique_ptr<ICacheStore> cache_;     // May be null
    std::unique_ptr<IDiagnosticParser> parser_;
    std::unique_ptr<IDirectiveMatcher> matcher_;

    std::ostream& out_;
    std::ostream& err_;

public:
    IgnoreApp(std::unique_ptr<IFileAccessor> accessor,
              std::unique_ptr<ICacheStore> cache,
              std::unique_ptr<IDiagnosticParser> parser,
              std::unique_ptr<IDirectiveMatcher> matcher,
              std::ostream& out,
              std::ostream& err);

    auto run(const Config& config) -> int;

    // Same as run() with the analyzer output already in memory
    auto process(const std::string& analyzer_output, const Config& config) -> int;

private:
    auto read_input(const Config& config) -> std::optional<std::string>;
    auto report(const FilterResult& result, const Config& config) -> void;
};

} // namespace lintignore
