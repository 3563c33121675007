#include "lintignore/application/ignore_app.hpp"
#include "lintignore/core/range_manager.hpp"
#include "lintignore/ui/summary_report.hpp"
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>

namespace lintignore {

IgnoreApp::IgnoreApp(std::unique_ptr<IFileAccessor> accessor, std::unique_ptr<ICacheStore> cache,
                     std::unique_ptr<IDiagnosticParser> parser,
                     std::unique_ptr<IDirectiveMatcher> matcher, std::ostream& out,
                     std::ostream& err)
    : accessor_(std::move(accessor)), cache_(std::move(cache)), parser_(std::move(parser)),
      matcher_(std::move(matcher)), out_(out), err_(err) {}

auto IgnoreApp::run(const Config& config) -> int {
    auto input = read_input(config);
    if (!input) {
        err_ << "Error: Could not read diagnostics from " << config.input_file << "\n";
        return kExitError;
    }
    return process(*input, config);
}

auto IgnoreApp::process(const std::string& analyzer_output, const Config& config) -> int {
    auto diagnostics = parser_->parse_diagnostics(analyzer_output);

    // One registry per run, seeded lazily from the cache as files come up
    ICacheStore* cache = config.use_cache ? cache_.get() : nullptr;
    RangeManager manager(*accessor_, cache, *matcher_);

    auto result = filter_diagnostics(manager, diagnostics);
    report(result, config);

    if (cache != nullptr) {
        auto tracked = manager.tracked_files().size();
        auto saved = manager.persist();
        if (saved != tracked) {
            err_ << "Warning: Saved " << saved << " of " << tracked << " cache entries\n";
        }
    }

    return result.accepted.empty() ? kExitClean : kExitFindings;
}

auto IgnoreApp::read_input(const Config& config) -> std::optional<std::string> {
    if (config.input_file == "-") {
        return std::string((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());
    }

    std::ifstream file(config.input_file);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

auto IgnoreApp::report(const FilterResult& result, const Config& config) -> void {
    for (const auto& diagnostic : result.accepted) {
        out_ << format_diagnostic(diagnostic) << "\n";
    }

    if (config.show_suppressed) {
        for (const auto& diagnostic : result.suppressed) {
            out_ << "suppressed: " << format_diagnostic(diagnostic) << "\n";
        }
    }

    if (config.show_summary) {
        out_ << render_summary(result, config.summary_width) << "\n";
    } else {
        err_ << result.accepted.size() << " reported, " << result.suppressed.size()
             << " suppressed";
        if (!result.unreadable.empty()) {
            err_ << ", " << result.unreadable.size() << " from unreadable files";
        }
        err_ << "\n";
    }
}

} // namespace lintignore
