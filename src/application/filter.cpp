#include "lintignore/application/filter.hpp"
#include "lintignore/errors.hpp"
#include <iostream>
#include <unordered_set>

namespace lintignore {

auto filter_diagnostics(RangeManager& manager, std::span<const Diagnostic> diagnostics)
    -> FilterResult {
    FilterResult result;
    std::unordered_set<std::string> reported_files;

    for (const auto& diagnostic : diagnostics) {
        try {
            if (manager.is_ignored(diagnostic)) {
                result.suppressed.push_back(diagnostic);
            } else {
                result.accepted.push_back(diagnostic);
            }
        } catch (const FileAccessError& e) {
            // Fail open: infrastructure trouble must not hide findings
            if (reported_files.insert(diagnostic.file).second) {
                std::cerr << "Warning: " << e.what() << "; reporting its diagnostics unfiltered\n";
            }
            result.accepted.push_back(diagnostic);
            result.unreadable.push_back(diagnostic);
        }
    }

    return result;
}

} // namespace lintignore
