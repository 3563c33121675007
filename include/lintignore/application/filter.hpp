#pragma once

#include "lintignore/core/diagnostic.hpp"
#include "lintignore/core/range_manager.hpp"
#include <span>
#include <string>
#include <vector>

namespace lintignore {

struct FilterResult {
    std::vector<Diagnostic> accepted;     // Reported to the user
    std::vector<Diagnostic> suppressed;   // Covered by an ignore directive
    std::vector<Diagnostic> unreadable;   // Also in accepted: source could not be read (fail-open)
};

// Runs every diagnostic through the range manager. A diagnostic whose file
// cannot be read is reported, never dropped.
auto filter_diagnostics(RangeManager& manager, std::span<const Diagnostic> diagnostics)
    -> FilterResult;

} // namespace lintignore
