#pragma once

#include "lintignore/application/filter.hpp"
#include <string>
#include <vector>

namespace lintignore {

struct AnalyzerStats {
    std::string analyzer;
    size_t accepted{};
    size_t suppressed{};
    size_t unreadable{};
};

// Per-analyzer counts, sorted by analyzer name
auto collect_stats(const FilterResult& result) -> std::vector<AnalyzerStats>;

// Boxed summary table rendered with FTXUI, as plain text of the given width
auto render_summary(const FilterResult& result, int width = 60) -> std::string;

} // namespace lintignore
