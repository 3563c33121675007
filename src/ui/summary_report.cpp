#include "lintignore/ui/summary_report.hpp"

#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/screen.hpp>

#include <algorithm>
#include <map>

namespace lintignore {

namespace {

auto count_cell(size_t value, int width) -> ftxui::Element {
    using namespace ftxui;
    return text(std::to_string(value)) | align_right | size(WIDTH, EQUAL, width);
}

auto stats_row(const std::string& name, size_t accepted, size_t suppressed, size_t unreadable)
    -> ftxui::Element {
    using namespace ftxui;
    return hbox({
        text(name) | flex,
        count_cell(accepted, 10),
        count_cell(suppressed, 12),
        count_cell(unreadable, 12),
    });
}

} // namespace

auto collect_stats(const FilterResult& result) -> std::vector<AnalyzerStats> {
    std::map<std::string, AnalyzerStats> by_analyzer;

    auto entry = [&by_analyzer](const Diagnostic& diagnostic) -> AnalyzerStats& {
        auto& stats = by_analyzer[diagnostic.analyzer];
        stats.analyzer = diagnostic.analyzer;
        return stats;
    };

    for (const auto& diagnostic : result.accepted) {
        entry(diagnostic).accepted++;
    }
    for (const auto& diagnostic : result.suppressed) {
        entry(diagnostic).suppressed++;
    }
    for (const auto& diagnostic : result.unreadable) {
        entry(diagnostic).unreadable++;
    }

    std::vector<AnalyzerStats> stats;
    stats.reserve(by_analyzer.size());
    for (auto& [name, entry_stats] : by_analyzer) {
        stats.push_back(std::move(entry_stats));
    }
    return stats;
}

auto render_summary(const FilterResult& result, int width) -> std::string {
    using namespace ftxui;

    auto stats = collect_stats(result);

    Elements rows;
    rows.push_back(hbox({
                       text("Analyzer") | flex,
                       text("Reported") | align_right | size(WIDTH, EQUAL, 10),
                       text("Suppressed") | align_right | size(WIDTH, EQUAL, 12),
                       text("Unreadable") | align_right | size(WIDTH, EQUAL, 12),
                   })
                   | bold);
    rows.push_back(separator());

    for (const auto& entry : stats) {
        rows.push_back(stats_row(entry.analyzer, entry.accepted, entry.suppressed, entry.unreadable));
    }
    if (stats.empty()) {
        rows.push_back(text("No diagnostics") | dim);
    }

    rows.push_back(separator());
    rows.push_back(stats_row("Total", result.accepted.size(), result.suppressed.size(),
                             result.unreadable.size())
                   | bold);

    auto document = window(text(" lintignore summary "), vbox(std::move(rows)));

    auto screen = Screen::Create(Dimension::Fixed(std::max(width, 40)), Dimension::Fit(document));
    Render(screen, document);
    return screen.ToString();
}

} // namespace lintignore
