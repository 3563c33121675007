#include "lintignore/core/position.hpp"
#include <sstream>
#include <stdexcept>

namespace lintignore {

auto compare(const Position& a, const Position& b) -> std::strong_ordering {
    return a <=> b;
}

auto make_range(std::optional<FileIdentity> file, Position start, Position stop) -> Range {
    if (start > stop) {
        throw std::invalid_argument("range start " + to_string(start) + " is after stop "
                                    + to_string(stop));
    }
    return Range{.start = start, .stop = stop, .file = std::move(file)};
}

auto line_range(std::optional<FileIdentity> file, size_t line) -> Range {
    return make_range(std::move(file), Position{.line = line, .column = 0},
                      Position{.line = line, .column = kEndOfFile});
}

auto whole_file_range() -> Range {
    return Range{.start = {}, .stop = {}, .file = std::nullopt};
}

auto is_whole_file(const Range& range) -> bool {
    return !range.file.has_value() && range.start.line == 0;
}

auto contains(const Range& outer, const Range& inner) -> bool {
    if (is_whole_file(outer)) {
        return true;
    }
    if (!outer.file || !inner.file || *outer.file != *inner.file) {
        return false;
    }
    return inner.start >= outer.start && inner.stop <= outer.stop;
}

auto order(const Range& a, const Range& b) -> std::strong_ordering {
    if (a.file != b.file) {
        throw std::logic_error("cannot order ranges from different files: " + to_string(a)
                               + " and " + to_string(b));
    }
    if (auto cmp = compare(a.start, b.start); cmp != 0) {
        return cmp;
    }
    return compare(a.stop, b.stop);
}

auto to_string(const Position& position) -> std::string {
    std::ostringstream oss;
    oss << position.line;
    if (position.column != kEndOfFile) {
        oss << ":" << position.column;
    }
    return oss.str();
}

auto to_string(const Range& range) -> std::string {
    if (is_whole_file(range)) {
        return "<whole file>";
    }
    std::ostringstream oss;
    if (range.file) {
        oss << *range.file << ":";
    }
    oss << to_string(range.start);
    if (range.stop != range.start) {
        oss << "-";
        if (range.stop.line == kEndOfFile) {
            oss << "EOF";
        } else {
            oss << to_string(range.stop);
        }
    }
    return oss.str();
}

} // namespace lintignore
