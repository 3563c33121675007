#pragma once

#include <compare>
#include <cstddef>
#include <limits>
#include <optional>
#include <string>

namespace lintignore {

// Normalized path of a source file, used as the key for all per-file state
using FileIdentity = std::string;

// Lines are one-based; line 0 means "no line" (whole-file ranges)
struct Position {
    size_t line{};
    size_t column{};

    auto operator<=>(const Position& other) const = default;
};

inline constexpr size_t kEndOfFile = std::numeric_limits<size_t>::max();

struct Range {
    Position start;
    Position stop;
    std::optional<FileIdentity> file;

    auto operator==(const Range& other) const -> bool = default;
};

// Total order on positions. Only meaningful for positions in the same file.
auto compare(const Position& a, const Position& b) -> std::strong_ordering;

// Throws std::invalid_argument if start > stop
auto make_range(std::optional<FileIdentity> file, Position start, Position stop) -> Range;

// Single line, all columns
auto line_range(std::optional<FileIdentity> file, size_t line) -> Range;

// "Whole file" marker: no file, no coordinates
auto whole_file_range() -> Range;
auto is_whole_file(const Range& range) -> bool;

// True if inner lies within outer. A whole-file outer contains everything
// in the file of the query context.
auto contains(const Range& outer, const Range& inner) -> bool;

// Orders two ranges by start then stop. Throws std::logic_error when the
// ranges name different files.
auto order(const Range& a, const Range& b) -> std::strong_ordering;

auto to_string(const Position& position) -> std::string;
auto to_string(const Range& range) -> std::string;

} // namespace lintignore
