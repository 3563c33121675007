#pragma once

#include "lintignore/core/directive.hpp"
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace lintignore {

// Everything the range manager knows about one file, as persisted between runs
struct FileSnapshot {
    std::string fingerprint;
    size_t watermark{};                   // lines 1..watermark are fully resolved
    bool complete = false;                // watermark reached end of file
    std::set<size_t> probed_lines;        // lines past the watermark resolved by a short-circuit
    std::vector<IgnoreInterval> intervals;

    auto operator==(const FileSnapshot& other) const -> bool = default;
};

// Text format, one record per line:
//   lintignore-snapshot|1
//   fingerprint|<hex>
//   watermark|<n>|<complete 0/1>
//   probed|<line>             (zero or more)
//   interval|<START|INLINE>|<start>|<end or "open">|<target;target(rule)>
auto serialize_snapshot(const FileSnapshot& snapshot) -> std::string;

// Returns nullopt for anything it cannot read back exactly
auto deserialize_snapshot(const std::string& blob) -> std::optional<FileSnapshot>;

} // namespace lintignore
