#pragma once

#include "lintignore/core/diagnostic.hpp"
#include "lintignore/core/directive.hpp"
#include "lintignore/core/snapshot.hpp"
#include "lintignore/interfaces.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace lintignore {

// Answers "is this range ignored?" for diagnostics as they arrive.
//
// Nothing is scanned up front. The first query on a file reads backward from
// the queried line to line 1; later queries only read the lines between the
// file's watermark and the new query. Per-file state can be seeded from and
// saved to an ICacheStore keyed by content fingerprint.
//
// Queries on different files never block each other; queries on the same file
// are serialized by a per-file mutex. A FileAccessError leaves the file's
// state exactly as it was.
class RangeManager {
public:
    // cache may be null
    RangeManager(IFileAccessor& accessor, ICacheStore* cache, const IDirectiveMatcher& matcher);

    RangeManager(const RangeManager&) = delete;
    auto operator=(const RangeManager&) -> RangeManager& = delete;

    // Throws FileAccessError
    auto is_ignored(const FileIdentity& file, const Range& range, const RuleId& rule) -> bool;
    auto is_ignored(const Diagnostic& diagnostic) -> bool;

    // Copy of the current per-file state, nullopt if the file was never resolved
    auto snapshot(const FileIdentity& file) const -> std::optional<FileSnapshot>;

    // Forget a file, e.g. after its content changed
    auto invalidate(const FileIdentity& file) -> void;

    auto tracked_files() const -> std::vector<FileIdentity>;

    // Save every resolved file through the cache store. Returns files saved.
    auto persist() -> size_t;

private:
    struct FileState {
        std::mutex mutex;
        bool seeded = false;
        FileSnapshot data;
    };

    auto state_for(const FileIdentity& file) -> FileState&;
    auto seed(const FileIdentity& file, FileState& state) -> void;
    auto resolve(const FileIdentity& file, FileState& state, const Range& range,
                 const RuleId& rule) -> bool;

    // A line already read and matched by the caller
    struct PrereadLine {
        size_t number{};
        std::optional<Directive> directive;
    };

    // Reads lines (watermark, last_line] backward and commits what it finds.
    // last_line == kEndOfFile scans to the end of the file.
    auto extend(FileState& state, ILineSource& source, size_t last_line,
                std::optional<PrereadLine> preread = std::nullopt) -> void;

    auto covered(const FileIdentity& file, const FileState& state, const Range& range,
                 const RuleId& rule) const -> bool;
    auto any_compatible(const FileState& state, const RuleId& rule) const -> bool;

    IFileAccessor& accessor_;
    ICacheStore* cache_;
    const IDirectiveMatcher& matcher_;

    mutable std::mutex registry_mutex_;
    std::unordered_map<FileIdentity, std::unique_ptr<FileState>> files_;
};

} // namespace lintignore
