#include "lintignore/core/range_manager.hpp"
#include "lintignore/errors.hpp"
#include <algorithm>
#include <iostream>
#include <iterator>
#include <utility>

namespace lintignore {

RangeManager::RangeManager(IFileAccessor& accessor, ICacheStore* cache,
                           const IDirectiveMatcher& matcher)
    : accessor_(accessor), cache_(cache), matcher_(matcher) {}

auto RangeManager::is_ignored(const Diagnostic& diagnostic) -> bool {
    return is_ignored(diagnostic.file, diagnostic.affected_code, rule_id(diagnostic));
}

auto RangeManager::is_ignored(const FileIdentity& file, const Range& range, const RuleId& rule)
    -> bool {
    auto& state = state_for(file);
    std::lock_guard lock(state.mutex);

    const bool first_contact = !state.seeded;
    if (first_contact) {
        seed(file, state);
    }

    try {
        return resolve(file, state, range, rule);
    } catch (const FileAccessError&) {
        // A file never read successfully stays untracked
        if (first_contact) {
            state.data = FileSnapshot{};
            state.seeded = false;
        }
        throw;
    }
}

auto RangeManager::resolve(const FileIdentity& file, FileState& state, const Range& range,
                           const RuleId& rule) -> bool {
    auto& data = state.data;

    // Whole file: any compatible interval anywhere suppresses
    if (is_whole_file(range)) {
        if (any_compatible(state, rule)) {
            return true;
        }
        if (!data.complete) {
            auto source = accessor_.open(file);
            extend(state, *source, kEndOfFile);
        }
        return any_compatible(state, rule);
    }

    Range located = range;
    located.file = file;
    const size_t last_line = std::max(range.start.line, range.stop.line);

    if (data.complete || last_line <= data.watermark) {
        return covered(file, state, located, rule);
    }

    const bool single_line = range.start.line == range.stop.line;
    if (single_line && data.probed_lines.contains(last_line) && covered(file, state, located, rule)) {
        return true;
    }

    auto source = accessor_.open(file);

    // An inline directive on the queried line answers without walking further
    std::optional<PrereadLine> preread;
    if (single_line && !data.probed_lines.contains(last_line)) {
        if (auto text = source->line(last_line)) {
            auto directive = matcher_.match(*text);
            if (directive && directive->kind == DirectiveKind::INLINE
                && targets_cover(directive->targets, rule)) {
                data.intervals.push_back(IgnoreInterval{.origin = DirectiveKind::INLINE,
                                                        .start_line = last_line,
                                                        .end_line = last_line,
                                                        .targets = std::move(directive->targets)});
                std::ranges::stable_sort(data.intervals, {}, &IgnoreInterval::start_line);
                data.probed_lines.insert(last_line);
                return true;
            }
            preread = PrereadLine{.number = last_line, .directive = std::move(directive)};
        }
    }

    extend(state, *source, last_line, std::move(preread));
    return covered(file, state, located, rule);
}

auto RangeManager::extend(FileState& state, ILineSource& source, size_t last_line,
                          std::optional<PrereadLine> preread) -> void {
    auto& data = state.data;
    bool reached_end = false;

    if (last_line == kEndOfFile) {
        last_line = source.line_count();
        reached_end = true;
    }

    // Walk backward from the query to the watermark, collecting directives
    std::vector<std::pair<size_t, Directive>> found;
    for (size_t number = last_line; number > data.watermark; --number) {
        if (data.probed_lines.contains(number)) {
            continue;  // Its inline interval is already recorded
        }
        if (preread && preread->number == number) {
            if (preread->directive) {
                found.emplace_back(number, std::move(*preread->directive));
            }
            continue;
        }
        auto text = source.line(number);
        if (!text) {
            // Query lies past the end of the file: resume from its last line
            reached_end = true;
            number = std::min(number, source.line_count() + 1);
            continue;
        }
        if (auto directive = matcher_.match(*text)) {
            found.emplace_back(number, std::move(*directive));
        }
    }

    // Apply in file order so every STOP sees the STARTs above it
    auto intervals = data.intervals;
    for (auto it = found.rbegin(); it != found.rend(); ++it) {
        auto& [number, directive] = *it;

        switch (directive.kind) {
        case DirectiveKind::START:
            intervals.push_back(IgnoreInterval{.origin = DirectiveKind::START,
                                               .start_line = number,
                                               .end_line = std::nullopt,
                                               .targets = std::move(directive.targets)});
            break;
        case DirectiveKind::STOP: {
            // A STOP naming only some of a START's targets splits the region
            std::vector<IgnoreInterval> reopened;
            for (auto& interval : intervals) {
                if (interval.origin != DirectiveKind::START || interval.end_line
                    || interval.start_line >= number
                    || !stop_closes(directive.targets, interval.targets)) {
                    continue;
                }
                interval.end_line = number;
                auto remaining = targets_left_open(directive.targets, interval.targets);
                if (!remaining.empty()) {
                    reopened.push_back(IgnoreInterval{.origin = DirectiveKind::START,
                                                      .start_line = number,
                                                      .end_line = std::nullopt,
                                                      .targets = std::move(remaining)});
                }
            }
            std::ranges::move(reopened, std::back_inserter(intervals));
            break;
        }
        case DirectiveKind::INLINE:
            intervals.push_back(IgnoreInterval{.origin = DirectiveKind::INLINE,
                                               .start_line = number,
                                               .end_line = number,
                                               .targets = std::move(directive.targets)});
            break;
        }
    }
    std::ranges::stable_sort(intervals, {}, &IgnoreInterval::start_line);

    // Commit
    data.intervals = std::move(intervals);
    data.watermark = std::max(data.watermark, last_line);
    data.complete = data.complete || reached_end;
    std::erase_if(data.probed_lines, [&data](size_t line) { return line <= data.watermark; });
}

auto RangeManager::covered(const FileIdentity& file, const FileState& state, const Range& range,
                           const RuleId& rule) const -> bool {
    return std::ranges::any_of(state.data.intervals, [&](const IgnoreInterval& interval) {
        return targets_cover(interval.targets, rule) && contains(interval_range(interval, file), range);
    });
}

auto RangeManager::any_compatible(const FileState& state, const RuleId& rule) const -> bool {
    return std::ranges::any_of(state.data.intervals, [&rule](const IgnoreInterval& interval) {
        return targets_cover(interval.targets, rule);
    });
}

auto RangeManager::state_for(const FileIdentity& file) -> FileState& {
    std::lock_guard lock(registry_mutex_);
    auto [it, inserted] = files_.try_emplace(file);
    if (inserted) {
        it->second = std::make_unique<FileState>();
    }
    return *it->second;
}

auto RangeManager::seed(const FileIdentity& file, FileState& state) -> void {
    FileSnapshot fresh;

    // The fingerprint reads the whole file, so it is only taken for the cache
    if (cache_ != nullptr) {
        fresh.fingerprint = accessor_.fingerprint(file);
        if (auto blob = cache_->load(file, fresh.fingerprint)) {
            auto restored = deserialize_snapshot(*blob);
            if (!restored) {
                std::cerr << "Warning: discarding unreadable cache snapshot for " << file << "\n";
            } else if (restored->fingerprint == fresh.fingerprint) {
                fresh = std::move(*restored);
            }
        }
    }

    state.data = std::move(fresh);
    state.seeded = true;
}

auto RangeManager::snapshot(const FileIdentity& file) const -> std::optional<FileSnapshot> {
    FileState* state = nullptr;
    {
        std::lock_guard lock(registry_mutex_);
        auto it = files_.find(file);
        if (it == files_.end()) {
            return std::nullopt;
        }
        state = it->second.get();
    }

    std::lock_guard lock(state->mutex);
    if (!state->seeded) {
        return std::nullopt;
    }
    return state->data;
}

auto RangeManager::invalidate(const FileIdentity& file) -> void {
    FileState* state = nullptr;
    {
        std::lock_guard lock(registry_mutex_);
        auto it = files_.find(file);
        if (it == files_.end()) {
            return;
        }
        state = it->second.get();
    }

    // Entries are never erased, so other threads may still hold this state
    std::lock_guard lock(state->mutex);
    state->data = FileSnapshot{};
    state->seeded = false;
}

auto RangeManager::tracked_files() const -> std::vector<FileIdentity> {
    std::vector<std::pair<FileIdentity, FileState*>> entries;
    {
        std::lock_guard lock(registry_mutex_);
        for (const auto& [file, state] : files_) {
            entries.emplace_back(file, state.get());
        }
    }

    std::vector<FileIdentity> files;
    for (const auto& [file, state] : entries) {
        std::lock_guard lock(state->mutex);
        if (state->seeded) {
            files.push_back(file);
        }
    }
    std::ranges::sort(files);
    return files;
}

auto RangeManager::persist() -> size_t {
    if (cache_ == nullptr) {
        return 0;
    }

    size_t saved = 0;
    for (const auto& file : tracked_files()) {
        auto data = snapshot(file);
        if (!data) {
            continue;  // Invalidated meanwhile
        }
        if (cache_->save(file, data->fingerprint, serialize_snapshot(*data))) {
            ++saved;
        } else {
            std::cerr << "Warning: could not save cache snapshot for " << file << "\n";
        }
    }
    return saved;
}

} // namespace lintignore
