#pragma once

#include "lintignore/core/diagnostic.hpp"
#include "lintignore/core/directive.hpp"
#include "lintignore/core/position.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lintignore {

// Abstract interfaces for dependency injection

// Recognizes ignore directives in a single line of text. Implementations must
// be safe to call concurrently.
class IDirectiveMatcher {
public:
    virtual ~IDirectiveMatcher() = default;
    virtual auto match(const std::string& line) const -> std::optional<Directive> = 0;
};

// Random access to the lines of one opened file, 1-based.
class ILineSource {
public:
    virtual ~ILineSource() = default;
    virtual auto line(size_t number) -> std::optional<std::string> = 0;  // nullopt past end of file
    virtual auto line_count() -> size_t = 0;
};

// Throws FileAccessError when a file is missing or unreadable.
class IFileAccessor {
public:
    virtual ~IFileAccessor() = default;
    virtual auto open(const FileIdentity& file) -> std::unique_ptr<ILineSource> = 0;
    virtual auto fingerprint(const FileIdentity& file) -> std::string = 0;
};

// Keyed blob store persisted across runs. Blobs are opaque to the store.
class ICacheStore {
public:
    virtual ~ICacheStore() = default;
    virtual auto load(const FileIdentity& file, const std::string& fingerprint)
        -> std::optional<std::string> = 0;
    virtual auto save(const FileIdentity& file, const std::string& fingerprint,
                      const std::string& blob) -> bool = 0;
};

class IDiagnosticParser {
public:
    virtual ~IDiagnosticParser() = default;
    virtual auto parse_diagnostics(const std::string& analyzer_output) -> std::vector<Diagnostic> = 0;
};

} // namespace lintignore
