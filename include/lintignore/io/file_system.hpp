#pragma once

#include "lintignore/interfaces.hpp"
#include <fstream>
#include <string>
#include <vector>

namespace lintignore {

// Lines of one file on disk. Line start offsets are indexed on demand, so
// asking for line N never reads past line N.
class FileLineSource : public ILineSource {
public:
    explicit FileLineSource(const std::string& path);  // Throws FileAccessError

    auto line(size_t number) -> std::optional<std::string> override;
    auto line_count() -> size_t override;

private:
    auto index_through(size_t number) -> void;

    std::string path_;
    std::ifstream stream_;
    std::vector<std::streamoff> offsets_;   // offsets_[i] = start of line i + 1
    bool at_end_ = false;
};

class FileSystemAccessor : public IFileAccessor {
public:
    auto open(const FileIdentity& file) -> std::unique_ptr<ILineSource> override;
    auto fingerprint(const FileIdentity& file) -> std::string override;
};

} // namespace lintignore
