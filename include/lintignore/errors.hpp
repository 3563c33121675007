#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace lintignore {

// A source file could not be opened or read. Fatal for the query that hit it,
// never for other files.
class FileAccessError : public std::runtime_error {
public:
    FileAccessError(std::string path, const std::string& reason)
        : std::runtime_error("cannot read " + path + ": " + reason), path_(std::move(path)) {}

    auto path() const -> const std::string& { return path_; }

private:
    std::string path_;
};

} // namespace lintignore
