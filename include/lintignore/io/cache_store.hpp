#pragma once

#include "lintignore/interfaces.hpp"
#include <filesystem>
#include <string>

namespace lintignore {

// One cache entry per source file under a directory:
//   <dir>/<hash of file identity>.snapshot
// First line "<file identity>|<fingerprint>", the blob after it.
class DirectoryCacheStore : public ICacheStore {
public:
    explicit DirectoryCacheStore(std::filesystem::path directory);

    auto load(const FileIdentity& file, const std::string& fingerprint)
        -> std::optional<std::string> override;
    auto save(const FileIdentity& file, const std::string& fingerprint, const std::string& blob)
        -> bool override;

    auto entry_path(const FileIdentity& file) const -> std::filesystem::path;

private:
    std::filesystem::path directory_;
};

} // namespace lintignore
