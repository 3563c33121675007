#include "lintignore/io/cache_store.hpp"
#include "lintignore/string_utils.hpp"
#include <fstream>
#include <iterator>
#include <sstream>

namespace lintignore {

DirectoryCacheStore::DirectoryCacheStore(std::filesystem::path directory)
    : directory_(std::move(directory)) {}

auto DirectoryCacheStore::entry_path(const FileIdentity& file) const -> std::filesystem::path {
    return directory_ / (StringUtils::to_hex(StringUtils::fnv1a(file)) + ".snapshot");
}

auto DirectoryCacheStore::load(const FileIdentity& file, const std::string& fingerprint)
    -> std::optional<std::string> {
    std::ifstream stream(entry_path(file), std::ios::binary);
    if (!stream.is_open()) {
        return std::nullopt;
    }

    std::string header;
    if (!std::getline(stream, header)) {
        return std::nullopt;
    }

    // Hash collisions and stale content both miss
    if (header != StringUtils::escape_field(file) + "|" + fingerprint) {
        return std::nullopt;
    }

    std::string blob((std::istreambuf_iterator<char>(stream)), std::istreambuf_iterator<char>());
    if (stream.bad()) {
        return std::nullopt;
    }
    return blob;
}

auto DirectoryCacheStore::save(const FileIdentity& file, const std::string& fingerprint,
                               const std::string& blob) -> bool {
    auto path = entry_path(file);
    auto temp_path = path;
    temp_path += ".tmp";

    try {
        std::filesystem::create_directories(directory_);

        {
            std::ofstream stream(temp_path, std::ios::binary | std::ios::trunc);
            if (!stream.is_open()) {
                return false;
            }
            stream << StringUtils::escape_field(file) << "|" << fingerprint << "\n" << blob;
            if (stream.fail()) {
                return false;
            }
        } // File closed here

        // Atomically replace the previous entry
        std::filesystem::rename(temp_path, path);
        return true;

    } catch (const std::filesystem::filesystem_error&) {
        std::error_code ec;
        std::filesystem::remove(temp_path, ec);
        return false;
    }
}

} // namespace lintignore
