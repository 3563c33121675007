#include "lintignore/io/file_system.hpp"
#include "lintignore/errors.hpp"
#include "lintignore/string_utils.hpp"
#include <array>
#include <cerrno>
#include <cstring>

namespace lintignore {

FileLineSource::FileLineSource(const std::string& path)
    : path_(path), stream_(path, std::ios::binary) {
    if (!stream_.is_open()) {
        throw FileAccessError(path, std::strerror(errno));
    }
    offsets_.push_back(0);
}

auto FileLineSource::index_through(size_t number) -> void {
    if (at_end_ || offsets_.size() > number) {
        return;
    }

    // Continue scanning forward from the last indexed line start
    stream_.clear();
    stream_.seekg(offsets_.back());

    std::string text;
    while (offsets_.size() <= number) {
        if (!std::getline(stream_, text)) {
            if (stream_.bad()) {
                throw FileAccessError(path_, "read error");
            }
            at_end_ = true;
            break;
        }
        if (stream_.eof()) {
            // Last line without a trailing newline
            offsets_.push_back(offsets_.back() + static_cast<std::streamoff>(text.size()) + 1);
            at_end_ = true;
            break;
        }
        offsets_.push_back(stream_.tellg());
    }
}

auto FileLineSource::line(size_t number) -> std::optional<std::string> {
    if (number == 0) {
        return std::nullopt;
    }

    // Line N exists when the start of line N + 1 is known
    index_through(number);
    if (offsets_.size() <= number) {
        return std::nullopt;
    }

    stream_.clear();
    stream_.seekg(offsets_[number - 1]);
    std::string text;
    if (!std::getline(stream_, text) && stream_.bad()) {
        throw FileAccessError(path_, "read error");
    }
    if (!text.empty() && text.back() == '\r') {
        text.pop_back();
    }
    return text;
}

auto FileLineSource::line_count() -> size_t {
    index_through(kEndOfFile - 1);
    return offsets_.size() - 1;
}

auto FileSystemAccessor::open(const FileIdentity& file) -> std::unique_ptr<ILineSource> {
    return std::make_unique<FileLineSource>(file);
}

auto FileSystemAccessor::fingerprint(const FileIdentity& file) -> std::string {
    std::ifstream stream(file, std::ios::binary);
    if (!stream.is_open()) {
        throw FileAccessError(file, std::strerror(errno));
    }

    uint64_t hash = StringUtils::fnv1a({});
    std::array<char, 8192> buffer{};
    while (stream.read(buffer.data(), buffer.size()) || stream.gcount() > 0) {
        hash = StringUtils::fnv1a(std::string_view(buffer.data(), static_cast<size_t>(stream.gcount())),
                                  hash);
    }
    if (stream.bad()) {
        throw FileAccessError(file, "read error");
    }
    return StringUtils::to_hex(hash);
}

} // namespace lintignore
