#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace lintignore {

class StringUtils {
public:
    static auto to_lowercase(std::string_view text) -> std::string;
    static auto trim(std::string_view text) -> std::string;
    static auto iequals(std::string_view a, std::string_view b) -> bool;

    // Percent-escape the characters that separate snapshot fields
    static auto escape_field(std::string_view text) -> std::string;
    static auto unescape_field(std::string_view text) -> std::optional<std::string>;

    // 64-bit FNV-1a, used for content fingerprints and cache file names
    static auto fnv1a(std::string_view data, uint64_t seed = 14695981039346656037ULL) -> uint64_t;
    static auto to_hex(uint64_t value) -> std::string;
};

} // namespace lintignore
