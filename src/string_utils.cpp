#include "lintignore/string_utils.hpp"
#include <algorithm>
#include <cctype>

namespace lintignore {

namespace {

constexpr std::string_view kEscaped = "%|;,()\r\n";
constexpr uint64_t kFnvPrime = 1099511628211ULL;

auto hex_value(char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

} // namespace

auto StringUtils::to_lowercase(std::string_view text) -> std::string {
    std::string result{text};
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

auto StringUtils::trim(std::string_view text) -> std::string {
    auto start = text.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) {
        return "";
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return std::string(text.substr(start, end - start + 1));
}

auto StringUtils::iequals(std::string_view a, std::string_view b) -> bool {
    return std::ranges::equal(a, b, [](unsigned char x, unsigned char y) {
        return std::tolower(x) == std::tolower(y);
    });
}

auto StringUtils::escape_field(std::string_view text) -> std::string {
    static constexpr char kHexDigits[] = "0123456789ABCDEF";
    std::string result;
    result.reserve(text.size());

    for (char c : text) {
        if (kEscaped.find(c) != std::string_view::npos) {
            auto byte = static_cast<unsigned char>(c);
            result += '%';
            result += kHexDigits[byte >> 4];
            result += kHexDigits[byte & 0x0F];
        } else {
            result += c;
        }
    }

    return result;
}

auto StringUtils::unescape_field(std::string_view text) -> std::optional<std::string> {
    std::string result;
    result.reserve(text.size());

    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '%') {
            result += text[i];
            continue;
        }
        if (i + 2 >= text.size()) {
            return std::nullopt;  // Truncated escape
        }
        int high = hex_value(text[i + 1]);
        int low = hex_value(text[i + 2]);
        if (high < 0 || low < 0) {
            return std::nullopt;
        }
        result += static_cast<char>((high << 4) | low);
        i += 2;
    }

    return result;
}

auto StringUtils::fnv1a(std::string_view data, uint64_t seed) -> uint64_t {
    uint64_t hash = seed;
    for (char c : data) {
        hash ^= static_cast<unsigned char>(c);
        hash *= kFnvPrime;
    }
    return hash;
}

auto StringUtils::to_hex(uint64_t value) -> std::string {
    static constexpr char kHexDigits[] = "0123456789abcdef";
    std::string result(16, '0');
    for (int i = 15; i >= 0; --i) {
        result[static_cast<size_t>(i)] = kHexDigits[value & 0x0F];
        value >>= 4;
    }
    return result;
}

} // namespace lintignore
