#include "lintignore/core/snapshot.hpp"
#include "lintignore/string_utils.hpp"
#include <sstream>

namespace lintignore {

namespace {

constexpr const char* kHeader = "lintignore-snapshot|1";
constexpr const char* kOpenEnd = "open";

auto split(const std::string& line, char separator) -> std::vector<std::string> {
    std::vector<std::string> fields;
    size_t begin = 0;
    while (true) {
        auto pos = line.find(separator, begin);
        if (pos == std::string::npos) {
            fields.push_back(line.substr(begin));
            break;
        }
        fields.push_back(line.substr(begin, pos - begin));
        begin = pos + 1;
    }
    return fields;
}

auto parse_number(const std::string& text) -> std::optional<size_t> {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }
    try {
        return static_cast<size_t>(std::stoull(text));
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

auto serialize_targets(const std::vector<Target>& targets) -> std::string {
    std::string result;
    for (const auto& target : targets) {
        if (!result.empty()) {
            result += ";";
        }
        result += StringUtils::escape_field(target.analyzer);
        if (target.rule) {
            result += "(" + StringUtils::escape_field(*target.rule) + ")";
        }
    }
    return result;
}

auto deserialize_targets(const std::string& text) -> std::optional<std::vector<Target>> {
    std::vector<Target> targets;
    if (text.empty()) {
        return targets;
    }

    for (const auto& field : split(text, ';')) {
        Target target;
        auto open = field.find('(');
        if (open == std::string::npos) {
            auto analyzer = StringUtils::unescape_field(field);
            if (!analyzer || analyzer->empty()) return std::nullopt;
            target.analyzer = std::move(*analyzer);
        } else {
            if (field.back() != ')') return std::nullopt;
            auto analyzer = StringUtils::unescape_field(field.substr(0, open));
            auto rule = StringUtils::unescape_field(field.substr(open + 1, field.size() - open - 2));
            if (!analyzer || !rule || analyzer->empty()) return std::nullopt;
            target.analyzer = std::move(*analyzer);
            target.rule = std::move(*rule);
        }
        targets.push_back(std::move(target));
    }
    return targets;
}

auto parse_interval(const std::vector<std::string>& fields) -> std::optional<IgnoreInterval> {
    if (fields.size() != 5) {
        return std::nullopt;
    }

    auto origin = kind_from_string(fields[1]);
    if (!origin || *origin == DirectiveKind::STOP) {
        return std::nullopt;
    }

    auto start = parse_number(fields[2]);
    if (!start || *start == 0) {
        return std::nullopt;
    }

    std::optional<size_t> end;
    if (fields[3] != kOpenEnd) {
        end = parse_number(fields[3]);
        if (!end || *end < *start) {
            return std::nullopt;
        }
    }

    auto targets = deserialize_targets(fields[4]);
    if (!targets) {
        return std::nullopt;
    }

    return IgnoreInterval{
        .origin = *origin, .start_line = *start, .end_line = end, .targets = std::move(*targets)};
}

} // namespace

auto serialize_snapshot(const FileSnapshot& snapshot) -> std::string {
    std::ostringstream oss;
    oss << kHeader << "\n";
    oss << "fingerprint|" << StringUtils::escape_field(snapshot.fingerprint) << "\n";
    oss << "watermark|" << snapshot.watermark << "|" << (snapshot.complete ? 1 : 0) << "\n";

    for (auto line : snapshot.probed_lines) {
        oss << "probed|" << line << "\n";
    }

    for (const auto& interval : snapshot.intervals) {
        oss << "interval|" << to_string(interval.origin) << "|" << interval.start_line << "|";
        if (interval.end_line) {
            oss << *interval.end_line;
        } else {
            oss << kOpenEnd;
        }
        oss << "|" << serialize_targets(interval.targets) << "\n";
    }

    return oss.str();
}

auto deserialize_snapshot(const std::string& blob) -> std::optional<FileSnapshot> {
    std::istringstream iss(blob);
    std::string line;

    if (!std::getline(iss, line) || line != kHeader) {
        return std::nullopt;
    }

    FileSnapshot snapshot;
    bool have_fingerprint = false;
    bool have_watermark = false;

    while (std::getline(iss, line)) {
        if (line.empty()) continue;

        auto fields = split(line, '|');
        const auto& record = fields[0];

        if (record == "fingerprint" && fields.size() == 2 && !have_fingerprint) {
            auto fingerprint = StringUtils::unescape_field(fields[1]);
            if (!fingerprint) return std::nullopt;
            snapshot.fingerprint = std::move(*fingerprint);
            have_fingerprint = true;
        } else if (record == "watermark" && fields.size() == 3 && !have_watermark) {
            auto watermark = parse_number(fields[1]);
            if (!watermark || (fields[2] != "0" && fields[2] != "1")) return std::nullopt;
            snapshot.watermark = *watermark;
            snapshot.complete = fields[2] == "1";
            have_watermark = true;
        } else if (record == "probed" && fields.size() == 2) {
            auto probed = parse_number(fields[1]);
            if (!probed) return std::nullopt;
            snapshot.probed_lines.insert(*probed);
        } else if (record == "interval") {
            auto interval = parse_interval(fields);
            if (!interval) return std::nullopt;
            snapshot.intervals.push_back(std::move(*interval));
        } else {
            return std::nullopt;  // Unknown or duplicated record
        }
    }

    if (!have_fingerprint || !have_watermark) {
        return std::nullopt;
    }
    return snapshot;
}

} // namespace lintignore
