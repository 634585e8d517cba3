#include "status_codes.hpp"
#include "util.hpp"
#include <cctype>

namespace {
    std::optional<int> parse_code(const std::string& text) {
        auto trimmed = util::trim(text);
        if (trimmed.empty() || trimmed.size() > 3) return std::nullopt;
        for (char c : trimmed) {
            if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
        }
        int code = std::stoi(trimmed);
        if (code < 100 || code > 599) return std::nullopt;
        return code;
    }
}

std::optional<StatusCodeMatcher> StatusCodeMatcher::parse(const std::string& pattern) {
    StatusCodeMatcher matcher;
    matcher.pattern_ = util::trim(pattern);

    for (const auto& part : util::split_string(matcher.pattern_, ',')) {
        if (util::trim(part).empty()) continue;

        auto dash = part.find('-');
        if (dash == std::string::npos) {
            auto code = parse_code(part);
            if (!code) return std::nullopt;
            matcher.ranges_.push_back({*code, *code});
            continue;
        }

        auto low = parse_code(part.substr(0, dash));
        auto high = parse_code(part.substr(dash + 1));
        if (!low || !high || *low > *high) return std::nullopt;
        matcher.ranges_.push_back({*low, *high});
    }

    if (matcher.ranges_.empty()) return std::nullopt;
    return matcher;
}

bool StatusCodeMatcher::matches(int status_code) const {
    for (const auto& range : ranges_) {
        if (status_code >= range.low && status_code <= range.high) return true;
    }
    return false;
}
