#pragma once
#include <optional>
#include <string>
#include <vector>

// Accepted HTTP status codes, e.g. "200-299" or "200-299,301,302"
class StatusCodeMatcher {
public:
    static std::optional<StatusCodeMatcher> parse(const std::string& pattern);

    bool matches(int status_code) const;
    const std::string& pattern() const { return pattern_; }

private:
    struct Range {
        int low;
        int high;
    };

    std::string pattern_;
    std::vector<Range> ranges_;
};
