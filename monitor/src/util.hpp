#pragma once
#include <string>
#include <vector>
#include <chrono>

namespace util {

// String utilities
std::vector<std::string> split_string(const std::string& str, char delimiter);
std::vector<std::string> split_whitespace(const std::string& str);
std::string trim(const std::string& str);
std::string to_lower(std::string str);
bool starts_with(const std::string& str, const std::string& prefix);

// Time utilities
std::string format_iso8601(const std::chrono::system_clock::time_point& tp);
std::chrono::system_clock::time_point parse_iso8601(const std::string& iso_string);
double to_epoch_seconds(const std::chrono::system_clock::time_point& tp);
std::chrono::system_clock::time_point from_epoch_seconds(double seconds);

// Random utilities
std::string generate_uuid();

} // namespace util
