#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace util {

// Logging
void setup_logging(const std::string& level, const std::string& logger_name);

// Environment variable helpers
std::optional<std::string> get_env(const std::string& name);

// String utilities
std::string trim(const std::string& str);
std::vector<std::string> split_list(const std::string& str);
std::optional<int> parse_int(const std::string& str);
std::optional<double> parse_double(const std::string& str);
std::optional<bool> parse_bool(const std::string& str);

// Time utilities

// "2025-12-07T12:34:56Z", UTC, second precision
std::string format_iso8601(const std::chrono::system_clock::time_point& tp);

// Accepts exactly the format produced by format_iso8601
std::optional<std::chrono::system_clock::time_point> parse_iso8601(const std::string& iso_string);

// Locale date and time ("%c") in the process timezone
std::string format_local_time(const std::chrono::system_clock::time_point& tp);

// "1 hour, 1 minute, 1 second"; zero-valued units are dropped, seconds are always kept
std::string format_duration(long long seconds);

// Applies a display timezone (e.g. "US/Eastern") to every local time conversion
void apply_display_timezone(const std::string& tz);

} // namespace util
