#include "util.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace util {

void setup_logging(const std::string& level, const std::string& logger_name) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(logger_name, console_sink);
    spdlog::set_default_logger(logger);

    auto parsed = spdlog::level::from_str(level);
    if (parsed == spdlog::level::off && level != "off") {
        // from_str maps unknown names to off
        parsed = spdlog::level::info;
    }
    spdlog::set_level(parsed);
    spdlog::flush_on(spdlog::level::info);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

std::optional<std::string> get_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (!value) {
        return std::nullopt;
    }
    return std::string(value);
}

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";

    auto end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

std::vector<std::string> split_list(const std::string& str) {
    std::string normalized = str;
    std::replace(normalized.begin(), normalized.end(), ',', ' ');

    std::istringstream iss(normalized);
    std::vector<std::string> items;
    std::string item;
    while (iss >> item) {
        items.push_back(item);
    }
    return items;
}

std::optional<int> parse_int(const std::string& str) {
    std::string s = trim(str);
    if (s.empty()) {
        return std::nullopt;
    }
    int value = 0;
    auto result = std::from_chars(s.data(), s.data() + s.size(), value);
    if (result.ec != std::errc() || result.ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return value;
}

std::optional<double> parse_double(const std::string& str) {
    std::string s = trim(str);
    if (s.empty()) {
        return std::nullopt;
    }
    try {
        size_t pos = 0;
        double value = std::stod(s, &pos);
        if (pos != s.size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<bool> parse_bool(const std::string& str) {
    std::string s = trim(str);
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    return std::nullopt;
}

std::string format_iso8601(const std::chrono::system_clock::time_point& tp) {
    auto tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&tt, &tm);

    std::stringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << 'Z';
    return ss.str();
}

std::optional<std::chrono::system_clock::time_point> parse_iso8601(const std::string& iso_string) {
    std::tm tm{};
    std::istringstream ss(iso_string);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        return std::nullopt;
    }

    if (ss.get() != 'Z' || ss.peek() != std::char_traits<char>::eof()) {
        return std::nullopt;
    }

    // timegm reads the fields as UTC, unlike mktime
    std::time_t tt = timegm(&tm);
    if (tt == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(tt);
}

std::string format_local_time(const std::chrono::system_clock::time_point& tp) {
    auto tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&tt, &tm);

    std::stringstream ss;
    ss << std::put_time(&tm, "%c");
    return ss.str();
}

std::string format_duration(long long seconds) {
    if (seconds < 0) {
        seconds = 0;
    }
    long long hours = seconds / 3600;
    long long minutes = (seconds % 3600) / 60;
    long long secs = seconds % 60;

    std::vector<std::string> parts;
    if (hours > 0) {
        parts.push_back(fmt::format("{} {}", hours, hours == 1 ? "hour" : "hours"));
    }
    if (minutes > 0) {
        parts.push_back(fmt::format("{} {}", minutes, minutes == 1 ? "minute" : "minutes"));
    }
    if (secs > 0 || parts.empty()) {
        parts.push_back(fmt::format("{} {}", secs, secs == 1 ? "second" : "seconds"));
    }
    return fmt::format("{}", fmt::join(parts, ", "));
}

void apply_display_timezone(const std::string& tz) {
    if (tz.empty()) {
        return;
    }
    if (setenv("TZ", tz.c_str(), 1) != 0) {
        spdlog::warn("Could not apply display timezone '{}'", tz);
        return;
    }
    tzset();
    spdlog::info("Display timezone set to {}", tz);
}

} // namespace util
