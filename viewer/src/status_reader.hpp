#pragma once

#include "status_types.hpp"
#include <chrono>
#include <string>
#include <nlohmann/json.hpp>

struct StatusBadge {
    SignalState state = SignalState::Unknown;
    std::string text;        // "Up", "Down", "Degraded", "Unknown"
    std::string css_class;   // "status-up", ...

    nlohmann::json to_json() const;
};

StatusBadge make_badge(SignalState state);

struct ViewerStatus {
    StatusBadge internet = make_badge(SignalState::Unknown);
    StatusBadge dns = make_badge(SignalState::Unknown);
};

// Reads the monitor's status file. Anything missing, malformed or older than
// max_age_seconds reads back as Unknown; max_age_seconds <= 0 trusts any age.
class StatusReader {
public:
    StatusReader(const std::string& path, int max_age_seconds);

    ViewerStatus load() const;

    static ViewerStatus resolve(const nlohmann::json& data, int max_age_seconds,
                                std::chrono::system_clock::time_point now);
    static bool is_fresh(const std::string& timestamp, int max_age_seconds,
                         std::chrono::system_clock::time_point now);

private:
    std::string path_;
    int max_age_seconds_;
};
