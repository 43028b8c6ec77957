#include "status_reader.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fstream>

nlohmann::json StatusBadge::to_json() const {
    return nlohmann::json{{"state", to_string(state)}, {"text", text}};
}

StatusBadge make_badge(SignalState state) {
    switch (state) {
        case SignalState::Up: return {state, "Up", "status-up"};
        case SignalState::Down: return {state, "Down", "status-down"};
        case SignalState::Warning: return {state, "Degraded", "status-warning"};
        case SignalState::Unknown: break;
    }
    return {SignalState::Unknown, "Unknown", "status-unknown"};
}

StatusReader::StatusReader(const std::string& path, int max_age_seconds)
    : path_(path), max_age_seconds_(max_age_seconds) {}

ViewerStatus StatusReader::load() const {
    std::ifstream file(path_);
    if (!file) {
        spdlog::debug("Status file {} not readable", path_);
        return {};
    }

    auto data = nlohmann::json::parse(file, nullptr, false);
    if (data.is_discarded()) {
        spdlog::warn("Status file {} is not valid JSON", path_);
        return {};
    }
    return resolve(data, max_age_seconds_, std::chrono::system_clock::now());
}

ViewerStatus StatusReader::resolve(const nlohmann::json& data, int max_age_seconds,
                                   std::chrono::system_clock::time_point now) {
    ViewerStatus status;
    if (!data.is_object()) {
        return status;
    }

    std::string timestamp;
    if (data.contains("timestamp") && data["timestamp"].is_string()) {
        timestamp = data["timestamp"].get<std::string>();
    }
    if (!is_fresh(timestamp, max_age_seconds, now)) {
        return status;
    }

    auto state_of = [&data](const char* key) {
        if (!data.contains(key) || !data[key].is_object()) {
            return SignalState::Unknown;
        }
        const auto& section = data[key];
        if (!section.contains("state") || !section["state"].is_string()) {
            return SignalState::Unknown;
        }
        return signal_state_from_string(section["state"].get<std::string>());
    };

    status.internet = make_badge(state_of("internet"));
    status.dns = make_badge(state_of("dns"));
    return status;
}

bool StatusReader::is_fresh(const std::string& timestamp, int max_age_seconds,
                            std::chrono::system_clock::time_point now) {
    if (max_age_seconds <= 0) {
        return true;
    }

    auto written = util::parse_iso8601(timestamp);
    if (!written) {
        return false;
    }

    auto age = std::chrono::duration_cast<std::chrono::seconds>(now - *written).count();
    return age >= 0 && age <= max_age_seconds;
}
