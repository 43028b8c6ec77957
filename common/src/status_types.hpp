#pragma once

#include <chrono>
#include <string>
#include <nlohmann/json.hpp>

enum class SignalState {
    Up,
    Down,
    Warning,
    Unknown
};

// "up", "down", "warning", "unknown"
std::string to_string(SignalState state);

// Case-insensitive; anything unrecognised is Unknown
SignalState signal_state_from_string(const std::string& value);

// What the monitor publishes after every cycle
struct StatusSnapshot {
    std::chrono::system_clock::time_point timestamp;
    SignalState internet = SignalState::Unknown;
    SignalState dns = SignalState::Unknown;

    nlohmann::json to_json() const;
};
