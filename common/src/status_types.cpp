#include "status_types.hpp"
#include "util.hpp"
#include <algorithm>
#include <cctype>

std::string to_string(SignalState state) {
    switch (state) {
        case SignalState::Up: return "up";
        case SignalState::Down: return "down";
        case SignalState::Warning: return "warning";
        case SignalState::Unknown: return "unknown";
    }
    return "unknown";
}

SignalState signal_state_from_string(const std::string& value) {
    std::string lowered = util::trim(value);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "up") return SignalState::Up;
    if (lowered == "down") return SignalState::Down;
    if (lowered == "warning") return SignalState::Warning;
    return SignalState::Unknown;
}

nlohmann::json StatusSnapshot::to_json() const {
    return {
        {"timestamp", util::format_iso8601(timestamp)},
        {"internet", {{"state", to_string(internet)}}},
        {"dns", {{"state", to_string(dns)}}}
    };
}
