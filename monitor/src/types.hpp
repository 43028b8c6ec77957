#pragma once

#include <chrono>
#include <optional>
#include <string>

// One probe cycle's raw measurement. An empty optional means the value could
// not be measured or parsed; it is never a stand-in for zero.
struct SampleResult {
    std::optional<bool> reachable;
    std::optional<int> loss_percent;        // 0..100
    std::optional<double> avg_latency_ms;
    bool dns_checked = false;               // false when DNS was not probed this cycle
    bool dns_resolved = false;
    std::chrono::system_clock::time_point sampled_at;
    std::string probe_error;                // raw failure reason, empty when none

    bool is_up() const { return reachable.has_value() && *reachable; }
    bool is_down() const { return reachable.has_value() && !*reachable; }
};

enum class Signal {
    Reachability,
    Latency,
    Dns,
    PacketLoss
};

enum class EventKind {
    Triggered,
    Recovered
};

struct NotificationEvent {
    Signal signal;
    EventKind kind;
    std::string title;
    std::string message;
};

std::string to_string(Signal signal);
std::string to_string(EventKind kind);
