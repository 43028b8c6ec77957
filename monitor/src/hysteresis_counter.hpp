#pragma once

#include <chrono>
#include <optional>

enum class Transition {
    None,
    Triggered,
    Recovered
};

struct Edge {
    Transition transition = Transition::None;
    int bad_count = 0;                                   // consecutive bad samples at the edge
    std::chrono::system_clock::time_point bad_since{};   // first bad sample of the run
};

// Debounce state for one signal: Healthy -> Suspect(n) -> Alerted.
// Invariants: notified() implies consecutive_bad_count() >= trigger_threshold(),
// and bad_since() is set exactly while consecutive_bad_count() > 0.
class HysteresisCounter {
public:
    explicit HysteresisCounter(int trigger_threshold);

    // Triggered exactly once, on the sample that reaches the threshold
    Edge record_bad(std::chrono::system_clock::time_point at);

    // Recovered exactly once, on the first good sample after Triggered
    Edge record_good(std::chrono::system_clock::time_point at);

    int consecutive_bad_count() const { return consecutive_bad_count_; }
    std::optional<std::chrono::system_clock::time_point> bad_since() const { return bad_since_; }
    bool notified() const { return notified_; }
    int trigger_threshold() const { return trigger_threshold_; }

private:
    int trigger_threshold_;
    int consecutive_bad_count_ = 0;
    std::optional<std::chrono::system_clock::time_point> bad_since_;
    bool notified_ = false;
};
