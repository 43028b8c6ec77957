#include "hysteresis_counter.hpp"
#include <algorithm>

HysteresisCounter::HysteresisCounter(int trigger_threshold)
    : trigger_threshold_(std::max(1, trigger_threshold)) {}

Edge HysteresisCounter::record_bad(std::chrono::system_clock::time_point at) {
    if (consecutive_bad_count_ == 0) {
        bad_since_ = at;
    }
    ++consecutive_bad_count_;

    Edge edge;
    edge.bad_count = consecutive_bad_count_;
    edge.bad_since = *bad_since_;

    if (!notified_ && consecutive_bad_count_ >= trigger_threshold_) {
        notified_ = true;
        edge.transition = Transition::Triggered;
    }
    return edge;
}

Edge HysteresisCounter::record_good(std::chrono::system_clock::time_point at) {
    Edge edge;
    edge.bad_count = consecutive_bad_count_;
    edge.bad_since = bad_since_.value_or(at);
    if (notified_) {
        edge.transition = Transition::Recovered;
    }

    consecutive_bad_count_ = 0;
    bad_since_.reset();
    notified_ = false;
    return edge;
}
