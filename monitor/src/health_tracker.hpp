#pragma once

#include "config.hpp"
#include "hysteresis_counter.hpp"
#include "status_types.hpp"
#include "types.hpp"
#include <vector>

struct TrackerUpdate {
    std::vector<NotificationEvent> events;
    StatusSnapshot snapshot;
};

// Debounces reachability, latency, DNS and packet loss independently and turns
// threshold crossings into notification events. Latency, DNS and packet loss
// are only evaluated on cycles where the target answered.
class HealthTracker {
public:
    explicit HealthTracker(const Config& config);

    TrackerUpdate update(const SampleResult& sample);

    const HysteresisCounter& reachability() const { return reachability_; }
    const HysteresisCounter& latency() const { return latency_; }
    const HysteresisCounter& dns() const { return dns_; }
    const HysteresisCounter& packet_loss() const { return packet_loss_; }

private:
    void track_reachability(const SampleResult& sample, std::vector<NotificationEvent>& events);
    void track_latency(const SampleResult& sample, std::vector<NotificationEvent>& events);
    void track_dns(const SampleResult& sample, std::vector<NotificationEvent>& events);
    void track_packet_loss(const SampleResult& sample, std::vector<NotificationEvent>& events);

    StatusSnapshot build_snapshot(const SampleResult& sample) const;

    std::string ping_host_;
    std::string dns_host_;
    double latency_threshold_ms_;
    int loss_threshold_percent_;
    bool track_packet_loss_;

    HysteresisCounter reachability_;
    HysteresisCounter latency_;
    HysteresisCounter dns_;
    HysteresisCounter packet_loss_;

    int worst_loss_percent_ = 0;   // worst loss of the current packet-loss run
};
