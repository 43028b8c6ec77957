#include "health_tracker.hpp"
#include "util.hpp"
#include <fmt/format.h>
#include <algorithm>

namespace {

long long elapsed_seconds(const Edge& edge, std::chrono::system_clock::time_point now) {
    return std::chrono::duration_cast<std::chrono::seconds>(now - edge.bad_since).count();
}

NotificationEvent make_event(Signal signal, EventKind kind, std::string title, std::string message) {
    return NotificationEvent{signal, kind, std::move(title), std::move(message)};
}

} // namespace

HealthTracker::HealthTracker(const Config& config)
    : ping_host_(config.ping_host),
      dns_host_(config.dns_host),
      latency_threshold_ms_(config.latency_threshold_ms),
      loss_threshold_percent_(config.loss_threshold_percent),
      track_packet_loss_(config.track_packet_loss),
      reachability_(config.trigger),
      latency_(config.latency_trigger),
      dns_(config.dns_trigger),
      packet_loss_(config.loss_trigger) {}

TrackerUpdate HealthTracker::update(const SampleResult& sample) {
    TrackerUpdate update;

    track_reachability(sample, update.events);
    if (sample.is_up()) {
        track_latency(sample, update.events);
        track_dns(sample, update.events);
        if (track_packet_loss_) {
            track_packet_loss(sample, update.events);
        }
    }

    update.snapshot = build_snapshot(sample);
    return update;
}

void HealthTracker::track_reachability(const SampleResult& sample, std::vector<NotificationEvent>& events) {
    if (!sample.reachable) {
        return;
    }

    if (sample.is_down()) {
        auto edge = reachability_.record_bad(sample.sampled_at);
        if (edge.transition == Transition::Triggered) {
            events.push_back(make_event(Signal::Reachability, EventKind::Triggered, "Internet Outage",
                fmt::format("Internet is DOWN! Ping to {} has failed ({}/{})",
                            ping_host_, edge.bad_count, reachability_.trigger_threshold())));
        }
        return;
    }

    auto edge = reachability_.record_good(sample.sampled_at);
    if (edge.transition == Transition::Recovered) {
        events.push_back(make_event(Signal::Reachability, EventKind::Recovered, "Internet Recovered",
            fmt::format("Internet is back from outage that started {} which was for {} in length",
                        util::format_local_time(edge.bad_since),
                        util::format_duration(elapsed_seconds(edge, sample.sampled_at)))));
    }
}

void HealthTracker::track_latency(const SampleResult& sample, std::vector<NotificationEvent>& events) {
    // A reading that could not be parsed neither counts against nor for the signal
    if (!sample.avg_latency_ms) {
        return;
    }

    double latency = *sample.avg_latency_ms;
    if (latency > latency_threshold_ms_) {
        auto edge = latency_.record_bad(sample.sampled_at);
        if (edge.transition == Transition::Triggered) {
            events.push_back(make_event(Signal::Latency, EventKind::Triggered, "High Latency",
                fmt::format("High Internet latency has been detected. Average latency: {:.1f} ms", latency)));
        }
        return;
    }

    auto edge = latency_.record_good(sample.sampled_at);
    if (edge.transition == Transition::Recovered) {
        events.push_back(make_event(Signal::Latency, EventKind::Recovered, "Latency Recovered",
            fmt::format("Internet has recovered from high latency that started {} which was for {} in length",
                        util::format_local_time(edge.bad_since),
                        util::format_duration(elapsed_seconds(edge, sample.sampled_at)))));
    }
}

void HealthTracker::track_dns(const SampleResult& sample, std::vector<NotificationEvent>& events) {
    if (!sample.dns_checked) {
        return;
    }

    if (!sample.dns_resolved) {
        auto edge = dns_.record_bad(sample.sampled_at);
        if (edge.transition == Transition::Triggered) {
            events.push_back(make_event(Signal::Dns, EventKind::Triggered, "DNS Failure",
                fmt::format("DNS resolution failure for {} ({}/{})",
                            dns_host_, edge.bad_count, dns_.trigger_threshold())));
        }
        return;
    }

    auto edge = dns_.record_good(sample.sampled_at);
    if (edge.transition == Transition::Recovered) {
        events.push_back(make_event(Signal::Dns, EventKind::Recovered, "DNS Recovered",
            fmt::format("DNS has recovered from failure that started {} which was for {} in length",
                        util::format_local_time(edge.bad_since),
                        util::format_duration(elapsed_seconds(edge, sample.sampled_at)))));
    }
}

void HealthTracker::track_packet_loss(const SampleResult& sample, std::vector<NotificationEvent>& events) {
    if (!sample.loss_percent) {
        return;
    }

    int loss = *sample.loss_percent;
    if (loss > loss_threshold_percent_) {
        auto edge = packet_loss_.record_bad(sample.sampled_at);
        worst_loss_percent_ = (edge.bad_count == 1) ? loss : std::max(worst_loss_percent_, loss);
        if (edge.transition == Transition::Triggered) {
            events.push_back(make_event(Signal::PacketLoss, EventKind::Triggered, "Packet Loss",
                fmt::format("Internet packet loss of {}% detected", loss)));
        }
        return;
    }

    auto edge = packet_loss_.record_good(sample.sampled_at);
    if (edge.transition == Transition::Recovered) {
        events.push_back(make_event(Signal::PacketLoss, EventKind::Recovered, "Packet Loss Recovered",
            fmt::format("Internet has recovered from packet loss of {}% that started {} which was for {} in length",
                        worst_loss_percent_,
                        util::format_local_time(edge.bad_since),
                        util::format_duration(elapsed_seconds(edge, sample.sampled_at)))));
    }
    worst_loss_percent_ = 0;
}

StatusSnapshot HealthTracker::build_snapshot(const SampleResult& sample) const {
    StatusSnapshot snapshot;
    snapshot.timestamp = sample.sampled_at;

    if (reachability_.notified()) {
        snapshot.internet = SignalState::Down;
    } else if (!sample.reachable) {
        snapshot.internet = SignalState::Unknown;
    } else if (latency_.notified() || (track_packet_loss_ && packet_loss_.notified())) {
        snapshot.internet = SignalState::Warning;
    } else {
        snapshot.internet = SignalState::Up;
    }

    if (!sample.is_up() || !sample.dns_checked) {
        snapshot.dns = SignalState::Unknown;
    } else if (dns_.notified()) {
        snapshot.dns = SignalState::Down;
    } else {
        snapshot.dns = SignalState::Up;
    }
    return snapshot;
}
