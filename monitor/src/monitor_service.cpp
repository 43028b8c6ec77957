#include "monitor_service.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <chrono>

namespace {
constexpr std::chrono::milliseconds kStopPollInterval{250};
} // namespace

MonitorService::MonitorService(const Config& config,
                               std::unique_ptr<Sampler> sampler,
                               std::unique_ptr<Notifier> notifier)
    : config_(config),
      sampler_(std::move(sampler)),
      notifier_(std::move(notifier)),
      connection_log_(config.log_path),
      status_publisher_(config.status_path),
      tracker_(config) {}

void MonitorService::run() {
    announce_start();

    while (!stop_requested_) {
        auto cycle_start = std::chrono::steady_clock::now();

        try {
            run_cycle();
        } catch (const std::exception& e) {
            spdlog::error("Error in monitor cycle: {}", e.what());
        }

        // An overrunning cycle leaves the deadline in the past and the next one starts at once
        auto deadline = cycle_start + std::chrono::seconds(config_.interval);
        std::unique_lock<std::mutex> lock(wait_mutex_);
        // stop() notifies without the lock, so wake up regularly to catch a missed notification
        while (!stop_requested_ && std::chrono::steady_clock::now() < deadline) {
            auto slice = std::min(deadline, std::chrono::steady_clock::now() + kStopPollInterval);
            wait_cv_.wait_until(lock, slice, [this] { return stop_requested_.load(); });
        }
    }
    spdlog::info("Monitor run loop finished.");
}

// Called from signal handlers: no locks, no logging
void MonitorService::stop() {
    stop_requested_ = true;
    wait_cv_.notify_all();
}

TrackerUpdate MonitorService::run_cycle() {
    SampleResult sample = sampler_->probe();
    log_sample(sample);

    TrackerUpdate update = tracker_.update(sample);

    if (config_.verbose) {
        if (sample.is_down()) {
            connection_log_.append(false, fmt::format("Missed ping to {} count ({}/{})", config_.ping_host,
                                                      tracker_.reachability().consecutive_bad_count(),
                                                      tracker_.reachability().trigger_threshold()));
        }
        if (sample.is_up() && sample.avg_latency_ms && *sample.avg_latency_ms > config_.latency_threshold_ms) {
            connection_log_.append(false, fmt::format("High Internet latency of {:.1f}ms detected count ({}/{})",
                                                      *sample.avg_latency_ms,
                                                      tracker_.latency().consecutive_bad_count(),
                                                      tracker_.latency().trigger_threshold()));
        }
    }

    for (const auto& event : update.events) {
        dispatch(event);
    }

    if (!status_publisher_.publish(update.snapshot)) {
        spdlog::warn("Status snapshot not updated this cycle");
    }
    return update;
}

void MonitorService::announce_start() {
    spdlog::info("Starting Internet Monitor Service. Interval: {}s, trigger: {}, pings: {}, target: {}",
                 config_.interval, config_.trigger, config_.pings, config_.ping_host);
    if (config_.verbose) {
        connection_log_.append(true, fmt::format(
            "Starting Internet Monitor Service in verbose mode, Interval: {} Seconds, {} Iterations. {} Pings for average",
            config_.interval, config_.trigger, config_.pings));
    } else {
        connection_log_.append(true, "Starting Internet Monitor Service");
    }
}

void MonitorService::log_sample(const SampleResult& sample) {
    if (!sample.probe_error.empty()) {
        spdlog::warn("Probe: {}", sample.probe_error);
        // Failed pings already show up as missed pings or as the outage itself
        if (!sample.is_down() || config_.verbose) {
            connection_log_.append(false, sample.probe_error);
        }
    }

    if (!config_.verbose || !sample.is_up()) {
        return;
    }
    if (sample.avg_latency_ms) {
        connection_log_.append(true, fmt::format("Avg Ping Time: {:.3f}", *sample.avg_latency_ms));
    }
    if (sample.loss_percent) {
        connection_log_.append(true, fmt::format("Packet Loss: {}%", *sample.loss_percent));
    }
    if (sample.dns_checked) {
        connection_log_.append(sample.dns_resolved, fmt::format("DNS lookup of {} {}", config_.dns_host,
                                                                sample.dns_resolved ? "succeeded" : "failed"));
    }
}

void MonitorService::dispatch(const NotificationEvent& event) {
    bool ok = event.kind == EventKind::Recovered;
    connection_log_.append(ok, "Alert: " + event.message);
    spdlog::info("{} {}: {}", to_string(event.signal), to_string(event.kind), event.message);

    try {
        if (!notifier_->send(event.message, event.title)) {
            spdlog::error("Notification '{}' was not delivered", event.title);
            connection_log_.append(false, fmt::format("Unable to send notification '{}': {}",
                                                      event.title, event.message));
        }
    } catch (const std::exception& e) {
        spdlog::error("Notification '{}' failed: {}", event.title, e.what());
        connection_log_.append(false, fmt::format("Unable to send notification '{}': {} ({})",
                                                  event.title, event.message, e.what()));
    }
}
