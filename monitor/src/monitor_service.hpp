#pragma once

#include "config.hpp"
#include "connection_log.hpp"
#include "health_tracker.hpp"
#include "notifier.hpp"
#include "sampler.hpp"
#include "status_publisher.hpp"
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>

class MonitorService {
public:
    MonitorService(const Config& config,
                   std::unique_ptr<Sampler> sampler,
                   std::unique_ptr<Notifier> notifier);

    // Runs cycles on a fixed cadence until stop() is called
    void run();
    void stop();

    // One probe -> track -> notify -> publish pass
    TrackerUpdate run_cycle();

    const HealthTracker& tracker() const { return tracker_; }

private:
    void announce_start();
    void log_sample(const SampleResult& sample);
    void dispatch(const NotificationEvent& event);

    Config config_;
    std::unique_ptr<Sampler> sampler_;
    std::unique_ptr<Notifier> notifier_;
    ConnectionLog connection_log_;
    StatusPublisher status_publisher_;
    HealthTracker tracker_;

    std::atomic<bool> stop_requested_{false};
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
};
