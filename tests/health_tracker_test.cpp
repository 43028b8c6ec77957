#include "health_tracker.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

using namespace testing_support;

namespace {

Config tracker_config() {
    Config config;
    config.ping_host = "8.8.8.8";
    config.dns_host = "www.google.com";
    config.trigger = 3;
    config.latency_trigger = 3;
    config.dns_trigger = 3;
    config.loss_trigger = 3;
    config.latency_threshold_ms = 1000.0;
    config.loss_threshold_percent = 0;
    config.track_packet_loss = true;
    return config;
}

std::vector<NotificationEvent> events_for(const std::vector<TrackerUpdate>& updates, Signal signal) {
    std::vector<NotificationEvent> events;
    for (const auto& update : updates) {
        for (const auto& event : update.events) {
            if (event.signal == signal) {
                events.push_back(event);
            }
        }
    }
    return events;
}

} // namespace

TEST(HealthTrackerTest, OutageTriggersOnceAndRecoversOnce) {
    HealthTracker tracker(tracker_config());

    std::vector<TrackerUpdate> updates;
    updates.push_back(tracker.update(up_sample(at_seconds(0))));
    updates.push_back(tracker.update(down_sample(at_seconds(60))));
    updates.push_back(tracker.update(down_sample(at_seconds(120))));
    updates.push_back(tracker.update(down_sample(at_seconds(180))));
    updates.push_back(tracker.update(down_sample(at_seconds(240))));
    updates.push_back(tracker.update(up_sample(at_seconds(300))));

    EXPECT_TRUE(updates[1].events.empty());
    EXPECT_TRUE(updates[2].events.empty());
    ASSERT_EQ(updates[3].events.size(), 1u);
    EXPECT_EQ(updates[3].events[0].kind, EventKind::Triggered);
    EXPECT_EQ(updates[3].events[0].title, "Internet Outage");
    EXPECT_EQ(updates[3].events[0].message, "Internet is DOWN! Ping to 8.8.8.8 has failed (3/3)");
    EXPECT_TRUE(updates[4].events.empty());

    auto reachability = events_for(updates, Signal::Reachability);
    ASSERT_EQ(reachability.size(), 2u);
    EXPECT_EQ(reachability[1].kind, EventKind::Recovered);
    EXPECT_EQ(reachability[1].title, "Internet Recovered");
    // Measured from the first Down sample
    EXPECT_NE(reachability[1].message.find("which was for 4 minutes in length"), std::string::npos);
    EXPECT_FALSE(tracker.reachability().notified());
}

TEST(HealthTrackerTest, SnapshotFollowsReachability) {
    HealthTracker tracker(tracker_config());

    auto up = tracker.update(up_sample(at_seconds(0)));
    EXPECT_EQ(up.snapshot.internet, SignalState::Up);
    EXPECT_EQ(up.snapshot.dns, SignalState::Up);
    EXPECT_EQ(up.snapshot.timestamp, at_seconds(0));

    // Suspect but not yet alerted: the published state stays up
    auto suspect = tracker.update(down_sample(at_seconds(60)));
    EXPECT_EQ(suspect.snapshot.internet, SignalState::Up);
    EXPECT_EQ(suspect.snapshot.dns, SignalState::Unknown);

    tracker.update(down_sample(at_seconds(120)));
    auto alerted = tracker.update(down_sample(at_seconds(180)));
    EXPECT_EQ(alerted.snapshot.internet, SignalState::Down);
    EXPECT_EQ(alerted.snapshot.dns, SignalState::Unknown);
}

TEST(HealthTrackerTest, UnknownReachabilityLeavesCounterUnchanged) {
    HealthTracker tracker(tracker_config());

    tracker.update(down_sample(at_seconds(0)));
    tracker.update(down_sample(at_seconds(60)));
    auto unknown = tracker.update(unknown_sample(at_seconds(120)));

    EXPECT_TRUE(unknown.events.empty());
    EXPECT_EQ(tracker.reachability().consecutive_bad_count(), 2);
    EXPECT_EQ(unknown.snapshot.internet, SignalState::Unknown);

    auto third = tracker.update(down_sample(at_seconds(180)));
    ASSERT_EQ(third.events.size(), 1u);
    EXPECT_EQ(third.events[0].kind, EventKind::Triggered);
}

TEST(HealthTrackerTest, UnknownLatencyDoesNotCountTowardTrigger) {
    HealthTracker tracker(tracker_config());

    auto slow = [](long long t) { return up_sample(at_seconds(t), 1500.0); };
    auto unparsed = [](long long t) {
        auto sample = up_sample(at_seconds(t));
        sample.avg_latency_ms.reset();
        return sample;
    };

    std::vector<TrackerUpdate> updates;
    updates.push_back(tracker.update(slow(0)));
    updates.push_back(tracker.update(unparsed(60)));
    updates.push_back(tracker.update(slow(120)));
    updates.push_back(tracker.update(unparsed(180)));
    EXPECT_EQ(tracker.latency().consecutive_bad_count(), 2);
    EXPECT_TRUE(events_for(updates, Signal::Latency).empty());

    auto fired = tracker.update(slow(240));
    ASSERT_EQ(fired.events.size(), 1u);
    EXPECT_EQ(fired.events[0].signal, Signal::Latency);
    EXPECT_EQ(fired.events[0].title, "High Latency");
    EXPECT_EQ(fired.events[0].message, "High Internet latency has been detected. Average latency: 1500.0 ms");
    EXPECT_EQ(fired.snapshot.internet, SignalState::Warning);
}

TEST(HealthTrackerTest, LatencyAtThresholdIsNotBad) {
    HealthTracker tracker(tracker_config());

    for (int i = 0; i < 5; ++i) {
        auto update = tracker.update(up_sample(at_seconds(i * 60), 1000.0));
        EXPECT_TRUE(update.events.empty());
    }
    EXPECT_EQ(tracker.latency().consecutive_bad_count(), 0);
}

TEST(HealthTrackerTest, LatencyRecoveryCarriesDuration) {
    HealthTracker tracker(tracker_config());

    tracker.update(up_sample(at_seconds(0), 2000.0));
    tracker.update(up_sample(at_seconds(60), 2000.0));
    tracker.update(up_sample(at_seconds(120), 2000.0));
    auto recovered = tracker.update(up_sample(at_seconds(3661), 20.0));

    ASSERT_EQ(recovered.events.size(), 1u);
    EXPECT_EQ(recovered.events[0].kind, EventKind::Recovered);
    EXPECT_EQ(recovered.events[0].title, "Latency Recovered");
    EXPECT_NE(recovered.events[0].message.find("which was for 1 hour, 1 minute, 1 second in length"),
              std::string::npos);
    EXPECT_EQ(recovered.snapshot.internet, SignalState::Up);
}

TEST(HealthTrackerTest, LatencyIsNotEvaluatedWhileDown) {
    HealthTracker tracker(tracker_config());

    tracker.update(up_sample(at_seconds(0), 2000.0));
    tracker.update(up_sample(at_seconds(60), 2000.0));

    auto down = down_sample(at_seconds(120));
    down.avg_latency_ms = 5000.0;
    tracker.update(down);

    EXPECT_EQ(tracker.latency().consecutive_bad_count(), 2);
}

TEST(HealthTrackerTest, DnsFailureTriggersAndRecovers) {
    HealthTracker tracker(tracker_config());

    tracker.update(up_sample(at_seconds(0), 12.0, 0, false));
    tracker.update(up_sample(at_seconds(60), 12.0, 0, false));
    auto failed = tracker.update(up_sample(at_seconds(120), 12.0, 0, false));

    ASSERT_EQ(failed.events.size(), 1u);
    EXPECT_EQ(failed.events[0].signal, Signal::Dns);
    EXPECT_EQ(failed.events[0].title, "DNS Failure");
    EXPECT_EQ(failed.events[0].message, "DNS resolution failure for www.google.com (3/3)");
    EXPECT_EQ(failed.snapshot.dns, SignalState::Down);
    EXPECT_EQ(failed.snapshot.internet, SignalState::Up);

    auto recovered = tracker.update(up_sample(at_seconds(180)));
    ASSERT_EQ(recovered.events.size(), 1u);
    EXPECT_EQ(recovered.events[0].kind, EventKind::Recovered);
    EXPECT_EQ(recovered.events[0].title, "DNS Recovered");
    EXPECT_EQ(recovered.snapshot.dns, SignalState::Up);
}

TEST(HealthTrackerTest, DnsIsNotEvaluatedWhileDown) {
    HealthTracker tracker(tracker_config());

    tracker.update(up_sample(at_seconds(0), 12.0, 0, false));
    tracker.update(up_sample(at_seconds(60), 12.0, 0, false));
    tracker.update(down_sample(at_seconds(120)));
    tracker.update(down_sample(at_seconds(180)));

    EXPECT_EQ(tracker.dns().consecutive_bad_count(), 2);
    EXPECT_FALSE(tracker.dns().notified());
}

TEST(HealthTrackerTest, PacketLossRecoveryReportsWorstLoss) {
    HealthTracker tracker(tracker_config());

    tracker.update(up_sample(at_seconds(0), 12.0, 20));
    tracker.update(up_sample(at_seconds(60), 12.0, 60));
    auto triggered = tracker.update(up_sample(at_seconds(120), 12.0, 40));

    ASSERT_EQ(triggered.events.size(), 1u);
    EXPECT_EQ(triggered.events[0].signal, Signal::PacketLoss);
    EXPECT_EQ(triggered.events[0].message, "Internet packet loss of 40% detected");
    EXPECT_EQ(triggered.snapshot.internet, SignalState::Warning);

    auto recovered = tracker.update(up_sample(at_seconds(180), 12.0, 0));
    ASSERT_EQ(recovered.events.size(), 1u);
    EXPECT_EQ(recovered.events[0].kind, EventKind::Recovered);
    EXPECT_NE(recovered.events[0].message.find("packet loss of 60%"), std::string::npos);
    EXPECT_NE(recovered.events[0].message.find("which was for 3 minutes in length"), std::string::npos);
}

TEST(HealthTrackerTest, PacketLossTrackingCanBeDisabled) {
    Config config = tracker_config();
    config.track_packet_loss = false;
    HealthTracker tracker(config);

    for (int i = 0; i < 5; ++i) {
        auto update = tracker.update(up_sample(at_seconds(i * 60), 12.0, 40));
        EXPECT_TRUE(update.events.empty());
        EXPECT_EQ(update.snapshot.internet, SignalState::Up);
    }
    EXPECT_EQ(tracker.packet_loss().consecutive_bad_count(), 0);
}

TEST(HealthTrackerTest, LossThresholdIsStrict) {
    Config config = tracker_config();
    config.loss_threshold_percent = 20;
    HealthTracker tracker(config);

    for (int i = 0; i < 4; ++i) {
        tracker.update(up_sample(at_seconds(i * 60), 12.0, 20));
    }
    EXPECT_EQ(tracker.packet_loss().consecutive_bad_count(), 0);
}

TEST(HealthTrackerTest, LatencyResumesImmediatelyAfterOutage) {
    HealthTracker tracker(tracker_config());

    tracker.update(down_sample(at_seconds(0)));
    tracker.update(down_sample(at_seconds(60)));
    tracker.update(down_sample(at_seconds(120)));
    auto back = tracker.update(up_sample(at_seconds(180), 1800.0));

    ASSERT_EQ(back.events.size(), 1u);
    EXPECT_EQ(back.events[0].signal, Signal::Reachability);
    EXPECT_EQ(tracker.latency().consecutive_bad_count(), 1);
}
