#include <gtest/gtest.h>

#include <algorithm>
#include <format>
#include <string>
#include <thread>
#include <vector>

#include "parity_tracker.hpp"


TEST(ParityTracker, GetOrCreateStartsAtZero) {
    FrameParityTracker tracker;
    const ParitySnapshot snapshot = tracker.get_or_create("s1");

    EXPECT_EQ(snapshot.session_id, "s1");
    EXPECT_TRUE(snapshot.streams.empty());
    EXPECT_EQ(snapshot.duplicates, 0u);
    EXPECT_EQ(snapshot.out_of_order, 0u);
    EXPECT_TRUE(snapshot.last_error.empty());
    EXPECT_EQ(tracker.list_session_ids(), std::vector<std::string>{ "s1" });
}

TEST(ParityTracker, BaselineScenario) {
    FrameParityTracker tracker;

    FrameVerdict v = tracker.record_frame_in("s1", "baseline", 1000, std::string("f1"));
    EXPECT_FALSE(v.is_duplicate);
    EXPECT_FALSE(v.is_out_of_order);
    EXPECT_TRUE(v.should_ack);
    tracker.record_ack_sent("s1", "baseline");

    v = tracker.record_frame_in("s1", "baseline", 1100, std::string("f1"));
    EXPECT_TRUE(v.is_duplicate);
    EXPECT_FALSE(v.should_ack);

    v = tracker.record_frame_in("s1", "baseline", 1200, std::string("f2"));
    EXPECT_TRUE(v.should_ack);
    tracker.record_ack_sent("s1", "baseline");

    const auto snapshot = tracker.snapshot("s1");
    ASSERT_TRUE(snapshot.has_value());
    const SubStreamStats& stats = snapshot->streams.at("baseline");
    EXPECT_EQ(stats.frames_in, 3u);
    EXPECT_EQ(stats.acked, 2u);
    EXPECT_EQ(stats.last_frame_ts, 1200u);
    EXPECT_EQ(snapshot->duplicates, 1u);
    EXPECT_EQ(snapshot->out_of_order, 0u);
}

TEST(ParityTracker, FramesWithoutIdAreNeverAcked) {
    FrameParityTracker tracker;
    const FrameVerdict v = tracker.record_frame_in("s1", "legacy_event", 10, std::nullopt);
    EXPECT_FALSE(v.should_ack);
    EXPECT_FALSE(v.is_duplicate);
    EXPECT_EQ(tracker.snapshot("s1")->streams.at("legacy_event").frames_in, 1u);
}

TEST(ParityTracker, OutOfOrderBeyondTolerance) {
    FrameParityTracker tracker;
    tracker.record_frame_in("s1", "coarse_state", 10000, std::nullopt);

    // within the 1000 ms tolerance
    FrameVerdict v = tracker.record_frame_in("s1", "coarse_state", 9000, std::nullopt);
    EXPECT_FALSE(v.is_out_of_order);
    EXPECT_EQ(tracker.snapshot("s1")->streams.at("coarse_state").last_frame_ts, 9000u);

    v = tracker.record_frame_in("s1", "coarse_state", 7000, std::nullopt);
    EXPECT_TRUE(v.is_out_of_order);

    const auto snapshot = tracker.snapshot("s1");
    EXPECT_EQ(snapshot->out_of_order, 1u);
    EXPECT_EQ(snapshot->streams.at("coarse_state").last_frame_ts, 9000u);
    EXPECT_EQ(snapshot->streams.at("coarse_state").frames_in, 3u);

    // other sub-streams have their own clock
    v = tracker.record_frame_in("s1", "high_fidelity", 100, std::nullopt);
    EXPECT_FALSE(v.is_out_of_order);
}

TEST(ParityTracker, ToleranceIsConfigurable) {
    FrameParityTracker tracker(ParityConfig { .out_of_order_tolerance_ms = 100 });
    tracker.record_frame_in("s1", "coarse_state", 1000, std::nullopt);
    EXPECT_TRUE(tracker.record_frame_in("s1", "coarse_state", 850, std::nullopt).is_out_of_order);
}

TEST(ParityTracker, DuplicateAndOutOfOrderAreIndependent) {
    FrameParityTracker tracker;
    tracker.record_frame_in("s1", "a", 5000, std::string("x"));
    const FrameVerdict v = tracker.record_frame_in("s1", "a", 1000, std::string("x"));
    EXPECT_TRUE(v.is_duplicate);
    EXPECT_TRUE(v.is_out_of_order);
    EXPECT_FALSE(v.should_ack);
}

TEST(ParityTracker, IdWindowEvictsOldestFirst) {
    FrameParityTracker tracker;
    for (int i = 0; i <= 1000; i++) {
        tracker.record_frame_in("s1", "a", std::nullopt, std::format("id-{}", i));
    }

    // id-0 fell out of the 1000 entry window
    FrameVerdict v = tracker.record_frame_in("s1", "a", std::nullopt, std::string("id-0"));
    EXPECT_FALSE(v.is_duplicate);
    EXPECT_TRUE(v.should_ack);

    v = tracker.record_frame_in("s1", "a", std::nullopt, std::string("id-1000"));
    EXPECT_TRUE(v.is_duplicate);
}

TEST(ParityTracker, FrameIdWindowNeverExceedsCapacity) {
    FrameIdWindow window(3);
    for (const char* id : { "a", "b", "c", "d", "e" }) {
        window.insert(id);
        EXPECT_LE(window.size(), 3u);
    }
    EXPECT_FALSE(window.contains("a"));
    EXPECT_FALSE(window.contains("b"));
    EXPECT_TRUE(window.contains("c"));
    EXPECT_TRUE(window.contains("e"));
}

TEST(ParityTracker, AckCountIsNotValidated) {
    FrameParityTracker tracker;
    tracker.record_ack_sent("s1", "control_input");
    tracker.record_ack_sent("s1", "control_input");

    const auto snapshot = tracker.snapshot("s1");
    EXPECT_EQ(snapshot->streams.at("control_input").acked, 2u);
    EXPECT_EQ(snapshot->streams.at("control_input").frames_in, 0u);
}

TEST(ParityTracker, ErrorIsTruncatedAndReplaced) {
    FrameParityTracker tracker;
    tracker.record_error("s1", "first");
    tracker.record_error("s1", std::string(500, 'x'));

    const auto snapshot = tracker.snapshot("s1");
    EXPECT_EQ(snapshot->last_error.size(), 200u);
    EXPECT_EQ(snapshot->last_error, std::string(200, 'x'));
}

TEST(ParityTracker, SnapshotIsACopy) {
    FrameParityTracker tracker;
    tracker.record_frame_in("s1", "a", 1, std::string("f"));
    const auto before = tracker.snapshot("s1");
    tracker.record_frame_in("s1", "a", 2, std::string("g"));

    EXPECT_EQ(before->streams.at("a").frames_in, 1u);
    EXPECT_EQ(tracker.snapshot("s1")->streams.at("a").frames_in, 2u);
}

TEST(ParityTracker, UnknownAndCleanedSessions) {
    FrameParityTracker tracker;
    EXPECT_FALSE(tracker.snapshot("nope").has_value());

    tracker.get_or_create("s1");
    tracker.get_or_create("s2");
    tracker.cleanup("s1");
    EXPECT_FALSE(tracker.snapshot("s1").has_value());
    EXPECT_EQ(tracker.list_session_ids(), std::vector<std::string>{ "s2" });

    // recreated from zero
    EXPECT_TRUE(tracker.get_or_create("s1").streams.empty());
}

TEST(ParityTracker, SessionsAreIsolatedUnderConcurrency) {
    FrameParityTracker tracker;
    std::vector<std::thread> workers;
    for (int w = 0; w < 4; w++) {
        workers.emplace_back([&tracker, w]() {
            const std::string session = std::format("s{}", w);
            for (int i = 0; i < 500; i++) {
                tracker.record_frame_in(session, "a", i, std::format("{}-{}", w, i));
            }
        });
    }
    for (auto& t : workers) {
        t.join();
    }

    auto ids = tracker.list_session_ids();
    std::sort(ids.begin(), ids.end());
    ASSERT_EQ(ids.size(), 4u);
    for (const auto& id : ids) {
        const auto snapshot = tracker.snapshot(id);
        EXPECT_EQ(snapshot->streams.at("a").frames_in, 500u);
        EXPECT_EQ(snapshot->duplicates, 0u);
    }
}
