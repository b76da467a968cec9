#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "ingest_sample.hpp"
#include "session_registry.hpp"


namespace {

class SessionRegistryTest : public ::testing::Test {
protected:
    std::shared_ptr<SubscriptionGate> gate = std::make_shared<SubscriptionGate>();
    std::atomic<uint64_t> clock_ms = 0;
    SessionRegistry registry { ParityConfig{}, SegmentConfig{}, gate, [this]() { return clock_ms.load(); } };

    void SetUp() override {
        registry.set_default_track_map(std::make_shared<const TrackSegmentMap>(
            generate_default_segment_map("ring", "Ring", 4000.0)));
    }

    static IngestSample position(const std::string& session, double pct, uint64_t ts,
                                 std::optional<std::string> frame_id = std::nullopt) {
        return IngestSample {
            .session_id = session,
            .sub_stream = SUB_STREAM_COARSE_STATE,
            .vehicle_id = 11,
            .driver_id = "d11",
            .frame_id = std::move(frame_id),
            .timestamp = ts,
            .cyclic_position = pct,
            .lap = 3,
        };
    }
};

} // namespace


TEST_F(SessionRegistryTest, IngestCreatesSessionAndCountsParity) {
    const IngestResult result = registry.ingest(position("s1", 0.05, 1000, std::string("f1")));
    EXPECT_TRUE(result.verdict.should_ack);
    EXPECT_FALSE(result.segment.has_value());

    EXPECT_EQ(registry.session_ids(), std::vector<std::string>{ "s1" });
    const auto snapshot = registry.parity_snapshot("s1");
    ASSERT_TRUE(snapshot.has_value());
    EXPECT_EQ(snapshot->streams.at(SUB_STREAM_COARSE_STATE).frames_in, 1u);
}

TEST_F(SessionRegistryTest, SegmentResultsFlowThroughIngest) {
    // 400 m segments, 12 s each
    registry.ingest(position("s1", 0.05, 0));
    registry.ingest(position("s1", 0.05, 1000));
    const IngestResult result = registry.ingest(position("s1", 0.15, 13000));

    ASSERT_TRUE(result.segment.has_value());
    EXPECT_EQ(result.segment->segment_id, "seg_0");
    EXPECT_NEAR(*result.segment->avg_speed_ms.value, 400.0 / 12.0, 1e-6);
}

TEST_F(SessionRegistryTest, DuplicateFramesDoNotFeedTheDetector) {
    registry.ingest(position("s1", 0.05, 0, std::string("a")));
    registry.ingest(position("s1", 0.05, 1000, std::string("b")));
    const IngestResult duplicate = registry.ingest(position("s1", 0.15, 13000, std::string("b")));

    EXPECT_TRUE(duplicate.verdict.is_duplicate);
    EXPECT_FALSE(duplicate.segment.has_value());
    EXPECT_EQ(registry.parity_snapshot("s1")->duplicates, 1u);
}

TEST_F(SessionRegistryTest, SamplesWithoutVehicleOnlyCountParity) {
    IngestSample frame = position("s1", 0.5, 100);
    frame.vehicle_id.reset();
    frame.sub_stream = SUB_STREAM_HIGH_FIDELITY;

    const IngestResult result = registry.ingest(frame);
    EXPECT_FALSE(result.segment.has_value());
    EXPECT_EQ(registry.parity_snapshot("s1")->streams.at(SUB_STREAM_HIGH_FIDELITY).frames_in, 1u);
}

TEST_F(SessionRegistryTest, SessionsAreIsolated) {
    registry.ingest(position("s1", 0.05, 0, std::string("x")));
    const IngestResult other = registry.ingest(position("s2", 0.05, 0, std::string("x")));
    EXPECT_FALSE(other.verdict.is_duplicate);

    auto ids = registry.session_ids();
    std::sort(ids.begin(), ids.end());
    EXPECT_EQ(ids, (std::vector<std::string>{ "s1", "s2" }));
}

TEST_F(SessionRegistryTest, PaceSubscriptionGoesThroughTheGate) {
    std::vector<SegmentPaceUpdate> received;
    std::string reason;
    auto unsubscribe = registry.subscribe_pace({ .role = "league", .session_id = "s1" },
        [&](const SegmentPaceUpdate& u) { received.push_back(u); }, reason);
    ASSERT_TRUE(unsubscribe.has_value()) << reason;

    // subscribing creates the session
    EXPECT_EQ(registry.session_ids(), std::vector<std::string>{ "s1" });
    EXPECT_EQ(gate->active_count(), 1u);

    // two transits 12 s apart in event time, both inside the 2 Hz budget
    registry.ingest(position("s1", 0.05, 0));
    registry.ingest(position("s1", 0.05, 1000));
    registry.ingest(position("s1", 0.15, 13000));
    registry.ingest(position("s1", 0.25, 13000 + 12000));
    EXPECT_EQ(received.size(), 2u);

    // other sessions never reach this subscriber
    registry.ingest(position("s2", 0.05, 0));
    registry.ingest(position("s2", 0.05, 1000));
    registry.ingest(position("s2", 0.15, 13000));
    EXPECT_EQ(received.size(), 2u);

    (*unsubscribe)();
    EXPECT_EQ(gate->active_count(), 0u);
    registry.ingest(position("s1", 0.35, 37000));
    EXPECT_EQ(received.size(), 2u);
}

TEST_F(SessionRegistryTest, RateLimitDropsUpdatesInsideTheInterval) {
    std::vector<SegmentPaceUpdate> received;
    std::string reason;
    auto unsubscribe = registry.subscribe_pace({ .role = "league", .session_id = "s1" },
        [&](const SegmentPaceUpdate& u) { received.push_back(u); }, reason);
    ASSERT_TRUE(unsubscribe.has_value());

    // two vehicles finishing seg_0 within 200 ms of each other
    IngestSample a = position("s1", 0.05, 0);
    IngestSample b = position("s1", 0.05, 0);
    b.vehicle_id = 12;
    registry.ingest(a);
    registry.ingest(b);
    a.timestamp = b.timestamp = 1000;
    registry.ingest(a);
    registry.ingest(b);
    a.cyclic_position = b.cyclic_position = 0.15;
    a.timestamp = 13000;
    b.timestamp = 13200;
    registry.ingest(a);
    registry.ingest(b);

    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0].vehicle_id, 11u);
    (*unsubscribe)();
}

TEST_F(SessionRegistryTest, RejectedSubscriptionCreatesNothing) {
    std::string reason;
    auto unsubscribe = registry.subscribe_trend({ .role = "nobody", .session_id = "s1" },
        [](const PaceTrend&) {}, reason);
    EXPECT_FALSE(unsubscribe.has_value());
    EXPECT_FALSE(reason.empty());
    EXPECT_TRUE(registry.session_ids().empty());
}

TEST_F(SessionRegistryTest, TrendSubscriptionReceivesAnalysis) {
    std::vector<PaceTrend> trends;
    std::string reason;
    auto unsubscribe = registry.subscribe_trend({ .role = "ops", .session_id = "s1" },
        [&](const PaceTrend& t) { trends.push_back(t); }, reason);
    ASSERT_TRUE(unsubscribe.has_value());

    uint64_t ts = 0;
    registry.ingest(position("s1", 0.05, ts));
    for (int i = 0; i < 5; i++) {
        ts += 10000;
        registry.ingest(position("s1", 0.05 + i * 0.1, ts));
    }

    const auto result = registry.analyze_pace_trends("s1");
    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result[0].vehicle_id, 11u);
    EXPECT_EQ(result[0].clean_sample_count, 4u);
    ASSERT_EQ(trends.size(), 1u);

    EXPECT_TRUE(registry.analyze_pace_trends("unknown").empty());
    EXPECT_FALSE(registry.analyze_pace_trend("s1", 99).has_value());
    (*unsubscribe)();
}

TEST_F(SessionRegistryTest, PerSessionTrackMap) {
    TrackSegmentMap map = generate_default_segment_map("other", "Other", 8000.0);
    std::string error;
    ASSERT_TRUE(registry.set_track_map("s1", map, error)) << error;

    registry.ingest(position("s1", 0.05, 0));
    registry.ingest(position("s1", 0.05, 1000));
    const IngestResult result = registry.ingest(position("s1", 0.15, 13000));
    ASSERT_TRUE(result.segment.has_value());
    EXPECT_NEAR(*result.segment->avg_speed_ms.value, 800.0 / 12.0, 1e-6);

    map.segments.clear();
    EXPECT_FALSE(registry.set_track_map("s1", map, error));
    EXPECT_FALSE(error.empty());
}

TEST_F(SessionRegistryTest, EndSessionReleasesEverything) {
    registry.ingest(position("s1", 0.05, 0));
    registry.record_error("s1", "relay hiccup");
    EXPECT_EQ(registry.parity_snapshot("s1")->last_error, "relay hiccup");

    EXPECT_TRUE(registry.end_session("s1"));
    EXPECT_FALSE(registry.end_session("s1"));
    EXPECT_FALSE(registry.parity_snapshot("s1").has_value());
    EXPECT_TRUE(registry.session_ids().empty());
}

TEST_F(SessionRegistryTest, IdleSessions) {
    clock_ms = 1000;
    registry.ingest(position("s1", 0.05, 0));
    clock_ms = 5000;
    registry.ingest(position("s2", 0.05, 0));
    registry.record_ack_sent("s2", SUB_STREAM_COARSE_STATE);

    clock_ms = 8000;
    EXPECT_EQ(registry.idle_sessions(5000), std::vector<std::string>{ "s1" });
    EXPECT_EQ(registry.idle_sessions(3000).size(), 2u);
    EXPECT_TRUE(registry.idle_sessions(10000).empty());
    EXPECT_EQ(registry.parity_snapshot("s2")->streams.at(SUB_STREAM_COARSE_STATE).acked, 1u);
}

TEST_F(SessionRegistryTest, EndedSessionStartsOverWithFreshCounters) {
    registry.ingest(position("s1", 0.05, 0, std::string("a")));
    registry.ingest(position("s1", 0.06, 100, std::string("b")));
    ASSERT_TRUE(registry.end_session("s1"));

    const IngestResult result = registry.ingest(position("s1", 0.07, 200, std::string("a")));
    EXPECT_FALSE(result.verdict.is_duplicate);
    EXPECT_EQ(registry.parity_snapshot("s1")->streams.at(SUB_STREAM_COARSE_STATE).frames_in, 1u);
}

TEST_F(SessionRegistryTest, EndSessionRacingIngestKeepsParityAndSessionTogether) {
    std::atomic<bool> stop = false;
    std::thread ender([&]() {
        while (!stop) {
            registry.end_session("s1");
        }
    });

    for (uint64_t i = 0; i < 2000; i++) {
        registry.ingest(position("s1", 0.05, i, std::to_string(i)));
    }
    stop = true;
    ender.join();

    const bool has_session = !registry.session_ids().empty();
    EXPECT_EQ(registry.parity_snapshot("s1").has_value(), has_session);

    registry.end_session("s1");
    EXPECT_FALSE(registry.parity_snapshot("s1").has_value());
    EXPECT_TRUE(registry.session_ids().empty());
}
