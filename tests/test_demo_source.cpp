#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include "demo_generator.hpp"
#include "source_demo.hpp"
#include "wire.hpp"


namespace {

struct Captured {
    std::vector<std::string> timings;
    std::vector<std::string> frames;
};

Captured run_demo(const std::string& seed, int ticks) {
    DemoSource source(seed, 100, false);
    Captured captured;
    auto stop_timing = source.on_timing([&](const SessionTiming& t) { captured.timings.push_back(encode_timing(t)); });
    auto stop_frames = source.on_frame([&](const ThinFrame& f) { captured.frames.push_back(encode_frame(f)); });

    EXPECT_TRUE(source.connect("demo-session"));
    for (int i = 0; i < ticks; i++) {
        source.step();
    }
    source.disconnect();
    stop_timing();
    stop_frames();
    return captured;
}

} // namespace


TEST(DemoGenerator, Mulberry32IsDeterministicAndInRange) {
    Mulberry32 a(12345);
    Mulberry32 b(12345);
    for (int i = 0; i < 1000; i++) {
        const double x = a.next();
        EXPECT_EQ(x, b.next());
        EXPECT_GE(x, 0.0);
        EXPECT_LT(x, 1.0);
    }
}

TEST(DemoGenerator, HashString) {
    EXPECT_EQ(hash_string(""), 0u);
    EXPECT_EQ(hash_string("a"), 97u);
    EXPECT_EQ(hash_string("ab"), 97u * 31u + 98u);
    EXPECT_EQ(hash_string("s1-default"), hash_string("s1-default"));
}

TEST(DemoGenerator, FieldShape) {
    DemoGenerator generator(DemoConfig { .session_id = "s1", .seed = "abc" });
    EXPECT_GE(generator.get_car_count(), 20u);
    EXPECT_LT(generator.get_car_count(), 60u);
    EXPECT_FALSE(generator.get_track_name().empty());

    generator.advance(1000);
    const SessionTiming timing = generator.generate_timing();
    ASSERT_EQ(timing.entries.size(), generator.get_car_count());
    EXPECT_EQ(timing.timestamp, 1000u);
    EXPECT_EQ(timing.leader_id, timing.entries.front().driver_id);
    EXPECT_EQ(timing.laps_remaining, 49);
    for (size_t i = 1; i < timing.entries.size(); i++) {
        EXPECT_LT(timing.entries[i - 1].position, timing.entries[i].position);
    }

    const ThinFrame frame = generator.generate_frame();
    EXPECT_EQ(frame.session_id, "s1");
    EXPECT_EQ(frame.driver_id, "demo-driver-0");
}

TEST(DemoGenerator, FixedCarCountAndEpoch) {
    DemoGenerator generator(DemoConfig {
        .session_id = "s1", .seed = "x", .car_count = 3, .track_name = "Summit Ring", .epoch_ms = 1000000
    });
    EXPECT_EQ(generator.get_car_count(), 3u);
    EXPECT_EQ(generator.get_track_name(), "Summit Ring");
    generator.advance(250);
    EXPECT_EQ(generator.generate_timing().timestamp, 1000250u);
}

TEST(DemoSource, EmitsOnItsCadence) {
    const Captured captured = run_demo("default", 10);
    EXPECT_EQ(captured.timings.size(), 2u);
    EXPECT_EQ(captured.frames.size(), 5u);
}

TEST(DemoSource, SameSeedSameSession) {
    const Captured a = run_demo("seed-1", 50);
    const Captured b = run_demo("seed-1", 50);
    EXPECT_EQ(a.timings, b.timings);
    EXPECT_EQ(a.frames, b.frames);

    const Captured c = run_demo("seed-2", 50);
    EXPECT_NE(a.timings, c.timings);
}

TEST(DemoSource, NothingAfterDisconnect) {
    DemoSource source("default", 100, false);
    int events = 0;
    auto stop_timing = source.on_timing([&](const SessionTiming&) { events++; });

    ASSERT_TRUE(source.connect("s1"));
    EXPECT_TRUE(source.is_connected());
    for (int i = 0; i < 5; i++) {
        source.step();
    }
    EXPECT_EQ(events, 1);
    EXPECT_EQ(source.get_tick_count(), 5u);

    source.disconnect();
    source.disconnect();
    EXPECT_FALSE(source.is_connected());
    EXPECT_FALSE(source.step());
    EXPECT_EQ(events, 1);
    stop_timing();
}

TEST(DemoSource, RejectsEmptySession) {
    DemoSource source("default", 100, false);
    EXPECT_FALSE(source.connect(""));
    EXPECT_FALSE(source.get_last_error().empty());
    EXPECT_FALSE(source.is_connected());
    source.disconnect();
}

TEST(DemoSource, RunsOnItsOwnClock) {
    DemoSource source("default", 1, true);
    std::atomic<int> frames = 0;
    auto stop_frames = source.on_frame([&](const ThinFrame&) { frames++; });

    ASSERT_TRUE(source.connect("s1"));
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (frames < 3 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    source.disconnect();
    EXPECT_GE(frames, 3);

    const int after = frames;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    EXPECT_EQ(frames, after);
    stop_frames();
}

TEST(DemoSource, ReconnectFromAListener) {
    DemoSource source("default", 1, true);
    std::atomic<bool> reconnected = false;
    std::atomic<bool> reconnect_ok = false;
    std::atomic<bool> second_session = false;

    auto stop_timing = source.on_timing([&](const SessionTiming& timing) {
        if (timing.session_id == "s1" && !reconnected.exchange(true)) {
            reconnect_ok = source.connect("s2");
        }
    });
    auto stop_frames = source.on_frame([&](const ThinFrame& frame) {
        if (frame.session_id == "s2") {
            second_session = true;
        }
    });

    ASSERT_TRUE(source.connect("s1"));
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!second_session && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    EXPECT_TRUE(reconnected);
    EXPECT_TRUE(reconnect_ok) << source.get_last_error();
    EXPECT_TRUE(second_session);
    EXPECT_TRUE(source.is_connected());

    source.disconnect();
    stop_timing();
    stop_frames();
}
