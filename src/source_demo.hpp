#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include "demo_generator.hpp"
#include "playback_clock.hpp"
#include "telemetry_source.hpp"

#define DEMO_TIMING_EVERY_TICKS 5
#define DEMO_FRAME_EVERY_TICKS 2

// Seeded synthetic session on the playback clock: timing every 5th tick,
// a frame every 2nd tick. Simulation time advances by the tick interval,
// so two runs with the same seed emit identical data.
class DemoSource : public TelemetrySource {
public:
    DemoSource(std::string seed, uint64_t tick_interval_ms = DEFAULT_TICK_INTERVAL_MS,
               bool start_clock = true, uint64_t epoch_ms = 0);
    ~DemoSource() override;

    bool connect(const std::string& session_id) override;
    void disconnect() override;

    Unsubscribe on_timing(TimingCallback callback) override { return timing_channel.subscribe(std::move(callback)); }
    Unsubscribe on_frame(FrameCallback callback) override { return frame_channel.subscribe(std::move(callback)); }

    bool is_connected() const override { return active; }

    std::string get_backend_name() const override { return "demo"; }
    std::string get_last_error() const override;

    // One clock tick. False when not connected.
    bool step();

    uint64_t get_tick_count() const;
    const std::string& get_seed() const { return seed; }

private:
    const std::string seed;
    const uint64_t tick_interval_ms;
    const bool start_clock;
    const uint64_t epoch_ms;

    EventChannel<SessionTiming> timing_channel;
    EventChannel<ThinFrame> frame_channel;

    std::unique_ptr<DemoGenerator> generator;
    uint64_t tick_count = 0;
    std::atomic<bool> active = false;
    std::atomic<uint64_t> connection = 0;
    std::string last_error;
    mutable std::mutex mutex;

    PlaybackClock clock;
};
