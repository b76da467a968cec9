#include "source_demo.hpp"

#include <format>
#include <iostream>
#include <optional>
#include <utility>


DemoSource::DemoSource(std::string _seed, uint64_t _tick_interval_ms, bool _start_clock, uint64_t _epoch_ms)
    : seed(std::move(_seed))
    , tick_interval_ms(_tick_interval_ms)
    , start_clock(_start_clock)
    , epoch_ms(_epoch_ms)
    , clock(std::chrono::milliseconds(_tick_interval_ms))
{
}

DemoSource::~DemoSource() {
    disconnect();
}

bool DemoSource::connect(const std::string& session_id) {
    disconnect();

    if (session_id.empty()) {
        std::lock_guard<std::mutex> lock(mutex);
        last_error = "empty session id";
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex);
        generator = std::make_unique<DemoGenerator>(DemoConfig {
            .session_id = session_id,
            .seed = seed,
            .epoch_ms = epoch_ms
        });
        tick_count = 0;
        std::cerr << std::format("Demo session {}: {} cars at {} (seed {})\n",
            session_id, generator->get_car_count(), generator->get_track_name(), seed);
    }

    connection++;
    active = true;
    if (start_clock && !clock.start([this]() { return step(); })) {
        active = false;
        std::lock_guard<std::mutex> lock(mutex);
        last_error = "playback clock is still running";
        return false;
    }
    return true;
}

void DemoSource::disconnect() {
    active = false;
    clock.stop();

    std::lock_guard<std::mutex> lock(mutex);
    generator.reset();
}

bool DemoSource::step() {
    std::optional<SessionTiming> timing;
    std::optional<ThinFrame> frame;
    const uint64_t current = connection;
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (!active || !generator) {
            return false;
        }

        generator->advance(tick_interval_ms);
        tick_count++;

        if (tick_count % DEMO_TIMING_EVERY_TICKS == 0) {
            timing = generator->generate_timing();
        }
        if (tick_count % DEMO_FRAME_EVERY_TICKS == 0) {
            frame = generator->generate_frame();
        }
    }

    // a listener may have reconnected meanwhile
    if (timing && active && connection == current) {
        timing_channel.publish(*timing);
    }
    if (frame && active && connection == current) {
        frame_channel.publish(*frame);
    }
    return true;
}

uint64_t DemoSource::get_tick_count() const {
    std::lock_guard<std::mutex> lock(mutex);
    return tick_count;
}

std::string DemoSource::get_last_error() const {
    std::lock_guard<std::mutex> lock(mutex);
    return last_error;
}
