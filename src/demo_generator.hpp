#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "timing.hpp"

// Small seeded PRNG, uniform in [0, 1). Same seed, same sequence, on
// every platform.
class Mulberry32 {
    uint32_t state;

public:
    explicit Mulberry32(uint32_t seed) : state(seed) {}
    double next();
};

// 31-based string hash folded to a non-negative 32 bit value.
uint32_t hash_string(std::string_view text);

struct DemoConfig {
    std::string session_id;
    std::string seed = "default";
    uint32_t car_count = 0;        // 0: 20-59, picked by the seed
    std::string track_name;        // empty: picked by the seed
    std::string session_type = "race";
    uint64_t epoch_ms = 0;         // timestamp of simulation time zero
};

// Deterministic fake session: a field of cars lapping a 90 s circuit
// with some speed noise, battles and the occasional position swap.
class DemoGenerator {
public:
    explicit DemoGenerator(const DemoConfig& config);

    void advance(uint64_t delta_ms);

    SessionTiming generate_timing();
    ThinFrame generate_frame();

    const std::string& get_session_id() const { return session_id; }
    const std::string& get_track_name() const { return track_name; }
    const std::string& get_session_type() const { return session_type; }
    uint32_t get_car_count() const { return car_count; }
    uint64_t get_simulation_time() const { return simulation_time_ms; }

private:
    struct DemoDriver {
        std::string driver_id;
        std::string driver_name;
        std::string car_number;
        std::string team_name;
    };

    Mulberry32 rng;
    const std::string session_id;
    const uint64_t epoch_ms;
    uint32_t car_count;
    std::string track_name;
    std::string session_type;

    std::vector<DemoDriver> drivers;
    std::vector<uint32_t> positions;
    std::vector<double> lap_dist_pcts;
    std::vector<double> speeds;   // km/h
    std::vector<int32_t> laps;
    int32_t current_lap = 1;
    uint64_t simulation_time_ms = 0;

    size_t pick(size_t count) { return static_cast<size_t>(rng.next() * count); }
};
