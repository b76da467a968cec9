#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Shapes shared by every telemetry source. Times are milliseconds unless
// the field name says otherwise.

struct TimingEntry {
    std::string driver_id;
    std::string driver_name;
    std::string car_number;
    std::string team_name;
    uint32_t position;
    int32_t lap_number;
    double lap_dist_pct;
    double last_lap_time;
    double best_lap_time;
    double gap_to_leader;
    std::optional<double> gap_ahead;
    std::optional<double> speed;   // km/h
    std::optional<int32_t> sector;
    bool in_pit = false;
    bool retired = false;
};

struct FastestLap {
    std::string driver_id;
    double time = 0.0;
    int32_t lap = 0;
};

// Coarse leaderboard view of a session.
struct SessionTiming {
    std::string session_id;
    std::vector<TimingEntry> entries;
    std::string session_state;
    double session_time_elapsed;   // s
    double session_time_remaining; // s, -1 when unknown
    int32_t laps_remaining;        // -1 when unknown
    std::string leader_id;
    FastestLap fastest_lap;
    uint64_t timestamp;
};

// Fine grained motion view of one (featured) vehicle.
struct ThinFrame {
    std::string session_id;
    uint64_t timestamp;
    std::string driver_id;
    double speed;  // km/h
    int32_t gear;
    double rpm;
    int32_t lap;
    double lap_progress;
    uint32_t position;
    std::optional<double> throttle;
    std::optional<double> brake;
};
