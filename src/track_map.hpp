#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class SegmentType {
    Straight,    // high-speed zone
    Corner,      // single turn
    Complex,     // multi-turn section
    PitEntry,
    PitExit,
    StartFinish
};

inline constexpr std::string_view SEGMENT_TYPE_NAMES[] = {
    "straight", "corner", "complex", "pit_entry", "pit_exit", "start_finish"
};

constexpr std::string_view segment_type_name(SegmentType t) {
    return SEGMENT_TYPE_NAMES[static_cast<int>(t)];
}

std::optional<SegmentType> parse_segment_type(std::string_view name);

// A virtual speed trap: a fixed arc of the lap, [start_pct, end_pct).
// start_pct > end_pct means the arc crosses the start/finish line.
struct TrackSegment {
    std::string segment_id;
    std::string label;
    double start_pct;
    double end_pct;
    double length_meters;
    SegmentType segment_type;
    bool is_speed_trap;
};

// Immutable once handed to a detector; shared read-only by all vehicles.
struct TrackSegmentMap {
    std::string track_id;
    std::string track_name;
    std::string layout_name;
    double track_length_meters = 0.0;
    std::vector<TrackSegment> segments; // ordered by position
    uint64_t created_at = 0;
    std::string version;

    std::optional<size_t> find_segment(double lap_dist_pct) const;
};

// Lap distance delta that survives the 1.0 -> 0.0 wrap at start/finish.
double wrap_safe_delta(double p1, double p2);
double delta_to_meters(double delta_pct, double track_length_meters);
bool is_in_segment(double lap_dist_pct, const TrackSegment& segment);

// Fallback when no curated map exists: 10 equal segments, every third
// one a straight, the first one a speed trap.
TrackSegmentMap generate_default_segment_map(const std::string& track_id,
                                             const std::string& track_name,
                                             double track_length_meters,
                                             uint64_t created_at = 0);

bool validate_track_map(const TrackSegmentMap& map, std::string& error);
bool load_track_map(const std::string& path, TrackSegmentMap& map, std::string& error);
