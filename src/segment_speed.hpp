#pragma once

#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "confidence.hpp"
#include "event_channel.hpp"
#include "track_map.hpp"

struct SegmentConfig {
    int64_t min_segment_time_ms = 500;    // faster => position teleport/reset
    int64_t max_segment_time_ms = 60000;  // slower => stopped or paused session
    size_t min_samples_for_trend = 3;
    size_t history_capacity = 100;
    double max_speed_ms = 100.0;          // 360 km/h
    double fuel_burn_slope_ms = -10.0;    // ms/lap
    double traffic_window_pct = 0.005;    // lap fraction counted as overlap
};

// One position observation of a vehicle.
struct PositionSample {
    uint32_t vehicle_id;
    std::string driver_id;
    double lap_dist_pct;
    int32_t lap;
    bool in_pit_lane;
    bool on_racing_surface;
    bool has_traffic_overlap;
    uint64_t timestamp;
};

struct SegmentSpeedResult {
    uint32_t vehicle_id;
    std::string driver_id;
    std::string segment_id;
    SegmentType segment_type;

    int64_t segment_time_ms;
    uint64_t entry_timestamp;
    uint64_t exit_timestamp;

    ConfidenceValue avg_speed_ms;  // m/s
    ConfidenceValue avg_speed_kph;

    SegmentQuality quality;
    std::vector<std::string> quality_reasons;

    int32_t lap_number;
};

struct VehicleSegmentState {
    uint32_t vehicle_id;
    std::string driver_id;

    double last_lap_dist_pct;
    int32_t last_lap;
    uint64_t last_timestamp;

    std::optional<size_t> current_segment; // index into the track map
    uint64_t segment_entry_time = 0;
    double segment_entry_pct = 0.0;
    int32_t segment_entry_lap = 0;

    // reflect the latest sample, not history
    bool in_pit_lane = false;
    bool on_racing_surface = true;
    bool has_traffic_overlap = false;

    std::deque<SegmentSpeedResult> history;
};

enum class DegradationType { Tire, FuelBurn, Unknown };

inline constexpr std::string_view DEGRADATION_TYPE_NAMES[] = { "tire", "fuel_burn", "unknown" };

constexpr std::string_view degradation_name(DegradationType t) {
    return DEGRADATION_TYPE_NAMES[static_cast<int>(t)];
}

struct SegmentPaceUpdate {
    std::string session_id;
    uint64_t timestamp;
    uint32_t vehicle_id;
    std::string driver_id;
    std::string segment_id;
    ConfidenceValue avg_speed;  // m/s
    int64_t segment_time_ms;
    SegmentQuality quality_flag;
    double confidence_score;
    ValueSource source;
};

struct PaceTrend {
    std::string session_id;
    uint64_t timestamp;
    uint32_t vehicle_id;
    std::string driver_id;

    ConfidenceValue straight_pace;
    ConfidenceValue corner_pace;
    ConfidenceValue overall_pace;

    ConfidenceValue pace_slope;  // ms per lap, positive = slowing
    DegradationType degradation_type;

    size_t clean_sample_count;
    size_t total_sample_count;
    SegmentQuality data_quality_summary;
};

// Derives speed from segment transit times ("virtual speed traps").
// One instance per session. Samples of the same vehicle must arrive
// serialized; different vehicles may be fed from different threads.
class SegmentSpeedDetector {
    const std::string session_id;
    const SegmentConfig config;

    EventChannel<SegmentPaceUpdate>* pace_updates;
    EventChannel<PaceTrend>* pace_trends;

    std::shared_ptr<const TrackSegmentMap> track_map;
    std::map<uint32_t, VehicleSegmentState> vehicles;
    mutable std::mutex mutex;

public:
    SegmentSpeedDetector(std::string session_id, SegmentConfig config,
                         EventChannel<SegmentPaceUpdate>* pace_updates = nullptr,
                         EventChannel<PaceTrend>* pace_trends = nullptr);

    // Replaces the map and drops all vehicle state.
    void set_track_map(std::shared_ptr<const TrackSegmentMap> map);
    std::shared_ptr<const TrackSegmentMap> get_track_map() const;

    // Result for the segment the vehicle just left, if any.
    std::optional<SegmentSpeedResult> process(const PositionSample& sample);

    std::optional<PaceTrend> analyze_pace_trend(uint32_t vehicle_id);

    std::optional<VehicleSegmentState> vehicle_state(uint32_t vehicle_id) const;
    std::vector<uint32_t> vehicle_ids() const;
    std::vector<SegmentSpeedResult> history(uint32_t vehicle_id) const;
    void clear();

    const std::string& get_session_id() const { return session_id; }

private:
    SegmentSpeedResult complete_segment(const VehicleSegmentState& state,
                                        const TrackSegment& segment,
                                        uint64_t exit_time) const;
    ConfidenceValue segment_speed(double length_meters, int64_t time_ms,
                                  SegmentQuality quality, uint64_t timestamp) const;
};

// exposed for tests and for the trend analysis
ConfidenceValue average_speed(const std::vector<const SegmentSpeedResult*>& samples, uint64_t timestamp);
ConfidenceValue pace_slope(const std::vector<const SegmentSpeedResult*>& samples, uint64_t timestamp);
DegradationType infer_degradation(const ConfidenceValue& slope, double fuel_burn_slope_ms);
