#include "segment_speed.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <iostream>
#include <utility>

#include <liquid/liquid.h>

#define MS_TO_KPH 3.6
#define TREND_CONFIDENCE_SAMPLES 10.0
#define MIN_REGRESSION_POINTS 3
#define CLEAN_SUMMARY_RATIO 0.7


struct QualityVerdict {
    SegmentQuality quality;
    std::vector<std::string> reasons;
};

// first matching rule wins
static QualityVerdict classify_quality(const VehicleSegmentState& state,
                                       int64_t segment_time_ms,
                                       const SegmentConfig& config)
{
    if (state.in_pit_lane) {
        return { SegmentQuality::Pit, { "Car in pit lane" } };
    }
    if (!state.on_racing_surface) {
        return { SegmentQuality::OffTrack, { "Off racing surface" } };
    }
    if (segment_time_ms < config.min_segment_time_ms) {
        return { SegmentQuality::Invalid, {
            std::format("Segment time {}ms below minimum {}ms (teleport?)",
                segment_time_ms, config.min_segment_time_ms) } };
    }
    if (segment_time_ms > config.max_segment_time_ms) {
        return { SegmentQuality::Invalid, {
            std::format("Segment time {}ms above maximum {}ms (stopped?)",
                segment_time_ms, config.max_segment_time_ms) } };
    }
    if (state.has_traffic_overlap) {
        return { SegmentQuality::TrafficAffected, { "Traffic overlap detected" } };
    }
    return { SegmentQuality::Clean, { "No quality issues detected" } };
}

static double tier_confidence(SegmentQuality quality) {
    switch (quality) {
        case SegmentQuality::Clean:           return 0.9;
        case SegmentQuality::TrafficAffected: return 0.6;
        case SegmentQuality::OffTrack:        return 0.3;
        default:                              return 0.5;
    }
}

SegmentSpeedDetector::SegmentSpeedDetector(std::string _session_id, SegmentConfig _config,
                                           EventChannel<SegmentPaceUpdate>* _pace_updates,
                                           EventChannel<PaceTrend>* _pace_trends)
    : session_id(std::move(_session_id))
    , config(_config)
    , pace_updates(_pace_updates)
    , pace_trends(_pace_trends)
{
}

void SegmentSpeedDetector::set_track_map(std::shared_ptr<const TrackSegmentMap> map) {
    size_t segment_count = 0;
    std::string track_id;
    {
        std::lock_guard<std::mutex> lock(mutex);
        track_map = std::move(map);
        vehicles.clear(); // in-flight occupancy is meaningless on another layout
        if (track_map) {
            segment_count = track_map->segments.size();
            track_id = track_map->track_id;
        }
    }
    if (!track_id.empty()) {
        std::cerr << std::format("[{}] track configured: {} ({} segments)\n",
            session_id, track_id, segment_count);
    }
}

std::shared_ptr<const TrackSegmentMap> SegmentSpeedDetector::get_track_map() const {
    std::lock_guard<std::mutex> lock(mutex);
    return track_map;
}

std::optional<SegmentSpeedResult> SegmentSpeedDetector::process(const PositionSample& sample) {
    std::optional<SegmentSpeedResult> result;
    std::optional<SegmentPaceUpdate> update;
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (!track_map) {
            return std::nullopt;
        }

        auto it = vehicles.find(sample.vehicle_id);
        if (it == vehicles.end()) {
            // a delta needs two samples
            vehicles.emplace(sample.vehicle_id, VehicleSegmentState {
                .vehicle_id = sample.vehicle_id,
                .driver_id = sample.driver_id,
                .last_lap_dist_pct = sample.lap_dist_pct,
                .last_lap = sample.lap,
                .last_timestamp = sample.timestamp,
            });
            return std::nullopt;
        }
        VehicleSegmentState& state = it->second;

        if (!sample.driver_id.empty()) {
            state.driver_id = sample.driver_id;
        }
        state.in_pit_lane = sample.in_pit_lane;
        state.on_racing_surface = sample.on_racing_surface;
        state.has_traffic_overlap = sample.has_traffic_overlap;

        const std::optional<size_t> segment = track_map->find_segment(sample.lap_dist_pct);
        if (segment && segment != state.current_segment) {
            if (state.current_segment) {
                const TrackSegment& previous = track_map->segments[*state.current_segment];
                result = complete_segment(state, previous, sample.timestamp);

                state.history.push_back(*result);
                while (state.history.size() > config.history_capacity) {
                    state.history.pop_front();
                }

                if (result->quality == SegmentQuality::Clean ||
                    result->quality == SegmentQuality::TrafficAffected) {
                    update = SegmentPaceUpdate {
                        .session_id = session_id,
                        .timestamp = result->exit_timestamp,
                        .vehicle_id = result->vehicle_id,
                        .driver_id = result->driver_id,
                        .segment_id = result->segment_id,
                        .avg_speed = result->avg_speed_ms,
                        .segment_time_ms = result->segment_time_ms,
                        .quality_flag = result->quality,
                        .confidence_score = result->avg_speed_ms.confidence,
                        .source = ValueSource::Derived
                    };
                }
            }

            state.current_segment = segment;
            state.segment_entry_time = sample.timestamp;
            state.segment_entry_pct = sample.lap_dist_pct;
            state.segment_entry_lap = sample.lap;
        }

        state.last_lap_dist_pct = sample.lap_dist_pct;
        state.last_lap = sample.lap;
        state.last_timestamp = sample.timestamp;
    }

    if (update && pace_updates) {
        pace_updates->publish(*update);
    }
    return result;
}

SegmentSpeedResult SegmentSpeedDetector::complete_segment(const VehicleSegmentState& state,
                                                          const TrackSegment& segment,
                                                          uint64_t exit_time) const
{
    const int64_t segment_time_ms = static_cast<int64_t>(exit_time) - static_cast<int64_t>(state.segment_entry_time);

    QualityVerdict verdict = classify_quality(state, segment_time_ms, config);
    const ConfidenceValue speed = segment_speed(segment.length_meters, segment_time_ms, verdict.quality, exit_time);

    ConfidenceValue speed_kph = speed;
    if (speed.value) {
        speed_kph.value = *speed.value * MS_TO_KPH;
    }

    // an implausible speed downgrades the whole result
    if (speed.source == ValueSource::Invalid) {
        verdict.quality = SegmentQuality::Invalid;
        verdict.reasons.push_back(std::format("Derived speed outside 0-{} m/s", config.max_speed_ms));
    }

    return SegmentSpeedResult {
        .vehicle_id = state.vehicle_id,
        .driver_id = state.driver_id,
        .segment_id = segment.segment_id,
        .segment_type = segment.segment_type,
        .segment_time_ms = segment_time_ms,
        .entry_timestamp = state.segment_entry_time,
        .exit_timestamp = exit_time,
        .avg_speed_ms = speed,
        .avg_speed_kph = speed_kph,
        .quality = verdict.quality,
        .quality_reasons = std::move(verdict.reasons),
        .lap_number = state.last_lap
    };
}

ConfidenceValue SegmentSpeedDetector::segment_speed(double length_meters, int64_t time_ms,
                                                    SegmentQuality quality, uint64_t timestamp) const
{
    if (quality == SegmentQuality::Invalid || quality == SegmentQuality::Pit) {
        return ConfidenceValue::unknown(quality, timestamp);
    }

    const double speed_ms = length_meters / (static_cast<double>(time_ms) / 1000.0);
    if (!std::isfinite(speed_ms) || speed_ms < 0.0 || speed_ms > config.max_speed_ms) {
        return ConfidenceValue::unknown(SegmentQuality::Invalid, timestamp, ValueSource::Invalid);
    }

    return ConfidenceValue::known(speed_ms, tier_confidence(quality), ValueSource::Derived, quality, timestamp);
}

ConfidenceValue average_speed(const std::vector<const SegmentSpeedResult*>& samples, uint64_t timestamp) {
    double weighted_sum = 0.0;
    double weight = 0.0;
    size_t valid = 0;

    for (const SegmentSpeedResult* s : samples) {
        if (!s->avg_speed_ms.value || s->avg_speed_ms.confidence <= 0.0) {
            continue;
        }
        weighted_sum += *s->avg_speed_ms.value * s->avg_speed_ms.confidence;
        weight += s->avg_speed_ms.confidence;
        valid++;
    }

    if (valid == 0) {
        return ConfidenceValue::unknown(SegmentQuality::Unknown, timestamp);
    }

    const double confidence = std::min(1.0, valid / TREND_CONFIDENCE_SAMPLES);
    return ConfidenceValue::known(weighted_sum / weight, confidence,
        ValueSource::Derived, SegmentQuality::Clean, timestamp);
}

// Least-squares fit of segment time (ms) over lap number. R^2 is the
// confidence of the slope.
ConfidenceValue pace_slope(const std::vector<const SegmentSpeedResult*>& samples, uint64_t timestamp) {
    std::vector<double> laps;
    std::vector<double> times;
    laps.reserve(samples.size());
    times.reserve(samples.size());

    for (const SegmentSpeedResult* s : samples) {
        if (s->avg_speed_ms.value) {
            laps.push_back(s->lap_number);
            times.push_back(static_cast<double>(s->segment_time_ms));
        }
    }

    if (laps.size() < MIN_REGRESSION_POINTS) {
        return ConfidenceValue::unknown(SegmentQuality::Unknown, timestamp);
    }

    const auto [min_lap, max_lap] = std::minmax_element(laps.begin(), laps.end());
    if (*min_lap == *max_lap) {
        // all points on one lap; slope over laps is undefined
        return ConfidenceValue::unknown(SegmentQuality::Unknown, timestamp);
    }

    double mean_lap = 0.0;
    double mean_time = 0.0;
    for (size_t i = 0; i < laps.size(); i++) {
        mean_lap += laps[i];
        mean_time += times[i];
    }
    mean_lap /= laps.size();
    mean_time /= times.size();

    // polyf_fit solves in float: fit the centred points so late laps and
    // long segments keep their precision
    std::vector<float> x(laps.size());
    std::vector<float> y(laps.size());
    for (size_t i = 0; i < laps.size(); i++) {
        x[i] = static_cast<float>(laps[i] - mean_lap);
        y[i] = static_cast<float>(times[i] - mean_time);
    }

    float coefficients[2] = {0.0f, 0.0f};
    polyf_fit(x.data(), y.data(), static_cast<unsigned int>(x.size()), coefficients, 2);
    const double offset = coefficients[0];
    const double slope = coefficients[1];

    double ss_total = 0.0;
    double ss_residual = 0.0;
    for (size_t i = 0; i < laps.size(); i++) {
        const double centred = times[i] - mean_time;
        const double predicted = offset + slope * (laps[i] - mean_lap);
        ss_total += centred * centred;
        ss_residual += (centred - predicted) * (centred - predicted);
    }
    const double r2 = (ss_total > 0.0) ? 1.0 - ss_residual / ss_total : 1.0;

    return ConfidenceValue::known(slope, std::max(0.0, r2),
        ValueSource::Inferred, SegmentQuality::Clean, timestamp);
}

DegradationType infer_degradation(const ConfidenceValue& slope, double fuel_burn_slope_ms) {
    if (!slope.value) {
        return DegradationType::Unknown;
    }
    if (*slope.value > 0.0) {
        return DegradationType::Tire;
    }
    if (*slope.value < fuel_burn_slope_ms) {
        return DegradationType::FuelBurn;
    }
    return DegradationType::Unknown;
}

std::optional<PaceTrend> SegmentSpeedDetector::analyze_pace_trend(uint32_t vehicle_id) {
    std::optional<PaceTrend> trend;
    {
        std::lock_guard<std::mutex> lock(mutex);

        const auto it = vehicles.find(vehicle_id);
        if (it == vehicles.end()) {
            return std::nullopt;
        }
        const VehicleSegmentState& state = it->second;

        std::vector<const SegmentSpeedResult*> clean;
        std::vector<const SegmentSpeedResult*> straights;
        std::vector<const SegmentSpeedResult*> corners;
        for (const auto& result : state.history) {
            if (result.quality != SegmentQuality::Clean) {
                continue;
            }
            clean.push_back(&result);
            if (result.segment_type == SegmentType::Straight) {
                straights.push_back(&result);
            } else if (result.segment_type == SegmentType::Corner) {
                corners.push_back(&result);
            }
        }

        // not enough data is "no trend yet", not an error
        if (clean.size() < config.min_samples_for_trend) {
            return std::nullopt;
        }

        const uint64_t now = state.last_timestamp;
        const ConfidenceValue slope = pace_slope(clean, now);
        const size_t total = state.history.size();

        trend = PaceTrend {
            .session_id = session_id,
            .timestamp = now,
            .vehicle_id = state.vehicle_id,
            .driver_id = state.driver_id,
            .straight_pace = average_speed(straights, now),
            .corner_pace = average_speed(corners, now),
            .overall_pace = average_speed(clean, now),
            .pace_slope = slope,
            .degradation_type = infer_degradation(slope, config.fuel_burn_slope_ms),
            .clean_sample_count = clean.size(),
            .total_sample_count = total,
            .data_quality_summary = (clean.size() > total * CLEAN_SUMMARY_RATIO)
                ? SegmentQuality::Clean : SegmentQuality::TrafficAffected
        };
    }

    if (pace_trends) {
        pace_trends->publish(*trend);
    }
    return trend;
}

std::optional<VehicleSegmentState> SegmentSpeedDetector::vehicle_state(uint32_t vehicle_id) const {
    std::lock_guard<std::mutex> lock(mutex);
    const auto it = vehicles.find(vehicle_id);
    if (it == vehicles.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<uint32_t> SegmentSpeedDetector::vehicle_ids() const {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<uint32_t> ids;
    ids.reserve(vehicles.size());
    for (const auto& [vehicle_id, state] : vehicles) {
        ids.push_back(vehicle_id);
    }
    return ids;
}

std::vector<SegmentSpeedResult> SegmentSpeedDetector::history(uint32_t vehicle_id) const {
    std::lock_guard<std::mutex> lock(mutex);
    const auto it = vehicles.find(vehicle_id);
    if (it == vehicles.end()) {
        return {};
    }
    return { it->second.history.begin(), it->second.history.end() };
}

void SegmentSpeedDetector::clear() {
    std::lock_guard<std::mutex> lock(mutex);
    vehicles.clear();
}
