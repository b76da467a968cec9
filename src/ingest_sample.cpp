#include "ingest_sample.hpp"

#include <charconv>
#include <cmath>
#include <format>

#include "track_map.hpp"


uint32_t vehicle_id_for(const TimingEntry& entry) {
    uint32_t number = 0;
    const char* first = entry.car_number.data();
    const char* last = first + entry.car_number.size();
    const auto [ptr, ec] = std::from_chars(first, last, number);
    if (ec == std::errc() && ptr == last && !entry.car_number.empty()) {
        return number;
    }

    // FNV-1a
    uint32_t hash = 2166136261u;
    for (unsigned char c : entry.driver_id) {
        hash ^= c;
        hash *= 16777619u;
    }
    return hash;
}

std::vector<IngestSample> timing_to_samples(const SessionTiming& timing, double traffic_window_pct) {
    std::vector<IngestSample> samples;
    samples.reserve(timing.entries.size());

    for (size_t i = 0; i < timing.entries.size(); i++) {
        const TimingEntry& entry = timing.entries[i];

        bool traffic = false;
        for (size_t j = 0; j < timing.entries.size() && !traffic; j++) {
            if (j == i || timing.entries[j].in_pit || timing.entries[j].retired) {
                continue;
            }
            const double gap = wrap_safe_delta(entry.lap_dist_pct, timing.entries[j].lap_dist_pct);
            traffic = std::fabs(gap) < traffic_window_pct;
        }

        const uint32_t vehicle_id = vehicle_id_for(entry);
        samples.push_back(IngestSample {
            .session_id = timing.session_id,
            .sub_stream = SUB_STREAM_COARSE_STATE,
            .vehicle_id = vehicle_id,
            .driver_id = entry.driver_id,
            .frame_id = std::format("T:{}:{}", timing.timestamp, vehicle_id),
            .timestamp = timing.timestamp,
            .cyclic_position = entry.lap_dist_pct,
            .lap = entry.lap_number,
            .in_pit_lane = entry.in_pit,
            .on_racing_surface = !entry.retired,
            .has_traffic_overlap = traffic
        });
    }
    return samples;
}

IngestSample frame_to_sample(const ThinFrame& frame) {
    return IngestSample {
        .session_id = frame.session_id,
        .sub_stream = SUB_STREAM_HIGH_FIDELITY,
        .vehicle_id = std::nullopt,
        .driver_id = frame.driver_id,
        .frame_id = std::format("F:{}:{}", frame.timestamp, frame.driver_id),
        .timestamp = frame.timestamp,
        .cyclic_position = frame.lap_progress,
        .lap = frame.lap,
    };
}
