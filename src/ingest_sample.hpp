#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "timing.hpp"

// conventional sub-stream names
#define SUB_STREAM_COARSE_STATE  "coarse_state"
#define SUB_STREAM_CONTROL_INPUT "control_input"
#define SUB_STREAM_HIGH_FIDELITY "high_fidelity"
#define SUB_STREAM_LEGACY_EVENT  "legacy_event"

// One inbound sample as the relay delivers it. Samples without a vehicle
// id only count for parity.
struct IngestSample {
    std::string session_id;
    std::string sub_stream;
    std::optional<uint32_t> vehicle_id;
    std::string driver_id;
    std::optional<std::string> frame_id;
    uint64_t timestamp = 0;
    double cyclic_position = 0.0;
    int32_t lap = 0;
    bool in_pit_lane = false;
    bool on_racing_surface = true;
    bool has_traffic_overlap = false;
};

// Car number when numeric, otherwise a stable hash of the driver id.
uint32_t vehicle_id_for(const TimingEntry& entry);

// One coarse_state sample per timing entry. Entries closer than
// `traffic_window_pct` of a lap to another car are flagged as traffic.
std::vector<IngestSample> timing_to_samples(const SessionTiming& timing, double traffic_window_pct);

// Frames carry no vehicle id; they feed the high_fidelity parity counters.
IngestSample frame_to_sample(const ThinFrame& frame);
