#pragma once

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string_view>

// Quality classification for segment data.
// Only Clean data may feed the pace models.
enum class SegmentQuality {
    Clean,            // unobstructed, valid timing
    TrafficAffected,  // slower due to traffic
    Pit,              // car in pit lane
    OffTrack,         // off racing surface
    Invalid,          // teleport, stall, out of physical bounds
    Unknown           // insufficient data
};

// Provenance of a derived number. There is no direct speed signal, so
// nothing here is ever "measured".
enum class ValueSource {
    Derived,   // calculated from position samples
    Inferred,  // estimated with uncertainty (regressions)
    Unknown,   // no opinion
    Invalid    // calculated, but rejected as implausible
};

inline constexpr std::string_view SEGMENT_QUALITY_NAMES[] = {
    "CLEAN", "TRAFFIC_AFFECTED", "PIT", "OFFTRACK", "INVALID", "UNKNOWN"
};

inline constexpr std::string_view VALUE_SOURCE_NAMES[] = {
    "DERIVED", "INFERRED", "UNKNOWN", "INVALID"
};

constexpr std::string_view quality_name(SegmentQuality q) {
    return SEGMENT_QUALITY_NAMES[static_cast<int>(q)];
}

constexpr std::string_view source_name(ValueSource s) {
    return VALUE_SOURCE_NAMES[static_cast<int>(s)];
}

// A derived number together with its confidence and provenance.
// Invariant: no value => confidence is 0.
struct ConfidenceValue {
    std::optional<double> value;
    double confidence = 0.0;
    ValueSource source = ValueSource::Unknown;
    SegmentQuality quality = SegmentQuality::Unknown;
    uint64_t timestamp = 0;

    static ConfidenceValue unknown(SegmentQuality quality, uint64_t timestamp,
                                   ValueSource source = ValueSource::Unknown) {
        return ConfidenceValue{std::nullopt, 0.0, source, quality, timestamp};
    }

    static ConfidenceValue known(double value, double confidence, ValueSource source,
                                 SegmentQuality quality, uint64_t timestamp) {
        return ConfidenceValue{value, std::clamp(confidence, 0.0, 1.0), source, quality, timestamp};
    }

    bool has_value() const { return value.has_value(); }
};
