#include "track_map.hpp"

#include <format>
#include <set>

#include <yaml-cpp/yaml.h>

#define DEFAULT_SEGMENT_COUNT 10
#define TRACK_MAP_VERSION "1.0.0"


std::optional<SegmentType> parse_segment_type(std::string_view name) {
    for (size_t i = 0; i < std::size(SEGMENT_TYPE_NAMES); i++) {
        if (SEGMENT_TYPE_NAMES[i] == name) {
            return static_cast<SegmentType>(i);
        }
    }
    return std::nullopt;
}

double wrap_safe_delta(double p1, double p2) {
    double dp = p2 - p1;
    if (dp < -0.5) {
        dp += 1.0; // crossed the line going forward
    }
    if (dp > 0.5) {
        dp -= 1.0; // crossed the line going backward (reset, tow...)
    }
    return dp;
}

double delta_to_meters(double delta_pct, double track_length_meters) {
    return delta_pct * track_length_meters;
}

bool is_in_segment(double lap_dist_pct, const TrackSegment& segment) {
    if (segment.start_pct <= segment.end_pct) {
        return lap_dist_pct >= segment.start_pct && lap_dist_pct < segment.end_pct;
    }
    return lap_dist_pct >= segment.start_pct || lap_dist_pct < segment.end_pct;
}

std::optional<size_t> TrackSegmentMap::find_segment(double lap_dist_pct) const {
    for (size_t i = 0; i < segments.size(); i++) {
        if (is_in_segment(lap_dist_pct, segments[i])) {
            return i;
        }
    }
    return std::nullopt;
}

TrackSegmentMap generate_default_segment_map(const std::string& track_id,
                                             const std::string& track_name,
                                             double track_length_meters,
                                             uint64_t created_at)
{
    const double segment_pct = 1.0 / DEFAULT_SEGMENT_COUNT;
    const double segment_length = track_length_meters / DEFAULT_SEGMENT_COUNT;

    TrackSegmentMap map = {
        .track_id = track_id,
        .track_name = track_name,
        .layout_name = "default",
        .track_length_meters = track_length_meters,
        .segments = {},
        .created_at = created_at,
        .version = TRACK_MAP_VERSION
    };

    map.segments.reserve(DEFAULT_SEGMENT_COUNT);
    for (int i = 0; i < DEFAULT_SEGMENT_COUNT; i++) {
        map.segments.push_back(TrackSegment {
            .segment_id = std::format("seg_{}", i),
            .label = std::format("Segment {}", i + 1),
            .start_pct = i * segment_pct,
            .end_pct = (i + 1) * segment_pct,
            .length_meters = segment_length,
            .segment_type = (i % 3 == 0) ? SegmentType::Straight : SegmentType::Corner,
            .is_speed_trap = (i == 0)
        });
    }
    return map;
}

bool validate_track_map(const TrackSegmentMap& map, std::string& error) {
    if (map.track_id.empty()) {
        error = "track_id is empty";
        return false;
    }
    if (!(map.track_length_meters > 0.0)) {
        error = std::format("track {}: track_length_meters must be positive", map.track_id);
        return false;
    }
    if (map.segments.empty()) {
        error = std::format("track {}: no segments defined", map.track_id);
        return false;
    }

    std::set<std::string> ids;
    for (const auto& segment : map.segments) {
        if (segment.segment_id.empty()) {
            error = std::format("track {}: segment without segment_id", map.track_id);
            return false;
        }
        if (!ids.insert(segment.segment_id).second) {
            error = std::format("track {}: duplicate segment_id {}", map.track_id, segment.segment_id);
            return false;
        }
        // end_pct may be exactly 1.0 for the last segment before the line
        if (segment.start_pct < 0.0 || segment.start_pct >= 1.0 ||
            segment.end_pct < 0.0 || segment.end_pct > 1.0) {
            error = std::format("segment {}: bounds [{}, {}) outside [0, 1)",
                segment.segment_id, segment.start_pct, segment.end_pct);
            return false;
        }
        if (segment.start_pct == segment.end_pct) {
            error = std::format("segment {}: empty interval", segment.segment_id);
            return false;
        }
        if (!(segment.length_meters > 0.0)) {
            error = std::format("segment {}: length_meters must be positive", segment.segment_id);
            return false;
        }
    }
    return true;
}

bool load_track_map(const std::string& path, TrackSegmentMap& map, std::string& error) {
    TrackSegmentMap loaded;
    try {
        const YAML::Node root = YAML::LoadFile(path);

        loaded.track_id = root["track_id"].as<std::string>("");
        loaded.track_name = root["track_name"].as<std::string>(loaded.track_id);
        loaded.layout_name = root["layout_name"].as<std::string>("default");
        loaded.track_length_meters = root["track_length_meters"].as<double>(0.0);
        loaded.created_at = root["created_at"].as<uint64_t>(0);
        loaded.version = root["version"].as<std::string>(TRACK_MAP_VERSION);

        const YAML::Node segments = root["segments"];
        if (!segments || !segments.IsSequence()) {
            error = std::format("{}: 'segments' must be a list", path);
            return false;
        }

        for (const auto& node : segments) {
            const std::string type_name = node["segment_type"].as<std::string>("corner");
            const std::optional<SegmentType> type = parse_segment_type(type_name);
            if (!type) {
                error = std::format("{}: unknown segment_type '{}'", path, type_name);
                return false;
            }

            TrackSegment segment = {
                .segment_id = node["segment_id"].as<std::string>(""),
                .label = node["label"].as<std::string>(""),
                .start_pct = node["start_pct"].as<double>(),
                .end_pct = node["end_pct"].as<double>(),
                .length_meters = node["length_meters"].as<double>(0.0),
                .segment_type = type.value(),
                .is_speed_trap = node["is_speed_trap"].as<bool>(false)
            };
            if (segment.label.empty()) {
                segment.label = segment.segment_id;
            }
            loaded.segments.push_back(std::move(segment));
        }
    } catch (const YAML::Exception& e) {
        error = std::format("{}: {}", path, e.what());
        return false;
    }

    if (!validate_track_map(loaded, error)) {
        return false;
    }
    map = std::move(loaded);
    return true;
}
