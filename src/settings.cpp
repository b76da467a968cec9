#include "settings.hpp"

#include <format>

#include <yaml-cpp/yaml.h>


bool validate_settings(const Settings& settings, std::string& error) {
    if (settings.parity.id_window_capacity == 0) {
        error = "parity.id_window_capacity must be at least 1";
        return false;
    }
    const SegmentConfig& seg = settings.segments;
    if (seg.min_segment_time_ms < 0 || seg.min_segment_time_ms >= seg.max_segment_time_ms) {
        error = std::format("segments: need 0 <= min_segment_time_ms ({}) < max_segment_time_ms ({})",
            seg.min_segment_time_ms, seg.max_segment_time_ms);
        return false;
    }
    if (seg.history_capacity == 0) {
        error = "segments.history_capacity must be at least 1";
        return false;
    }
    if (!(seg.max_speed_ms > 0.0)) {
        error = "segments.max_speed_ms must be positive";
        return false;
    }
    if (!(seg.traffic_window_pct >= 0.0 && seg.traffic_window_pct < 0.5)) {
        error = "segments.traffic_window_pct must be in [0, 0.5)";
        return false;
    }
    if (settings.publisher.port <= 0 || settings.publisher.port > 65535) {
        error = std::format("publisher.port {} out of range", settings.publisher.port);
        return false;
    }
    if (settings.publisher.report_period_ms == 0 || settings.publisher.trend_period_ms == 0) {
        error = "publisher periods must be positive";
        return false;
    }
    return true;
}

bool load_settings(const std::string& path, Settings& settings, std::string& error) {
    Settings loaded = settings;
    try {
        const YAML::Node root = YAML::LoadFile(path);

        if (const YAML::Node parity = root["parity"]) {
            ParityConfig& p = loaded.parity;
            p.out_of_order_tolerance_ms = parity["out_of_order_tolerance_ms"].as<uint64_t>(p.out_of_order_tolerance_ms);
            p.id_window_capacity = parity["id_window_capacity"].as<size_t>(p.id_window_capacity);
            p.max_error_length = parity["max_error_length"].as<size_t>(p.max_error_length);
        }

        if (const YAML::Node segments = root["segments"]) {
            SegmentConfig& s = loaded.segments;
            s.min_segment_time_ms = segments["min_segment_time_ms"].as<int64_t>(s.min_segment_time_ms);
            s.max_segment_time_ms = segments["max_segment_time_ms"].as<int64_t>(s.max_segment_time_ms);
            s.min_samples_for_trend = segments["min_samples_for_trend"].as<size_t>(s.min_samples_for_trend);
            s.history_capacity = segments["history_capacity"].as<size_t>(s.history_capacity);
            s.max_speed_ms = segments["max_speed_ms"].as<double>(s.max_speed_ms);
            s.fuel_burn_slope_ms = segments["fuel_burn_slope_ms"].as<double>(s.fuel_burn_slope_ms);
            s.traffic_window_pct = segments["traffic_window_pct"].as<double>(s.traffic_window_pct);
        }

        if (const YAML::Node gate = root["gate"]) {
            if (const YAML::Node roles = gate["roles"]) {
                if (!roles.IsMap()) {
                    error = std::format("{}: gate.roles must be a map", path);
                    return false;
                }
                for (const auto& entry : roles) {
                    const std::string name = entry.first.as<std::string>();
                    const RoleEntitlement current = loaded.roles.count(name)
                        ? loaded.roles[name] : RoleEntitlement { .allowed = true, .max_rate_hz = 0 };
                    loaded.roles[name] = RoleEntitlement {
                        .allowed = entry.second["allowed"].as<bool>(current.allowed),
                        .max_rate_hz = entry.second["max_rate_hz"].as<uint32_t>(current.max_rate_hz)
                    };
                }
            }
        }

        if (const YAML::Node publisher = root["publisher"]) {
            PublisherSettings& p = loaded.publisher;
            p.port = publisher["port"].as<int>(p.port);
            p.report_period_ms = publisher["report_period_ms"].as<uint64_t>(p.report_period_ms);
            p.trend_period_ms = publisher["trend_period_ms"].as<uint64_t>(p.trend_period_ms);
        }
    } catch (const YAML::Exception& e) {
        error = std::format("{}: {}", path, e.what());
        return false;
    }

    if (!validate_settings(loaded, error)) {
        error = std::format("{}: {}", path, error);
        return false;
    }
    settings = std::move(loaded);
    return true;
}
