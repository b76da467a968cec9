#include "telemetry_source.hpp"

#include <algorithm>
#include <format>
#include <iterator>

#include "source_demo.hpp"
#include "source_live.hpp"
#include "source_replay.hpp"


std::optional<SourceMode> parse_source_mode(std::string_view name) {
    for (size_t i = 0; i < std::size(SOURCE_MODE_NAMES); i++) {
        if (SOURCE_MODE_NAMES[i] == name) {
            return static_cast<SourceMode>(i);
        }
    }
    return std::nullopt;
}

bool is_allowed_playback_rate(uint32_t rate) {
    return std::find(std::begin(ALLOWED_PLAYBACK_RATES), std::end(ALLOWED_PLAYBACK_RATES), rate)
        != std::end(ALLOWED_PLAYBACK_RATES);
}

std::unique_ptr<TelemetrySource> create_telemetry_source(const SourceConfig& config, std::string& error) {
    if (config.tick_interval_ms == 0) {
        error = "tick interval must be positive";
        return nullptr;
    }

    switch (config.mode) {
        case SourceMode::Live:
            if (config.endpoint.empty()) {
                error = "live mode needs an endpoint";
                return nullptr;
            }
            return std::make_unique<LiveSource>(
                std::make_unique<ZmqLiveTransport>(config.endpoint), config.update_rate_hz);

        case SourceMode::Replay: {
            if (!config.store) {
                error = "replay mode needs a historical store";
                return nullptr;
            }
            if (config.end_ms <= config.start_ms) {
                error = std::format("replay window is empty ({} - {})", config.start_ms, config.end_ms);
                return nullptr;
            }
            if (!is_allowed_playback_rate(config.playback_rate)) {
                error = std::format("playback rate {} not in {{1, 2, 5, 10}}", config.playback_rate);
                return nullptr;
            }
            const ReplayOptions options = {
                .start_ms = config.start_ms,
                .end_ms = config.end_ms,
                .playback_rate = config.playback_rate,
                .tick_interval_ms = config.tick_interval_ms,
            };
            return std::make_unique<ReplaySource>(config.store, options, config.start_clock);
        }

        case SourceMode::Demo:
            return std::make_unique<DemoSource>(config.seed.empty() ? "default" : config.seed,
                config.tick_interval_ms, config.start_clock, config.epoch_ms);
    }

    error = "unknown source mode";
    return nullptr;
}
