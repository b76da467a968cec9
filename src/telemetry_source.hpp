#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "event_channel.hpp"
#include "historical_store.hpp"
#include "timing.hpp"

#define DEFAULT_TICK_INTERVAL_MS 100
#define DEFAULT_LIVE_RATE_HZ 5

using TimingCallback = std::function<void(const SessionTiming&)>;
using FrameCallback = std::function<void(const ThinFrame&)>;

// One consumer-facing interface in front of live, replay and demo data.
//
// Every on_* registration returns its own unregister handle. disconnect()
// is idempotent and safe before connect() or after a failed connect();
// once it returns, no callback runs.
class TelemetrySource {
public:
    virtual ~TelemetrySource() = default;

    // False on failure; get_last_error() says why and the source stays
    // disconnected, so connect() may simply be retried.
    virtual bool connect(const std::string& session_id) = 0;
    virtual void disconnect() = 0;

    virtual Unsubscribe on_timing(TimingCallback callback) = 0;
    virtual Unsubscribe on_frame(FrameCallback callback) = 0;

    virtual bool is_connected() const = 0;

    virtual std::string get_backend_name() const = 0;
    virtual std::string get_last_error() const = 0;
};

enum class SourceMode { Live, Replay, Demo };

inline constexpr std::string_view SOURCE_MODE_NAMES[] = { "live", "replay", "demo" };

constexpr std::string_view source_mode_name(SourceMode mode) {
    return SOURCE_MODE_NAMES[static_cast<int>(mode)];
}

std::optional<SourceMode> parse_source_mode(std::string_view name);

inline constexpr uint32_t ALLOWED_PLAYBACK_RATES[] = { 1, 2, 5, 10 };

bool is_allowed_playback_rate(uint32_t rate);

struct SourceConfig {
    SourceMode mode = SourceMode::Live;

    // live
    std::string endpoint;
    uint32_t update_rate_hz = DEFAULT_LIVE_RATE_HZ;

    // replay
    std::shared_ptr<HistoricalStore> store;
    uint64_t start_ms = 0;
    uint64_t end_ms = 0;
    uint32_t playback_rate = 1;

    // demo
    std::string seed = "default";
    uint64_t epoch_ms = 0;  // timestamp of simulation time zero

    uint64_t tick_interval_ms = DEFAULT_TICK_INTERVAL_MS;
    bool start_clock = true;  // false: ticks are driven by step()
};

// Rejects invalid mode parameters here rather than at playback time.
std::unique_ptr<TelemetrySource> create_telemetry_source(const SourceConfig& config, std::string& error);
