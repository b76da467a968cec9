#pragma once

#include <atomic>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "historical_store.hpp"
#include "playback_clock.hpp"
#include "telemetry_source.hpp"

#define REPLAY_PREFETCH_WINDOW_MS 60000
#define REPLAY_SNAPSHOT_QUANTUM_MS 500
#define REPLAY_RETRY_AFTER_TICKS 10

struct ReplayOptions {
    uint64_t start_ms = 0;
    uint64_t end_ms = 0;
    uint32_t playback_rate = 1;
    uint64_t tick_interval_ms = DEFAULT_TICK_INTERVAL_MS;
    uint64_t prefetch_window_ms = REPLAY_PREFETCH_WINDOW_MS;
    uint64_t snapshot_quantum_ms = REPLAY_SNAPSHOT_QUANTUM_MS;
};

// Plays a recorded time window back on the playback clock.
//
// connect() fetches the first window synchronously; this is the only
// blocking I/O. Every tick advances virtual time by interval x rate,
// emits the snapshot of the current 500 ms bucket (once per bucket) and
// the frames in [t, t + step). Data further ahead is fetched in bounded
// chunks on a background task and merged when it is ready; a tick never
// waits for it. Playback stops by itself at the window end.
class ReplaySource : public TelemetrySource {
public:
    ReplaySource(std::shared_ptr<HistoricalStore> store, ReplayOptions options, bool start_clock = true);
    ~ReplaySource() override;

    bool connect(const std::string& session_id) override;
    void disconnect() override;

    Unsubscribe on_timing(TimingCallback callback) override { return timing_channel.subscribe(std::move(callback)); }
    Unsubscribe on_frame(FrameCallback callback) override { return frame_channel.subscribe(std::move(callback)); }

    bool is_connected() const override;

    std::string get_backend_name() const override { return "replay/" + store->get_backend_name(); }
    std::string get_last_error() const override;

    // Clamped to the window. Restarts playback that already ran out.
    void seek(uint64_t time_ms);
    // Only 1, 2, 5 and 10 are accepted.
    bool set_playback_rate(uint32_t rate);

    // One clock tick. False once the window end is reached.
    bool step();

    uint64_t get_current_time() const;
    uint32_t get_playback_rate() const;
    size_t cached_snapshot_count() const;
    bool fetch_pending() const;

private:
    struct FetchResult {
        uint64_t generation;
        uint64_t from_ms;
        uint64_t to_ms;
        bool ok = false;
        HistoricalWindow window;
        std::string error;
    };

    // all below: caller holds the mutex
    void load(HistoricalWindow& window);
    void collect_fetch();
    void schedule_fetch();
    void evict_behind();
    uint64_t bucket_of(uint64_t time_ms) const { return time_ms / options.snapshot_quantum_ms * options.snapshot_quantum_ms; }

    const std::shared_ptr<HistoricalStore> store;
    ReplayOptions options;
    const bool start_clock;

    EventChannel<SessionTiming> timing_channel;
    EventChannel<ThinFrame> frame_channel;

    std::string session_id;
    uint64_t current_ms = 0;
    bool playing = false;
    std::atomic<bool> active = false;
    std::atomic<uint64_t> connection = 0;

    std::map<uint64_t, SessionTiming> timing_cache;   // by bucket
    std::multimap<uint64_t, ThinFrame> frame_cache;   // by timestamp
    uint64_t cache_from = 0;
    uint64_t cache_to = 0;
    std::optional<uint64_t> last_bucket;

    uint64_t generation = 0;
    std::future<FetchResult> pending_fetch;
    uint64_t ticks = 0;
    uint64_t retry_at_tick = 0;

    std::string last_error;
    mutable std::mutex mutex;

    PlaybackClock clock;
};
