#include "source_replay.hpp"

#include <algorithm>
#include <chrono>
#include <format>
#include <iostream>
#include <vector>


ReplaySource::ReplaySource(std::shared_ptr<HistoricalStore> _store, ReplayOptions _options, bool _start_clock)
    : store(std::move(_store))
    , options(_options)
    , start_clock(_start_clock)
    , clock(std::chrono::milliseconds(_options.tick_interval_ms))
{
}

ReplaySource::~ReplaySource() {
    disconnect();
}

bool ReplaySource::connect(const std::string& _session_id) {
    disconnect();

    std::string error;
    if (_session_id.empty()) {
        error = "empty session id";
    } else if (options.end_ms <= options.start_ms) {
        error = std::format("replay window is empty ({} - {})", options.start_ms, options.end_ms);
    } else if (!is_allowed_playback_rate(options.playback_rate)) {
        error = std::format("playback rate {} not allowed", options.playback_rate);
    }
    if (!error.empty()) {
        std::lock_guard<std::mutex> lock(mutex);
        last_error = error;
        return false;
    }

    const uint64_t prefetch_to = options.start_ms + std::min(options.prefetch_window_ms, options.end_ms - options.start_ms);

    HistoricalWindow window;
    if (!store->fetch(_session_id, options.start_ms, prefetch_to, window)) {
        std::lock_guard<std::mutex> lock(mutex);
        last_error = std::format("prefetch of {} [{}, {}) failed: {}",
            _session_id, options.start_ms, prefetch_to, store->get_last_error());
        std::cerr << "Error: " << last_error << "\n";
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex);
        session_id = _session_id;
        timing_cache.clear();
        frame_cache.clear();
        load(window);
        cache_from = options.start_ms;
        cache_to = prefetch_to;
        current_ms = options.start_ms;
        last_bucket.reset();
        generation++;
        ticks = 0;
        retry_at_tick = 0;
        playing = true;

        std::cerr << std::format("Replay {}: [{}, {}) x{}, {} snapshots and {} frames prefetched\n",
            session_id, options.start_ms, options.end_ms, options.playback_rate,
            timing_cache.size(), frame_cache.size());
    }

    connection++;
    active = true;
    if (start_clock && !clock.start([this]() { return step(); })) {
        active = false;
        std::lock_guard<std::mutex> lock(mutex);
        playing = false;
        last_error = "playback clock is still running";
        return false;
    }
    return true;
}

void ReplaySource::disconnect() {
    active = false;
    clock.stop();

    std::future<FetchResult> abandoned;
    {
        std::lock_guard<std::mutex> lock(mutex);
        playing = false;
        timing_cache.clear();
        frame_cache.clear();
        last_bucket.reset();
        generation++;
        abandoned = std::move(pending_fetch);
        session_id.clear();
    }
    // an in-flight fetch is bounded; it is awaited here, outside the lock
}

bool ReplaySource::is_connected() const {
    std::lock_guard<std::mutex> lock(mutex);
    return active && playing;
}

std::string ReplaySource::get_last_error() const {
    std::lock_guard<std::mutex> lock(mutex);
    return last_error;
}

bool ReplaySource::step() {
    std::optional<SessionTiming> timing;
    std::vector<ThinFrame> frames;
    const uint64_t current = connection;
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (!active || !playing) {
            return false;
        }
        if (current_ms >= options.end_ms) {
            playing = false;
            std::cerr << std::format("Replay {} reached {}\n", session_id, options.end_ms);
            return false;
        }

        ticks++;
        collect_fetch();

        const uint64_t t = current_ms;
        const uint64_t step_ms = options.tick_interval_ms * options.playback_rate;

        const uint64_t bucket = bucket_of(t);
        if (last_bucket != bucket) {
            last_bucket = bucket;
            const auto it = timing_cache.find(bucket);
            if (it != timing_cache.end()) {
                timing = it->second;
            }
        }

        for (auto it = frame_cache.lower_bound(t); it != frame_cache.end() && it->first < t + step_ms; ++it) {
            frames.push_back(it->second);
        }

        current_ms = t + step_ms;
        evict_behind();
        schedule_fetch();
    }

    // a listener may have reconnected meanwhile
    if (timing && active && connection == current) {
        timing_channel.publish(*timing);
    }
    for (const auto& frame : frames) {
        if (!active || connection != current) {
            break;
        }
        frame_channel.publish(frame);
    }
    return true;
}

void ReplaySource::seek(uint64_t time_ms) {
    std::lock_guard<std::mutex> lock(mutex);

    const uint64_t target = std::clamp(time_ms, options.start_ms, options.end_ms);
    current_ms = target;
    last_bucket.reset();

    if (target < cache_from || target >= cache_to) {
        // nothing cached around the target: start over from there
        timing_cache.clear();
        frame_cache.clear();
        cache_from = cache_to = bucket_of(target);
        generation++;
        retry_at_tick = 0;
        if (active) {
            schedule_fetch();
        }
    }

    if (active && !playing && target < options.end_ms) {
        playing = true;
        if (start_clock) {
            // the clock thread ended with the last tick; reap it first
            clock.stop();
            if (!clock.start([this]() { return step(); })) {
                playing = false;
                last_error = "playback clock is still running";
                std::cerr << "Error: " << last_error << "\n";
            }
        }
    }
}

bool ReplaySource::set_playback_rate(uint32_t rate) {
    std::lock_guard<std::mutex> lock(mutex);
    if (!is_allowed_playback_rate(rate)) {
        last_error = std::format("playback rate {} not allowed", rate);
        return false;
    }
    options.playback_rate = rate;
    return true;
}

uint64_t ReplaySource::get_current_time() const {
    std::lock_guard<std::mutex> lock(mutex);
    return current_ms;
}

uint32_t ReplaySource::get_playback_rate() const {
    std::lock_guard<std::mutex> lock(mutex);
    return options.playback_rate;
}

size_t ReplaySource::cached_snapshot_count() const {
    std::lock_guard<std::mutex> lock(mutex);
    return timing_cache.size();
}

bool ReplaySource::fetch_pending() const {
    std::lock_guard<std::mutex> lock(mutex);
    return pending_fetch.valid();
}

void ReplaySource::load(HistoricalWindow& window) {
    // the earliest snapshot of a bucket represents it
    for (auto& snapshot : window.snapshots) {
        const uint64_t bucket = bucket_of(snapshot.timestamp);
        const auto it = timing_cache.find(bucket);
        if (it == timing_cache.end()) {
            timing_cache.emplace(bucket, std::move(snapshot));
        } else if (snapshot.timestamp < it->second.timestamp) {
            it->second = std::move(snapshot);
        }
    }
    for (auto& frame : window.frames) {
        const uint64_t timestamp = frame.timestamp;
        frame_cache.emplace(timestamp, std::move(frame));
    }
}

void ReplaySource::collect_fetch() {
    if (!pending_fetch.valid()
        || pending_fetch.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
        return;
    }

    FetchResult result = pending_fetch.get();
    if (result.generation != generation || result.from_ms != cache_to) {
        return; // superseded by a seek
    }
    if (!result.ok) {
        last_error = std::format("fetch of {} [{}, {}) failed: {}",
            session_id, result.from_ms, result.to_ms, result.error);
        std::cerr << "Warning: " << last_error << "\n";
        retry_at_tick = ticks + REPLAY_RETRY_AFTER_TICKS;
        return;
    }

    load(result.window);
    cache_to = result.to_ms;
}

void ReplaySource::schedule_fetch() {
    if (pending_fetch.valid() || cache_to >= options.end_ms || ticks < retry_at_tick) {
        return;
    }
    // keep at least half a window buffered ahead
    if (current_ms + options.prefetch_window_ms / 2 < cache_to) {
        return;
    }

    const uint64_t from = cache_to;
    const uint64_t to = std::min(options.end_ms, from + options.prefetch_window_ms);

    pending_fetch = std::async(std::launch::async,
        [fetch_store = store, session = session_id, from, to, gen = generation]() {
            FetchResult result { .generation = gen, .from_ms = from, .to_ms = to };
            result.ok = fetch_store->fetch(session, from, to, result.window);
            if (!result.ok) {
                result.error = fetch_store->get_last_error();
            }
            return result;
        });
}

void ReplaySource::evict_behind() {
    if (current_ms < cache_from + options.prefetch_window_ms) {
        return;
    }
    const uint64_t keep_from = std::max(cache_from, bucket_of(current_ms - options.prefetch_window_ms));

    timing_cache.erase(timing_cache.begin(), timing_cache.lower_bound(keep_from));
    frame_cache.erase(frame_cache.begin(), frame_cache.lower_bound(keep_from));
    cache_from = keep_from;
}
