#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

// Fires a tick at a fixed wall-clock cadence on its own thread. Ticks
// are scheduled against absolute deadlines, so a slow tick does not shift
// the following ones. The tick returns false to stop the clock.
class PlaybackClock {
public:
    using Tick = std::function<bool()>;

    explicit PlaybackClock(std::chrono::milliseconds interval);
    ~PlaybackClock();

    PlaybackClock(const PlaybackClock&) = delete;
    PlaybackClock& operator=(const PlaybackClock&) = delete;

    // From inside a tick this re-arms the running clock: the new tick
    // takes over once the current one returns.
    bool start(Tick tick);

    // Joins the clock thread, unless called from a tick, in which case
    // the clock ends after the current tick returns.
    void stop();

    bool is_running() const { return running; }
    std::chrono::milliseconds get_interval() const { return interval; }

private:
    void run();
    void join();

    const std::chrono::milliseconds interval;
    Tick tick;
    Tick next_tick;
    std::thread thread;
    std::atomic<bool> running = false;
    bool stop_requested = false;
    std::mutex mutex;
    std::condition_variable wakeup;
};
