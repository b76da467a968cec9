#include "playback_clock.hpp"

#include <utility>


PlaybackClock::PlaybackClock(std::chrono::milliseconds _interval) : interval(_interval) {}

PlaybackClock::~PlaybackClock() {
    stop();
    join();
}

bool PlaybackClock::start(Tick _tick) {
    if (thread.joinable() && thread.get_id() == std::this_thread::get_id()) {
        std::lock_guard<std::mutex> lock(mutex);
        stop_requested = false;
        next_tick = std::move(_tick);
        return true;
    }
    if (running) {
        return false;
    }
    join(); // a clock that ended by itself

    {
        std::lock_guard<std::mutex> lock(mutex);
        stop_requested = false;
    }
    tick = std::move(_tick);
    running = true;
    thread = std::thread(&PlaybackClock::run, this);
    return true;
}

void PlaybackClock::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        stop_requested = true;
    }
    wakeup.notify_all();

    if (thread.joinable() && thread.get_id() == std::this_thread::get_id()) {
        return;
    }
    join();
}

void PlaybackClock::join() {
    if (thread.joinable() && thread.get_id() != std::this_thread::get_id()) {
        thread.join();
    }
}

void PlaybackClock::run() {
    auto deadline = std::chrono::steady_clock::now() + interval;

    while (true) {
        {
            std::unique_lock<std::mutex> lock(mutex);
            if (wakeup.wait_until(lock, deadline, [this] { return stop_requested; })) {
                break;
            }
        }
        deadline += interval;

        const bool keep_going = tick();
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (next_tick) {
                tick = std::move(next_tick);
                next_tick = nullptr;
                continue;
            }
        }
        if (!keep_going) {
            break;
        }

        // overran: drop the missed ticks instead of bursting
        const auto now = std::chrono::steady_clock::now();
        if (deadline < now) {
            deadline = now + interval;
        }

        std::lock_guard<std::mutex> lock(mutex);
        if (stop_requested) {
            break;
        }
    }

    running = false;
}
