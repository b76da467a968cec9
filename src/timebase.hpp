#pragma once

#include <atomic>
#include <cstdint>
#include <chrono>

// Milliseconds since startup (monotonic) or, with use_system_clock(),
// milliseconds since the unix epoch.
class Timebase {
  const uint64_t startup_ts;
  std::atomic<bool> mode_sysclk = false;

public:
  Timebase() : startup_ts(steady_ms()) {}

  static uint64_t steady_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()
    ).count();
  }

  static uint64_t system_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
  }

  void use_system_clock() { mode_sysclk = true; }
  bool is_system_clock() const { return mode_sysclk; }

  uint64_t now() const {
    return mode_sysclk ? system_ms() : steady_ms() - startup_ts;
  }
};
