#pragma once

#include <atomic>
#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>

#include "timing.hpp"

struct HistoricalWindow {
    std::vector<SessionTiming> snapshots;
    std::vector<ThinFrame> frames;
};

// Source of recorded session data for replay. fetch() may be called from
// a background task while the replay clock is running.
class HistoricalStore {
public:
    virtual ~HistoricalStore() = default;

    // Records with from_ms <= timestamp < to_ms, appended to `window`.
    virtual bool fetch(const std::string& session_id, uint64_t from_ms, uint64_t to_ms,
                       HistoricalWindow& window) = 0;

    virtual std::string get_backend_name() const = 0;
    virtual std::string get_last_error() const = 0;
};

// Reads T/F records written by TelemetryRecorder.
class FileHistoricalStore : public HistoricalStore {
public:
    explicit FileHistoricalStore(std::string path);

    bool fetch(const std::string& session_id, uint64_t from_ms, uint64_t to_ms,
               HistoricalWindow& window) override;

    std::string get_backend_name() const override { return "file"; }
    std::string get_last_error() const override;

private:
    const std::string path;
    std::string last_error;
    mutable std::mutex mutex;
};

// Appends every timing snapshot and frame it sees to a recording file.
class TelemetryRecorder {
public:
    bool open(const std::string& path);
    void record(const SessionTiming& timing);
    void record(const ThinFrame& frame);
    void close();

    uint64_t get_record_count() const { return records; }
    std::string get_last_error() const { return last_error; }

private:
    std::ofstream out;
    std::atomic<uint64_t> records = 0;
    std::string last_error;
    std::mutex mutex;
};
