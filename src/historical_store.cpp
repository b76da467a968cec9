#include "historical_store.hpp"

#include <format>
#include <iostream>
#include <utility>

#include "wire.hpp"


FileHistoricalStore::FileHistoricalStore(std::string _path) : path(std::move(_path)) {}

bool FileHistoricalStore::fetch(const std::string& session_id, uint64_t from_ms, uint64_t to_ms,
                                HistoricalWindow& window)
{
    std::ifstream in(path);
    if (!in) {
        std::lock_guard<std::mutex> lock(mutex);
        last_error = std::format("cannot open recording {}", path);
        return false;
    }

    uint64_t malformed = 0;
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty()) {
            continue;
        }

        switch (record_kind(line).value_or(' ')) {
            case WIRE_TIMING:
            if (auto timing = decode_timing(line)) {
                if (timing->session_id == session_id && timing->timestamp >= from_ms && timing->timestamp < to_ms) {
                    window.snapshots.push_back(std::move(*timing));
                }
            } else {
                malformed++;
            }
            break;
            case WIRE_FRAME:
            if (auto frame = decode_frame(line)) {
                if (frame->session_id == session_id && frame->timestamp >= from_ms && frame->timestamp < to_ms) {
                    window.frames.push_back(std::move(*frame));
                }
            } else {
                malformed++;
            }
            break;
            default:
            malformed++;
            break;
        }
    }

    if (in.bad()) {
        std::lock_guard<std::mutex> lock(mutex);
        last_error = std::format("read error in {}", path);
        return false;
    }
    if (malformed > 0) {
        std::cerr << std::format("Warning: skipped {} malformed records in {}\n", malformed, path);
    }
    return true;
}

std::string FileHistoricalStore::get_last_error() const {
    std::lock_guard<std::mutex> lock(mutex);
    return last_error;
}

bool TelemetryRecorder::open(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex);
    out.open(path, std::ios::out | std::ios::app);
    if (!out) {
        last_error = std::format("cannot open {} for writing", path);
        return false;
    }
    return true;
}

void TelemetryRecorder::record(const SessionTiming& timing) {
    std::lock_guard<std::mutex> lock(mutex);
    if (out.is_open()) {
        out << encode_timing(timing) << '\n';
        records++;
    }
}

void TelemetryRecorder::record(const ThinFrame& frame) {
    std::lock_guard<std::mutex> lock(mutex);
    if (out.is_open()) {
        out << encode_frame(frame) << '\n';
        records++;
    }
}

void TelemetryRecorder::close() {
    std::lock_guard<std::mutex> lock(mutex);
    if (out.is_open()) {
        out.flush();
        out.close();
    }
}
