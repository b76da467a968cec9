#include "parity_tracker.hpp"

#include <algorithm>


FrameIdWindow::FrameIdWindow(size_t _capacity) : capacity(std::max<size_t>(_capacity, 1)) {}

bool FrameIdWindow::contains(const std::string& frame_id) const {
    return ids.count(frame_id) > 0;
}

void FrameIdWindow::insert(const std::string& frame_id) {
    if (!ids.insert(frame_id).second) {
        return;
    }
    order.push_back(frame_id);
    while (order.size() > capacity) {
        ids.erase(order.front());
        order.pop_front();
    }
}

FrameParityTracker::FrameParityTracker(ParityConfig _config) : config(_config) {}

std::shared_ptr<FrameParityTracker::SessionParity> FrameParityTracker::session(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex);

    auto& entry = sessions[session_id];
    if (!entry) {
        entry = std::make_shared<SessionParity>(config.id_window_capacity);
    }
    return entry;
}

ParitySnapshot FrameParityTracker::copy_of(const std::string& session_id, SessionParity& parity) {
    std::lock_guard<std::mutex> lock(parity.mutex);

    return ParitySnapshot {
        .session_id = session_id,
        .streams = parity.streams,
        .duplicates = parity.duplicates,
        .out_of_order = parity.out_of_order,
        .last_error = parity.last_error
    };
}

ParitySnapshot FrameParityTracker::get_or_create(const std::string& session_id) {
    return copy_of(session_id, *session(session_id));
}

FrameVerdict FrameParityTracker::record_frame_in(const std::string& session_id,
                                                 const std::string& sub_stream,
                                                 std::optional<uint64_t> timestamp,
                                                 const std::optional<std::string>& frame_id)
{
    const auto parity = session(session_id);
    FrameVerdict verdict;

    std::lock_guard<std::mutex> lock(parity->mutex);

    SubStreamStats& stats = parity->streams[sub_stream];
    stats.frames_in++;

    if (frame_id) {
        if (parity->window.contains(*frame_id)) {
            parity->duplicates++;
            verdict.is_duplicate = true;
        } else {
            parity->window.insert(*frame_id);
            verdict.should_ack = true;
        }
    }

    if (timestamp) {
        if (stats.last_frame_ts > *timestamp + config.out_of_order_tolerance_ms) {
            parity->out_of_order++;
            verdict.is_out_of_order = true;
        } else {
            stats.last_frame_ts = *timestamp;
        }
    }

    return verdict;
}

void FrameParityTracker::record_ack_sent(const std::string& session_id, const std::string& sub_stream) {
    const auto parity = session(session_id);
    std::lock_guard<std::mutex> lock(parity->mutex);
    parity->streams[sub_stream].acked++;
}

void FrameParityTracker::record_error(const std::string& session_id, const std::string& message) {
    const auto parity = session(session_id);
    std::lock_guard<std::mutex> lock(parity->mutex);
    parity->last_error = message.substr(0, config.max_error_length);
}

std::optional<ParitySnapshot> FrameParityTracker::snapshot(const std::string& session_id) const {
    std::shared_ptr<SessionParity> parity;
    {
        std::lock_guard<std::mutex> lock(mutex);
        const auto it = sessions.find(session_id);
        if (it == sessions.end()) {
            return std::nullopt;
        }
        parity = it->second;
    }
    return copy_of(session_id, *parity);
}

std::vector<std::string> FrameParityTracker::list_session_ids() const {
    std::lock_guard<std::mutex> lock(mutex);

    std::vector<std::string> ids;
    ids.reserve(sessions.size());
    for (const auto& [session_id, parity] : sessions) {
        ids.push_back(session_id);
    }
    return ids;
}

void FrameParityTracker::cleanup(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex);
    sessions.erase(session_id);
}
