#pragma once

#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

struct ParityConfig {
    uint64_t out_of_order_tolerance_ms = 1000;
    size_t id_window_capacity = 1000;
    size_t max_error_length = 200;
};

// Acks and frames are counted independently; acked > frames_in or
// acked < frames_in are both meaningful (ack loss, ack storms).
struct SubStreamStats {
    uint64_t frames_in = 0;
    uint64_t acked = 0;
    uint64_t last_frame_ts = 0;
};

struct ParitySnapshot {
    std::string session_id;
    std::map<std::string, SubStreamStats> streams;
    uint64_t duplicates = 0;
    uint64_t out_of_order = 0;
    std::string last_error;
};

struct FrameVerdict {
    bool is_duplicate = false;
    bool is_out_of_order = false;
    bool should_ack = false;
};

// Recently seen frame ids, FIFO eviction. Duplicates older than the
// window are not detected.
class FrameIdWindow {
    std::deque<std::string> order;
    std::unordered_set<std::string> ids;
    size_t capacity;

public:
    explicit FrameIdWindow(size_t capacity);

    bool contains(const std::string& frame_id) const;
    void insert(const std::string& frame_id);
    size_t size() const { return order.size(); }
};

class FrameParityTracker {
    struct SessionParity {
        std::mutex mutex;
        std::map<std::string, SubStreamStats> streams;
        FrameIdWindow window;
        uint64_t duplicates = 0;
        uint64_t out_of_order = 0;
        std::string last_error;

        explicit SessionParity(size_t window_capacity) : window(window_capacity) {}
    };

    const ParityConfig config;
    std::map<std::string, std::shared_ptr<SessionParity>> sessions;
    mutable std::mutex mutex;

    std::shared_ptr<SessionParity> session(const std::string& session_id);
    static ParitySnapshot copy_of(const std::string& session_id, SessionParity& parity);

public:
    explicit FrameParityTracker(ParityConfig config = {});

    ParitySnapshot get_or_create(const std::string& session_id);

    FrameVerdict record_frame_in(const std::string& session_id,
                                 const std::string& sub_stream,
                                 std::optional<uint64_t> timestamp,
                                 const std::optional<std::string>& frame_id);
    void record_ack_sent(const std::string& session_id, const std::string& sub_stream);
    void record_error(const std::string& session_id, const std::string& message);

    std::optional<ParitySnapshot> snapshot(const std::string& session_id) const;
    std::vector<std::string> list_session_ids() const;
    void cleanup(const std::string& session_id);

    const ParityConfig& get_config() const { return config; }
};
