#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "event_channel.hpp"
#include "ingest_sample.hpp"
#include "parity_tracker.hpp"
#include "segment_speed.hpp"
#include "subscription_gate.hpp"
#include "track_map.hpp"

struct IngestResult {
    FrameVerdict verdict;
    std::optional<SegmentSpeedResult> segment;
};

// Owns every piece of per-session state: parity counters, one segment
// speed detector per session and the activity clock used for idle
// cleanup. Nothing else mutates session state.
class SessionRegistry {
public:
    using Clock = std::function<uint64_t()>;

private:
    struct Session {
        explicit Session(std::unique_ptr<SegmentSpeedDetector> _detector, uint64_t now)
            : detector(std::move(_detector)), last_activity(now) {}

        std::unique_ptr<SegmentSpeedDetector> detector;
        std::atomic<uint64_t> last_activity;
    };

    const SegmentConfig segment_config;
    std::shared_ptr<SubscriptionGate> gate;
    Clock now_ms;

    FrameParityTracker parity;

    // declared before the sessions: detectors publish into them
    EventChannel<SegmentPaceUpdate> pace_updates;
    EventChannel<PaceTrend> pace_trends;

    std::shared_ptr<const TrackSegmentMap> default_track_map;
    std::map<std::string, std::shared_ptr<Session>> sessions;
    mutable std::mutex mutex;

    std::shared_ptr<Session> session(const std::string& session_id);
    // caller holds the mutex; parity and detector are created together
    std::shared_ptr<Session> open_session(const std::string& session_id);
    std::shared_ptr<Session> find(const std::string& session_id) const;

    template<typename Event>
    std::optional<Unsubscribe> subscribe_events(EventChannel<Event>& channel,
                                                const SubscriptionRequest& request,
                                                std::function<void(const Event&)> callback,
                                                std::string& reason);

public:
    SessionRegistry(ParityConfig parity_config, SegmentConfig segment_config,
                    std::shared_ptr<SubscriptionGate> gate, Clock now_ms);

    // Parity for every sample; segment detection when a vehicle id is present.
    IngestResult ingest(const IngestSample& sample);
    void record_ack_sent(const std::string& session_id, const std::string& sub_stream);
    void record_error(const std::string& session_id, const std::string& message);

    // Applied to sessions created afterwards.
    void set_default_track_map(std::shared_ptr<const TrackSegmentMap> map);
    bool set_track_map(const std::string& session_id, const TrackSegmentMap& map, std::string& error);

    std::optional<ParitySnapshot> parity_snapshot(const std::string& session_id) const;
    std::vector<std::string> session_ids() const;

    std::optional<PaceTrend> analyze_pace_trend(const std::string& session_id, uint32_t vehicle_id);
    std::vector<PaceTrend> analyze_pace_trends(const std::string& session_id);

    // Releases all state of the session. False for unknown sessions.
    bool end_session(const std::string& session_id);
    std::vector<std::string> idle_sessions(uint64_t timeout_ms) const;

    // Subscriptions go through the gate and create the session.
    std::optional<Unsubscribe> subscribe_pace(const SubscriptionRequest& request,
                                              std::function<void(const SegmentPaceUpdate&)> callback,
                                              std::string& reason);
    std::optional<Unsubscribe> subscribe_trend(const SubscriptionRequest& request,
                                               std::function<void(const PaceTrend&)> callback,
                                               std::string& reason);
};
