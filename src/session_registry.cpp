#include "session_registry.hpp"

#include <format>
#include <iostream>
#include <utility>


SessionRegistry::SessionRegistry(ParityConfig parity_config, SegmentConfig _segment_config,
                                 std::shared_ptr<SubscriptionGate> _gate, Clock _now_ms)
    : segment_config(_segment_config)
    , gate(std::move(_gate))
    , now_ms(std::move(_now_ms))
    , parity(parity_config)
{
}

std::shared_ptr<SessionRegistry::Session> SessionRegistry::session(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex);
    return open_session(session_id);
}

std::shared_ptr<SessionRegistry::Session> SessionRegistry::open_session(const std::string& session_id) {
    const auto it = sessions.find(session_id);
    if (it != sessions.end()) {
        return it->second;
    }

    auto detector = std::make_unique<SegmentSpeedDetector>(session_id, segment_config, &pace_updates, &pace_trends);
    if (default_track_map) {
        detector->set_track_map(default_track_map);
    }
    auto created = std::make_shared<Session>(std::move(detector), now_ms());
    sessions.emplace(session_id, created);
    parity.get_or_create(session_id);

    std::cerr << std::format("[{}] session opened\n", session_id);
    return created;
}

std::shared_ptr<SessionRegistry::Session> SessionRegistry::find(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex);
    const auto it = sessions.find(session_id);
    if (it == sessions.end()) {
        return nullptr;
    }
    return it->second;
}

IngestResult SessionRegistry::ingest(const IngestSample& sample) {
    IngestResult result;
    std::shared_ptr<Session> s;
    {
        // an end_session() in between must not leave parity counters behind
        std::lock_guard<std::mutex> lock(mutex);
        s = open_session(sample.session_id);
        s->last_activity = now_ms();
        result.verdict = parity.record_frame_in(sample.session_id, sample.sub_stream, sample.timestamp, sample.frame_id);
    }

    // a duplicate would be counted twice as a segment transit
    if (sample.vehicle_id && !result.verdict.is_duplicate) {
        result.segment = s->detector->process(PositionSample {
            .vehicle_id = *sample.vehicle_id,
            .driver_id = sample.driver_id,
            .lap_dist_pct = sample.cyclic_position,
            .lap = sample.lap,
            .in_pit_lane = sample.in_pit_lane,
            .on_racing_surface = sample.on_racing_surface,
            .has_traffic_overlap = sample.has_traffic_overlap,
            .timestamp = sample.timestamp
        });
    }
    return result;
}

void SessionRegistry::record_ack_sent(const std::string& session_id, const std::string& sub_stream) {
    std::lock_guard<std::mutex> lock(mutex);
    open_session(session_id)->last_activity = now_ms();
    parity.record_ack_sent(session_id, sub_stream);
}

void SessionRegistry::record_error(const std::string& session_id, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex);
    open_session(session_id);
    parity.record_error(session_id, message);
}

void SessionRegistry::set_default_track_map(std::shared_ptr<const TrackSegmentMap> map) {
    std::lock_guard<std::mutex> lock(mutex);
    default_track_map = std::move(map);
}

bool SessionRegistry::set_track_map(const std::string& session_id, const TrackSegmentMap& map, std::string& error) {
    if (!validate_track_map(map, error)) {
        return false;
    }
    session(session_id)->detector->set_track_map(std::make_shared<const TrackSegmentMap>(map));
    return true;
}

std::optional<ParitySnapshot> SessionRegistry::parity_snapshot(const std::string& session_id) const {
    return parity.snapshot(session_id);
}

std::vector<std::string> SessionRegistry::session_ids() const {
    std::lock_guard<std::mutex> lock(mutex);

    std::vector<std::string> ids;
    ids.reserve(sessions.size());
    for (const auto& [session_id, s] : sessions) {
        ids.push_back(session_id);
    }
    return ids;
}

std::optional<PaceTrend> SessionRegistry::analyze_pace_trend(const std::string& session_id, uint32_t vehicle_id) {
    const auto s = find(session_id);
    if (!s) {
        return std::nullopt;
    }
    return s->detector->analyze_pace_trend(vehicle_id);
}

std::vector<PaceTrend> SessionRegistry::analyze_pace_trends(const std::string& session_id) {
    std::vector<PaceTrend> trends;
    const auto s = find(session_id);
    if (!s) {
        return trends;
    }

    for (uint32_t vehicle_id : s->detector->vehicle_ids()) {
        if (auto trend = s->detector->analyze_pace_trend(vehicle_id)) {
            trends.push_back(std::move(*trend));
        }
    }
    return trends;
}

bool SessionRegistry::end_session(const std::string& session_id) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (sessions.erase(session_id) == 0) {
            return false;
        }
        parity.cleanup(session_id);
    }
    std::cerr << std::format("[{}] session closed\n", session_id);
    return true;
}

std::vector<std::string> SessionRegistry::idle_sessions(uint64_t timeout_ms) const {
    const uint64_t now = now_ms();

    std::lock_guard<std::mutex> lock(mutex);
    std::vector<std::string> idle;
    for (const auto& [session_id, s] : sessions) {
        const uint64_t last = s->last_activity;
        if (now >= last && now - last >= timeout_ms) {
            idle.push_back(session_id);
        }
    }
    return idle;
}

template<typename Event>
std::optional<Unsubscribe> SessionRegistry::subscribe_events(EventChannel<Event>& channel,
                                                             const SubscriptionRequest& request,
                                                             std::function<void(const Event&)> callback,
                                                             std::string& reason)
{
    const std::optional<SubscriptionGrant> grant = gate->request(request, reason);
    if (!grant) {
        return std::nullopt;
    }
    session(request.session_id)->last_activity = now_ms();

    const uint64_t subscription_id = grant->subscription_id;
    const std::string session_id = grant->session_id;
    std::weak_ptr<SubscriptionGate> weak_gate = gate;

    Unsubscribe detach = channel.subscribe([weak_gate, subscription_id, session_id, callback](const Event& event) {
        if (event.session_id != session_id) {
            return;
        }
        auto g = weak_gate.lock();
        if (!g || !g->admit(subscription_id, event.timestamp)) {
            return;
        }
        callback(event);
    });

    return [detach, weak_gate, subscription_id]() {
        detach();
        if (auto g = weak_gate.lock()) {
            g->release(subscription_id);
        }
    };
}

std::optional<Unsubscribe> SessionRegistry::subscribe_pace(const SubscriptionRequest& request,
                                                           std::function<void(const SegmentPaceUpdate&)> callback,
                                                           std::string& reason)
{
    return subscribe_events(pace_updates, request, std::move(callback), reason);
}

std::optional<Unsubscribe> SessionRegistry::subscribe_trend(const SubscriptionRequest& request,
                                                            std::function<void(const PaceTrend&)> callback,
                                                            std::string& reason)
{
    return subscribe_events(pace_trends, request, std::move(callback), reason);
}
