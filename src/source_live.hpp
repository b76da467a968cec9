#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

#include <zmq.hpp>

#include "telemetry_source.hpp"

// Push subscription to the relay, keyed by session and update rate.
class LiveTransport {
public:
    virtual ~LiveTransport() = default;

    virtual bool subscribe(const std::string& session_id, uint32_t rate_hz,
                           TimingCallback on_timing, FrameCallback on_frame) = 0;
    // Returns once no handler runs anymore.
    virtual void unsubscribe() = 0;

    virtual bool is_connected() const = 0;
    virtual std::string get_backend_name() const = 0;
    virtual std::string get_last_error() const = 0;
};

// Forwards every snapshot and frame the transport delivers, unchanged.
class LiveSource : public TelemetrySource {
public:
    LiveSource(std::unique_ptr<LiveTransport> transport, uint32_t update_rate_hz);
    ~LiveSource() override;

    bool connect(const std::string& session_id) override;
    void disconnect() override;

    Unsubscribe on_timing(TimingCallback callback) override { return timing_channel.subscribe(std::move(callback)); }
    Unsubscribe on_frame(FrameCallback callback) override { return frame_channel.subscribe(std::move(callback)); }

    bool is_connected() const override;

    std::string get_backend_name() const override { return "live/" + transport->get_backend_name(); }
    std::string get_last_error() const override;

private:
    std::unique_ptr<LiveTransport> transport;
    const uint32_t update_rate_hz;

    EventChannel<SessionTiming> timing_channel;
    EventChannel<ThinFrame> frame_channel;

    std::atomic<bool> active = false;
    std::string session_id;
    std::string last_error;
    mutable std::mutex mutex;
};

// SUB socket on the relay's PUB endpoint. Subscribes to the
// "T/<session>/" and "F/<session>/" topics and throttles timing to the
// requested rate; frames pass through.
class ZmqLiveTransport : public LiveTransport {
public:
    explicit ZmqLiveTransport(std::string endpoint);
    ~ZmqLiveTransport() override;

    bool subscribe(const std::string& session_id, uint32_t rate_hz,
                   TimingCallback on_timing, FrameCallback on_frame) override;
    void unsubscribe() override;

    bool is_connected() const override { return streaming; }
    std::string get_backend_name() const override { return "zmq"; }
    std::string get_last_error() const override;

private:
    void rx_loop();
    void set_error(const std::string& message);

    const std::string endpoint;
    zmq::context_t context;
    std::unique_ptr<zmq::socket_t> socket;
    std::thread rx_thread;
    std::atomic<bool> streaming = false;
    std::atomic<bool> do_exit = false;

    uint32_t rate_hz = 0;
    TimingCallback timing_handler;
    FrameCallback frame_handler;

    std::string last_error;
    mutable std::mutex mutex;
};
