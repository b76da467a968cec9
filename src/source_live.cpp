#include "source_live.hpp"

#include <chrono>
#include <format>
#include <iostream>
#include <iterator>
#include <optional>
#include <utility>
#include <vector>

#include <zmq_addon.hpp>

#include "wire.hpp"

#define RX_TIMEOUT_MS 100


LiveSource::LiveSource(std::unique_ptr<LiveTransport> _transport, uint32_t _update_rate_hz)
    : transport(std::move(_transport))
    , update_rate_hz(_update_rate_hz)
{
}

LiveSource::~LiveSource() {
    disconnect();
}

bool LiveSource::connect(const std::string& _session_id) {
    disconnect();

    active = true;
    const bool ok = transport->subscribe(_session_id, update_rate_hz,
        [this](const SessionTiming& timing) {
            if (active) {
                timing_channel.publish(timing);
            }
        },
        [this](const ThinFrame& frame) {
            if (active) {
                frame_channel.publish(frame);
            }
        });

    std::lock_guard<std::mutex> lock(mutex);
    if (!ok) {
        active = false;
        last_error = std::format("subscribe to {} failed: {}", _session_id, transport->get_last_error());
        return false;
    }
    session_id = _session_id;
    return true;
}

void LiveSource::disconnect() {
    active = false;
    transport->unsubscribe();

    std::lock_guard<std::mutex> lock(mutex);
    session_id.clear();
}

bool LiveSource::is_connected() const {
    return active && transport->is_connected();
}

std::string LiveSource::get_last_error() const {
    std::lock_guard<std::mutex> lock(mutex);
    return last_error;
}

ZmqLiveTransport::ZmqLiveTransport(std::string _endpoint)
    : endpoint(std::move(_endpoint))
    , context(1)
{
}

ZmqLiveTransport::~ZmqLiveTransport() {
    unsubscribe();
}

bool ZmqLiveTransport::subscribe(const std::string& session_id, uint32_t _rate_hz,
                                 TimingCallback on_timing, FrameCallback on_frame)
{
    // the receive thread cannot join itself to start its successor
    if (rx_thread.joinable() && rx_thread.get_id() == std::this_thread::get_id()) {
        set_error(std::format("cannot subscribe to {} from a receive handler", session_id));
        return false;
    }
    unsubscribe();

    try {
        socket = std::make_unique<zmq::socket_t>(context, zmq::socket_type::sub);
        socket->set(zmq::sockopt::rcvtimeo, RX_TIMEOUT_MS);
        socket->set(zmq::sockopt::linger, 0);
        socket->set(zmq::sockopt::subscribe, topic_for(WIRE_TIMING, session_id));
        socket->set(zmq::sockopt::subscribe, topic_for(WIRE_FRAME, session_id));
        socket->connect(endpoint);
    } catch (const zmq::error_t& e) {
        set_error(std::format("cannot connect to {}: {}", endpoint, e.what()));
        socket.reset();
        return false;
    }

    rate_hz = _rate_hz;
    timing_handler = std::move(on_timing);
    frame_handler = std::move(on_frame);

    do_exit = false;
    streaming = true;
    rx_thread = std::thread(&ZmqLiveTransport::rx_loop, this);

    std::cerr << std::format("Subscribed to {} on {} ({} Hz)\n", session_id, endpoint, rate_hz);
    return true;
}

void ZmqLiveTransport::unsubscribe() {
    do_exit = true;
    if (rx_thread.joinable() && rx_thread.get_id() == std::this_thread::get_id()) {
        return; // from a handler: the loop ends after it returns
    }
    if (rx_thread.joinable()) {
        rx_thread.join();
    }
    streaming = false;
    socket.reset();
}

void ZmqLiveTransport::rx_loop() {
    const auto min_interval = std::chrono::milliseconds(rate_hz > 0 ? 1000 / rate_hz : 0);
    std::optional<std::chrono::steady_clock::time_point> last_timing;

    while (!do_exit) {
        std::vector<zmq::message_t> parts;
        try {
            const auto received = zmq::recv_multipart(*socket, std::back_inserter(parts));
            if (!received) {
                continue; // timeout
            }
        } catch (const zmq::error_t& e) {
            set_error(std::format("receive failed: {}", e.what()));
            break;
        }

        if (parts.size() != 2) {
            continue;
        }
        const std::string record = parts[1].to_string();

        switch (record_kind(record).value_or(' ')) {
            case WIRE_TIMING: {
                const auto now = std::chrono::steady_clock::now();
                if (last_timing && now - *last_timing < min_interval) {
                    break;
                }
                if (auto timing = decode_timing(record)) {
                    last_timing = now;
                    timing_handler(*timing);
                }
                break;
            }
            case WIRE_FRAME:
                if (auto frame = decode_frame(record)) {
                    frame_handler(*frame);
                }
                break;
            default:
                break;
        }
    }

    streaming = false;
}

void ZmqLiveTransport::set_error(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex);
    last_error = message;
    std::cerr << "Error: " << message << "\n";
}

std::string ZmqLiveTransport::get_last_error() const {
    std::lock_guard<std::mutex> lock(mutex);
    return last_error;
}
