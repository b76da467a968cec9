#include "commons.hpp"

#include <cstdlib>
#include <format>
#include <iostream>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <zmq.hpp>
#include <zmq_addon.hpp>

#include "subscription_gate.hpp"
#include "timebase.hpp"
#include "track_map.hpp"
#include "wire.hpp"


static int zmq_port = 0;            // 0: from settings
static int ingest_port = 0;         // 0: no ingest socket
static std::unique_ptr<zmq::context_t> zmq_context;
static std::unique_ptr<zmq::socket_t> publisher;
static std::unique_ptr<zmq::socket_t> ingest_socket;
static std::mutex publisher_mutex;

static std::string settings_path;
static std::string track_path;
static std::string track_id = "default";
static std::string track_name = "Unknown";
static double track_length = 0.0;
static uint64_t idle_timeout_ms = 0;

static Settings settings;
static std::shared_ptr<SubscriptionGate> gate;
static std::unique_ptr<SessionRegistry> registry;

static bool monitor_mode = false;
static Timebase timebase;
static uint64_t last_report_ts = 0;
static uint64_t last_trend_ts = 0;


bool parse_common_arguments(int& i, const int argc, const std::string& arg, char** argv) {
    if (arg == "-p" && i + 1 < argc) {
        zmq_port = std::atoi(argv[++i]);
    } else if (arg == "-i" && i + 1 < argc) {
        ingest_port = std::atoi(argv[++i]);
    } else if (arg == "-m") {
        monitor_mode = true;
    } else if (arg == "-t") {
        timebase.use_system_clock();
    } else if (arg == "-g" && i + 1 < argc) {
        settings_path = argv[++i];
    } else if (arg == "-k" && i + 1 < argc) {
        track_path = argv[++i];
    } else if (arg == "-x" && i + 1 < argc) {
        idle_timeout_ms = std::strtoull(argv[++i], nullptr, 10) * 1000;
    } else if (arg == "--track-id" && i + 1 < argc) {
        track_id = argv[++i];
    } else if (arg == "--track-name" && i + 1 < argc) {
        track_name = argv[++i];
    } else if (arg == "--track-length" && i + 1 < argc) {
        track_length = std::atof(argv[++i]);
    } else {
        return false;
    }
    return true;
}

void print_common_usage() {
    std::cerr << "\t-p port     default:" << DEFAULT_ZEROMQ_PORT << "\tZeroMQ publisher port\n";
    std::cerr << "\t-i port     default:off \tZeroMQ PULL port for relay samples (acks go out on the publisher)\n";
    std::cerr << "\t-g file     default:none\tYAML settings (parity, segments, gate, publisher)\n";
    std::cerr << "\t-k file     default:none\tYAML track segment map\n";
    std::cerr << "\t--track-id id --track-name name --track-length m\n";
    std::cerr << "\t                        \tgenerate a 10 segment map when no -k is given\n";
    std::cerr << "\t-x seconds  default:off \tEnd sessions idle for this long\n";
    std::cerr << "\t-m          default:off \tEnable monitor mode (print published records to stdout)\n";
    std::cerr << "\t-t          default:off \tUse system clock as the timebase (beware of NTP jumps)\n";
}

static bool init_track_map() {
    if (!track_path.empty()) {
        TrackSegmentMap map;
        std::string error;
        if (!load_track_map(track_path, map, error)) {
            std::cerr << "Error: " << error << "\n";
            return false;
        }
        std::cerr << std::format("Track {} ({}): {} segments, {:.0f} m\n",
            map.track_id, map.track_name, map.segments.size(), map.track_length_meters);
        registry->set_default_track_map(std::make_shared<const TrackSegmentMap>(std::move(map)));
    } else if (track_length > 0.0) {
        registry->set_default_track_map(std::make_shared<const TrackSegmentMap>(
            generate_default_segment_map(track_id, track_name, track_length, timebase.now())));
        std::cerr << std::format("Track {} ({}): generated segments, {:.0f} m\n", track_id, track_name, track_length);
    } else {
        std::cerr << "Warning: no track map, segment speeds are disabled\n";
    }
    return true;
}

bool init_commons() {
    if (!settings_path.empty()) {
        std::string error;
        if (!load_settings(settings_path, settings, error)) {
            std::cerr << "Error: " << error << "\n";
            return false;
        }
    }
    if (zmq_port != 0) {
        settings.publisher.port = zmq_port;
        std::string error;
        if (!validate_settings(settings, error)) {
            std::cerr << "Error: " << error << "\n";
            return false;
        }
    }

    gate = std::make_shared<SubscriptionGate>(settings.roles);
    registry = std::make_unique<SessionRegistry>(settings.parity, settings.segments, gate,
        []() { return timebase.now(); });

    if (!init_track_map()) {
        return false;
    }

    //  Prepare our context and publisher
    std::string zmq_address;
    std::format_to(std::back_inserter(zmq_address), "tcp://*:{}", settings.publisher.port);
    try {
        zmq_context = std::make_unique<zmq::context_t>(1);
        publisher = std::make_unique<zmq::socket_t>(*zmq_context, zmq::socket_type::pub);
        publisher->bind(zmq_address);
        std::cout << "Listening on " << zmq_address << std::endl;

        if (ingest_port != 0) {
            const std::string ingest_address = std::format("tcp://*:{}", ingest_port);
            ingest_socket = std::make_unique<zmq::socket_t>(*zmq_context, zmq::socket_type::pull);
            ingest_socket->bind(ingest_address);
            std::cout << "Ingesting on " << ingest_address << std::endl;
        }
    } catch (const zmq::error_t& e) {
        std::cerr << "Error: cannot bind " << zmq_address << ": " << e.what() << "\n";
        return false;
    }

    last_report_ts = last_trend_ts = timebase.now();
    return true;
}

void close_commons() {
    std::lock_guard<std::mutex> lock(publisher_mutex);
    ingest_socket.reset();
    publisher.reset();
    zmq_context.reset();
}

SessionRegistry& session_registry() {
    return *registry;
}

const Settings& common_settings() {
    return settings;
}

uint64_t now_ms() {
    return timebase.now();
}

bool is_system_clock() {
    return timebase.is_system_clock();
}

void publish(char kind, const std::string& session_id, const std::string& record) {
    if (monitor_mode || kind == WIRE_STATUS) {
        std::cout << record << std::endl;
    }

    std::lock_guard<std::mutex> lock(publisher_mutex);
    if (!publisher) {
        return;
    }
    const std::string topic = topic_for(kind, session_id);
    try {
        publisher->send(zmq::buffer(topic), zmq::send_flags::sndmore);
        publisher->send(zmq::buffer(record), zmq::send_flags::none);
    } catch (const zmq::error_t& e) {
        std::cerr << "Warning: publish failed: " << e.what() << "\n";
    }
}

void ingest_and_ack(const IngestSample& sample) {
    const IngestResult result = registry->ingest(sample);
    if (result.verdict.should_ack && sample.frame_id) {
        publish(WIRE_ACK, sample.session_id, encode_ack(sample.session_id, sample.sub_stream, *sample.frame_id));
        registry->record_ack_sent(sample.session_id, sample.sub_stream);
    }
}

void drain_ingest() {
    if (!ingest_socket) {
        return;
    }

    // bounded, so a flooding relay cannot starve the reports
    for (int n = 0; n < DEFAULT_INGEST_BATCH; n++) {
        std::vector<zmq::message_t> parts;
        try {
            const auto received = zmq::recv_multipart(*ingest_socket, std::back_inserter(parts), zmq::recv_flags::dontwait);
            if (!received) {
                return;
            }
        } catch (const zmq::error_t& e) {
            std::cerr << "Warning: ingest receive failed: " << e.what() << "\n";
            return;
        }

        // [record] or [topic, record]
        const std::string line = parts.back().to_string();
        const std::optional<IngestSample> sample = decode_ingest(line);
        if (!sample) {
            std::cerr << "Warning: malformed ingest record: " << line << "\n";
            continue;
        }
        ingest_and_ack(*sample);
    }
}

void report_status() {
    const uint64_t now = timebase.now();
    const PublisherSettings& period = settings.publisher;

    // parity status of every session
    if (now >= last_report_ts + period.report_period_ms) {
        last_report_ts = now;
        for (const auto& session_id : registry->session_ids()) {
            if (const auto snapshot = registry->parity_snapshot(session_id)) {
                publish(WIRE_STATUS, session_id, encode_status(now, *snapshot));
            }
        }
    }

    // trends reach the publisher through its trend subscription
    if (now >= last_trend_ts + period.trend_period_ms) {
        last_trend_ts = now;
        for (const auto& session_id : registry->session_ids()) {
            registry->analyze_pace_trends(session_id);
        }
    }

    if (idle_timeout_ms > 0) {
        for (const auto& session_id : registry->idle_sessions(idle_timeout_ms)) {
            registry->end_session(session_id);
        }
    }
}
