#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <format>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include "commons.hpp"
#include "historical_store.hpp"
#include "ingest_sample.hpp"
#include "telemetry_source.hpp"
#include "timebase.hpp"
#include "wire.hpp"


static std::atomic<bool> do_exit(false);

#define DEFAULT_SESSION_ID "default"
#define DEFAULT_ROLE "ops"

// signal handler to break the main loop
void signal_handler(int signum) {
    std::cerr << "\nCaught signal " << signum << ", stopping...\n";
    do_exit = true;
}

int main(int argc, char** argv) {
    SourceConfig config;
    config.mode = SourceMode::Demo;
    std::string session_id = DEFAULT_SESSION_ID;
    std::string replay_path;
    std::string record_path;
    std::string role = DEFAULT_ROLE;

    // process command line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-M" && i + 1 < argc) {
            const std::string name = argv[++i];
            const std::optional<SourceMode> mode = parse_source_mode(name);
            if (!mode) {
                std::cerr << "Unknown source mode: " << name << "\n";
                return 1;
            }
            config.mode = *mode;
        } else if (arg == "-s" && i + 1 < argc) {
            session_id = argv[++i];
        } else if (arg == "-c" && i + 1 < argc) {
            config.endpoint = argv[++i];
        } else if (arg == "-u" && i + 1 < argc) {
            config.update_rate_hz = std::atoi(argv[++i]);
        } else if (arg == "-f" && i + 1 < argc) {
            replay_path = argv[++i];
        } else if (arg == "-a" && i + 1 < argc) {
            config.start_ms = std::strtoull(argv[++i], nullptr, 10);
        } else if (arg == "-b" && i + 1 < argc) {
            config.end_ms = std::strtoull(argv[++i], nullptr, 10);
        } else if (arg == "-r" && i + 1 < argc) {
            config.playback_rate = std::atoi(argv[++i]);
        } else if (arg == "-S" && i + 1 < argc) {
            config.seed = argv[++i];
        } else if (arg == "-w" && i + 1 < argc) {
            record_path = argv[++i];
        } else if (arg == "-R" && i + 1 < argc) {
            role = argv[++i];
        } else if (parse_common_arguments(i, argc, arg, argv)) {
            // do nothing
        } else {
            if (arg != "-h") {
                std::cerr << "Unknown argument: " << arg << "\n";
            }
            std::cerr << "Usage: " << argv[0] << " [-M mode] [-s session] [-c endpoint] [-u hz] [-f file] [-a from_ms] [-b to_ms] [-r rate]"
                      << " [-S seed] [-w file] [-R role] [-p tcp_port] [-i tcp_port] [-g file] [-k file] [-x seconds] [-m] [-t]\n";
            std::cerr << "\t-M mode     default:demo\tlive, replay or demo\n";
            std::cerr << "\t-s session  default:" << DEFAULT_SESSION_ID << "\tsession id\n";
            std::cerr << "\t-c endpoint default:none\tlive: relay PUB endpoint, e.g. tcp://relay:5557\n";
            std::cerr << "\t-u hz       default:" << DEFAULT_LIVE_RATE_HZ << "   \tlive: timing update rate\n";
            std::cerr << "\t-f file     default:none\treplay: recording made with -w\n";
            std::cerr << "\t-a ms       default:0   \treplay: window start\n";
            std::cerr << "\t-b ms       default:0   \treplay: window end\n";
            std::cerr << "\t-r rate     default:1   \treplay: playback rate (1, 2, 5 or 10)\n";
            std::cerr << "\t-S seed     default:default\tdemo: generator seed\n";
            std::cerr << "\t-w file     default:off \tappend incoming timing and frames to a recording\n";
            std::cerr << "\t-R role     default:" << DEFAULT_ROLE << " \trole of the published event stream\n";
            print_common_usage();

            return 1;
        }
    }

    if (!init_commons()) {
        return EXIT_FAILURE;
    }

    if (config.mode == SourceMode::Replay) {
        if (replay_path.empty()) {
            std::cerr << "Error: replay mode needs a recording (-f)\n";
            return EXIT_FAILURE;
        }
        config.store = std::make_shared<FileHistoricalStore>(replay_path);
    }
    if (config.mode == SourceMode::Demo && is_system_clock()) {
        config.epoch_ms = Timebase::system_ms();
    }

    std::string error;
    std::unique_ptr<TelemetrySource> source = create_telemetry_source(config, error);
    if (!source) {
        std::cerr << "Error: " << error << "\n";
        return EXIT_FAILURE;
    }

    TelemetryRecorder recorder;
    if (!record_path.empty() && !recorder.open(record_path)) {
        std::cerr << "Error: " << recorder.get_last_error() << "\n";
        return EXIT_FAILURE;
    }

    // derived events of the session go out on the publisher, at the rate the role allows
    const SubscriptionRequest request = { .role = role, .session_id = session_id };
    std::optional<Unsubscribe> pace_subscription = session_registry().subscribe_pace(request,
        [](const SegmentPaceUpdate& update) {
            publish(WIRE_PACE_UPDATE, update.session_id, encode_pace_update(update));
        }, error);
    std::optional<Unsubscribe> trend_subscription;
    if (pace_subscription) {
        trend_subscription = session_registry().subscribe_trend(request,
            [](const PaceTrend& trend) {
                publish(WIRE_PACE_TREND, trend.session_id, encode_pace_trend(trend));
            }, error);
    }
    if (!pace_subscription || !trend_subscription) {
        std::cerr << "Error: subscription for role " << role << " rejected: " << error << "\n";
        return EXIT_FAILURE;
    }

    const double traffic_window_pct = common_settings().segments.traffic_window_pct;
    Unsubscribe timing_subscription = source->on_timing([&recorder, traffic_window_pct](const SessionTiming& timing) {
        recorder.record(timing);
        for (const auto& sample : timing_to_samples(timing, traffic_window_pct)) {
            session_registry().ingest(sample);
        }
    });
    Unsubscribe frame_subscription = source->on_frame([&recorder](const ThinFrame& frame) {
        recorder.record(frame);
        session_registry().ingest(frame_to_sample(frame));
    });

    // install signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    if (!source->connect(session_id)) {
        std::cerr << std::format("Error: {} source failed to connect: {}\n",
            source->get_backend_name(), source->get_last_error());
        close_commons();
        return EXIT_FAILURE;
    }
    std::cerr << std::format("Streaming {} session {}... stop with Ctrl-C\n", source->get_backend_name(), session_id);

    // main loop: exit when handler sets do_exit or the source stops
    while (!do_exit && source->is_connected()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        drain_ingest();
        report_status();
    }

    if (!source->is_connected() && !source->get_last_error().empty()) {
        std::cerr << "Error: " << source->get_last_error() << "\n";
    }

    source->disconnect();
    timing_subscription();
    frame_subscription();
    (*pace_subscription)();
    (*trend_subscription)();

    recorder.close();
    if (!record_path.empty()) {
        std::cerr << std::format("Recorded {} records to {}\n", recorder.get_record_count(), record_path);
    }

    std::cout << "cleanup\n";
    close_commons();

    std::cerr << "Done.\n";
    return 0;
}
