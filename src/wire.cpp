#include "wire.hpp"

#include <charconv>
#include <format>
#include <iterator>

#define ABSENT "-"
#define TIMING_FIELDS 12
#define TIMING_ENTRY_FIELDS 15
#define FRAME_FIELDS 12
#define INGEST_FIELDS 12


std::string escape_field(std::string_view text) {
    if (text.empty()) {
        return ABSENT;
    }
    if (text == ABSENT) {
        return "%2D";
    }

    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '%': case ' ': case '|': case ',': case ':':
            case '\n': case '\r': case '\t':
                std::format_to(std::back_inserter(out), "%{:02X}", static_cast<unsigned char>(c));
                break;
            default:
                out.push_back(c);
        }
    }
    return out;
}

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

std::string unescape_field(std::string_view field) {
    if (field == ABSENT) {
        return "";
    }

    std::string out;
    out.reserve(field.size());
    for (size_t i = 0; i < field.size(); i++) {
        if (field[i] == '%' && i + 2 < field.size()) {
            const int hi = hex_value(field[i + 1]);
            const int lo = hex_value(field[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>(hi * 16 + lo));
                i += 2;
                continue;
            }
        }
        out.push_back(field[i]);
    }
    return out;
}

std::vector<std::string_view> split_fields(std::string_view line, char separator) {
    std::vector<std::string_view> fields;
    size_t start = 0;
    while (start <= line.size()) {
        const size_t end = line.find(separator, start);
        if (end == std::string_view::npos) {
            fields.push_back(line.substr(start));
            break;
        }
        fields.push_back(line.substr(start, end - start));
        start = end + 1;
    }
    return fields;
}

std::string topic_for(char kind, const std::string& session_id) {
    return std::format("{}/{}/", kind, session_id);
}

std::optional<char> record_kind(std::string_view line) {
    if (line.size() < 2 || line[1] != ' ') {
        return std::nullopt;
    }
    return line[0];
}

// ---------------------------------------------------------------------------
// field helpers

template<typename T>
static bool parse_number(std::string_view field, T& out) {
    const auto [ptr, ec] = std::from_chars(field.data(), field.data() + field.size(), out);
    return ec == std::errc() && ptr == field.data() + field.size();
}

template<typename T>
static bool parse_optional(std::string_view field, std::optional<T>& out) {
    if (field == ABSENT) {
        out = std::nullopt;
        return true;
    }
    T value;
    if (!parse_number(field, value)) {
        return false;
    }
    out = value;
    return true;
}

static bool parse_flag(std::string_view field, bool& out) {
    if (field == "1") {
        out = true;
    } else if (field == "0") {
        out = false;
    } else {
        return false;
    }
    return true;
}

template<typename T>
static std::string optional_field(const std::optional<T>& value) {
    return value ? std::format("{}", *value) : std::string(ABSENT);
}

static std::string speed_field(const ConfidenceValue& value) {
    return value.value ? std::format("{:.2f}", *value.value) : std::string(ABSENT);
}

// value:confidence:SOURCE
static std::string tagged_field(const ConfidenceValue& value, int precision) {
    const std::string number = value.value
        ? std::format("{:.{}f}", *value.value, precision) : std::string(ABSENT);
    return std::format("{}:{:.2f}:{}", number, value.confidence, source_name(value.source));
}

// ---------------------------------------------------------------------------
// T

static std::string encode_entry(const TimingEntry& e) {
    return std::format("{},{},{},{},{},{},{},{},{},{},{},{},{},{},{}",
        escape_field(e.driver_id),
        escape_field(e.driver_name),
        escape_field(e.car_number),
        escape_field(e.team_name),
        e.position,
        e.lap_number,
        e.lap_dist_pct,
        e.last_lap_time,
        e.best_lap_time,
        e.gap_to_leader,
        optional_field(e.gap_ahead),
        optional_field(e.speed),
        optional_field(e.sector),
        e.in_pit ? 1 : 0,
        e.retired ? 1 : 0
    );
}

static bool decode_entry(std::string_view text, TimingEntry& e) {
    const auto f = split_fields(text, ',');
    if (f.size() != TIMING_ENTRY_FIELDS) {
        return false;
    }
    e.driver_id = unescape_field(f[0]);
    e.driver_name = unescape_field(f[1]);
    e.car_number = unescape_field(f[2]);
    e.team_name = unescape_field(f[3]);
    return parse_number(f[4], e.position)
        && parse_number(f[5], e.lap_number)
        && parse_number(f[6], e.lap_dist_pct)
        && parse_number(f[7], e.last_lap_time)
        && parse_number(f[8], e.best_lap_time)
        && parse_number(f[9], e.gap_to_leader)
        && parse_optional(f[10], e.gap_ahead)
        && parse_optional(f[11], e.speed)
        && parse_optional(f[12], e.sector)
        && parse_flag(f[13], e.in_pit)
        && parse_flag(f[14], e.retired);
}

std::string encode_timing(const SessionTiming& timing) {
    std::string entries;
    for (const auto& entry : timing.entries) {
        if (!entries.empty()) {
            entries.push_back('|');
        }
        entries += encode_entry(entry);
    }
    if (entries.empty()) {
        entries = ABSENT;
    }

    return std::format("T {} {} {} {} {} {} {} {} {} {} {}",
        escape_field(timing.session_id),
        timing.timestamp,
        escape_field(timing.session_state),
        timing.session_time_elapsed,
        timing.session_time_remaining,
        timing.laps_remaining,
        escape_field(timing.leader_id),
        escape_field(timing.fastest_lap.driver_id),
        timing.fastest_lap.time,
        timing.fastest_lap.lap,
        entries
    );
}

std::optional<SessionTiming> decode_timing(std::string_view line) {
    const auto f = split_fields(line, ' ');
    if (f.size() != TIMING_FIELDS || f[0] != "T") {
        return std::nullopt;
    }

    SessionTiming timing;
    timing.session_id = unescape_field(f[1]);
    timing.session_state = unescape_field(f[3]);
    timing.leader_id = unescape_field(f[7]);
    timing.fastest_lap.driver_id = unescape_field(f[8]);

    if (!parse_number(f[2], timing.timestamp)
        || !parse_number(f[4], timing.session_time_elapsed)
        || !parse_number(f[5], timing.session_time_remaining)
        || !parse_number(f[6], timing.laps_remaining)
        || !parse_number(f[9], timing.fastest_lap.time)
        || !parse_number(f[10], timing.fastest_lap.lap)) {
        return std::nullopt;
    }

    if (f[11] != ABSENT) {
        for (const auto& text : split_fields(f[11], '|')) {
            TimingEntry entry;
            if (!decode_entry(text, entry)) {
                return std::nullopt;
            }
            timing.entries.push_back(std::move(entry));
        }
    }
    return timing;
}

// ---------------------------------------------------------------------------
// F

std::string encode_frame(const ThinFrame& frame) {
    return std::format("F {} {} {} {} {} {} {} {} {} {} {}",
        escape_field(frame.session_id),
        frame.timestamp,
        escape_field(frame.driver_id),
        frame.speed,
        frame.gear,
        frame.rpm,
        frame.lap,
        frame.lap_progress,
        frame.position,
        optional_field(frame.throttle),
        optional_field(frame.brake)
    );
}

std::optional<ThinFrame> decode_frame(std::string_view line) {
    const auto f = split_fields(line, ' ');
    if (f.size() != FRAME_FIELDS || f[0] != "F") {
        return std::nullopt;
    }

    ThinFrame frame;
    frame.session_id = unescape_field(f[1]);
    frame.driver_id = unescape_field(f[3]);
    if (!parse_number(f[2], frame.timestamp)
        || !parse_number(f[4], frame.speed)
        || !parse_number(f[5], frame.gear)
        || !parse_number(f[6], frame.rpm)
        || !parse_number(f[7], frame.lap)
        || !parse_number(f[8], frame.lap_progress)
        || !parse_number(f[9], frame.position)
        || !parse_optional(f[10], frame.throttle)
        || !parse_optional(f[11], frame.brake)) {
        return std::nullopt;
    }
    return frame;
}

// ---------------------------------------------------------------------------
// I / A

std::string encode_ingest(const IngestSample& s) {
    return std::format("I {} {} {} {} {} {} {} {} {} {} {}",
        escape_field(s.session_id),
        escape_field(s.sub_stream),
        optional_field(s.vehicle_id),
        escape_field(s.driver_id),
        s.frame_id ? escape_field(*s.frame_id) : std::string(ABSENT),
        s.timestamp,
        s.cyclic_position,
        s.lap,
        s.in_pit_lane ? 1 : 0,
        s.on_racing_surface ? 1 : 0,
        s.has_traffic_overlap ? 1 : 0
    );
}

std::optional<IngestSample> decode_ingest(std::string_view line) {
    const auto f = split_fields(line, ' ');
    if (f.size() != INGEST_FIELDS || f[0] != "I") {
        return std::nullopt;
    }

    IngestSample s;
    s.session_id = unescape_field(f[1]);
    s.sub_stream = unescape_field(f[2]);
    s.driver_id = unescape_field(f[4]);
    if (f[5] != ABSENT) {
        s.frame_id = unescape_field(f[5]);
    }
    if (s.session_id.empty() || s.sub_stream.empty()
        || !parse_optional(f[3], s.vehicle_id)
        || !parse_number(f[6], s.timestamp)
        || !parse_number(f[7], s.cyclic_position)
        || !parse_number(f[8], s.lap)
        || !parse_flag(f[9], s.in_pit_lane)
        || !parse_flag(f[10], s.on_racing_surface)
        || !parse_flag(f[11], s.has_traffic_overlap)) {
        return std::nullopt;
    }
    return s;
}

std::string encode_ack(const std::string& session_id, const std::string& sub_stream, const std::string& frame_id) {
    return std::format("A {} {} {}", escape_field(session_id), escape_field(sub_stream), escape_field(frame_id));
}

// ---------------------------------------------------------------------------
// V / R / S

std::string encode_pace_update(const SegmentPaceUpdate& u) {
    return std::format("V {} {} {} {} {} {} {} {} {:.2f} {}",
        escape_field(u.session_id),
        u.timestamp,
        u.vehicle_id,
        escape_field(u.driver_id),
        escape_field(u.segment_id),
        speed_field(u.avg_speed),
        u.segment_time_ms,
        quality_name(u.quality_flag),
        u.confidence_score,
        source_name(u.source)
    );
}

std::string encode_pace_trend(const PaceTrend& t) {
    return std::format("R {} {} {} {} {} {} {} {} {} {} {} {}",
        escape_field(t.session_id),
        t.timestamp,
        t.vehicle_id,
        escape_field(t.driver_id),
        tagged_field(t.straight_pace, 2),
        tagged_field(t.corner_pace, 2),
        tagged_field(t.overall_pace, 2),
        tagged_field(t.pace_slope, 1),
        degradation_name(t.degradation_type),
        t.clean_sample_count,
        t.total_sample_count,
        quality_name(t.data_quality_summary)
    );
}

std::string encode_status(uint64_t timestamp, const ParitySnapshot& snapshot) {
    std::string streams;
    for (const auto& [name, stats] : snapshot.streams) {
        if (!streams.empty()) {
            streams.push_back(',');
        }
        std::format_to(std::back_inserter(streams), "{}:{}:{}:{}",
            escape_field(name), stats.frames_in, stats.acked, stats.last_frame_ts);
    }
    if (streams.empty()) {
        streams = ABSENT;
    }

    return std::format("S {} {} {} {} {} {}",
        timestamp,
        escape_field(snapshot.session_id),
        snapshot.duplicates,
        snapshot.out_of_order,
        streams,
        escape_field(snapshot.last_error)
    );
}
