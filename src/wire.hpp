#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ingest_sample.hpp"
#include "parity_tracker.hpp"
#include "segment_speed.hpp"
#include "timing.hpp"

// Text records, one per line, space separated, first token is the kind:
//
//   T  timing snapshot        F  thin frame          I  ingest sample
//   A  acknowledgment echo    V  segment pace update R  pace trend
//   S  parity status
//
// On ZeroMQ every record travels as [topic, record] where the topic is
// "<kind>/<session>/", so subscribers can filter per session by prefix.
// Free text fields are percent-escaped, absent values are "-".

#define WIRE_TIMING      'T'
#define WIRE_FRAME       'F'
#define WIRE_INGEST      'I'
#define WIRE_ACK         'A'
#define WIRE_PACE_UPDATE 'V'
#define WIRE_PACE_TREND  'R'
#define WIRE_STATUS      'S'

std::string escape_field(std::string_view text);
std::string unescape_field(std::string_view field);
std::vector<std::string_view> split_fields(std::string_view line, char separator);

std::string topic_for(char kind, const std::string& session_id);
std::optional<char> record_kind(std::string_view line);

std::string encode_timing(const SessionTiming& timing);
std::optional<SessionTiming> decode_timing(std::string_view line);

std::string encode_frame(const ThinFrame& frame);
std::optional<ThinFrame> decode_frame(std::string_view line);

std::string encode_ingest(const IngestSample& sample);
std::optional<IngestSample> decode_ingest(std::string_view line);

std::string encode_ack(const std::string& session_id, const std::string& sub_stream, const std::string& frame_id);

std::string encode_pace_update(const SegmentPaceUpdate& update);
std::string encode_pace_trend(const PaceTrend& trend);
std::string encode_status(uint64_t timestamp, const ParitySnapshot& snapshot);
