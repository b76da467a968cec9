#pragma once

#include <cstdint>
#include <string>

#include "session_registry.hpp"
#include "settings.hpp"

#define DEFAULT_INGEST_BATCH 1000

bool parse_common_arguments(int& i, const int argc, const std::string& arg, char** argv);
void print_common_usage();

// Loads settings and the track map, binds the sockets. False on any
// configuration error, which has already been reported on stderr.
bool init_commons();
void close_commons();

SessionRegistry& session_registry();
const Settings& common_settings();
uint64_t now_ms();
bool is_system_clock();

// Sends [topic, record] on the PUB socket; monitor mode echoes it.
void publish(char kind, const std::string& session_id, const std::string& record);

// Feeds one relay sample to the registry and echoes the ack when due.
void ingest_and_ack(const IngestSample& sample);
void drain_ingest();

void report_status();
