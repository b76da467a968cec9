#pragma once

#include <cstdint>
#include <map>
#include <string>

#include "parity_tracker.hpp"
#include "segment_speed.hpp"
#include "subscription_gate.hpp"

#define DEFAULT_ZEROMQ_PORT 5557
#define REPORTING_PERIOD 5000
#define TREND_PERIOD 10000

struct PublisherSettings {
    int port = DEFAULT_ZEROMQ_PORT;
    uint64_t report_period_ms = REPORTING_PERIOD;
    uint64_t trend_period_ms = TREND_PERIOD;
};

struct Settings {
    ParityConfig parity;
    SegmentConfig segments;
    std::map<std::string, RoleEntitlement> roles = SubscriptionGate::default_roles();
    PublisherSettings publisher;
};

// Keys missing from the file keep their defaults. `settings` is only
// modified when the whole file is valid.
bool load_settings(const std::string& path, Settings& settings, std::string& error);
bool validate_settings(const Settings& settings, std::string& error);
