#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Rate 0 means unlimited.
struct RoleEntitlement {
    bool allowed;
    uint32_t max_rate_hz;
};

struct SubscriptionRequest {
    std::string role;
    std::string session_id;
    uint32_t requested_rate_hz = 0;
};

struct SubscriptionGrant {
    uint64_t subscription_id;
    std::string session_id;
    std::string role;
    uint32_t granted_rate_hz;
};

// Accepts or rejects subscriptions per connecting role and throttles
// each accepted subscription to its granted rate.
class SubscriptionGate {
    struct Subscription {
        SubscriptionGrant grant;
        std::optional<uint64_t> last_admitted;
    };

    std::map<std::string, RoleEntitlement> roles;
    std::map<uint64_t, Subscription> subscriptions;
    uint64_t next_id = 1;
    mutable std::mutex mutex;

public:
    SubscriptionGate();
    explicit SubscriptionGate(std::map<std::string, RoleEntitlement> roles);

    // driver 10 Hz, team 5 Hz, league 2 Hz, broadcast 5 Hz, ops unlimited
    static std::map<std::string, RoleEntitlement> default_roles();

    void set_role(const std::string& role, RoleEntitlement entitlement);
    std::optional<RoleEntitlement> role(const std::string& role) const;

    // On rejection returns nothing and fills `reason`.
    std::optional<SubscriptionGrant> request(const SubscriptionRequest& request, std::string& reason);

    // True when an update may be delivered at `now_ms`. A clock that
    // moved backwards (replay seek) restarts the interval.
    bool admit(uint64_t subscription_id, uint64_t now_ms);
    void release(uint64_t subscription_id);

    size_t active_count() const;
    std::vector<SubscriptionGrant> subscriptions_for(const std::string& session_id) const;
};
