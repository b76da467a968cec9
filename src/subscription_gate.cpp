#include "subscription_gate.hpp"

#include <algorithm>
#include <format>
#include <utility>


SubscriptionGate::SubscriptionGate() : roles(default_roles()) {}

SubscriptionGate::SubscriptionGate(std::map<std::string, RoleEntitlement> _roles) : roles(std::move(_roles)) {}

std::map<std::string, RoleEntitlement> SubscriptionGate::default_roles() {
    return {
        { "driver",    { .allowed = true, .max_rate_hz = 10 } },
        { "team",      { .allowed = true, .max_rate_hz = 5 } },
        { "league",    { .allowed = true, .max_rate_hz = 2 } },
        { "broadcast", { .allowed = true, .max_rate_hz = 5 } },
        { "ops",       { .allowed = true, .max_rate_hz = 0 } },
    };
}

void SubscriptionGate::set_role(const std::string& role, RoleEntitlement entitlement) {
    std::lock_guard<std::mutex> lock(mutex);
    roles[role] = entitlement;
}

std::optional<RoleEntitlement> SubscriptionGate::role(const std::string& role) const {
    std::lock_guard<std::mutex> lock(mutex);
    const auto it = roles.find(role);
    if (it == roles.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<SubscriptionGrant> SubscriptionGate::request(const SubscriptionRequest& request, std::string& reason) {
    if (request.session_id.empty()) {
        reason = "missing session id";
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(mutex);

    const auto it = roles.find(request.role);
    if (it == roles.end()) {
        reason = std::format("unknown role '{}'", request.role);
        return std::nullopt;
    }
    const RoleEntitlement& entitlement = it->second;
    if (!entitlement.allowed) {
        reason = std::format("role '{}' may not subscribe", request.role);
        return std::nullopt;
    }

    uint32_t rate;
    if (request.requested_rate_hz == 0) {
        rate = entitlement.max_rate_hz;
    } else if (entitlement.max_rate_hz == 0) {
        rate = request.requested_rate_hz;
    } else {
        rate = std::min(request.requested_rate_hz, entitlement.max_rate_hz);
    }

    SubscriptionGrant grant {
        .subscription_id = next_id++,
        .session_id = request.session_id,
        .role = request.role,
        .granted_rate_hz = rate
    };
    subscriptions.emplace(grant.subscription_id, Subscription { .grant = grant, .last_admitted = std::nullopt });
    return grant;
}

bool SubscriptionGate::admit(uint64_t subscription_id, uint64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex);

    const auto it = subscriptions.find(subscription_id);
    if (it == subscriptions.end()) {
        return false;
    }
    Subscription& subscription = it->second;
    if (subscription.grant.granted_rate_hz == 0) {
        return true;
    }

    const uint64_t min_interval_ms = 1000 / subscription.grant.granted_rate_hz;
    if (subscription.last_admitted
        && now_ms >= *subscription.last_admitted
        && now_ms - *subscription.last_admitted < min_interval_ms) {
        return false;
    }
    subscription.last_admitted = now_ms;
    return true;
}

void SubscriptionGate::release(uint64_t subscription_id) {
    std::lock_guard<std::mutex> lock(mutex);
    subscriptions.erase(subscription_id);
}

size_t SubscriptionGate::active_count() const {
    std::lock_guard<std::mutex> lock(mutex);
    return subscriptions.size();
}

std::vector<SubscriptionGrant> SubscriptionGate::subscriptions_for(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex);

    std::vector<SubscriptionGrant> grants;
    for (const auto& [id, subscription] : subscriptions) {
        if (subscription.grant.session_id == session_id) {
            grants.push_back(subscription.grant);
        }
    }
    return grants;
}
