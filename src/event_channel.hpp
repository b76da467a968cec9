#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

// Calling it removes the registration. Safe to call more than once and
// safe to call after the channel is gone.
using Unsubscribe = std::function<void()>;

template<typename Event>
class EventChannel {
public:
    using Callback = std::function<void(const Event&)>;

private:
    struct Registry {
        std::mutex mutex;
        std::map<uint64_t, std::shared_ptr<Callback>> subscribers;
        uint64_t next_id = 1;
    };
    std::shared_ptr<Registry> registry;

public:
    EventChannel() : registry(std::make_shared<Registry>()) {}

    // subscribers are bound to this instance
    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    Unsubscribe subscribe(Callback callback) {
        std::lock_guard<std::mutex> lock(registry->mutex);
        const uint64_t id = registry->next_id++;
        registry->subscribers.emplace(id, std::make_shared<Callback>(std::move(callback)));

        std::weak_ptr<Registry> weak_registry = registry;
        return [weak_registry, id]() {
            if (auto r = weak_registry.lock()) {
                std::lock_guard<std::mutex> lock(r->mutex);
                r->subscribers.erase(id);
            }
        };
    }

    // Callbacks run on the publishing thread, outside the lock, so a
    // callback may unsubscribe itself.
    void publish(const Event& event) {
        std::vector<std::shared_ptr<Callback>> targets;
        {
            std::lock_guard<std::mutex> lock(registry->mutex);
            targets.reserve(registry->subscribers.size());
            for (const auto& [id, callback] : registry->subscribers) {
                targets.push_back(callback);
            }
        }
        for (const auto& callback : targets) {
            (*callback)(event);
        }
    }

    size_t subscriber_count() const {
        std::lock_guard<std::mutex> lock(registry->mutex);
        return registry->subscribers.size();
    }
};
