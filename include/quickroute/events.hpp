// QuickRoute - Event Channels
// Observer lists where a failing listener never affects the others

#pragma once

#include <spdlog/spdlog.h>
#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace quickroute {

using SubscriptionId = uint64_t;

// Unique across every channel, so one id names one listener anywhere
inline SubscriptionId next_subscription_id() {
    static std::atomic<SubscriptionId> next{1};
    return next.fetch_add(1);
}

template <typename Event>
class EventChannel {
public:
    using Listener = std::function<void(const Event&)>;

    explicit EventChannel(std::string name) : name_(std::move(name)) {}

    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    SubscriptionId subscribe(Listener listener) {
        std::lock_guard<std::mutex> lock(mutex_);
        SubscriptionId id = next_subscription_id();
        listeners_.emplace_back(id, std::move(listener));
        return id;
    }

    bool unsubscribe(SubscriptionId id) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = listeners_.begin(); it != listeners_.end(); ++it) {
            if (it->first == id) {
                listeners_.erase(it);
                return true;
            }
        }
        return false;
    }

    /// Deliver to every listener; returns the number that threw
    size_t publish(const Event& event) const {
        std::vector<std::pair<SubscriptionId, Listener>> snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            snapshot = listeners_;
        }

        size_t failures = 0;
        for (const auto& [id, listener] : snapshot) {
            try {
                listener(event);
            } catch (const std::exception& e) {
                ++failures;
                spdlog::error("{} listener {} failed: {}", name_, id, e.what());
            } catch (...) {
                ++failures;
                spdlog::error("{} listener {} threw a non-standard exception", name_, id);
            }
        }
        return failures;
    }

    [[nodiscard]] size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return listeners_.size();
    }

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

private:
    std::string name_;
    std::vector<std::pair<SubscriptionId, Listener>> listeners_;
    mutable std::mutex mutex_;
};

}  // namespace quickroute
