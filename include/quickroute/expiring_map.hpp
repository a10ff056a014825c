// QuickRoute - Expiring Map
// Keyed store whose entries are dropped by a timer once their TTL elapses.
// Lookups also check the deadline, so expiry holds even while the timer
// queue is not being driven.

#pragma once

#include <quickroute/timer_queue.hpp>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace quickroute {

template <typename Value>
class ExpiringMap {
public:
    ExpiringMap(TimerQueue& timers, std::chrono::milliseconds ttl)
        : timers_(timers), ttl_(ttl) {}

    ~ExpiringMap() { clear(); }

    ExpiringMap(const ExpiringMap&) = delete;
    ExpiringMap& operator=(const ExpiringMap&) = delete;

    /// Insert or replace; a replaced entry's expiry timer is cancelled
    void put(const std::string& key, Value value) {
        int64_t expires_at = timers_.clock().now_ms() + ttl_.count();

        std::lock_guard<std::mutex> lock(mutex_);
        uint64_t generation = ++generation_;
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            timers_.cancel(it->second.timer);
        }

        TimerId timer = timers_.schedule_at(expires_at, [this, key, generation] {
            std::lock_guard<std::mutex> guard(mutex_);
            auto found = entries_.find(key);
            if (found != entries_.end() && found->second.generation == generation) {
                entries_.erase(found);
            }
        });
        entries_[key] = Entry{std::move(value), expires_at, generation, timer};
    }

    [[nodiscard]] std::optional<Value> get(const std::string& key) const {
        int64_t now = timers_.clock().now_ms();

        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end() || now >= it->second.expires_at) {
            return std::nullopt;
        }
        return it->second.value;
    }

    bool erase(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return false;
        }
        timers_.cancel(it->second.timer);
        entries_.erase(it);
        return true;
    }

    /// Remove every entry for which pred(key, value) holds
    template <typename Pred>
    size_t erase_if(Pred pred) {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t removed = 0;
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (pred(it->first, it->second.value)) {
                timers_.cancel(it->second.timer);
                it = entries_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [key, entry] : entries_) {
            timers_.cancel(entry.timer);
        }
        entries_.clear();
    }

    [[nodiscard]] size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    [[nodiscard]] std::vector<std::string> keys() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> out;
        out.reserve(entries_.size());
        for (const auto& [key, entry] : entries_) {
            out.push_back(key);
        }
        return out;
    }

    [[nodiscard]] std::chrono::milliseconds ttl() const noexcept { return ttl_; }

private:
    struct Entry {
        Value value;
        int64_t expires_at = 0;
        uint64_t generation = 0;
        TimerId timer = 0;
    };

    TimerQueue& timers_;
    std::chrono::milliseconds ttl_;
    std::unordered_map<std::string, Entry> entries_;
    uint64_t generation_ = 0;
    mutable std::mutex mutex_;
};

}  // namespace quickroute
