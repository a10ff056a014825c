// QuickRoute - Route Cache

#pragma once

#include <quickroute/expiring_map.hpp>
#include <quickroute/routing/types.hpp>
#include <atomic>
#include <optional>
#include <string>
#include <vector>

namespace quickroute::routing {

class RouteCache {
public:
    RouteCache(TimerQueue& timers, std::chrono::milliseconds ttl)
        : entries_(timers, ttl) {}

    /// "<chain>-<in>-<out>-<amount>"
    static std::string key(const Token& in, const Token& out, Amount amount_in) {
        return pair_key(in, out) + "-" + amount::to_string(amount_in);
    }

    [[nodiscard]] std::optional<std::vector<OptimizedRoute>> get(const std::string& key) {
        auto routes = entries_.get(key);
        if (routes) {
            hits_.fetch_add(1);
        } else {
            misses_.fetch_add(1);
        }
        return routes;
    }

    void put(const std::string& key, std::vector<OptimizedRoute> routes) {
        entries_.put(key, std::move(routes));
    }

    void clear() { entries_.clear(); }

    [[nodiscard]] size_t size() const { return entries_.size(); }

    [[nodiscard]] double hit_rate() const noexcept {
        auto hits = hits_.load();
        auto total = hits + misses_.load();
        return total > 0 ? static_cast<double>(hits) / static_cast<double>(total) : 0.0;
    }

private:
    ExpiringMap<std::vector<OptimizedRoute>> entries_;
    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
};

}  // namespace quickroute::routing
