// QuickRoute - Price Cache
// Aggregated prices by pair key. Entries expire after the cache TTL and are
// only served while younger than the max stale time.

#pragma once

#include <quickroute/aggregation/types.hpp>
#include <quickroute/expiring_map.hpp>
#include <chrono>
#include <optional>
#include <string>

namespace quickroute::aggregation {

class PriceCache {
public:
    PriceCache(TimerQueue& timers, int64_t ttl_ms, int64_t max_stale_ms)
        : timers_(timers),
          entries_(timers, std::chrono::milliseconds(ttl_ms)),
          max_stale_ms_(max_stale_ms) {}

    /// Entry if present and fresh enough to serve
    [[nodiscard]] std::optional<AggregatedPrice> get(const std::string& pair) const {
        auto entry = entries_.get(pair);
        if (!entry || timers_.clock().now_ms() - entry->last_updated >= max_stale_ms_) {
            return std::nullopt;
        }
        return entry;
    }

    /// Entry regardless of staleness, for incremental patching
    [[nodiscard]] std::optional<AggregatedPrice> peek(const std::string& pair) const {
        return entries_.get(pair);
    }

    void put(const AggregatedPrice& price) { entries_.put(price.pair, price); }

    bool erase(const std::string& pair) { return entries_.erase(pair); }

    /// Drop entries whose last update is older than the TTL
    size_t purge_stale(int64_t now_ms) {
        auto ttl = entries_.ttl().count();
        return entries_.erase_if([now_ms, ttl](const std::string&, const AggregatedPrice& p) {
            return now_ms - p.last_updated > ttl;
        });
    }

    void clear() { entries_.clear(); }

    [[nodiscard]] size_t size() const { return entries_.size(); }

private:
    TimerQueue& timers_;
    ExpiringMap<AggregatedPrice> entries_;
    int64_t max_stale_ms_;
};

}  // namespace quickroute::aggregation
