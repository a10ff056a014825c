// QuickRoute - Price Aggregator
// Cache-first aggregation pipeline: admit, fetch, validate, filter, aggregate, publish

#pragma once

#include <quickroute/aggregation/aggregator.hpp>
#include <quickroute/aggregation/price_cache.hpp>
#include <quickroute/aggregation/quote_fetcher.hpp>
#include <quickroute/aggregation/source_registry.hpp>
#include <quickroute/config.hpp>
#include <quickroute/events.hpp>
#include <memory>
#include <mutex>

namespace quickroute::aggregation {

struct AggregationEvents {
    EventChannel<AggregatedPrice> price_updates{"price_update"};
    EventChannel<ArbitrageOpportunity> arbitrage{"arbitrage"};
    EventChannel<ErrorEvent> errors{"error"};
};

struct AggregatorStats {
    uint64_t total_requests = 0;
    uint64_t successful_requests = 0;
    uint64_t failed_requests = 0;
    uint64_t cache_hits = 0;
    uint64_t feed_updates = 0;
    uint64_t arbitrage_opportunities = 0;
    double average_response_ms = 0.0;
    size_t cache_size = 0;
};

class PriceAggregator {
public:
    PriceAggregator(AggregatorConfig config, SourceRegistry& registry,
                    std::shared_ptr<HttpChannel> http, TimerQueue& timers,
                    AggregationEvents& events);

    PriceAggregator(const PriceAggregator&) = delete;
    PriceAggregator& operator=(const PriceAggregator&) = delete;

    /// Serve from cache when fresh, else fan out to every enabled source.
    /// Per-source failures go to the error channel; throws NoValidPrices
    /// only when no quote survives.
    AggregatedPrice get_aggregated_price(const Token& token_in, const Token& token_out, Amount amount_in);

    /// Patch the cached aggregate with a pushed quote, recompute and republish.
    /// Returns false when there is nothing cached for the pair or source.
    bool apply_update(const PriceUpdate& update);

    /// Drop cache entries older than the cache TTL
    size_t purge_stale();

    void clear_cache();

    [[nodiscard]] AggregatorStats stats() const;
    [[nodiscard]] const AggregatorConfig& config() const noexcept { return config_; }

private:
    void publish(const AggregatedPrice& price);
    void report(const ErrorEvent& error);

    AggregatorConfig config_;
    SourceRegistry& registry_;
    TimerQueue& timers_;
    AggregationEvents& events_;
    QuoteFetcher fetcher_;
    Aggregator aggregator_;
    PriceCache cache_;
    AggregatorStats stats_;
    uint64_t timed_responses_ = 0;
    mutable std::mutex stats_mutex_;
};

}  // namespace quickroute::aggregation
