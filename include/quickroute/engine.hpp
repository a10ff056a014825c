// QuickRoute - Engine
// Public entry point: aggregated prices, optimal routes and event subscriptions

#pragma once

#include <quickroute/aggregation/feed_manager.hpp>
#include <quickroute/aggregation/price_aggregator.hpp>
#include <quickroute/aggregation/source_registry.hpp>
#include <quickroute/clock.hpp>
#include <quickroute/config.hpp>
#include <quickroute/events.hpp>
#include <quickroute/routing/route_optimizer.hpp>
#include <quickroute/timer_queue.hpp>
#include <atomic>
#include <functional>
#include <memory>
#include <optional>

namespace quickroute {

// Transport and time seams; unset members get the production implementations
struct EngineDependencies {
    std::shared_ptr<Clock> clock;
    std::shared_ptr<aggregation::HttpChannel> http;
    aggregation::FeedChannelFactory feeds;
    bool drive_timers = true;   // run the timer queue on a background thread after start()
};

struct EngineStats {
    aggregation::AggregatorStats aggregation;
    routing::OptimizerMetrics routing;
    size_t active_feeds = 0;
    size_t total_feeds = 0;
};

class Engine {
public:
    explicit Engine(Config config);
    Engine(Config config, EngineDependencies deps);
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    /// Connect feeds and schedule periodic maintenance
    void start();

    /// Stop maintenance and close every feed
    void stop();

    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }

    /// Run due timers on the calling thread; returns how many ran
    size_t poll();

    // Aggregation

    aggregation::AggregatedPrice get_aggregated_price(const Token& token_in, const Token& token_out,
                                                      Amount amount_in);

    // Routing

    void load_pools(std::vector<LiquidityPool> pools);

    std::vector<routing::OptimizedRoute> find_optimal_routes(
        const Token& token_in, const Token& token_out, Amount amount_in,
        const std::vector<PriceData>& quotes = {});

    routing::SplitExecutionPlan find_optimal_route_for_large_volume(
        const Token& token_in, const Token& token_out, Amount amount_in,
        const std::vector<PriceData>& quotes = {},
        std::optional<double> input_price_usd = std::nullopt);

    void record_route_outcome(const routing::OptimizedRoute& route, bool success);

    // Events

    SubscriptionId on_price_update(std::function<void(const aggregation::AggregatedPrice&)> listener);
    SubscriptionId on_arbitrage_opportunity(std::function<void(const aggregation::ArbitrageOpportunity&)> listener);
    SubscriptionId on_error(std::function<void(const ErrorEvent&)> listener);
    bool unsubscribe(SubscriptionId id);

    /// Purge stale cache entries and heartbeat the feeds
    void run_maintenance();

    void clear_cache();

    [[nodiscard]] EngineStats stats() const;
    [[nodiscard]] const Config& config() const noexcept { return config_; }
    [[nodiscard]] aggregation::SourceRegistry& sources() noexcept { return *registry_; }
    [[nodiscard]] aggregation::FeedManager& feeds() noexcept { return *feeds_; }
    [[nodiscard]] routing::RouteOptimizer& router() noexcept { return *optimizer_; }
    [[nodiscard]] Clock& clock() const noexcept { return *clock_; }

private:
    void schedule_maintenance();

    Config config_;
    std::shared_ptr<Clock> clock_;
    bool drive_timers_;
    TimerQueue timers_;
    aggregation::AggregationEvents events_;
    std::unique_ptr<aggregation::SourceRegistry> registry_;
    std::unique_ptr<aggregation::PriceAggregator> aggregator_;
    std::unique_ptr<routing::RouteOptimizer> optimizer_;
    std::unique_ptr<aggregation::FeedManager> feeds_;
    std::optional<TimerId> maintenance_timer_;
    std::mutex maintenance_mutex_;
    std::atomic<bool> running_{false};
};

}  // namespace quickroute
