// QuickRoute - Configuration
// Builder pattern for fluent configuration

#pragma once

#include <quickroute/aggregation/types.hpp>
#include <quickroute/routing/types.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace quickroute {

namespace sources {
inline constexpr std::string_view UNISWAP_V3 = "uniswap_v3";
inline constexpr std::string_view JUPITER = "jupiter";
inline constexpr std::string_view SUSHISWAP = "sushiswap";
inline constexpr std::string_view CURVE = "curve";
inline constexpr std::string_view BALANCER = "balancer";
inline constexpr std::string_view PANCAKESWAP = "pancakeswap";
}  // namespace sources

struct GeneralConfig {
    std::string log_level = "info";
};

// Price aggregation settings
struct AggregatorConfig {
    int64_t update_interval_ms = 5000;
    int64_t max_stale_time_ms = 30000;
    bool feeds_enabled = true;
    bool cache_enabled = true;
    int64_t cache_ttl_ms = 10000;
    size_t max_concurrent_requests = 10;
    int64_t timeout_ms = 5000;
    int retry_attempts = 3;
    int64_t retry_base_delay_ms = 1000;
    bool outlier_detection = true;
    double arbitrage_threshold = 0.5;    // percent
    double min_liquidity = 10000.0;      // USD
    double arbitrage_fee_buffer = 0.6;   // percent taken off the spread
    int max_reconnect_attempts = 5;
    int64_t heartbeat_timeout_ms = 30000;
    std::vector<std::string> enabled_sources = {
        std::string(sources::UNISWAP_V3), std::string(sources::JUPITER),
        std::string(sources::SUSHISWAP), std::string(sources::CURVE),
        std::string(sources::BALANCER), std::string(sources::PANCAKESWAP)
    };
};

// Weights of the balanced objective; each term is normalized to 0..1
struct BalancedWeights {
    double output = 0.4;
    double gas = 0.2;
    double speed = 0.2;
    double confidence = 0.1;
    double risk = 0.1;
    double gas_ceiling = 500000.0;
    double time_ceiling_s = 60.0;
};

// Route optimization settings
struct RoutingConfig {
    routing::OptimizeFor optimize_for = routing::OptimizeFor::Balanced;
    int max_hops = 3;
    size_t max_routes = 10;
    bool use_multi_path = true;
    bool include_stablecoin_routes = true;
    double min_liquidity_usd = 10000.0;
    std::vector<std::string> stablecoins = {"USDC", "USDT", "DAI", "BUSD", "FRAX", "UST"};
    uint64_t gas_per_hop = 50000;
    BalancedWeights weights;
    double min_arbitrage_profit = 0.01;     // fraction, 0.01 = 1%
    double low_risk_tvl = 10'000'000.0;
    double medium_risk_tvl = 1'000'000.0;
    int64_t route_cache_ttl_ms = 30000;
    size_t history_size = 100;
    double large_order_threshold = 100000.0;
    double max_split_size = 50000.0;
    int64_t split_time_penalty_s = 5;
    double split_risk_reduction = 10.0;
    double service_fee_rate = 0.0033;
};

// Per-source overrides; unset fields keep the registry defaults
struct SourceConfig {
    std::string id;
    std::optional<std::string> name;
    std::optional<std::string> api_endpoint;
    std::optional<std::string> feed_url;
    std::optional<size_t> rate_limit;
    std::optional<int64_t> window_ms;
    std::optional<double> reliability;
    std::optional<bool> active;
    std::vector<uint64_t> supported_chains;
    std::map<std::string, std::string> headers;

    SourceConfig() = default;

    static SourceConfig create(std::string_view id) {
        SourceConfig cfg;
        cfg.id = std::string(id);
        return cfg;
    }

    SourceConfig& with_endpoint(std::string_view url) {
        api_endpoint = std::string(url);
        return *this;
    }

    SourceConfig& with_feed(std::string_view url) {
        feed_url = std::string(url);
        return *this;
    }

    SourceConfig& with_rate_limit(size_t limit, int64_t window = 1000) {
        rate_limit = limit;
        window_ms = window;
        return *this;
    }

    SourceConfig& with_reliability(double r) {
        reliability = r;
        return *this;
    }

    SourceConfig& with_chains(std::vector<uint64_t> chains) {
        supported_chains = std::move(chains);
        return *this;
    }

    SourceConfig& with_header(std::string_view key, std::string_view value) {
        headers[std::string(key)] = std::string(value);
        return *this;
    }

    SourceConfig& disable() {
        active = false;
        return *this;
    }

    /// Apply the set fields on top of `base`
    [[nodiscard]] aggregation::SourceInfo apply(aggregation::SourceInfo base) const;
};

class Config {
public:
    GeneralConfig general;
    AggregatorConfig aggregator;
    RoutingConfig routing;
    std::unordered_map<std::string, SourceConfig> sources;

    Config() = default;

    // Load from TOML file
    static Config from_file(std::string_view path);

    // Load from TOML string
    static Config from_toml(std::string_view content);

    // Builder methods
    Config& with_source(SourceConfig cfg) {
        std::string id = cfg.id;
        sources[id] = std::move(cfg);
        return *this;
    }

    Config& set_log_level(std::string_view level) {
        general.log_level = std::string(level);
        return *this;
    }

    Config& set_enabled_sources(std::vector<std::string> ids) {
        aggregator.enabled_sources = std::move(ids);
        return *this;
    }

    Config& set_timeout(int64_t ms) {
        aggregator.timeout_ms = ms;
        return *this;
    }

    Config& set_retry(int attempts, int64_t base_delay_ms = 1000) {
        aggregator.retry_attempts = attempts;
        aggregator.retry_base_delay_ms = base_delay_ms;
        return *this;
    }

    Config& set_cache(bool enabled, int64_t ttl_ms, int64_t max_stale_ms) {
        aggregator.cache_enabled = enabled;
        aggregator.cache_ttl_ms = ttl_ms;
        aggregator.max_stale_time_ms = max_stale_ms;
        return *this;
    }

    Config& enable_feeds(bool enabled = true) {
        aggregator.feeds_enabled = enabled;
        return *this;
    }

    Config& enable_outlier_detection(bool enabled = true) {
        aggregator.outlier_detection = enabled;
        return *this;
    }

    Config& set_arbitrage_threshold(double pct) {
        aggregator.arbitrage_threshold = pct;
        return *this;
    }

    Config& set_min_liquidity(double usd) {
        aggregator.min_liquidity = usd;
        return *this;
    }

    Config& optimize_for(routing::OptimizeFor objective) {
        routing.optimize_for = objective;
        return *this;
    }

    Config& set_max_hops(int hops) {
        routing.max_hops = hops;
        return *this;
    }

    Config& set_max_routes(size_t n) {
        routing.max_routes = n;
        return *this;
    }

    Config& enable_stablecoin_routes(bool enabled = true) {
        routing.include_stablecoin_routes = enabled;
        return *this;
    }
};

}  // namespace quickroute
