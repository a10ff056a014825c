// QuickRoute - Configuration Tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <quickroute/config.hpp>
#include <quickroute/errors.hpp>

using namespace quickroute;
using Catch::Approx;

TEST_CASE("Config defaults", "[config]") {
    Config cfg;

    REQUIRE(cfg.aggregator.update_interval_ms == 5000);
    REQUIRE(cfg.aggregator.max_stale_time_ms == 30000);
    REQUIRE(cfg.aggregator.arbitrage_threshold == Approx(0.5));
    REQUIRE(cfg.aggregator.max_reconnect_attempts == 5);
    REQUIRE(cfg.aggregator.enabled_sources.size() == 6);

    REQUIRE(cfg.routing.optimize_for == routing::OptimizeFor::Balanced);
    REQUIRE(cfg.routing.max_hops == 3);
    REQUIRE(cfg.routing.max_routes == 10);
    REQUIRE(cfg.routing.service_fee_rate == Approx(0.0033));
}

TEST_CASE("Config builder", "[config]") {
    auto cfg = Config()
        .set_timeout(2000)
        .set_retry(2, 250)
        .set_cache(false, 1000, 5000)
        .enable_feeds(false)
        .optimize_for(routing::OptimizeFor::Gas)
        .set_max_hops(2)
        .with_source(SourceConfig::create("curve").with_rate_limit(2, 500).disable());

    REQUIRE(cfg.aggregator.timeout_ms == 2000);
    REQUIRE(cfg.aggregator.retry_attempts == 2);
    REQUIRE(cfg.aggregator.retry_base_delay_ms == 250);
    REQUIRE_FALSE(cfg.aggregator.cache_enabled);
    REQUIRE_FALSE(cfg.aggregator.feeds_enabled);
    REQUIRE(cfg.routing.optimize_for == routing::OptimizeFor::Gas);
    REQUIRE(cfg.routing.max_hops == 2);

    REQUIRE(cfg.sources.count("curve") == 1);
    auto info = cfg.sources["curve"].apply(aggregation::SourceInfo{});
    REQUIRE(info.id == "curve");
    REQUIRE(info.rate_limit == 2);
    REQUIRE(info.window_ms == 500);
    REQUIRE_FALSE(info.active);
}

TEST_CASE("Config from TOML", "[config]") {
    SECTION("All sections") {
        auto cfg = Config::from_toml(R"(
# engine settings
[general]
log_level = "debug"

[aggregator]
update_interval_ms = 2500
outlier_detection = false   # keep every quote
enabled_sources = ["uniswap_v3", "curve"]
arbitrage_threshold = 1.25

[routing]
optimize_for = "price"
max_hops = 2
stablecoins = ["USDC", "DAI"]

[routing.weights]
output = 0.7
gas = 0.1

[sources.curve]
api_endpoint = "https://curve.example/api"
rate_limit = 3
supported_chains = [1, 137]
)");

        REQUIRE(cfg.general.log_level == "debug");
        REQUIRE(cfg.aggregator.update_interval_ms == 2500);
        REQUIRE_FALSE(cfg.aggregator.outlier_detection);
        REQUIRE(cfg.aggregator.enabled_sources == std::vector<std::string>{"uniswap_v3", "curve"});
        REQUIRE(cfg.aggregator.arbitrage_threshold == Approx(1.25));
        REQUIRE(cfg.routing.optimize_for == routing::OptimizeFor::Price);
        REQUIRE(cfg.routing.max_hops == 2);
        REQUIRE(cfg.routing.stablecoins.size() == 2);
        REQUIRE(cfg.routing.weights.output == Approx(0.7));
        REQUIRE(cfg.routing.weights.gas == Approx(0.1));

        const auto& curve = cfg.sources.at("curve");
        REQUIRE(curve.api_endpoint == std::optional<std::string>("https://curve.example/api"));
        REQUIRE(curve.rate_limit == std::optional<size_t>(3));
        REQUIRE(curve.supported_chains == std::vector<uint64_t>{1, 137});
    }

    SECTION("Unknown objective") {
        REQUIRE_THROWS_AS(Config::from_toml("[routing]\noptimize_for = \"vibes\"\n"), ConfigError);
    }

    SECTION("Malformed numbers") {
        REQUIRE_THROWS_AS(Config::from_toml("[aggregator]\ntimeout_ms = soon\n"), ConfigError);
        REQUIRE_THROWS_AS(Config::from_toml("[aggregator]\ncache_enabled = yes\n"), ConfigError);
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(Config::from_file("/nonexistent/quickroute.toml"), ConfigError);
    }
}
