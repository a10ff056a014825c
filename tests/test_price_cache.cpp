// QuickRoute - Price Cache and Aggregation Pipeline Tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <quickroute/aggregation/price_aggregator.hpp>
#include "support/fakes.hpp"

using namespace quickroute;
using namespace quickroute::aggregation;
using namespace std::chrono_literals;
using Catch::Approx;
using Reply = testing::FakeHttpChannel::Reply;

namespace {

AggregatedPrice aggregate_at(const std::string& pair, int64_t ts) {
    AggregatedPrice p;
    p.pair = pair;
    p.last_updated = ts;
    return p;
}

}  // namespace

TEST_CASE("PriceCache freshness", "[cache]") {
    auto clock = std::make_shared<ManualClock>();
    TimerQueue timers(clock);
    PriceCache cache(timers, 10000, 30000);

    cache.put(aggregate_at("1-a-b", clock->now_ms()));

    SECTION("Served inside the TTL") {
        clock->advance(9999ms);
        REQUIRE(cache.get("1-a-b").has_value());
    }

    SECTION("Gone once the TTL timer fires") {
        clock->advance(10000ms);
        timers.run_due();
        REQUIRE_FALSE(cache.get("1-a-b").has_value());
        REQUIRE(cache.size() == 0);
    }

    SECTION("Old aggregate never served even if freshly stored") {
        cache.put(aggregate_at("1-c-d", clock->now_ms() - 30000));
        REQUIRE_FALSE(cache.get("1-c-d").has_value());
        REQUIRE(cache.peek("1-c-d").has_value());
    }

    SECTION("Purge by age") {
        cache.put(aggregate_at("1-c-d", clock->now_ms() - 20000));
        REQUIRE(cache.purge_stale(clock->now_ms()) == 1);
        REQUIRE(cache.size() == 1);
    }
}

TEST_CASE("PriceAggregator pipeline", "[aggregation]") {
    auto clock = std::make_shared<ManualClock>();
    TimerQueue timers(clock);
    auto http = std::make_shared<testing::FakeHttpChannel>();
    AggregationEvents events;

    AggregatorConfig config;
    config.enabled_sources = {"uniswap_v3", "sushiswap", "curve"};
    config.retry_attempts = 1;
    config.outlier_detection = false;
    auto registry = SourceRegistry::from_config(Config{});
    PriceAggregator aggregator(config, *registry, http, timers, events);

    auto weth = testing::token("WETH");
    auto usdc = testing::token("USDC", 6);
    Amount one = amount::pow10(18);

    std::vector<ErrorEvent> errors;
    std::vector<AggregatedPrice> published;
    events.errors.subscribe([&](const ErrorEvent& e) { errors.push_back(e); });
    events.price_updates.subscribe([&](const AggregatedPrice& p) { published.push_back(p); });

    SECTION("Fresh aggregate then cache hit") {
        http->always("uniswap_v3", Reply::ok(testing::quote_body(2000.0, "2000000000")));
        http->always("sushiswap", Reply::ok(testing::quote_body(2003.0, "2003000000")));
        http->always("curve", Reply::timed_out());

        auto agg = aggregator.get_aggregated_price(weth, usdc, one);
        REQUIRE(agg.best.source == "sushiswap");
        REQUIRE(agg.valid_quotes.size() == 2);
        REQUIRE(errors.size() == 1);
        REQUIRE(errors[0].kind == ErrorKind::SourceTimeout);
        REQUIRE(published.size() == 1);

        auto again = aggregator.get_aggregated_price(weth, usdc, one);
        REQUIRE(again.best.source == "sushiswap");
        REQUIRE(http->calls("uniswap_v3") == 1);

        auto stats = aggregator.stats();
        REQUIRE(stats.cache_hits == 1);
        REQUIRE(stats.successful_requests == 2);
        REQUIRE(stats.failed_requests == 1);
        REQUIRE(stats.cache_size == 1);
    }

    SECTION("Every source failing raises NoValidPrices") {
        http->always("uniswap_v3", Reply::unreachable());
        http->always("sushiswap", Reply::status_only(500));
        http->always("curve", Reply::timed_out());

        REQUIRE_THROWS_AS(aggregator.get_aggregated_price(weth, usdc, one), NoValidPrices);
        REQUIRE(errors.size() == 4);
        REQUIRE(errors.back().kind == ErrorKind::NoValidPrices);
        REQUIRE(published.empty());
    }

    SECTION("Feed update patches the cached aggregate") {
        http->always("uniswap_v3", Reply::ok(testing::quote_body(2000.0, "2000000000")));
        http->always("sushiswap", Reply::ok(testing::quote_body(2003.0, "2003000000")));
        http->always("curve", Reply::ok(testing::quote_body(2001.0, "2001000000")));
        auto agg = aggregator.get_aggregated_price(weth, usdc, one);

        PriceUpdate update{"uniswap_v3", agg.pair, 2010.0, 2'010'000'000, std::nullopt, clock->now_ms()};
        REQUIRE(aggregator.apply_update(update));

        auto patched = aggregator.get_aggregated_price(weth, usdc, one);
        REQUIRE(patched.best.source == "uniswap_v3");
        REQUIRE(patched.best.price == Approx(2010.0));
        REQUIRE(published.size() == 2);
        REQUIRE(aggregator.stats().feed_updates == 1);

        PriceUpdate unknown{"uniswap_v3", "1-0xX-0xY", 1.0, 1, std::nullopt, clock->now_ms()};
        REQUIRE_FALSE(aggregator.apply_update(unknown));
    }

    SECTION("Invalid feed updates leave the aggregate untouched") {
        http->always("uniswap_v3", Reply::ok(testing::quote_body(2000.0, "2000000000")));
        http->always("sushiswap", Reply::ok(testing::quote_body(2003.0, "2003000000")));
        http->always("curve", Reply::ok(testing::quote_body(2001.0, "2001000000")));
        auto agg = aggregator.get_aggregated_price(weth, usdc, one);

        PriceUpdate negative{"uniswap_v3", agg.pair, -5.0, 9'000'000'000ULL, std::nullopt, clock->now_ms()};
        PriceUpdate empty{"uniswap_v3", agg.pair, 2010.0, 0, std::nullopt, clock->now_ms()};
        PriceUpdate drained{"uniswap_v3", agg.pair, 2010.0, 2'010'000'000, -1.0, clock->now_ms()};
        REQUIRE_FALSE(aggregator.apply_update(negative));
        REQUIRE_FALSE(aggregator.apply_update(empty));
        REQUIRE_FALSE(aggregator.apply_update(drained));

        REQUIRE(errors.size() == 3);
        REQUIRE(errors[0].kind == ErrorKind::InvalidPriceData);
        REQUIRE(errors[0].source == "uniswap_v3");
        REQUIRE(aggregator.stats().feed_updates == 0);
        REQUIRE(published.size() == 1);

        auto cached = aggregator.get_aggregated_price(weth, usdc, one);
        REQUIRE(cached.best.source == "sushiswap");
        REQUIRE(cached.spread.min == Approx(2000.0));
    }

    SECTION("Rate limited sources are skipped and reported") {
        AggregatorConfig curve_only = config;
        curve_only.enabled_sources = {"curve"};
        curve_only.cache_enabled = false;
        PriceAggregator strict(curve_only, *registry, http, timers, events);
        http->always("curve", Reply::ok(testing::quote_body(2001.0, "2001000000")));

        // Curve allows two requests per second
        REQUIRE_NOTHROW(strict.get_aggregated_price(weth, usdc, one));
        REQUIRE_NOTHROW(strict.get_aggregated_price(weth, usdc, one));
        REQUIRE_THROWS_AS(strict.get_aggregated_price(weth, usdc, one), NoValidPrices);
        REQUIRE(http->calls("curve") == 2);
        REQUIRE(errors.front().kind == ErrorKind::SourceRateLimited);
    }
}
