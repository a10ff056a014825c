// QuickRoute - Aggregator and Arbitrage Detector Tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <quickroute/aggregation/aggregator.hpp>
#include <quickroute/errors.hpp>
#include "support/fakes.hpp"

using namespace quickroute;
using namespace quickroute::aggregation;
using Catch::Approx;

namespace {

const int64_t NOW = 1'700'000'000'000LL;

PriceData quote(const std::string& source, double price, Amount out,
                double liquidity = 1'000'000.0, int64_t timestamp = NOW) {
    PriceData q;
    q.source = source;
    q.token_in = testing::token("WETH");
    q.token_out = testing::token("USDC", 6);
    q.price = price;
    q.amount_out = out;
    q.price_impact = 0.1;
    q.liquidity = liquidity;
    q.gas_estimate = 150000;
    q.timestamp = timestamp;
    q.confidence = 95.0;
    return q;
}

QuoteRequest request() {
    return QuoteRequest{testing::token("WETH"), testing::token("USDC", 6), amount::pow10(18)};
}

}  // namespace

TEST_CASE("Spread statistics", "[aggregator]") {
    SECTION("Odd count") {
        auto s = compute_spread({3.0, 1.0, 2.0});
        REQUIRE(s.min == Approx(1.0));
        REQUIRE(s.max == Approx(3.0));
        REQUIRE(s.median == Approx(2.0));
        REQUIRE(s.mean == Approx(2.0));
        REQUIRE(s.std_dev == Approx(0.816497).epsilon(1e-5));
    }

    SECTION("Even count averages the middle pair") {
        auto s = compute_spread({1.0, 2.0, 3.0, 10.0});
        REQUIRE(s.median == Approx(2.5));
    }

    SECTION("Empty") {
        auto s = compute_spread({});
        REQUIRE(s.max == 0.0);
        REQUIRE(s.std_dev == 0.0);
    }
}

TEST_CASE("Arbitrage threshold", "[aggregator][arbitrage]") {
    ArbitrageDetector detector(ArbitrageParams{0.5, 10000.0, 0.6, 1000});

    SECTION("Reported only at or above the threshold") {
        REQUIRE(detector.scan({quote("a", 100.0, 1), quote("b", 100.6, 1)}, NOW).size() == 1);
        REQUIRE(detector.scan({quote("a", 100.0, 1), quote("b", 100.4, 1)}, NOW).empty());
    }

    SECTION("Buy side is the cheaper source") {
        auto opps = detector.scan({quote("b", 102.0, 1), quote("a", 100.0, 1)}, NOW);
        REQUIRE(opps.size() == 1);
        REQUIRE(opps[0].buy_source == "a");
        REQUIRE(opps[0].sell_source == "b");
        REQUIRE(opps[0].spread_pct == Approx(2.0));
        REQUIRE(opps[0].profit_margin == Approx(1.4));
        REQUIRE(opps[0].volume == Approx(1'000'000.0));
        REQUIRE(opps[0].gas_estimate == 300000);
        REQUIRE(opps[0].timestamp == NOW);
    }

    SECTION("Same source never pairs with itself") {
        REQUIRE(detector.scan({quote("a", 100.0, 1), quote("a", 110.0, 1)}, NOW).empty());
    }

    SECTION("Thin liquidity excluded") {
        REQUIRE(detector.scan({quote("a", 100.0, 1), quote("b", 110.0, 1, 5000.0)}, NOW).empty());
    }

    SECTION("Sorted by profit margin") {
        auto opps = detector.scan({quote("a", 100.0, 1), quote("b", 101.0, 1), quote("c", 105.0, 1)}, NOW);
        REQUIRE(opps.size() == 3);
        REQUIRE(opps[0].buy_source == "a");
        REQUIRE(opps[0].sell_source == "c");
        REQUIRE(opps[0].profit_margin >= opps[1].profit_margin);
        REQUIRE(opps[1].profit_margin >= opps[2].profit_margin);
    }
}

TEST_CASE("Arbitrage risk score", "[aggregator][arbitrage]") {
    auto buy = quote("a", 100.0, 1);
    auto sell = quote("b", 101.0, 1);

    SECTION("Deep, confident, cheap") {
        REQUIRE(ArbitrageDetector::risk_score(buy, sell) == Approx(30.0));
    }

    SECTION("Every penalty caps at 100") {
        buy.liquidity = 20000.0;
        sell.price_impact = 6.0;
        buy.confidence = 50.0;
        buy.gas_estimate = 400000;
        REQUIRE(ArbitrageDetector::risk_score(buy, sell) == Approx(100.0));
    }

    SECTION("Moderate liquidity") {
        buy.liquidity = 75000.0;
        REQUIRE(ArbitrageDetector::risk_score(buy, sell) == Approx(50.0));
    }
}

TEST_CASE("Aggregate quotes", "[aggregator]") {
    Aggregator aggregator(AggregatorParams{});

    SECTION("Best is the largest output among survivors") {
        auto agg = aggregator.aggregate(request(),
            {quote("a", 2000.0, 2000), quote("b", 2010.0, 2010), quote("c", 2005.0, 2005)}, NOW);
        REQUIRE(agg.best.source == "b");
        REQUIRE(agg.valid_quotes.size() == 3);
        REQUIRE(agg.pair == pair_key(testing::token("WETH"), testing::token("USDC", 6)));
        REQUIRE(agg.last_updated == NOW);
    }

    SECTION("Outlier cannot win even with the largest output") {
        auto agg = aggregator.aggregate(request(),
            {quote("a", 100.0, 100), quote("b", 102.0, 102), quote("c", 1000.0, 1000)}, NOW);
        REQUIRE(agg.best.source == "b");
        REQUIRE(agg.valid_quotes.size() == 2);
        REQUIRE(agg.all_quotes.size() == 3);
        REQUIRE(agg.spread.max == Approx(102.0));
        REQUIRE(agg.arbitrage.size() == 1);
        REQUIRE(agg.arbitrage[0].buy_source == "a");
        REQUIRE(agg.arbitrage[0].sell_source == "b");
    }

    SECTION("Stale quotes set aside") {
        auto agg = aggregator.aggregate(request(),
            {quote("a", 2000.0, 2000), quote("b", 2100.0, 2100, 1e6, NOW - 31000)}, NOW);
        REQUIRE(agg.best.source == "a");
        REQUIRE(agg.stale_quotes.size() == 1);
        REQUIRE(agg.stale_quotes[0].source == "b");
    }

    SECTION("Nothing usable") {
        REQUIRE_THROWS_AS(aggregator.aggregate(request(), {}, NOW), NoValidPrices);
        REQUIRE_THROWS_AS(aggregator.aggregate(request(),
            {quote("a", 2000.0, 2000, 1e6, NOW - 60000)}, NOW), NoValidPrices);
    }

    SECTION("Outlier detection off keeps everything") {
        AggregatorParams params;
        params.outlier_detection = false;
        Aggregator lenient(params);
        auto agg = lenient.aggregate(request(),
            {quote("a", 100.0, 100), quote("b", 102.0, 102), quote("c", 1000.0, 1000)}, NOW);
        REQUIRE(agg.best.source == "c");
    }
}
