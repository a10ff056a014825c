// QuickRoute - Liquidity Graph, Path Finder and Route Builder Tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <quickroute/errors.hpp>
#include <quickroute/routing/liquidity_graph.hpp>
#include <quickroute/routing/path_finder.hpp>
#include <quickroute/routing/route_builder.hpp>
#include <nlohmann/json.hpp>
#include "support/fakes.hpp"

using namespace quickroute;
using namespace quickroute::routing;
using Catch::Approx;

namespace {

struct Market {
    Token weth = testing::token("WETH");
    Token usdc = testing::token("USDC", 6);
    Token usdt = testing::token("USDT", 6);
    Token dai = testing::token("DAI");
    Token link = testing::token("LINK");

    LiquidityGraph graph{{
        testing::pool("p-weth-usdc", weth, usdc, 1000, 2'000'000, "uniswap_v3"),
        testing::pool("p-weth-usdt", weth, usdt, 500, 1'000'000, "sushiswap"),
        testing::pool("p-usdc-usdt", usdc, usdt, 5'000'000, 5'000'000, "curve"),
        testing::pool("p-weth-link", weth, link, 100, 14'000, "uniswap_v3"),
        testing::pool("p-link-usdc", link, usdc, 10'000, 140'000, "sushiswap"),
        testing::pool("p-usdc-dai", usdc, dai, 3'000'000, 3'000'000, "curve"),
        testing::pool("p-weth-dai-thin", weth, dai, 1, 2000, "pancakeswap", 4000.0),
    }};

    PathOptions options() const {
        PathOptions o;
        o.max_hops = 3;
        o.max_paths = 10;
        return o;
    }
};

std::vector<std::string> addresses(const PoolPath& path) {
    std::vector<std::string> out;
    for (const auto* p : path) out.push_back(p->address);
    return out;
}

}  // namespace

TEST_CASE("Liquidity graph indexing", "[graph]") {
    Market m;
    REQUIRE(m.graph.pool_count() == 7);
    REQUIRE(m.graph.token_count() == 5);
    REQUIRE(m.graph.pools_for(m.weth.address).size() == 4);
    REQUIRE(m.graph.pools_for("0xNOPE").empty());
    REQUIRE(m.graph.find("p-usdc-dai")->source == "curve");
    REQUIRE(m.graph.find("missing") == nullptr);
}

TEST_CASE("Pool snapshot parsing", "[graph]") {
    SECTION("Object form with string reserves") {
        auto pools = LiquidityGraph::parse_pools(nlohmann::json::parse(R"({
            "pools": [{
                "address": "0xpool",
                "token0": {"address": "0xa", "symbol": "USDC", "decimals": 6},
                "token1": {"address": "0xb", "symbol": "WETH"},
                "reserve0": "2000000000000",
                "reserve1": "1000000000000000000000",
                "fee": 0.0005,
                "source": "uniswap_v3",
                "tvl_usd": 4000000
            }]
        })"));
        REQUIRE(pools.size() == 1);
        REQUIRE(pools[0].token0.decimals == 6);
        REQUIRE(pools[0].token1.decimals == 18);
        REQUIRE(pools[0].reserve1 == amount::parse("1000000000000000000000"));
        REQUIRE(pools[0].fee_pips == 500);
        REQUIRE(pools[0].tvl_usd == Approx(4e6));
    }

    SECTION("Bad entries") {
        REQUIRE_THROWS_AS(LiquidityGraph::parse_pools(nlohmann::json::parse(R"([{"address": "x"}])")),
                          ConfigError);
        REQUIRE_THROWS_AS(LiquidityGraph::parse_pools(nlohmann::json::parse(R"({"pools": 3})")),
                          ConfigError);
        REQUIRE_THROWS_AS(LiquidityGraph::load_file("/nonexistent/pools.json"), ConfigError);
    }
}

TEST_CASE("Path search", "[paths]") {
    Market m;

    SECTION("Stablecoin intermediates only") {
        PathFinder finder(m.graph, m.options());
        auto paths = finder.find(m.weth, m.usdc);

        REQUIRE(paths.size() == 2);
        REQUIRE(addresses(paths[0]) == std::vector<std::string>{"p-weth-usdc"});
        REQUIRE(addresses(paths[1]) == std::vector<std::string>{"p-weth-usdt", "p-usdc-usdt"});
    }

    SECTION("Any intermediate when the restriction is off") {
        auto options = m.options();
        options.stablecoin_intermediates = false;
        PathFinder finder(m.graph, options);
        auto paths = finder.find(m.weth, m.usdc);

        REQUIRE(paths.size() == 3);
        REQUIRE(paths[0].size() == 1);
        for (const auto& path : paths) {
            REQUIRE(path.size() <= 3);
            REQUIRE(addresses(path) != std::vector<std::string>{"p-weth-dai-thin", "p-usdc-dai"});
        }
    }

    SECTION("Hop and path limits") {
        auto options = m.options();
        options.max_hops = 1;
        REQUIRE(PathFinder(m.graph, options).find(m.weth, m.usdc).size() == 1);

        options = m.options();
        options.max_paths = 1;
        REQUIRE(PathFinder(m.graph, options).find(m.weth, m.usdc).size() == 1);
    }

    SECTION("Thin pools are not traversed") {
        PathFinder finder(m.graph, m.options());
        auto paths = finder.find(m.weth, m.dai);
        REQUIRE(paths.size() == 2);
        for (const auto& path : paths) {
            REQUIRE(path.front()->address != "p-weth-dai-thin");
            REQUIRE(path.back()->address == "p-usdc-dai");
        }
    }

    SECTION("Same token or unknown token") {
        PathFinder finder(m.graph, m.options());
        REQUIRE(finder.find(m.weth, m.weth).empty());
        REQUIRE(finder.find(m.weth, testing::token("UNI")).empty());
    }

    SECTION("Stablecoin symbols match case-insensitively") {
        PathFinder finder(m.graph, m.options());
        REQUIRE(finder.is_stablecoin(Token{"0x1", "usdc", 1, 6}));
        REQUIRE_FALSE(finder.is_stablecoin(m.link));
    }
}

TEST_CASE("Route building", "[paths]") {
    Market m;
    RouteBuilder builder(50000);
    PathFinder finder(m.graph, m.options());
    auto paths = finder.find(m.weth, m.usdc);
    Amount one_eth = amount::pow10(18);

    SECTION("Multi-hop replay through the AMM") {
        auto route = builder.from_path(paths[1], m.weth, one_eth);
        REQUIRE(route.has_value());
        REQUIRE(route->kind == RouteKind::MultiHop);
        REQUIRE(route->hop_count() == 2);
        REQUIRE(route->steps[0].token_out == m.usdt);
        REQUIRE(route->steps[1].amount_in == route->steps[0].amount_out);
        REQUIRE(route->estimated_output == route->steps[1].amount_out);
        REQUIRE(route->total_gas == 100000);
        REQUIRE(route->total_fee == Approx(0.006));
        REQUIRE(route->confidence == Approx(90.0));
        REQUIRE(route->estimated_time_s == 35);
        REQUIRE(route->signature() == "sushiswap-curve");

        double out = amount::to_units(route->estimated_output, 6);
        REQUIRE(out > 1950.0);
        REQUIRE(out < 2000.0);
    }

    SECTION("Direct quote route") {
        PriceData q;
        q.source = "jupiter";
        q.token_in = m.weth;
        q.token_out = m.usdc;
        q.amount_out = 2'001'000'000;
        q.price_impact = 0.2;
        q.gas_estimate = 120000;
        q.confidence = 92.0;
        q.metadata.fee = 0.0025;

        auto route = builder.from_quote(q, one_eth);
        REQUIRE(route.kind == RouteKind::Direct);
        REQUIRE(route.total_gas == 120000);
        REQUIRE(route.confidence == Approx(92.0));
        REQUIRE(route.estimated_time_s == 20);
        REQUIRE(route.risk_score == Approx(27.0));
    }

    SECTION("Confidence and risk formulas") {
        std::vector<RouteStep> steps(4);
        REQUIRE(RouteBuilder::route_confidence(steps) == Approx(75.0));
        for (auto& s : steps) s.pool_address = "0xp";
        REQUIRE(RouteBuilder::route_confidence(steps) == Approx(80.0));
        REQUIRE(RouteBuilder::route_confidence(std::vector<RouteStep>(8)) == Approx(60.0));

        steps[0].price_impact = 5.0;
        REQUIRE(RouteBuilder::route_risk(steps) == Approx(100.0));
        REQUIRE(RouteBuilder::route_risk(std::vector<RouteStep>(1)) == Approx(25.0));
    }

    SECTION("Empty path or zero input") {
        REQUIRE_FALSE(builder.from_path({}, m.weth, one_eth).has_value());
        REQUIRE_FALSE(builder.from_path(paths[0], m.weth, 0).has_value());
        REQUIRE_FALSE(builder.from_path(paths[0], m.dai, one_eth).has_value());
    }
}
