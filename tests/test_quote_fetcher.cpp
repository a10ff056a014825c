// QuickRoute - Quote Fetcher Tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <quickroute/aggregation/quote_fetcher.hpp>
#include "support/fakes.hpp"

using namespace quickroute;
using namespace quickroute::aggregation;
using namespace std::chrono_literals;
using Catch::Approx;
using Reply = testing::FakeHttpChannel::Reply;

namespace {

FetchTask task_for(const std::string& id) {
    SourceInfo info;
    info.id = id;
    info.name = id;
    info.api_endpoint = "https://" + id + ".example";
    info.reliability = 90.0;
    return FetchTask{info, make_adapter(id),
                     QuoteRequest{testing::token("WETH"), testing::token("USDC", 6), amount::pow10(18)}};
}

}  // namespace

TEST_CASE("Fetch with retry", "[fetcher]") {
    auto http = std::make_shared<testing::FakeHttpChannel>();
    auto clock = std::make_shared<ManualClock>();
    QuoteFetcher fetcher(http, clock, FetchPolicy{5000ms, 3, 1000ms});

    SECTION("First try succeeds") {
        http->always("uniswap_v3", Reply::ok(testing::quote_body(2000.0, "2000000000")));
        auto outcome = fetcher.fetch(task_for("uniswap_v3"));

        REQUIRE(outcome.ok());
        REQUIRE_FALSE(outcome.error.has_value());
        REQUIRE(outcome.attempts == 1);
        REQUIRE(outcome.quote->price == Approx(2000.0));
        REQUIRE(outcome.quote->confidence == Approx(90.0));
        REQUIRE(clock->slept_ms() == 0);
    }

    SECTION("Recovers after transient failures with linear backoff") {
        http->script("uniswap_v3", {Reply::timed_out(), Reply::status_only(503),
                                    Reply::ok(testing::quote_body(2000.0, "2000000000"))});
        auto outcome = fetcher.fetch(task_for("uniswap_v3"));

        REQUIRE(outcome.ok());
        REQUIRE(outcome.attempts == 3);
        REQUIRE(http->calls("uniswap_v3") == 3);
        REQUIRE(clock->slept_ms() == 3000);
        REQUIRE(outcome.elapsed_ms >= 3000);
    }

    SECTION("Gives up after the last attempt") {
        http->always("uniswap_v3", Reply::timed_out());
        auto outcome = fetcher.fetch(task_for("uniswap_v3"));

        REQUIRE_FALSE(outcome.ok());
        REQUIRE(outcome.attempts == 3);
        REQUIRE(outcome.error->kind == ErrorKind::SourceTimeout);
        REQUIRE(outcome.error->source == "uniswap_v3");
    }

    SECTION("HTTP 429 maps to rate limited") {
        http->always("uniswap_v3", Reply::status_only(429));
        auto outcome = fetcher.fetch(task_for("uniswap_v3"));
        REQUIRE(outcome.error->kind == ErrorKind::SourceRateLimited);
    }

    SECTION("Invalid quotes are not retried") {
        http->always("uniswap_v3", Reply::ok(R"({"price": 0, "amountOut": "5"})"));
        auto outcome = fetcher.fetch(task_for("uniswap_v3"));

        REQUIRE_FALSE(outcome.ok());
        REQUIRE(outcome.attempts == 1);
        REQUIRE(outcome.error->kind == ErrorKind::InvalidPriceData);
    }

    SECTION("Unparseable body is a transport failure") {
        http->always("uniswap_v3", Reply::ok("<html>"));
        auto outcome = fetcher.fetch(task_for("uniswap_v3"));
        REQUIRE(outcome.error->kind == ErrorKind::Transport);
        REQUIRE(outcome.attempts == 3);
    }
}

TEST_CASE("Fan out keeps task order", "[fetcher]") {
    auto http = std::make_shared<testing::FakeHttpChannel>();
    auto clock = std::make_shared<ManualClock>();
    QuoteFetcher fetcher(http, clock, FetchPolicy{5000ms, 1, 0ms});

    http->always("uniswap_v3", Reply::ok(testing::quote_body(2000.0, "2000000000")));
    http->always("sushiswap", Reply::unreachable());
    http->always("curve", Reply::ok(testing::quote_body(2001.0, "2001000000")));

    std::vector<FetchTask> tasks{task_for("uniswap_v3"), task_for("sushiswap"), task_for("curve")};
    auto outcomes = fetcher.fetch_all(tasks, 2);

    REQUIRE(outcomes.size() == 3);
    REQUIRE(outcomes[0].source == "uniswap_v3");
    REQUIRE(outcomes[0].ok());
    REQUIRE(outcomes[1].source == "sushiswap");
    REQUIRE(outcomes[1].error->kind == ErrorKind::Transport);
    REQUIRE(outcomes[2].source == "curve");
    REQUIRE(outcomes[2].ok());
}
