// QuickRoute - Performance Learner Tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <quickroute/routing/performance_learner.hpp>

using namespace quickroute::routing;
using Catch::Approx;

namespace {

OptimizedRoute route_via(const std::string& a, const std::string& b, double confidence, double risk) {
    OptimizedRoute r;
    r.steps.resize(2);
    r.steps[0].source = a;
    r.steps[1].source = b;
    r.confidence = confidence;
    r.risk_score = risk;
    return r;
}

}  // namespace

TEST_CASE("Outcome history", "[learner]") {
    PerformanceLearner learner(3);

    SECTION("Average of recorded outcomes") {
        learner.record("uniswap_v3", 1.0);
        learner.record("uniswap_v3", 0.0);
        REQUIRE(learner.average("uniswap_v3") == Approx(0.5));
        REQUIRE_FALSE(learner.average("curve").has_value());
    }

    SECTION("History is bounded, oldest dropped first") {
        learner.record("s", 0.0);
        for (int i = 0; i < 3; ++i) learner.record("s", 1.0);
        REQUIRE(learner.history_length("s") == 3);
        REQUIRE(learner.average("s") == Approx(1.0));
    }

    SECTION("Scores are clamped") {
        learner.record("s", 4.0);
        learner.record("s", -1.0);
        REQUIRE(learner.average("s") == Approx(0.5));
    }

    SECTION("Route outcomes keyed by signature") {
        auto route = route_via("uniswap_v3", "curve", 90.0, 20.0);
        learner.record(route, true);
        learner.record(route, false);
        REQUIRE(learner.history_length("uniswap_v3-curve") == 2);

        auto m = learner.metrics();
        REQUIRE(m.signatures == 1);
        REQUIRE(m.outcomes == 2);
        REQUIRE(m.success_rate == Approx(0.5));

        learner.clear();
        REQUIRE(learner.metrics().outcomes == 0);
    }
}

TEST_CASE("History scales confidence and risk", "[learner]") {
    PerformanceLearner learner(100);

    SECTION("Half the routes succeeded") {
        learner.record("a-b", 1.0);
        learner.record("a-b", 0.0);
        std::vector<OptimizedRoute> routes{route_via("a", "b", 90.0, 20.0)};
        learner.apply(routes);
        REQUIRE(routes[0].confidence == Approx(45.0));
        REQUIRE(routes[0].risk_score == Approx(30.0));
    }

    SECTION("Bounds hold") {
        learner.record("a-b", 1.0);
        learner.record("c-d", 1.0);
        std::vector<OptimizedRoute> routes{route_via("a", "b", 99.0, 3.0), route_via("c", "d", 80.0, 50.0)};
        learner.apply(routes);
        REQUIRE(routes[0].confidence == Approx(95.0));
        REQUIRE(routes[0].risk_score == Approx(5.0));
        REQUIRE(routes[1].confidence == Approx(80.0));
        REQUIRE(routes[1].risk_score == Approx(50.0));
    }

    SECTION("Routes without history are untouched") {
        std::vector<OptimizedRoute> routes{route_via("x", "y", 88.0, 33.0)};
        learner.apply(routes);
        REQUIRE(routes[0].confidence == Approx(88.0));
        REQUIRE(routes[0].risk_score == Approx(33.0));
    }
}
