// QuickRoute - Event Channel Tests

#include <catch2/catch_test_macros.hpp>
#include <quickroute/events.hpp>
#include <stdexcept>

using namespace quickroute;

TEST_CASE("EventChannel delivery", "[events]") {
    EventChannel<int> channel("numbers");

    SECTION("Every listener sees every event") {
        int a = 0, b = 0;
        channel.subscribe([&](const int& v) { a += v; });
        channel.subscribe([&](const int& v) { b += v * 2; });

        REQUIRE(channel.publish(5) == 0);
        REQUIRE(a == 5);
        REQUIRE(b == 10);
    }

    SECTION("A throwing listener does not stop the rest") {
        int seen = 0;
        channel.subscribe([](const int&) { throw std::runtime_error("boom"); });
        channel.subscribe([&](const int& v) { seen = v; });

        REQUIRE(channel.publish(7) == 1);
        REQUIRE(seen == 7);
    }

    SECTION("A listener throwing a non-exception type is contained") {
        int seen = 0;
        channel.subscribe([](const int&) { throw 42; });
        channel.subscribe([&](const int& v) { seen = v; });

        size_t failures = 0;
        REQUIRE_NOTHROW(failures = channel.publish(9));
        REQUIRE(failures == 1);
        REQUIRE(seen == 9);
    }

    SECTION("Unsubscribe") {
        int calls = 0;
        auto id = channel.subscribe([&](const int&) { ++calls; });
        REQUIRE(channel.unsubscribe(id));
        REQUIRE_FALSE(channel.unsubscribe(id));

        channel.publish(1);
        REQUIRE(calls == 0);
        REQUIRE(channel.size() == 0);
    }
}

TEST_CASE("Subscription ids are unique across channels", "[events]") {
    EventChannel<int> first("first");
    EventChannel<std::string> second("second");

    auto a = first.subscribe([](const int&) {});
    auto b = second.subscribe([](const std::string&) {});

    REQUIRE(a != b);
    REQUIRE_FALSE(first.unsubscribe(b));
    REQUIRE(second.unsubscribe(b));
}
