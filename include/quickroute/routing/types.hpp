// QuickRoute - Routing Types

#pragma once

#include <quickroute/types.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace quickroute::routing {

enum class OptimizeFor : uint8_t {
    Price,     // maximum output
    Gas,       // minimum gas
    Speed,     // minimum estimated time
    Balanced   // weighted score
};

inline constexpr const char* to_string(OptimizeFor o) noexcept {
    switch (o) {
        case OptimizeFor::Price: return "price";
        case OptimizeFor::Gas: return "gas";
        case OptimizeFor::Speed: return "speed";
        case OptimizeFor::Balanced: return "balanced";
    }
    return "unknown";
}

/// Throws ConfigError on an unknown objective
OptimizeFor parse_optimize_for(std::string_view s);

enum class RouteKind : uint8_t {
    Direct,      // single quote from one source
    MultiHop,    // path through the pool graph
    Arbitrage    // cycle returning to the input token
};

inline constexpr const char* to_string(RouteKind k) noexcept {
    switch (k) {
        case RouteKind::Direct: return "direct";
        case RouteKind::MultiHop: return "multi_hop";
        case RouteKind::Arbitrage: return "arbitrage";
    }
    return "unknown";
}

struct RouteStep {
    std::string source;
    Token token_in;
    Token token_out;
    Amount amount_in = 0;
    Amount amount_out = 0;
    std::optional<std::string> pool_address;
    double fee = 0.0;             // fraction
    double price_impact = 0.0;    // percent
};

struct OptimizedRoute {
    RouteKind kind = RouteKind::Direct;
    std::vector<RouteStep> steps;
    uint64_t total_gas = 0;
    double total_fee = 0.0;
    double total_price_impact = 0.0;
    double confidence = 0.0;      // 0..100
    Amount estimated_output = 0;
    int64_t estimated_time_s = 0;
    double risk_score = 0.0;      // 0..100
    bool split = false;

    /// Ordered source names joined by '-', the learning key for this route shape
    [[nodiscard]] std::string signature() const {
        std::string sig;
        for (const auto& step : steps) {
            if (!sig.empty()) sig += '-';
            sig += step.source;
        }
        return sig;
    }

    [[nodiscard]] size_t hop_count() const noexcept { return steps.size(); }
};

}  // namespace quickroute::routing
