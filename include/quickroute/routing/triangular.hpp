// QuickRoute - Triangular Arbitrage
// Three-pool cycles base -> intermediate -> final -> base that return more than they take

#pragma once

#include <quickroute/routing/liquidity_graph.hpp>
#include <quickroute/routing/route_builder.hpp>
#include <array>
#include <vector>

namespace quickroute::routing {

struct TriangularOptions {
    double min_profit = 0.01;              // fraction of the input
    double low_risk_tvl = 10'000'000.0;
    double medium_risk_tvl = 1'000'000.0;
    double min_liquidity_usd = 0.0;
    size_t max_results = 10;
};

struct TriangularOpportunity {
    Token base;
    Token intermediate;
    Token final;
    std::array<const LiquidityPool*, 3> pools{};
    Amount amount_in = 0;
    Amount amount_out = 0;
    double profit_margin = 0.0;   // fraction
    double risk_score = 0.0;
};

class TriangularDetector {
public:
    TriangularDetector(const LiquidityGraph& graph, TriangularOptions options);

    /// Profitable cycles starting and ending at `base`, most profitable first
    [[nodiscard]] std::vector<TriangularOpportunity> find(const Token& base, Amount amount_in) const;

    /// Three-step route for an opportunity; confidence is fixed at 70
    [[nodiscard]] OptimizedRoute to_route(const TriangularOpportunity& opp, const RouteBuilder& builder) const;

    // 20 above the low-risk TVL, 50 above the medium tier, 80 otherwise
    [[nodiscard]] double risk_for_tvl(double average_tvl) const noexcept;

private:
    const LiquidityGraph& graph_;
    TriangularOptions options_;
};

}  // namespace quickroute::routing
