// QuickRoute - Triangular Arbitrage Implementation

#include <quickroute/routing/triangular.hpp>
#include <quickroute/routing/amm.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

namespace quickroute::routing {

namespace {

constexpr double ARBITRAGE_CONFIDENCE = 70.0;

// Zero when the pool's reserves are out of range, which ends that cycle
Amount swap_out(const LiquidityPool& pool, const Token& token_in, Amount amount_in) {
    try {
        return amm::quote(pool, token_in, amount_in).amount_out;
    } catch (const std::overflow_error& e) {
        spdlog::debug("skipping pool {} in cycle search: {}", pool.address, e.what());
        return 0;
    }
}

}  // namespace

TriangularDetector::TriangularDetector(const LiquidityGraph& graph, TriangularOptions options)
    : graph_(graph), options_(options) {}

double TriangularDetector::risk_for_tvl(double average_tvl) const noexcept {
    if (average_tvl > options_.low_risk_tvl) return 20.0;
    if (average_tvl > options_.medium_risk_tvl) return 50.0;
    return 80.0;
}

std::vector<TriangularOpportunity> TriangularDetector::find(const Token& base, Amount amount_in) const {
    std::vector<TriangularOpportunity> found;
    if (amount_in == 0) {
        return found;
    }

    auto usable = [this](const LiquidityPool* p) {
        return p->tvl_usd >= options_.min_liquidity_usd;
    };

    for (const LiquidityPool* first : graph_.pools_for(base.address)) {
        if (!first->contains(base) || !usable(first)) continue;
        const Token& intermediate = first->other(base);
        Amount amount1 = swap_out(*first, base, amount_in);
        if (amount1 == 0) continue;

        for (const LiquidityPool* second : graph_.pools_for(intermediate.address)) {
            if (second == first || !second->contains(intermediate) || !usable(second)) continue;
            const Token& final_token = second->other(intermediate);
            if (final_token == base || final_token == intermediate) continue;
            Amount amount2 = swap_out(*second, intermediate, amount1);
            if (amount2 == 0) continue;

            for (const LiquidityPool* closing : graph_.pools_for(final_token.address)) {
                if (closing == first || closing == second || !usable(closing)) continue;
                if (!closing->contains(final_token) || closing->other(final_token) != base) continue;

                Amount amount3 = swap_out(*closing, final_token, amount2);
                if (amount3 <= amount_in) continue;

                double profit = (amount::to_double(amount3) - amount::to_double(amount_in)) /
                                amount::to_double(amount_in);
                if (profit <= options_.min_profit) continue;

                double avg_tvl = (first->tvl_usd + second->tvl_usd + closing->tvl_usd) / 3.0;

                TriangularOpportunity opp;
                opp.base = base;
                opp.intermediate = intermediate;
                opp.final = final_token;
                opp.pools = {first, second, closing};
                opp.amount_in = amount_in;
                opp.amount_out = amount3;
                opp.profit_margin = profit;
                opp.risk_score = risk_for_tvl(avg_tvl);
                found.push_back(std::move(opp));
            }
        }
    }

    std::sort(found.begin(), found.end(),
              [](const auto& a, const auto& b) { return a.profit_margin > b.profit_margin; });
    if (found.size() > options_.max_results) {
        found.resize(options_.max_results);
    }
    return found;
}

OptimizedRoute TriangularDetector::to_route(const TriangularOpportunity& opp, const RouteBuilder& builder) const {
    PoolPath path(opp.pools.begin(), opp.pools.end());
    auto route = builder.from_path(path, opp.base, opp.amount_in, RouteKind::Arbitrage);

    // find() only reports cycles whose every hop produced output
    OptimizedRoute result = route ? *route : OptimizedRoute{};
    result.kind = RouteKind::Arbitrage;
    result.confidence = ARBITRAGE_CONFIDENCE;
    result.risk_score = opp.risk_score;
    return result;
}

}  // namespace quickroute::routing
