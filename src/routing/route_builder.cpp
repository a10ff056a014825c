// QuickRoute - Route Builder Implementation

#include <quickroute/routing/route_builder.hpp>
#include <quickroute/routing/amm.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

namespace quickroute::routing {

OptimizedRoute RouteBuilder::from_quote(const PriceData& quote, Amount amount_in) const {
    RouteStep step;
    step.source = quote.source;
    step.token_in = quote.token_in;
    step.token_out = quote.token_out;
    step.amount_in = amount_in;
    step.amount_out = quote.amount_out;
    step.pool_address = quote.metadata.pool_address;
    step.fee = quote.metadata.fee;
    step.price_impact = quote.price_impact;

    OptimizedRoute route;
    route.kind = RouteKind::Direct;
    route.steps.push_back(step);
    route.total_gas = quote.gas_estimate;
    route.total_fee = quote.metadata.fee;
    route.total_price_impact = quote.price_impact;
    route.confidence = quote.confidence;
    route.estimated_output = quote.amount_out;
    route.estimated_time_s = estimated_time_s(1);
    route.risk_score = route_risk(route.steps);
    return route;
}

std::optional<OptimizedRoute> RouteBuilder::from_path(
    const PoolPath& path, const Token& token_in, Amount amount_in, RouteKind kind) const {

    if (path.empty() || amount_in == 0) {
        return std::nullopt;
    }

    OptimizedRoute route;
    route.kind = kind;

    Token current = token_in;
    Amount current_amount = amount_in;
    for (const LiquidityPool* pool : path) {
        if (!pool->contains(current)) {
            return std::nullopt;
        }

        amm::SwapQuote swap;
        try {
            swap = amm::quote(*pool, current, current_amount);
        } catch (const std::overflow_error& e) {
            spdlog::debug("skipping path through pool {}: {}", pool->address, e.what());
            return std::nullopt;
        }
        if (swap.amount_out == 0) {
            return std::nullopt;
        }

        RouteStep step;
        step.source = pool->source;
        step.token_in = current;
        step.token_out = pool->other(current);
        step.amount_in = current_amount;
        step.amount_out = swap.amount_out;
        step.pool_address = pool->address;
        step.fee = pool->fee_rate();
        step.price_impact = swap.price_impact;

        route.total_fee += step.fee;
        route.total_price_impact += step.price_impact;
        route.total_gas += gas_per_hop_;

        current = step.token_out;
        current_amount = step.amount_out;
        route.steps.push_back(std::move(step));
    }

    route.estimated_output = current_amount;
    route.confidence = route_confidence(route.steps);
    route.estimated_time_s = estimated_time_s(route.steps.size());
    route.risk_score = route_risk(route.steps);
    return route;
}

double RouteBuilder::route_confidence(const std::vector<RouteStep>& steps) noexcept {
    double confidence = 95.0 - 5.0 * static_cast<double>(steps.size());
    bool all_pools = !steps.empty() &&
        std::all_of(steps.begin(), steps.end(),
                    [](const RouteStep& s) { return s.pool_address.has_value(); });
    if (all_pools) {
        confidence += 5.0;
    }
    return std::max(60.0, confidence);
}

double RouteBuilder::route_risk(const std::vector<RouteStep>& steps) noexcept {
    double risk = 10.0 + 15.0 * static_cast<double>(steps.size());
    for (const auto& step : steps) {
        risk += step.price_impact * 10.0;
    }
    return std::min(100.0, risk);
}

}  // namespace quickroute::routing
