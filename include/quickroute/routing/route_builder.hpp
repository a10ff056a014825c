// QuickRoute - Route Builder
// Turns quotes and pool paths into OptimizedRoute values with cost estimates

#pragma once

#include <quickroute/routing/types.hpp>
#include <optional>
#include <vector>

namespace quickroute::routing {

using PoolPath = std::vector<const LiquidityPool*>;

class RouteBuilder {
public:
    explicit RouteBuilder(uint64_t gas_per_hop = 50000) : gas_per_hop_(gas_per_hop) {}

    /// One-step route carrying the quote's own gas, fee, impact and confidence
    [[nodiscard]] OptimizedRoute from_quote(const PriceData& quote, Amount amount_in) const;

    /// Replay `amount_in` through the pools in order. Returns nullopt when a
    /// hop yields nothing or its reserves are out of range.
    [[nodiscard]] std::optional<OptimizedRoute> from_path(
        const PoolPath& path, const Token& token_in, Amount amount_in,
        RouteKind kind = RouteKind::MultiHop) const;

    // 95 - 5 per step, +5 when every step names a pool, floor 60
    [[nodiscard]] static double route_confidence(const std::vector<RouteStep>& steps) noexcept;

    // 10 + 15 per step + 10 per percent of impact, capped at 100
    [[nodiscard]] static double route_risk(const std::vector<RouteStep>& steps) noexcept;

    [[nodiscard]] static int64_t estimated_time_s(size_t step_count) noexcept {
        return static_cast<int64_t>(step_count) * 15 + 5;
    }

    [[nodiscard]] uint64_t gas_per_hop() const noexcept { return gas_per_hop_; }

private:
    uint64_t gas_per_hop_;
};

}  // namespace quickroute::routing
