// QuickRoute - Route Scorer
// Orders candidate routes by the configured objective

#pragma once

#include <quickroute/config.hpp>
#include <quickroute/routing/types.hpp>
#include <vector>

namespace quickroute::routing {

class RouteScorer {
public:
    explicit RouteScorer(OptimizeFor objective, BalancedWeights weights = {});

    /// Sort best-first. Ties on the objective fall back to higher output.
    void rank(std::vector<OptimizedRoute>& routes) const;

    /// Weighted score in 0..1. Output is normalized by `best_output`, the largest
    /// output among the routes being compared.
    [[nodiscard]] double balanced_score(const OptimizedRoute& route, Amount best_output) const;

    /// True if `a` should rank ahead of `b`
    [[nodiscard]] bool better(const OptimizedRoute& a, const OptimizedRoute& b, Amount best_output) const;

    [[nodiscard]] OptimizeFor objective() const noexcept { return objective_; }

private:
    OptimizeFor objective_;
    BalancedWeights weights_;
};

}  // namespace quickroute::routing
