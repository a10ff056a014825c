// QuickRoute - Route Scorer Implementation

#include <quickroute/routing/route_scorer.hpp>
#include <quickroute/errors.hpp>
#include <algorithm>

namespace quickroute::routing {

OptimizeFor parse_optimize_for(std::string_view s) {
    if (s == "price") return OptimizeFor::Price;
    if (s == "gas") return OptimizeFor::Gas;
    if (s == "speed") return OptimizeFor::Speed;
    if (s == "balanced") return OptimizeFor::Balanced;
    throw ConfigError("unknown optimization objective: " + std::string(s));
}

namespace {

double clamp01(double v) noexcept {
    return std::clamp(v, 0.0, 1.0);
}

}  // namespace

RouteScorer::RouteScorer(OptimizeFor objective, BalancedWeights weights)
    : objective_(objective), weights_(weights) {}

double RouteScorer::balanced_score(const OptimizedRoute& route, Amount best_output) const {
    double output = best_output > 0
        ? amount::to_double(route.estimated_output) / amount::to_double(best_output)
        : 0.0;
    double gas = weights_.gas_ceiling > 0.0
        ? (weights_.gas_ceiling - static_cast<double>(route.total_gas)) / weights_.gas_ceiling
        : 0.0;
    double speed = weights_.time_ceiling_s > 0.0
        ? (weights_.time_ceiling_s - static_cast<double>(route.estimated_time_s)) / weights_.time_ceiling_s
        : 0.0;

    return weights_.output * clamp01(output) +
           weights_.gas * clamp01(gas) +
           weights_.speed * clamp01(speed) +
           weights_.confidence * clamp01(route.confidence / 100.0) +
           weights_.risk * clamp01((100.0 - route.risk_score) / 100.0);
}

bool RouteScorer::better(const OptimizedRoute& a, const OptimizedRoute& b, Amount best_output) const {
    switch (objective_) {
        case OptimizeFor::Price:
            return a.estimated_output > b.estimated_output;
        case OptimizeFor::Gas:
            if (a.total_gas != b.total_gas) return a.total_gas < b.total_gas;
            break;
        case OptimizeFor::Speed:
            if (a.estimated_time_s != b.estimated_time_s) return a.estimated_time_s < b.estimated_time_s;
            break;
        case OptimizeFor::Balanced: {
            double sa = balanced_score(a, best_output);
            double sb = balanced_score(b, best_output);
            if (sa != sb) return sa > sb;
            break;
        }
    }
    return a.estimated_output > b.estimated_output;
}

void RouteScorer::rank(std::vector<OptimizedRoute>& routes) const {
    Amount best_output = 0;
    for (const auto& r : routes) {
        best_output = std::max(best_output, r.estimated_output);
    }

    std::stable_sort(routes.begin(), routes.end(),
                     [&](const OptimizedRoute& a, const OptimizedRoute& b) {
                         return better(a, b, best_output);
                     });
}

}  // namespace quickroute::routing
