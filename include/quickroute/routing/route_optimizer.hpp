// QuickRoute - Route Optimizer
// Builds, scores, caches and learns from candidate execution routes

#pragma once

#include <quickroute/config.hpp>
#include <quickroute/routing/liquidity_graph.hpp>
#include <quickroute/routing/performance_learner.hpp>
#include <quickroute/routing/route_builder.hpp>
#include <quickroute/routing/route_cache.hpp>
#include <quickroute/routing/route_scorer.hpp>
#include <quickroute/routing/service_fee.hpp>
#include <quickroute/routing/volume_splitter.hpp>
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace quickroute::routing {

enum class Recommendation : uint8_t {
    ValidAlternative,
    SignificantlyWorse,   // output more than 5% below the best
    NotRecommended,       // output more than 10% below the best
    HighRisk,             // confidence below 70
    TooSlow               // estimated time above 120 s
};

inline constexpr const char* to_string(Recommendation r) noexcept {
    switch (r) {
        case Recommendation::ValidAlternative: return "valid_alternative";
        case Recommendation::SignificantlyWorse: return "significantly_worse";
        case Recommendation::NotRecommended: return "not_recommended";
        case Recommendation::HighRisk: return "high_risk";
        case Recommendation::TooSlow: return "too_slow";
    }
    return "unknown";
}

struct RouteAlternative {
    OptimizedRoute route;
    double output_shortfall_pct = 0.0;
    Recommendation recommendation = Recommendation::ValidAlternative;
};

struct RouteComparison {
    OptimizedRoute best;
    double best_score = 0.0;
    std::vector<RouteAlternative> alternatives;
};

struct SplitExecutionPlan {
    std::vector<Amount> slices;
    std::vector<std::vector<OptimizedRoute>> routes;   // ranked routes per slice
    Amount total_estimated_output = 0;                  // sum of each slice's best route
    bool split = false;
};

struct OptimizerMetrics {
    uint64_t routes_analyzed = 0;
    double success_rate = 0.0;
    double cache_hit_rate = 0.0;
    size_t cache_size = 0;
    size_t pool_count = 0;
};

class RouteOptimizer {
public:
    RouteOptimizer(RoutingConfig config, TimerQueue& timers);

    RouteOptimizer(const RouteOptimizer&) = delete;
    RouteOptimizer& operator=(const RouteOptimizer&) = delete;

    /// Replace the pool snapshot. Searches already running keep the old one.
    void set_pools(std::vector<LiquidityPool> pools);

    [[nodiscard]] std::shared_ptr<const LiquidityGraph> snapshot() const;

    /// Ranked routes for the pair, at most max_routes. Candidates come from the
    /// supplied quotes, pool paths and, when in == out, triangular cycles.
    /// Empty when nothing connects the tokens.
    std::vector<OptimizedRoute> find_optimal_routes(
        const Token& token_in, const Token& token_out, Amount amount_in,
        const std::vector<PriceData>& quotes = {});

    /// Split orders whose notional exceeds the large-order threshold and route
    /// every slice. Notional is amount_in in whole tokens, times
    /// input_price_usd when given. Throws std::invalid_argument when that
    /// notional is not finite.
    SplitExecutionPlan find_optimal_route_for_large_volume(
        const Token& token_in, const Token& token_out, Amount amount_in,
        const std::vector<PriceData>& quotes = {},
        std::optional<double> input_price_usd = std::nullopt);

    /// Feed an execution outcome back into the learner
    void record_outcome(const OptimizedRoute& route, bool success);

    /// Throws std::invalid_argument on an empty list
    [[nodiscard]] RouteComparison compare_routes(const std::vector<OptimizedRoute>& routes) const;

    [[nodiscard]] ServiceFee quote_service_fee(const OptimizedRoute& route) const;
    ServiceFee charge_service_fee(const OptimizedRoute& route, const std::string& user);
    [[nodiscard]] RevenueStats revenue() const { return fees_.stats(); }

    [[nodiscard]] OptimizerMetrics metrics() const;
    void clear_cache();

    [[nodiscard]] const RoutingConfig& config() const noexcept { return config_; }
    [[nodiscard]] PerformanceLearner& learner() noexcept { return learner_; }

private:
    std::vector<OptimizedRoute> build_candidates(
        const LiquidityGraph& graph, const Token& token_in, const Token& token_out,
        Amount amount_in, const std::vector<PriceData>& quotes) const;

    RoutingConfig config_;
    RouteBuilder builder_;
    RouteScorer scorer_;
    RouteCache cache_;
    PerformanceLearner learner_;
    VolumeSplitter splitter_;
    ServiceFeeTracker fees_;
    std::shared_ptr<const LiquidityGraph> graph_;
    mutable std::mutex graph_mutex_;
    std::atomic<uint64_t> routes_analyzed_{0};
};

}  // namespace quickroute::routing
