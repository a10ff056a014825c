// QuickRoute - Route Optimizer Implementation

#include <quickroute/routing/route_optimizer.hpp>
#include <quickroute/routing/path_finder.hpp>
#include <quickroute/routing/triangular.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

namespace quickroute::routing {

namespace {

constexpr double SIGNIFICANTLY_WORSE_PCT = 5.0;
constexpr double NOT_RECOMMENDED_PCT = 10.0;
constexpr double HIGH_RISK_CONFIDENCE = 70.0;
constexpr int64_t TOO_SLOW_S = 120;

}  // namespace

RouteOptimizer::RouteOptimizer(RoutingConfig config, TimerQueue& timers)
    : config_(std::move(config)),
      builder_(config_.gas_per_hop),
      scorer_(config_.optimize_for, config_.weights),
      cache_(timers, std::chrono::milliseconds(config_.route_cache_ttl_ms)),
      learner_(config_.history_size),
      splitter_(config_.large_order_threshold, config_.max_split_size,
                config_.split_time_penalty_s, config_.split_risk_reduction),
      fees_(config_.service_fee_rate, timers.clock_ptr()),
      graph_(std::make_shared<const LiquidityGraph>()) {}

void RouteOptimizer::set_pools(std::vector<LiquidityPool> pools) {
    auto graph = std::make_shared<const LiquidityGraph>(std::move(pools));
    spdlog::info("route optimizer loaded {} pools across {} tokens",
                 graph->pool_count(), graph->token_count());
    {
        std::lock_guard<std::mutex> lock(graph_mutex_);
        graph_ = std::move(graph);
    }
    cache_.clear();
}

std::shared_ptr<const LiquidityGraph> RouteOptimizer::snapshot() const {
    std::lock_guard<std::mutex> lock(graph_mutex_);
    return graph_;
}

std::vector<OptimizedRoute> RouteOptimizer::build_candidates(
    const LiquidityGraph& graph, const Token& token_in, const Token& token_out,
    Amount amount_in, const std::vector<PriceData>& quotes) const {

    std::vector<OptimizedRoute> candidates;

    for (const auto& quote : quotes) {
        if (quote.token_in == token_in && quote.token_out == token_out && quote.is_valid()) {
            candidates.push_back(builder_.from_quote(quote, amount_in));
        }
    }

    if (token_in == token_out) {
        TriangularOptions tri_options;
        tri_options.min_profit = config_.min_arbitrage_profit;
        tri_options.low_risk_tvl = config_.low_risk_tvl;
        tri_options.medium_risk_tvl = config_.medium_risk_tvl;
        tri_options.min_liquidity_usd = config_.min_liquidity_usd;
        tri_options.max_results = config_.max_routes;

        TriangularDetector detector(graph, tri_options);
        for (const auto& opp : detector.find(token_in, amount_in)) {
            candidates.push_back(detector.to_route(opp, builder_));
        }
        return candidates;
    }

    PathOptions path_options;
    path_options.max_hops = config_.use_multi_path ? config_.max_hops : 1;
    path_options.max_paths = config_.max_routes;
    path_options.stablecoin_intermediates = config_.include_stablecoin_routes;
    path_options.min_liquidity_usd = config_.min_liquidity_usd;
    path_options.stablecoins = config_.stablecoins;

    PathFinder finder(graph, path_options);
    for (const auto& path : finder.find(token_in, token_out)) {
        auto kind = path.size() == 1 ? RouteKind::Direct : RouteKind::MultiHop;
        if (auto route = builder_.from_path(path, token_in, amount_in, kind)) {
            candidates.push_back(std::move(*route));
        }
    }
    return candidates;
}

std::vector<OptimizedRoute> RouteOptimizer::find_optimal_routes(
    const Token& token_in, const Token& token_out, Amount amount_in,
    const std::vector<PriceData>& quotes) {

    std::string key = RouteCache::key(token_in, token_out, amount_in);

    std::vector<OptimizedRoute> routes;
    if (auto cached = cache_.get(key)) {
        spdlog::debug("route cache hit for {}", key);
        routes = std::move(*cached);
    } else {
        auto graph = snapshot();
        routes = build_candidates(*graph, token_in, token_out, amount_in, quotes);
        routes_analyzed_.fetch_add(routes.size());
        if (!routes.empty()) {
            cache_.put(key, routes);
        }
    }

    // History moves confidence and risk, so rank after applying it
    learner_.apply(routes);
    scorer_.rank(routes);
    if (routes.size() > config_.max_routes) {
        routes.resize(config_.max_routes);
    }

    if (routes.empty()) {
        spdlog::debug("no route from {} to {}", token_in.symbol, token_out.symbol);
    }
    return routes;
}

SplitExecutionPlan RouteOptimizer::find_optimal_route_for_large_volume(
    const Token& token_in, const Token& token_out, Amount amount_in,
    const std::vector<PriceData>& quotes, std::optional<double> input_price_usd) {

    double notional = amount::to_units(amount_in, token_in.decimals);
    if (input_price_usd) {
        notional *= *input_price_usd;
    }

    SplitExecutionPlan result;
    SplitPlan plan = splitter_.plan(amount_in, notional);
    result.slices = plan.slices;
    result.split = plan.is_split();

    if (result.split) {
        spdlog::info("splitting {} {} into {} slices", notional, token_in.symbol, plan.slices.size());
    }

    for (Amount slice : plan.slices) {
        // Quotes were priced for the full amount and do not apply to a slice
        auto routes = result.split
            ? find_optimal_routes(token_in, token_out, slice)
            : find_optimal_routes(token_in, token_out, slice, quotes);
        if (result.split) {
            splitter_.adjust(routes);
        }
        if (!routes.empty()) {
            result.total_estimated_output += routes.front().estimated_output;
        }
        result.routes.push_back(std::move(routes));
    }
    return result;
}

void RouteOptimizer::record_outcome(const OptimizedRoute& route, bool success) {
    learner_.record(route, success);
}

RouteComparison RouteOptimizer::compare_routes(const std::vector<OptimizedRoute>& routes) const {
    if (routes.empty()) {
        throw std::invalid_argument("no routes to compare");
    }

    Amount best_output = 0;
    for (const auto& r : routes) {
        best_output = std::max(best_output, r.estimated_output);
    }

    RouteScorer balanced(OptimizeFor::Balanced, config_.weights);
    auto best = std::max_element(routes.begin(), routes.end(),
        [&](const OptimizedRoute& a, const OptimizedRoute& b) {
            return balanced.balanced_score(a, best_output) < balanced.balanced_score(b, best_output);
        });

    RouteComparison comparison;
    comparison.best = *best;
    comparison.best_score = balanced.balanced_score(*best, best_output);

    double best_out = amount::to_double(best->estimated_output);
    for (auto it = routes.begin(); it != routes.end(); ++it) {
        if (it == best) continue;

        RouteAlternative alt;
        alt.route = *it;
        if (best_out > 0.0) {
            alt.output_shortfall_pct = (best_out - amount::to_double(it->estimated_output)) / best_out * 100.0;
        }

        if (alt.output_shortfall_pct > SIGNIFICANTLY_WORSE_PCT) alt.recommendation = Recommendation::SignificantlyWorse;
        if (alt.output_shortfall_pct > NOT_RECOMMENDED_PCT) alt.recommendation = Recommendation::NotRecommended;
        if (it->confidence < HIGH_RISK_CONFIDENCE) alt.recommendation = Recommendation::HighRisk;
        if (it->estimated_time_s > TOO_SLOW_S) alt.recommendation = Recommendation::TooSlow;

        comparison.alternatives.push_back(std::move(alt));
    }
    return comparison;
}

ServiceFee RouteOptimizer::quote_service_fee(const OptimizedRoute& route) const {
    return fees_.quote(route);
}

ServiceFee RouteOptimizer::charge_service_fee(const OptimizedRoute& route, const std::string& user) {
    return fees_.charge(route, user);
}

OptimizerMetrics RouteOptimizer::metrics() const {
    OptimizerMetrics m;
    m.routes_analyzed = routes_analyzed_.load();
    m.success_rate = learner_.metrics().success_rate;
    m.cache_hit_rate = cache_.hit_rate();
    m.cache_size = cache_.size();
    m.pool_count = snapshot()->pool_count();
    return m;
}

void RouteOptimizer::clear_cache() {
    cache_.clear();
}

}  // namespace quickroute::routing
