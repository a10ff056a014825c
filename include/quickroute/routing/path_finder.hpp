// QuickRoute - Path Finder
// Breadth-first enumeration of bounded-length pool paths between two tokens

#pragma once

#include <quickroute/routing/liquidity_graph.hpp>
#include <quickroute/routing/route_builder.hpp>
#include <string>
#include <unordered_set>
#include <vector>

namespace quickroute::routing {

struct PathOptions {
    int max_hops = 3;
    size_t max_paths = 10;
    bool stablecoin_intermediates = true;   // only stablecoins may sit between hops
    double min_liquidity_usd = 10000.0;     // pools below this TVL are not traversed
    std::vector<std::string> stablecoins = {"USDC", "USDT", "DAI", "BUSD", "FRAX", "UST"};
};

class PathFinder {
public:
    PathFinder(const LiquidityGraph& graph, PathOptions options);

    /// Paths are returned shortest first. No token or pool repeats inside a path.
    [[nodiscard]] std::vector<PoolPath> find(const Token& from, const Token& to) const;

    [[nodiscard]] bool is_stablecoin(const Token& token) const;

private:
    const LiquidityGraph& graph_;
    PathOptions options_;
    std::unordered_set<std::string> stable_symbols_;
};

}  // namespace quickroute::routing
