// QuickRoute - Path Finder Implementation

#include <quickroute/routing/path_finder.hpp>
#include <algorithm>
#include <cctype>
#include <deque>

namespace quickroute::routing {

namespace {

std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

struct SearchNode {
    Token token;
    PoolPath pools;
    std::vector<std::string> visited;
};

bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

}  // namespace

PathFinder::PathFinder(const LiquidityGraph& graph, PathOptions options)
    : graph_(graph), options_(std::move(options)) {
    for (const auto& symbol : options_.stablecoins) {
        stable_symbols_.insert(upper(symbol));
    }
}

bool PathFinder::is_stablecoin(const Token& token) const {
    return stable_symbols_.count(upper(token.symbol)) > 0;
}

std::vector<PoolPath> PathFinder::find(const Token& from, const Token& to) const {
    std::vector<PoolPath> paths;
    if (from == to || options_.max_hops < 1 || options_.max_paths == 0) {
        return paths;
    }

    const size_t max_hops = static_cast<size_t>(options_.max_hops);
    std::deque<SearchNode> queue;
    queue.push_back(SearchNode{from, {}, {from.address}});

    while (!queue.empty()) {
        SearchNode node = std::move(queue.front());
        queue.pop_front();

        for (const LiquidityPool* pool : graph_.pools_for(node.token.address)) {
            if (!pool->contains(node.token) || pool->tvl_usd < options_.min_liquidity_usd) {
                continue;
            }
            if (std::find(node.pools.begin(), node.pools.end(), pool) != node.pools.end()) {
                continue;
            }

            const Token& next = pool->other(node.token);

            if (next == to) {
                PoolPath path = node.pools;
                path.push_back(pool);
                paths.push_back(std::move(path));
                if (paths.size() >= options_.max_paths) {
                    return paths;
                }
                continue;
            }

            if (node.pools.size() + 1 >= max_hops) continue;
            if (contains(node.visited, next.address)) continue;
            if (options_.stablecoin_intermediates && !is_stablecoin(next)) continue;

            SearchNode child{next, node.pools, node.visited};
            child.pools.push_back(pool);
            child.visited.push_back(next.address);
            queue.push_back(std::move(child));
        }
    }

    return paths;
}

}  // namespace quickroute::routing
