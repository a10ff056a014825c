// QuickRoute - Liquidity Graph
// Immutable pool snapshot indexed by token: tokens are nodes, pools are edges

#pragma once

#include <quickroute/types.hpp>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace quickroute::routing {

class LiquidityGraph {
public:
    LiquidityGraph() = default;
    explicit LiquidityGraph(std::vector<LiquidityPool> pools);

    /// Pools touching the token with this address
    [[nodiscard]] std::vector<const LiquidityPool*> pools_for(const std::string& token_address) const;

    [[nodiscard]] const LiquidityPool* find(std::string_view pool_address) const;

    [[nodiscard]] const std::vector<LiquidityPool>& pools() const noexcept { return pools_; }
    [[nodiscard]] size_t pool_count() const noexcept { return pools_.size(); }
    [[nodiscard]] size_t token_count() const noexcept { return by_token_.size(); }

    /// Parse a snapshot: either an array of pools or {"pools": [...]}.
    /// Reserves are decimal strings in base units.
    static std::vector<LiquidityPool> parse_pools(const nlohmann::json& j);
    static std::vector<LiquidityPool> load_file(std::string_view path);

private:
    std::vector<LiquidityPool> pools_;
    std::unordered_map<std::string, std::vector<size_t>> by_token_;
};

}  // namespace quickroute::routing
