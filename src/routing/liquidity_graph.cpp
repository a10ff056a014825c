// QuickRoute - Liquidity Graph Implementation

#include <quickroute/routing/liquidity_graph.hpp>
#include <quickroute/errors.hpp>
#include <quickroute/routing/amm.hpp>
#include <nlohmann/json.hpp>
#include <fstream>

namespace quickroute::routing {

namespace {

Token parse_token(const nlohmann::json& j, uint64_t default_chain) {
    Token t;
    t.address = j.at("address").get<std::string>();
    t.symbol = j.value("symbol", "");
    t.chain_id = j.value("chain_id", default_chain);
    t.decimals = j.value("decimals", static_cast<uint8_t>(18));
    return t;
}

Amount parse_reserve(const nlohmann::json& j) {
    if (j.is_string()) {
        return amount::parse(j.get<std::string>());
    }
    return static_cast<Amount>(j.get<uint64_t>());
}

}  // namespace

LiquidityGraph::LiquidityGraph(std::vector<LiquidityPool> pools)
    : pools_(std::move(pools)) {
    for (size_t i = 0; i < pools_.size(); ++i) {
        by_token_[pools_[i].token0.address].push_back(i);
        by_token_[pools_[i].token1.address].push_back(i);
    }
}

std::vector<const LiquidityPool*> LiquidityGraph::pools_for(const std::string& token_address) const {
    std::vector<const LiquidityPool*> out;
    auto it = by_token_.find(token_address);
    if (it == by_token_.end()) {
        return out;
    }
    out.reserve(it->second.size());
    for (size_t idx : it->second) {
        out.push_back(&pools_[idx]);
    }
    return out;
}

const LiquidityPool* LiquidityGraph::find(std::string_view pool_address) const {
    for (const auto& pool : pools_) {
        if (pool.address == pool_address) {
            return &pool;
        }
    }
    return nullptr;
}

std::vector<LiquidityPool> LiquidityGraph::parse_pools(const nlohmann::json& j) {
    const nlohmann::json& list = j.is_object() ? j.at("pools") : j;
    if (!list.is_array()) {
        throw ConfigError("pool snapshot must be an array");
    }

    std::vector<LiquidityPool> pools;
    pools.reserve(list.size());
    for (const auto& p : list) {
        try {
            LiquidityPool pool;
            pool.chain_id = p.value("chain_id", static_cast<uint64_t>(1));
            pool.address = p.at("address").get<std::string>();
            pool.token0 = parse_token(p.at("token0"), pool.chain_id);
            pool.token1 = parse_token(p.at("token1"), pool.chain_id);
            pool.reserve0 = parse_reserve(p.at("reserve0"));
            pool.reserve1 = parse_reserve(p.at("reserve1"));
            if (p.contains("fee_pips")) {
                pool.fee_pips = p.at("fee_pips").get<uint32_t>();
            } else {
                pool.fee_pips = amm::fee_to_pips(p.value("fee", 0.003));
            }
            pool.source = p.value("source", "");
            pool.tvl_usd = p.value("tvl_usd", 0.0);
            pools.push_back(std::move(pool));
        } catch (const nlohmann::json::exception& e) {
            throw ConfigError(std::string("invalid pool entry: ") + e.what());
        } catch (const std::invalid_argument& e) {
            throw ConfigError(std::string("invalid pool reserve: ") + e.what());
        }
    }
    return pools;
}

std::vector<LiquidityPool> LiquidityGraph::load_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw ConfigError("Cannot open pool snapshot: " + path_str);
    }

    try {
        return parse_pools(nlohmann::json::parse(file));
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError(std::string("malformed pool snapshot: ") + e.what());
    }
}

}  // namespace quickroute::routing
