// QuickRoute - Aggregation Types

#pragma once

#include <quickroute/types.hpp>
#include <algorithm>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace quickroute::aggregation {

// Static metadata for one liquidity source
struct SourceInfo {
    std::string id;
    std::string name;
    std::string api_endpoint;
    std::optional<std::string> feed_url;
    size_t rate_limit = 5;          // requests per window
    int64_t window_ms = 1000;
    double reliability = 80.0;      // 0..100, used as quote confidence
    bool active = true;
    std::vector<uint64_t> supported_chains;
    std::map<std::string, std::string> headers;

    /// An empty chain list means any chain
    [[nodiscard]] bool supports_chain(uint64_t chain_id) const noexcept {
        return supported_chains.empty() ||
               std::find(supported_chains.begin(), supported_chains.end(), chain_id) !=
                   supported_chains.end();
    }
};

struct QuoteRequest {
    Token token_in;
    Token token_out;
    Amount amount_in = 0;
};

struct SpreadStats {
    double min = 0.0;
    double max = 0.0;
    double median = 0.0;
    double mean = 0.0;
    double std_dev = 0.0;
};

struct ArbitrageOpportunity {
    std::string buy_source;
    std::string sell_source;
    std::string pair;
    double buy_price = 0.0;
    double sell_price = 0.0;
    double spread_pct = 0.0;
    double profit_margin = 0.0;   // percent, spread minus fee buffer
    double volume = 0.0;          // USD, min of both liquidities
    double risk_score = 0.0;
    Amount min_amount = 0;
    Amount max_amount = 0;
    uint64_t gas_estimate = 0;
    double confidence = 0.0;
    int64_t timestamp = 0;
};

struct AggregatedPrice {
    std::string pair;
    Token token_in;
    Token token_out;
    Amount amount_in = 0;
    PriceData best;
    std::vector<PriceData> all_quotes;     // every validated quote, outliers included
    std::vector<PriceData> valid_quotes;   // post-filter and fresh
    std::vector<PriceData> stale_quotes;
    SpreadStats spread;
    std::vector<ArbitrageOpportunity> arbitrage;
    int64_t last_updated = 0;
};

// Incremental quote pushed by a source feed
struct PriceUpdate {
    std::string source;
    std::string pair;
    double price = 0.0;
    Amount amount_out = 0;
    std::optional<double> liquidity;
    int64_t timestamp = 0;
};

}  // namespace quickroute::aggregation
