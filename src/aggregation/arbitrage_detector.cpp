// QuickRoute - Cross-Source Arbitrage Detector Implementation

#include <quickroute/aggregation/arbitrage_detector.hpp>
#include <algorithm>
#include <cmath>

namespace quickroute::aggregation {

std::vector<ArbitrageOpportunity> ArbitrageDetector::scan(const std::vector<PriceData>& quotes,
                                                          int64_t now_ms) const {
    std::vector<ArbitrageOpportunity> opportunities;

    for (size_t i = 0; i < quotes.size(); ++i) {
        for (size_t j = i + 1; j < quotes.size(); ++j) {
            const auto& a = quotes[i];
            const auto& b = quotes[j];

            if (a.source == b.source) continue;
            if (a.liquidity < params_.min_liquidity || b.liquidity < params_.min_liquidity) continue;

            double low = std::min(a.price, b.price);
            if (low <= 0.0) continue;

            double spread = std::abs(a.price - b.price) / low * 100.0;
            if (spread < params_.threshold_pct) continue;

            const auto& buy = a.price <= b.price ? a : b;
            const auto& sell = a.price <= b.price ? b : a;

            ArbitrageOpportunity opp;
            opp.buy_source = buy.source;
            opp.sell_source = sell.source;
            opp.pair = pair_key(buy.token_in, buy.token_out);
            opp.buy_price = buy.price;
            opp.sell_price = sell.price;
            opp.spread_pct = spread;
            opp.profit_margin = spread - params_.fee_buffer_pct;
            opp.volume = std::min(buy.liquidity, sell.liquidity);
            opp.risk_score = risk_score(buy, sell);
            opp.min_amount = params_.min_amount;
            opp.max_amount = static_cast<Amount>(opp.volume);
            opp.gas_estimate = buy.gas_estimate + sell.gas_estimate;
            opp.confidence = std::min(buy.confidence, sell.confidence);
            opp.timestamp = now_ms;
            opportunities.push_back(std::move(opp));
        }
    }

    std::sort(opportunities.begin(), opportunities.end(),
              [](const auto& x, const auto& y) { return x.profit_margin > y.profit_margin; });
    return opportunities;
}

double ArbitrageDetector::risk_score(const PriceData& buy, const PriceData& sell) noexcept {
    double risk = 30.0;

    double min_liquidity = std::min(buy.liquidity, sell.liquidity);
    if (min_liquidity < 100000.0) risk += 20.0;
    if (min_liquidity < 50000.0) risk += 30.0;

    double max_impact = std::max(buy.price_impact, sell.price_impact);
    if (max_impact > 2.0) risk += 15.0;
    if (max_impact > 5.0) risk += 25.0;

    double min_confidence = std::min(buy.confidence, sell.confidence);
    if (min_confidence < 80.0) risk += 10.0;
    if (min_confidence < 60.0) risk += 20.0;

    if (buy.gas_estimate + sell.gas_estimate > 500000) risk += 15.0;

    return std::min(100.0, risk);
}

}  // namespace quickroute::aggregation
