// QuickRoute - Cross-Source Arbitrage Detector

#pragma once

#include <quickroute/aggregation/types.hpp>
#include <vector>

namespace quickroute::aggregation {

struct ArbitrageParams {
    double threshold_pct = 0.5;     // minimum spread to report
    double min_liquidity = 10000.0; // both sides must have at least this much
    double fee_buffer_pct = 0.6;    // subtracted from the spread for profit margin
    Amount min_amount = 1000;
};

class ArbitrageDetector {
public:
    explicit ArbitrageDetector(ArbitrageParams params = {}) : params_(params) {}

    /// Every unordered pair of quotes from different sources whose relative
    /// spread |p1 - p2| / min(p1, p2) reaches the threshold, best margin first.
    /// Buy side is the cheaper source.
    [[nodiscard]] std::vector<ArbitrageOpportunity> scan(const std::vector<PriceData>& quotes,
                                                         int64_t now_ms) const;

    /// 0..100 from liquidity, impact, confidence and combined gas of both sides
    [[nodiscard]] static double risk_score(const PriceData& buy, const PriceData& sell) noexcept;

    [[nodiscard]] const ArbitrageParams& params() const noexcept { return params_; }

private:
    ArbitrageParams params_;
};

}  // namespace quickroute::aggregation
