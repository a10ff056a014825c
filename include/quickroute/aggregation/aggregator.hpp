// QuickRoute - Aggregator
// Folds a set of quotes into one AggregatedPrice

#pragma once

#include <quickroute/aggregation/arbitrage_detector.hpp>
#include <quickroute/aggregation/types.hpp>
#include <vector>

namespace quickroute::aggregation {

/// min/max/median/mean and population standard deviation; zeros when empty
[[nodiscard]] SpreadStats compute_spread(std::vector<double> prices);

struct AggregatorParams {
    int64_t max_stale_time_ms = 30000;
    bool outlier_detection = true;
    ArbitrageParams arbitrage;
};

class Aggregator {
public:
    explicit Aggregator(AggregatorParams params) : params_(params), detector_(params.arbitrage) {}

    /// Split stale quotes off, drop outliers, pick the largest output as best,
    /// then compute spread statistics and arbitrage over the survivors.
    /// Throws NoValidPrices when nothing survives.
    [[nodiscard]] AggregatedPrice aggregate(const QuoteRequest& request,
                                            std::vector<PriceData> quotes,
                                            int64_t now_ms) const;

    [[nodiscard]] const AggregatorParams& params() const noexcept { return params_; }

private:
    AggregatorParams params_;
    ArbitrageDetector detector_;
};

}  // namespace quickroute::aggregation
