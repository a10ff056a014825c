// QuickRoute - Aggregator Implementation

#include <quickroute/aggregation/aggregator.hpp>
#include <quickroute/aggregation/outlier_filter.hpp>
#include <quickroute/errors.hpp>
#include <algorithm>
#include <cmath>
#include <numeric>

namespace quickroute::aggregation {

SpreadStats compute_spread(std::vector<double> prices) {
    SpreadStats s;
    if (prices.empty()) {
        return s;
    }

    std::sort(prices.begin(), prices.end());
    size_t n = prices.size();

    s.min = prices.front();
    s.max = prices.back();
    s.median = n % 2 == 0 ? (prices[n / 2 - 1] + prices[n / 2]) / 2.0 : prices[n / 2];
    s.mean = std::accumulate(prices.begin(), prices.end(), 0.0) / static_cast<double>(n);

    double variance = 0.0;
    for (double p : prices) {
        double diff = p - s.mean;
        variance += diff * diff;
    }
    s.std_dev = std::sqrt(variance / static_cast<double>(n));
    return s;
}

AggregatedPrice Aggregator::aggregate(const QuoteRequest& request,
                                      std::vector<PriceData> quotes,
                                      int64_t now_ms) const {
    AggregatedPrice agg;
    agg.pair = pair_key(request.token_in, request.token_out);
    agg.token_in = request.token_in;
    agg.token_out = request.token_out;
    agg.amount_in = request.amount_in;
    agg.last_updated = now_ms;

    std::vector<PriceData> fresh;
    for (const auto& q : quotes) {
        if (now_ms - q.timestamp > params_.max_stale_time_ms) {
            agg.stale_quotes.push_back(q);
        } else {
            fresh.push_back(q);
        }
    }
    agg.all_quotes = std::move(quotes);

    agg.valid_quotes = params_.outlier_detection ? filter_outliers(fresh) : std::move(fresh);
    if (agg.valid_quotes.empty()) {
        throw NoValidPrices(agg.pair);
    }

    agg.best = *std::max_element(agg.valid_quotes.begin(), agg.valid_quotes.end(),
        [](const PriceData& a, const PriceData& b) { return a.amount_out < b.amount_out; });

    std::vector<double> prices;
    prices.reserve(agg.valid_quotes.size());
    for (const auto& q : agg.valid_quotes) {
        prices.push_back(q.price);
    }
    agg.spread = compute_spread(std::move(prices));
    agg.arbitrage = detector_.scan(agg.valid_quotes, now_ms);
    return agg;
}

}  // namespace quickroute::aggregation
