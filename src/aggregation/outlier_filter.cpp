// QuickRoute - Outlier Filter Implementation

#include <quickroute/aggregation/outlier_filter.hpp>
#include <algorithm>
#include <cmath>

namespace quickroute::aggregation {

namespace {

constexpr size_t MIN_SAMPLES = 3;
constexpr double IQR_MULTIPLIER = 1.5;

double quantile_lower(const std::vector<double>& sorted, double p) {
    auto idx = static_cast<size_t>(std::floor(p * static_cast<double>(sorted.size() - 1)));
    return sorted[idx];
}

}  // namespace

std::optional<PriceFences> price_fences(std::vector<double> prices) {
    if (prices.size() < MIN_SAMPLES) {
        return std::nullopt;
    }

    std::sort(prices.begin(), prices.end());

    PriceFences f;
    f.q1 = quantile_lower(prices, 0.25);
    f.q3 = quantile_lower(prices, 0.75);
    double iqr = f.q3 - f.q1;
    f.lower = f.q1 - IQR_MULTIPLIER * iqr;
    f.upper = f.q3 + IQR_MULTIPLIER * iqr;
    return f;
}

std::vector<PriceData> filter_outliers(const std::vector<PriceData>& quotes) {
    std::vector<double> prices;
    prices.reserve(quotes.size());
    for (const auto& q : quotes) {
        prices.push_back(q.price);
    }

    auto fences = price_fences(std::move(prices));
    if (!fences) {
        return quotes;
    }

    std::vector<PriceData> kept;
    kept.reserve(quotes.size());
    for (const auto& q : quotes) {
        if (q.price >= fences->lower && q.price <= fences->upper) {
            kept.push_back(q);
        }
    }
    return kept;
}

}  // namespace quickroute::aggregation
