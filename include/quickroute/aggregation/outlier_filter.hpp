// QuickRoute - Outlier Filter
// Tukey fences on quoted prices

#pragma once

#include <quickroute/types.hpp>
#include <optional>
#include <vector>

namespace quickroute::aggregation {

struct PriceFences {
    double q1 = 0.0;
    double q3 = 0.0;
    double lower = 0.0;   // q1 - 1.5 * IQR
    double upper = 0.0;   // q3 + 1.5 * IQR
};

/// Quartiles at sorted[floor(p * (n - 1))]; nullopt with fewer than 3 prices
[[nodiscard]] std::optional<PriceFences> price_fences(std::vector<double> prices);

/// Quotes whose price lies within the fences, in input order.
/// Fewer than 3 quotes pass through unchanged.
[[nodiscard]] std::vector<PriceData> filter_outliers(const std::vector<PriceData>& quotes);

}  // namespace quickroute::aggregation
