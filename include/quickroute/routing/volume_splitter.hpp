// QuickRoute - Volume Splitter
// Breaks orders above the large-order threshold into near-equal slices

#pragma once

#include <quickroute/routing/types.hpp>
#include <vector>

namespace quickroute::routing {

struct SplitPlan {
    std::vector<Amount> slices;
    double notional = 0.0;

    [[nodiscard]] bool is_split() const noexcept { return slices.size() > 1; }
};

class VolumeSplitter {
public:
    VolumeSplitter(double threshold, double max_split_size,
                   int64_t time_penalty_s = 5, double risk_reduction = 10.0);

    [[nodiscard]] bool is_large(double notional) const noexcept { return notional > threshold_; }

    /// ceil(notional / max_split_size) slices summing exactly to amount_in;
    /// a single slice when the order is not large. Throws std::invalid_argument
    /// on a non-finite notional.
    [[nodiscard]] SplitPlan plan(Amount amount_in, double notional) const;

    /// Mark routes as split: time += penalty, risk -= reduction (floor 5)
    void adjust(std::vector<OptimizedRoute>& routes) const;

private:
    double threshold_;
    double max_split_size_;
    int64_t time_penalty_s_;
    double risk_reduction_;
};

}  // namespace quickroute::routing
