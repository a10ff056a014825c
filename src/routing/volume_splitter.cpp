// QuickRoute - Volume Splitter Implementation

#include <quickroute/routing/volume_splitter.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace quickroute::routing {

namespace {

constexpr double MIN_SPLIT_RISK = 5.0;

}  // namespace

VolumeSplitter::VolumeSplitter(double threshold, double max_split_size,
                               int64_t time_penalty_s, double risk_reduction)
    : threshold_(threshold),
      max_split_size_(max_split_size),
      time_penalty_s_(time_penalty_s),
      risk_reduction_(risk_reduction) {
    if (!(max_split_size_ > 0.0)) {
        throw std::invalid_argument("max split size must be positive");
    }
}

SplitPlan VolumeSplitter::plan(Amount amount_in, double notional) const {
    if (!std::isfinite(notional)) {
        throw std::invalid_argument("order notional must be finite");
    }

    SplitPlan plan;
    plan.notional = notional;

    if (!is_large(notional) || amount_in == 0) {
        plan.slices.push_back(amount_in);
        return plan;
    }

    // One slice per base unit at most; compare in double before narrowing
    double wanted = std::ceil(notional / max_split_size_);
    Amount count = wanted >= amount::to_double(amount_in)
        ? amount_in
        : static_cast<Amount>(wanted);

    // Spread the remainder one base unit at a time over the leading slices
    Amount base = amount_in / count;
    Amount remainder = amount_in % count;
    plan.slices.reserve(static_cast<size_t>(count));
    for (Amount i = 0; i < count; ++i) {
        plan.slices.push_back(base + (i < remainder ? 1 : 0));
    }
    return plan;
}

void VolumeSplitter::adjust(std::vector<OptimizedRoute>& routes) const {
    for (auto& route : routes) {
        route.split = true;
        route.estimated_time_s += time_penalty_s_;
        route.risk_score = std::max(MIN_SPLIT_RISK, route.risk_score - risk_reduction_);
    }
}

}  // namespace quickroute::routing
