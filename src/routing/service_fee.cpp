// QuickRoute - Service Fee Implementation

#include <quickroute/routing/service_fee.hpp>
#include <quickroute/routing/amm.hpp>
#include <cmath>
#include <stdexcept>

namespace quickroute::routing {

namespace {

constexpr int64_t DAY_MS = 24LL * 60 * 60 * 1000;
constexpr uint64_t RATE_SCALE = 1'000'000;   // fee rate resolution in millionths

}  // namespace

ServiceFeeTracker::ServiceFeeTracker(double rate, std::shared_ptr<Clock> clock)
    : rate_(rate), clock_(std::move(clock)) {
    if (rate_ < 0.0 || rate_ >= 1.0) {
        throw std::invalid_argument("service fee rate must be in [0, 1)");
    }
}

ServiceFee ServiceFeeTracker::quote(const OptimizedRoute& route) const {
    ServiceFee fee;
    fee.rate = rate_;
    fee.gross_output = route.estimated_output;

    auto rate_scaled = static_cast<U128>(std::llround(rate_ * RATE_SCALE));
    fee.fee_amount = amm::mul_div(route.estimated_output, rate_scaled, RATE_SCALE);
    fee.net_output = fee.gross_output - fee.fee_amount;
    return fee;
}

ServiceFee ServiceFeeTracker::charge(const OptimizedRoute& route, const std::string& user) {
    ServiceFee fee = quote(route);

    RevenueRecord record;
    record.user = user;
    record.route_signature = route.signature();
    record.fee_amount = fee.fee_amount;
    record.timestamp = clock_->now_ms();
    if (!route.steps.empty()) {
        record.fee_units = amount::to_units(fee.fee_amount, route.steps.back().token_out.decimals);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    records_.push_back(std::move(record));
    return fee;
}

RevenueStats ServiceFeeTracker::stats() const {
    int64_t cutoff = clock_->now_ms() - DAY_MS;

    std::lock_guard<std::mutex> lock(mutex_);
    RevenueStats s;
    s.transactions = records_.size();
    for (const auto& r : records_) {
        s.total += r.fee_units;
        if (r.timestamp > cutoff) {
            s.last_24h += r.fee_units;
        }
    }
    s.average_fee = s.transactions > 0 ? s.total / static_cast<double>(s.transactions) : 0.0;
    return s;
}

std::vector<RevenueRecord> ServiceFeeTracker::records_for(const std::string& user) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<RevenueRecord> out;
    for (const auto& r : records_) {
        if (r.user == user) out.push_back(r);
    }
    return out;
}

}  // namespace quickroute::routing
