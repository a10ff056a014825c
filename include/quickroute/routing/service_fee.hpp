// QuickRoute - Service Fee
// Platform fee on route output with per-user revenue records

#pragma once

#include <quickroute/clock.hpp>
#include <quickroute/routing/types.hpp>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace quickroute::routing {

struct ServiceFee {
    double rate = 0.0;
    Amount gross_output = 0;
    Amount fee_amount = 0;
    Amount net_output = 0;
};

struct RevenueRecord {
    std::string user;
    std::string route_signature;
    Amount fee_amount = 0;
    double fee_units = 0.0;     // fee in whole output-token units
    int64_t timestamp = 0;
};

struct RevenueStats {
    double total = 0.0;
    double last_24h = 0.0;
    double average_fee = 0.0;
    size_t transactions = 0;
};

class ServiceFeeTracker {
public:
    ServiceFeeTracker(double rate, std::shared_ptr<Clock> clock);

    /// Fee on the route's estimated output without recording it
    [[nodiscard]] ServiceFee quote(const OptimizedRoute& route) const;

    /// Quote and record revenue attributed to `user`
    ServiceFee charge(const OptimizedRoute& route, const std::string& user);

    [[nodiscard]] RevenueStats stats() const;
    [[nodiscard]] std::vector<RevenueRecord> records_for(const std::string& user) const;

private:
    double rate_;
    std::shared_ptr<Clock> clock_;
    std::vector<RevenueRecord> records_;
    mutable std::mutex mutex_;
};

}  // namespace quickroute::routing
