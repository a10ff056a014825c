// QuickRoute - Rate Limiter Implementation

#include <quickroute/aggregation/rate_limiter.hpp>

namespace quickroute::aggregation {

RateLimiter::RateLimiter(size_t limit, int64_t window_ms)
    : limit_(limit), window_ms_(window_ms) {}

void RateLimiter::prune(int64_t now_ms) {
    while (!requests_.empty() && now_ms - requests_.front() >= window_ms_) {
        requests_.pop_front();
    }
}

bool RateLimiter::can_admit(int64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    prune(now_ms);
    return requests_.size() < limit_;
}

void RateLimiter::record(int64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    requests_.push_back(now_ms);
}

bool RateLimiter::try_admit(int64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    prune(now_ms);
    if (requests_.size() >= limit_) {
        return false;
    }
    requests_.push_back(now_ms);
    return true;
}

size_t RateLimiter::in_window(int64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    prune(now_ms);
    return requests_.size();
}

}  // namespace quickroute::aggregation
