// QuickRoute - Rate Limiter
// Sliding-window admission control, one window per source

#pragma once

#include <cstdint>
#include <deque>
#include <mutex>

namespace quickroute::aggregation {

class RateLimiter {
public:
    RateLimiter(size_t limit, int64_t window_ms);

    /// Prune timestamps older than the window, then compare the count to the limit
    [[nodiscard]] bool can_admit(int64_t now_ms);

    /// Append a request timestamp
    void record(int64_t now_ms);

    /// can_admit and record under one lock
    bool try_admit(int64_t now_ms);

    [[nodiscard]] size_t in_window(int64_t now_ms);

    [[nodiscard]] size_t limit() const noexcept { return limit_; }
    [[nodiscard]] int64_t window_ms() const noexcept { return window_ms_; }

private:
    void prune(int64_t now_ms);

    size_t limit_;
    int64_t window_ms_;
    std::deque<int64_t> requests_;
    std::mutex mutex_;
};

}  // namespace quickroute::aggregation
