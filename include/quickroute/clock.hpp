// QuickRoute - Clock
// Injectable time source; ManualClock drives TTLs and backoff deterministically

#pragma once

#include <quickroute/types.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <thread>

namespace quickroute {

class Clock {
public:
    virtual ~Clock() = default;

    [[nodiscard]] virtual int64_t now_ms() const = 0;
    virtual void sleep_for(std::chrono::milliseconds duration) = 0;
};

class SystemClock : public Clock {
public:
    [[nodiscard]] int64_t now_ms() const override { return quickroute::now_ms(); }

    void sleep_for(std::chrono::milliseconds duration) override {
        std::this_thread::sleep_for(duration);
    }
};

// Virtual time that only moves when told to. sleep_for advances instead of blocking.
class ManualClock : public Clock {
public:
    explicit ManualClock(int64_t start_ms = 1'700'000'000'000LL) : now_(start_ms) {}

    [[nodiscard]] int64_t now_ms() const override { return now_.load(); }

    void sleep_for(std::chrono::milliseconds duration) override {
        now_.fetch_add(duration.count());
        slept_.fetch_add(duration.count());
    }

    void advance(std::chrono::milliseconds duration) { now_.fetch_add(duration.count()); }
    void set(int64_t ms) { now_.store(ms); }

    /// Total time spent in sleep_for
    [[nodiscard]] int64_t slept_ms() const noexcept { return slept_.load(); }

private:
    std::atomic<int64_t> now_;
    std::atomic<int64_t> slept_{0};
};

}  // namespace quickroute
