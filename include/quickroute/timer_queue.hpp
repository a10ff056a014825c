// QuickRoute - Timer Queue
// Cancellable one-shot timers keyed by due time on an injectable clock

#pragma once

#include <quickroute/clock.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>

namespace quickroute {

using TimerId = uint64_t;

class TimerQueue {
public:
    using Task = std::function<void()>;

    explicit TimerQueue(std::shared_ptr<Clock> clock);
    ~TimerQueue();

    TimerQueue(const TimerQueue&) = delete;
    TimerQueue& operator=(const TimerQueue&) = delete;

    TimerId schedule_after(std::chrono::milliseconds delay, Task task);
    TimerId schedule_at(int64_t due_ms, Task task);

    /// Returns false if the timer already fired or was never scheduled
    bool cancel(TimerId id);

    /// Run every task due at the current clock time. Tasks run outside the lock
    /// and may schedule or cancel timers. Returns the number of tasks run.
    size_t run_due();

    [[nodiscard]] std::optional<int64_t> next_due() const;
    [[nodiscard]] size_t pending() const;

    /// Drive run_due from a background thread
    void start(std::chrono::milliseconds tick = std::chrono::milliseconds(20));
    void stop();

    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }

    [[nodiscard]] Clock& clock() const noexcept { return *clock_; }
    [[nodiscard]] const std::shared_ptr<Clock>& clock_ptr() const noexcept { return clock_; }

private:
    void run_loop(std::chrono::milliseconds tick);

    std::shared_ptr<Clock> clock_;
    // (due, id) -> task; the id breaks ties in scheduling order
    std::map<std::pair<int64_t, TimerId>, Task> queue_;
    std::unordered_map<TimerId, int64_t> due_by_id_;
    TimerId next_id_ = 1;
    mutable std::mutex mutex_;
    std::atomic<bool> running_{false};
    std::unique_ptr<std::thread> thread_;
};

}  // namespace quickroute
