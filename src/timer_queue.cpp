// QuickRoute - Timer Queue Implementation

#include <quickroute/timer_queue.hpp>
#include <spdlog/spdlog.h>
#include <vector>

namespace quickroute {

TimerQueue::TimerQueue(std::shared_ptr<Clock> clock)
    : clock_(std::move(clock)) {}

TimerQueue::~TimerQueue() {
    stop();
}

TimerId TimerQueue::schedule_after(std::chrono::milliseconds delay, Task task) {
    return schedule_at(clock_->now_ms() + delay.count(), std::move(task));
}

TimerId TimerQueue::schedule_at(int64_t due_ms, Task task) {
    std::lock_guard<std::mutex> lock(mutex_);
    TimerId id = next_id_++;
    queue_.emplace(std::make_pair(due_ms, id), std::move(task));
    due_by_id_[id] = due_ms;
    return id;
}

bool TimerQueue::cancel(TimerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = due_by_id_.find(id);
    if (it == due_by_id_.end()) {
        return false;
    }
    queue_.erase({it->second, id});
    due_by_id_.erase(it);
    return true;
}

size_t TimerQueue::run_due() {
    int64_t now = clock_->now_ms();

    std::vector<Task> due;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = queue_.begin();
        while (it != queue_.end() && it->first.first <= now) {
            due_by_id_.erase(it->first.second);
            due.push_back(std::move(it->second));
            it = queue_.erase(it);
        }
    }

    for (auto& task : due) {
        try {
            task();
        } catch (const std::exception& e) {
            spdlog::error("timer task failed: {}", e.what());
        } catch (...) {
            spdlog::error("timer task threw a non-standard exception");
        }
    }
    return due.size();
}

std::optional<int64_t> TimerQueue::next_due() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
        return std::nullopt;
    }
    return queue_.begin()->first.first;
}

size_t TimerQueue::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void TimerQueue::start(std::chrono::milliseconds tick) {
    if (running_.exchange(true)) {
        return;  // Already running
    }

    thread_ = std::make_unique<std::thread>(&TimerQueue::run_loop, this, tick);
}

void TimerQueue::stop() {
    running_.store(false);

    if (thread_ && thread_->joinable()) {
        thread_->join();
    }
    thread_.reset();
}

void TimerQueue::run_loop(std::chrono::milliseconds tick) {
    while (running_.load()) {
        run_due();
        std::this_thread::sleep_for(tick);
    }
}

}  // namespace quickroute
