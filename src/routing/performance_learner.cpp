// QuickRoute - Performance Learner Implementation

#include <quickroute/routing/performance_learner.hpp>
#include <algorithm>
#include <numeric>

namespace quickroute::routing {

namespace {

constexpr double MAX_LEARNED_CONFIDENCE = 95.0;
constexpr double MIN_LEARNED_RISK = 5.0;

double mean(const std::deque<double>& values) {
    if (values.empty()) return 0.0;
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

}  // namespace

PerformanceLearner::PerformanceLearner(size_t history_size)
    : history_size_(std::max<size_t>(history_size, 1)) {}

void PerformanceLearner::record(const std::string& signature, double score) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& history = history_[signature];
    history.push_back(std::clamp(score, 0.0, 1.0));
    while (history.size() > history_size_) {
        history.pop_front();
    }
}

std::optional<double> PerformanceLearner::average(const std::string& signature) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = history_.find(signature);
    if (it == history_.end() || it->second.empty()) {
        return std::nullopt;
    }
    return mean(it->second);
}

size_t PerformanceLearner::history_length(const std::string& signature) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = history_.find(signature);
    return it == history_.end() ? 0 : it->second.size();
}

void PerformanceLearner::apply(std::vector<OptimizedRoute>& routes) const {
    for (auto& route : routes) {
        auto avg = average(route.signature());
        if (!avg) continue;

        route.confidence = std::min(MAX_LEARNED_CONFIDENCE, route.confidence * *avg);
        route.risk_score = std::max(MIN_LEARNED_RISK, route.risk_score * (2.0 - *avg));
    }
}

LearnerMetrics PerformanceLearner::metrics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    LearnerMetrics m;
    m.signatures = history_.size();

    double total = 0.0;
    for (const auto& [sig, history] : history_) {
        m.outcomes += history.size();
        total += std::accumulate(history.begin(), history.end(), 0.0);
    }
    m.success_rate = m.outcomes > 0 ? total / static_cast<double>(m.outcomes) : 0.0;
    return m;
}

void PerformanceLearner::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    history_.clear();
}

}  // namespace quickroute::routing
