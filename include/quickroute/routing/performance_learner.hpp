// QuickRoute - Performance Learner
// Bounded per-signature execution history that rescales route confidence and risk

#pragma once

#include <quickroute/routing/types.hpp>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace quickroute::routing {

struct LearnerMetrics {
    size_t signatures = 0;
    size_t outcomes = 0;
    double success_rate = 0.0;   // mean over every recorded outcome, 0..1
};

class PerformanceLearner {
public:
    explicit PerformanceLearner(size_t history_size = 100);

    /// Record a score in [0, 1] for a route signature; values are clamped
    void record(const std::string& signature, double score);

    void record(const OptimizedRoute& route, bool success) {
        record(route.signature(), success ? 1.0 : 0.0);
    }

    [[nodiscard]] std::optional<double> average(const std::string& signature) const;
    [[nodiscard]] size_t history_length(const std::string& signature) const;

    /// confidence = min(95, confidence * avg), risk = max(5, risk * (2 - avg))
    /// for every route with recorded history
    void apply(std::vector<OptimizedRoute>& routes) const;

    [[nodiscard]] LearnerMetrics metrics() const;
    void clear();

private:
    size_t history_size_;
    std::unordered_map<std::string, std::deque<double>> history_;
    mutable std::mutex mutex_;
};

}  // namespace quickroute::routing
