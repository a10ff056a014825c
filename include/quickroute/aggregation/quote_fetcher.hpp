// QuickRoute - Quote Fetcher
// Per-source fetch with bounded retry and linear backoff, fanned out concurrently

#pragma once

#include <quickroute/aggregation/http_channel.hpp>
#include <quickroute/aggregation/source_adapter.hpp>
#include <quickroute/aggregation/types.hpp>
#include <quickroute/clock.hpp>
#include <quickroute/errors.hpp>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace quickroute::aggregation {

struct FetchPolicy {
    std::chrono::milliseconds timeout{5000};
    int retry_attempts = 3;                       // total attempts per source
    std::chrono::milliseconds base_delay{1000};   // wait base_delay * attempt before retrying
};

struct FetchTask {
    SourceInfo source;
    std::shared_ptr<const SourceAdapter> adapter;
    QuoteRequest request;
};

// Settled result of one source; exactly one of quote/error is set
struct FetchOutcome {
    std::string source;
    std::optional<PriceData> quote;
    std::optional<ErrorEvent> error;
    int attempts = 0;
    int64_t elapsed_ms = 0;

    [[nodiscard]] bool ok() const noexcept { return quote.has_value(); }
};

class QuoteFetcher {
public:
    QuoteFetcher(std::shared_ptr<HttpChannel> http, std::shared_ptr<Clock> clock, FetchPolicy policy);

    /// Never throws; failures come back as an error outcome.
    /// Malformed or invalid quotes are not retried.
    [[nodiscard]] FetchOutcome fetch(const FetchTask& task) const;

    /// Run every task, at most max_concurrency at a time, in task order
    [[nodiscard]] std::vector<FetchOutcome> fetch_all(const std::vector<FetchTask>& tasks,
                                                      size_t max_concurrency) const;

    [[nodiscard]] const FetchPolicy& policy() const noexcept { return policy_; }

private:
    PriceData fetch_once(const FetchTask& task) const;

    std::shared_ptr<HttpChannel> http_;
    std::shared_ptr<Clock> clock_;
    FetchPolicy policy_;
};

}  // namespace quickroute::aggregation
