// QuickRoute - Quote Fetcher Implementation

#include <quickroute/aggregation/quote_fetcher.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <future>

namespace quickroute::aggregation {

QuoteFetcher::QuoteFetcher(std::shared_ptr<HttpChannel> http, std::shared_ptr<Clock> clock, FetchPolicy policy)
    : http_(std::move(http)), clock_(std::move(clock)), policy_(policy) {}

PriceData QuoteFetcher::fetch_once(const FetchTask& task) const {
    const auto& source = task.source;
    HttpRequest request = task.adapter->build_request(source, task.request);
    HttpResponse response = http_->send(source.id, request, policy_.timeout);

    if (response.status_code == 429) {
        throw SourceRateLimited(source.id);
    }
    if (response.status_code < 200 || response.status_code >= 300) {
        throw TransportError(source.id, "HTTP " + std::to_string(response.status_code) + " from " + request.url);
    }

    nlohmann::json body;
    try {
        body = nlohmann::json::parse(response.body);
    } catch (const nlohmann::json::parse_error& e) {
        throw TransportError(source.id, std::string("unparseable response: ") + e.what());
    }

    PriceData quote = task.adapter->parse_response(source, task.request, body, clock_->now_ms());
    if (!quote.is_valid()) {
        throw InvalidPriceData(source.id, "quote failed validation");
    }
    return quote;
}

FetchOutcome QuoteFetcher::fetch(const FetchTask& task) const {
    FetchOutcome outcome;
    outcome.source = task.source.id;
    int64_t started = clock_->now_ms();
    const int max_attempts = std::max(1, policy_.retry_attempts);

    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        outcome.attempts = attempt;
        try {
            outcome.quote = fetch_once(task);
            outcome.error.reset();
            break;
        } catch (const InvalidPriceData& e) {
            spdlog::warn("{}: {}", task.source.id, e.what());
            outcome.error = ErrorEvent::from(e, clock_->now_ms());
            break;
        } catch (const EngineError& e) {
            outcome.error = ErrorEvent::from(e, clock_->now_ms());
        } catch (const std::exception& e) {
            outcome.error = ErrorEvent{ErrorKind::Transport, task.source.id, e.what(), clock_->now_ms()};
        }

        if (attempt < max_attempts) {
            auto delay = policy_.base_delay * attempt;
            spdlog::debug("{}: attempt {} failed ({}), retrying in {}ms",
                          task.source.id, attempt, outcome.error->message, delay.count());
            clock_->sleep_for(delay);
        } else {
            spdlog::warn("{}: giving up after {} attempts: {}",
                         task.source.id, attempt, outcome.error->message);
        }
    }

    outcome.elapsed_ms = clock_->now_ms() - started;
    return outcome;
}

std::vector<FetchOutcome> QuoteFetcher::fetch_all(const std::vector<FetchTask>& tasks,
                                                  size_t max_concurrency) const {
    std::vector<FetchOutcome> outcomes;
    outcomes.reserve(tasks.size());
    const size_t batch = std::max<size_t>(1, max_concurrency);

    for (size_t start = 0; start < tasks.size(); start += batch) {
        size_t end = std::min(tasks.size(), start + batch);

        std::vector<std::future<FetchOutcome>> futures;
        futures.reserve(end - start);
        for (size_t i = start; i < end; ++i) {
            futures.push_back(std::async(std::launch::async,
                [this, &task = tasks[i]] { return fetch(task); }));
        }

        for (auto& f : futures) {
            outcomes.push_back(f.get());
        }
    }
    return outcomes;
}

}  // namespace quickroute::aggregation
