// QuickRoute - Price Aggregator Implementation

#include <quickroute/aggregation/price_aggregator.hpp>
#include <spdlog/spdlog.h>

namespace quickroute::aggregation {

namespace {

AggregatorParams params_from(const AggregatorConfig& config) {
    AggregatorParams p;
    p.max_stale_time_ms = config.max_stale_time_ms;
    p.outlier_detection = config.outlier_detection;
    p.arbitrage.threshold_pct = config.arbitrage_threshold;
    p.arbitrage.min_liquidity = config.min_liquidity;
    p.arbitrage.fee_buffer_pct = config.arbitrage_fee_buffer;
    return p;
}

FetchPolicy policy_from(const AggregatorConfig& config) {
    FetchPolicy p;
    p.timeout = std::chrono::milliseconds(config.timeout_ms);
    p.retry_attempts = config.retry_attempts;
    p.base_delay = std::chrono::milliseconds(config.retry_base_delay_ms);
    return p;
}

}  // namespace

PriceAggregator::PriceAggregator(AggregatorConfig config, SourceRegistry& registry,
                                 std::shared_ptr<HttpChannel> http, TimerQueue& timers,
                                 AggregationEvents& events)
    : config_(std::move(config)),
      registry_(registry),
      timers_(timers),
      events_(events),
      fetcher_(std::move(http), timers.clock_ptr(), policy_from(config_)),
      aggregator_(params_from(config_)),
      cache_(timers, config_.cache_ttl_ms, config_.max_stale_time_ms) {}

AggregatedPrice PriceAggregator::get_aggregated_price(const Token& token_in, const Token& token_out,
                                                      Amount amount_in) {
    QuoteRequest request{token_in, token_out, amount_in};
    std::string pair = pair_key(token_in, token_out);

    if (config_.cache_enabled) {
        if (auto cached = cache_.get(pair)) {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.cache_hits++;
            spdlog::debug("price cache hit for {}", pair);
            return *cached;
        }
    }

    int64_t now = timers_.clock().now_ms();
    std::vector<FetchTask> tasks;
    for (const auto& id : config_.enabled_sources) {
        auto info = registry_.find(id);
        if (!info) {
            spdlog::warn("enabled source {} is not registered", id);
            continue;
        }
        if (!info->active || !info->supports_chain(token_in.chain_id)) {
            continue;
        }
        if (!registry_.try_admit(id, now)) {
            spdlog::debug("{} rate limited, skipping", id);
            report(ErrorEvent::from(SourceRateLimited(id), now));
            continue;
        }
        tasks.push_back(FetchTask{std::move(*info), registry_.adapter(id), request});
    }

    auto outcomes = fetcher_.fetch_all(tasks, config_.max_concurrent_requests);

    std::vector<PriceData> quotes;
    for (auto& outcome : outcomes) {
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.total_requests++;
            if (outcome.ok()) {
                stats_.successful_requests++;
                timed_responses_++;
                stats_.average_response_ms +=
                    (static_cast<double>(outcome.elapsed_ms) - stats_.average_response_ms) /
                    static_cast<double>(timed_responses_);
            } else {
                stats_.failed_requests++;
            }
        }

        if (outcome.ok()) {
            quotes.push_back(std::move(*outcome.quote));
        } else if (outcome.error) {
            report(*outcome.error);
        }
    }

    AggregatedPrice aggregated;
    try {
        aggregated = aggregator_.aggregate(request, std::move(quotes), timers_.clock().now_ms());
    } catch (const NoValidPrices& e) {
        report(ErrorEvent::from(e, timers_.clock().now_ms()));
        throw;
    }

    if (config_.cache_enabled) {
        cache_.put(aggregated);
    }
    publish(aggregated);
    return aggregated;
}

bool PriceAggregator::apply_update(const PriceUpdate& update) {
    auto cached = cache_.peek(update.pair);
    if (!cached) {
        spdlog::debug("feed update for uncached pair {}", update.pair);
        return false;
    }

    auto quotes = cached->all_quotes;
    bool patched = false;
    for (auto& q : quotes) {
        if (q.source != update.source) continue;
        q.price = update.price;
        q.amount_out = update.amount_out;
        if (update.liquidity) q.liquidity = *update.liquidity;
        q.timestamp = update.timestamp;
        if (!q.is_valid()) {
            spdlog::warn("dropping invalid feed update from {} for {}", update.source, update.pair);
            report(ErrorEvent::from(InvalidPriceData(update.source,
                "feed update failed validation for " + update.pair), timers_.clock().now_ms()));
            return false;
        }
        patched = true;
    }
    if (!patched) {
        return false;
    }

    QuoteRequest request{cached->token_in, cached->token_out, cached->amount_in};
    AggregatedPrice aggregated;
    try {
        aggregated = aggregator_.aggregate(request, std::move(quotes), timers_.clock().now_ms());
    } catch (const NoValidPrices& e) {
        report(ErrorEvent::from(e, timers_.clock().now_ms()));
        return false;
    }

    cache_.put(aggregated);
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.feed_updates++;
    }
    publish(aggregated);
    return true;
}

void PriceAggregator::publish(const AggregatedPrice& price) {
    events_.price_updates.publish(price);

    for (const auto& opp : price.arbitrage) {
        spdlog::info("arbitrage {}: buy {} @ {} sell {} @ {} ({:.2f}%)",
                     opp.pair, opp.buy_source, opp.buy_price,
                     opp.sell_source, opp.sell_price, opp.spread_pct);
        events_.arbitrage.publish(opp);
    }

    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.arbitrage_opportunities += price.arbitrage.size();
}

void PriceAggregator::report(const ErrorEvent& error) {
    events_.errors.publish(error);
}

size_t PriceAggregator::purge_stale() {
    size_t removed = cache_.purge_stale(timers_.clock().now_ms());
    if (removed > 0) {
        spdlog::debug("purged {} stale price entries", removed);
    }
    return removed;
}

void PriceAggregator::clear_cache() {
    cache_.clear();
}

AggregatorStats PriceAggregator::stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    AggregatorStats s = stats_;
    s.cache_size = cache_.size();
    return s;
}

}  // namespace quickroute::aggregation
