// QuickRoute - Engine Implementation

#include <quickroute/engine.hpp>
#include <spdlog/spdlog.h>

namespace quickroute {

Engine::Engine(Config config)
    : Engine(std::move(config), EngineDependencies{}) {}

Engine::Engine(Config config, EngineDependencies deps)
    : config_(std::move(config)),
      clock_(deps.clock ? deps.clock : std::shared_ptr<Clock>(std::make_shared<SystemClock>())),
      drive_timers_(deps.drive_timers),
      timers_(clock_),
      registry_(aggregation::SourceRegistry::from_config(config_)) {
    if (!deps.http) deps.http = std::make_shared<aggregation::CprHttpChannel>();
    if (!deps.feeds) deps.feeds = aggregation::WebSocketFeedChannel::factory();

    aggregator_ = std::make_unique<aggregation::PriceAggregator>(
        config_.aggregator, *registry_, deps.http, timers_, events_);
    optimizer_ = std::make_unique<routing::RouteOptimizer>(config_.routing, timers_);
    feeds_ = std::make_unique<aggregation::FeedManager>(
        timers_, deps.feeds, config_.aggregator.max_reconnect_attempts,
        config_.aggregator.heartbeat_timeout_ms);

    feeds_->on_update([this](const aggregation::PriceUpdate& update) {
        aggregator_->apply_update(update);
    });
    feeds_->on_error([this](const ErrorEvent& error) {
        events_.errors.publish(error);
    });
    feeds_->on_inactive([this](const std::string& source) {
        spdlog::warn("source {} marked inactive for this session", source);
        registry_->set_active(source, false);
    });

    for (const auto& id : config_.aggregator.enabled_sources) {
        if (auto info = registry_->find(id); info && info->active) {
            feeds_->add_source(*info);
        }
    }

    spdlog::debug("engine configured with {} sources, {} feeds",
                  registry_->size(), feeds_->total_count());
}

Engine::~Engine() {
    stop();
}

void Engine::start() {
    if (running_.exchange(true)) {
        return;  // Already running
    }

    if (config_.aggregator.feeds_enabled) {
        feeds_->connect_all();
    }
    schedule_maintenance();

    if (drive_timers_) {
        timers_.start();
    }
    spdlog::info("engine started");
}

void Engine::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    timers_.stop();
    {
        std::lock_guard<std::mutex> lock(maintenance_mutex_);
        if (maintenance_timer_) {
            timers_.cancel(*maintenance_timer_);
            maintenance_timer_.reset();
        }
    }
    feeds_->disconnect_all();
    spdlog::info("engine stopped");
}

size_t Engine::poll() {
    return timers_.run_due();
}

void Engine::schedule_maintenance() {
    std::lock_guard<std::mutex> lock(maintenance_mutex_);
    maintenance_timer_ = timers_.schedule_after(
        std::chrono::milliseconds(config_.aggregator.update_interval_ms),
        [this] {
            run_maintenance();
            if (running_.load()) {
                schedule_maintenance();
            }
        });
}

void Engine::run_maintenance() {
    aggregator_->purge_stale();
    feeds_->heartbeat();
}

aggregation::AggregatedPrice Engine::get_aggregated_price(const Token& token_in, const Token& token_out,
                                                          Amount amount_in) {
    auto price = aggregator_->get_aggregated_price(token_in, token_out, amount_in);

    if (config_.aggregator.feeds_enabled) {
        for (const auto& quote : price.all_quotes) {
            feeds_->subscribe(quote.source, price.pair);
        }
    }
    return price;
}

void Engine::load_pools(std::vector<LiquidityPool> pools) {
    optimizer_->set_pools(std::move(pools));
}

std::vector<routing::OptimizedRoute> Engine::find_optimal_routes(
    const Token& token_in, const Token& token_out, Amount amount_in,
    const std::vector<PriceData>& quotes) {

    auto routes = optimizer_->find_optimal_routes(token_in, token_out, amount_in, quotes);
    if (routes.empty()) {
        events_.errors.publish(ErrorEvent{ErrorKind::RouteNotFound, "",
            "no route from " + token_in.address + " to " + token_out.address, clock_->now_ms()});
    }
    return routes;
}

routing::SplitExecutionPlan Engine::find_optimal_route_for_large_volume(
    const Token& token_in, const Token& token_out, Amount amount_in,
    const std::vector<PriceData>& quotes, std::optional<double> input_price_usd) {
    return optimizer_->find_optimal_route_for_large_volume(token_in, token_out, amount_in,
                                                           quotes, input_price_usd);
}

void Engine::record_route_outcome(const routing::OptimizedRoute& route, bool success) {
    optimizer_->record_outcome(route, success);
}

SubscriptionId Engine::on_price_update(std::function<void(const aggregation::AggregatedPrice&)> listener) {
    return events_.price_updates.subscribe(std::move(listener));
}

SubscriptionId Engine::on_arbitrage_opportunity(
    std::function<void(const aggregation::ArbitrageOpportunity&)> listener) {
    return events_.arbitrage.subscribe(std::move(listener));
}

SubscriptionId Engine::on_error(std::function<void(const ErrorEvent&)> listener) {
    return events_.errors.subscribe(std::move(listener));
}

bool Engine::unsubscribe(SubscriptionId id) {
    return events_.price_updates.unsubscribe(id) ||
           events_.arbitrage.unsubscribe(id) ||
           events_.errors.unsubscribe(id);
}

void Engine::clear_cache() {
    aggregator_->clear_cache();
    optimizer_->clear_cache();
}

EngineStats Engine::stats() const {
    EngineStats s;
    s.aggregation = aggregator_->stats();
    s.routing = optimizer_->metrics();
    s.active_feeds = feeds_->active_count();
    s.total_feeds = feeds_->total_count();
    return s;
}

}  // namespace quickroute
