// QuickRoute - Feed Manager Implementation

#include <quickroute/aggregation/feed_manager.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <tuple>

namespace quickroute::aggregation {

namespace {

const std::string PING_MESSAGE = R"({"type":"ping"})";

std::string subscribe_message(const std::string& pair) {
    return nlohmann::json{{"type", "subscribe"}, {"tokenPair", pair}}.dump();
}

}  // namespace

FeedManager::FeedManager(TimerQueue& timers, FeedChannelFactory factory,
                         int max_reconnect_attempts, int64_t heartbeat_timeout_ms)
    : timers_(timers),
      factory_(std::move(factory)),
      max_reconnect_attempts_(max_reconnect_attempts),
      heartbeat_timeout_ms_(heartbeat_timeout_ms) {}

FeedManager::~FeedManager() {
    disconnect_all();
}

int64_t FeedManager::backoff_ms(int attempts) noexcept {
    return (int64_t{1} << std::min(attempts, 30)) * 1000;
}

void FeedManager::on_update(UpdateHandler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    update_handler_ = std::move(handler);
}

void FeedManager::on_error(ErrorHandler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    error_handler_ = std::move(handler);
}

void FeedManager::on_inactive(InactiveHandler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    inactive_handler_ = std::move(handler);
}

void FeedManager::add_source(const SourceInfo& source) {
    if (!source.feed_url) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto& conn = connections_[source.id];
    conn.state.source = source.id;
    conn.state.url = *source.feed_url;
}

void FeedManager::connect_all() {
    std::vector<std::string> sources;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = false;
        for (const auto& [id, conn] : connections_) {
            sources.push_back(id);
        }
    }
    for (const auto& id : sources) {
        connect(id);
    }
}

void FeedManager::connect(const std::string& source) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = false;
    }
    open_connection(source);
}

void FeedManager::open_connection(const std::string& source) {
    std::shared_ptr<FeedChannel> channel;
    std::shared_ptr<FeedChannel> previous;
    std::string url;
    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = connections_.find(source);
        if (it == connections_.end() || it->second.state.inactive || stopped_) {
            return;
        }

        auto& conn = it->second;
        if (conn.state.connected) {
            return;
        }
        if (conn.reconnect_timer) {
            timers_.cancel(*conn.reconnect_timer);
            conn.reconnect_timer.reset();
        }
        conn.state.next_reconnect_at.reset();

        generation = ++conn.generation;
        previous = std::move(conn.channel);
        channel = std::shared_ptr<FeedChannel>(factory_());
        conn.channel = channel;
        url = conn.state.url;
    }

    // The previous channel may join its io thread; never under our lock
    previous.reset();

    spdlog::info("connecting feed {} -> {}", source, url);

    FeedHandlers handlers;
    handlers.on_open = [this, source, generation] { handle_open(source, generation); };
    handlers.on_message = [this, source, generation](const std::string& payload) {
        handle_message(source, generation, payload);
    };
    handlers.on_close = [this, source, generation](const std::string& reason) {
        handle_close(source, generation, reason);
    };

    try {
        channel->open(url, std::move(handlers));
    } catch (const std::exception& e) {
        handle_close(source, generation, e.what());
    }
}

void FeedManager::handle_open(const std::string& source, uint64_t generation) {
    std::shared_ptr<FeedChannel> channel;
    std::vector<std::string> subscriptions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = connections_.find(source);
        if (it == connections_.end() || it->second.generation != generation) {
            return;
        }

        auto& state = it->second.state;
        int64_t now = timers_.clock().now_ms();
        state.connected = true;
        state.reconnect_attempts = 0;
        state.last_ping = now;
        state.last_message = now;
        state.next_reconnect_at.reset();

        channel = it->second.channel;
        subscriptions = state.subscriptions;
    }

    spdlog::info("feed {} connected", source);
    send_subscriptions(channel, subscriptions);
}

void FeedManager::handle_message(const std::string& source, uint64_t generation, const std::string& payload) {
    int64_t now = timers_.clock().now_ms();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = connections_.find(source);
        if (it == connections_.end() || it->second.generation != generation) {
            return;
        }
        it->second.state.last_message = now;
    }

    auto update = parse_message(source, payload, now);
    if (!update) {
        return;
    }

    UpdateHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        handler = update_handler_;
    }
    if (handler) {
        handler(*update);
    }
}

void FeedManager::handle_close(const std::string& source, uint64_t generation, const std::string& reason) {
    bool exhausted = false;
    int64_t delay = 0;
    int attempt = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = connections_.find(source);
        if (it == connections_.end() || it->second.generation != generation) {
            return;
        }

        auto& conn = it->second;
        // Later callbacks from this channel are stale
        ++conn.generation;
        conn.state.connected = false;

        if (stopped_) {
            return;
        }

        if (conn.state.reconnect_attempts >= max_reconnect_attempts_) {
            conn.state.inactive = true;
            exhausted = true;
        } else {
            delay = backoff_ms(conn.state.reconnect_attempts);
            conn.state.reconnect_attempts++;
            attempt = conn.state.reconnect_attempts;
            conn.state.next_reconnect_at = timers_.clock().now_ms() + delay;
            conn.reconnect_timer = timers_.schedule_after(std::chrono::milliseconds(delay),
                [this, source] { open_connection(source); });
        }
    }

    ErrorHandler error_handler;
    InactiveHandler inactive_handler;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        error_handler = error_handler_;
        inactive_handler = inactive_handler_;
    }

    int64_t now = timers_.clock().now_ms();
    if (exhausted) {
        spdlog::error("feed {} gave up after {} reconnect attempts", source, max_reconnect_attempts_);
        if (error_handler) {
            error_handler(ErrorEvent{ErrorKind::FeedDisconnected, source,
                                     "reconnect attempts exhausted: " + reason, now});
        }
        if (inactive_handler) {
            inactive_handler(source);
        }
        return;
    }

    spdlog::info("feed {} disconnected ({}), reconnect {} in {}ms", source, reason, attempt, delay);
    if (error_handler) {
        error_handler(ErrorEvent{ErrorKind::FeedDisconnected, source, reason, now});
    }
}

void FeedManager::subscribe(const std::string& source, const std::string& pair) {
    std::shared_ptr<FeedChannel> channel;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = connections_.find(source);
        if (it == connections_.end()) {
            return;
        }

        auto& subs = it->second.state.subscriptions;
        if (std::find(subs.begin(), subs.end(), pair) != subs.end()) {
            return;
        }
        subs.push_back(pair);
        if (it->second.state.connected) {
            channel = it->second.channel;
        }
    }

    if (channel) {
        channel->send(subscribe_message(pair));
    }
}

void FeedManager::send_subscriptions(const std::shared_ptr<FeedChannel>& channel,
                                     const std::vector<std::string>& pairs) const {
    if (!channel) return;
    for (const auto& pair : pairs) {
        channel->send(subscribe_message(pair));
    }
}

void FeedManager::heartbeat() {
    int64_t now = timers_.clock().now_ms();
    std::vector<std::shared_ptr<FeedChannel>> to_ping;
    std::vector<std::tuple<std::string, uint64_t, std::shared_ptr<FeedChannel>>> dead;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [id, conn] : connections_) {
            if (!conn.state.connected || !conn.channel) continue;

            if (now - conn.state.last_message > heartbeat_timeout_ms_) {
                dead.emplace_back(id, conn.generation, conn.channel);
            } else {
                conn.state.last_ping = now;
                to_ping.push_back(conn.channel);
            }
        }
    }

    for (const auto& channel : to_ping) {
        channel->send(PING_MESSAGE);
    }

    for (const auto& [id, generation, channel] : dead) {
        spdlog::warn("feed {} silent for over {}ms, closing", id, heartbeat_timeout_ms_);
        channel->close();
        handle_close(id, generation, "heartbeat timeout");
    }
}

void FeedManager::disconnect_all() {
    std::vector<std::shared_ptr<FeedChannel>> channels;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = true;
        for (auto& [id, conn] : connections_) {
            if (conn.reconnect_timer) {
                timers_.cancel(*conn.reconnect_timer);
                conn.reconnect_timer.reset();
            }
            ++conn.generation;
            conn.state.connected = false;
            conn.state.next_reconnect_at.reset();
            if (conn.channel) {
                channels.push_back(std::move(conn.channel));
            }
        }
    }

    for (auto& channel : channels) {
        channel->close();
    }
}

std::optional<FeedState> FeedManager::state(const std::string& source) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(source);
    if (it == connections_.end()) {
        return std::nullopt;
    }
    return it->second.state;
}

size_t FeedManager::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = 0;
    for (const auto& [id, conn] : connections_) {
        if (conn.state.connected) ++n;
    }
    return n;
}

size_t FeedManager::total_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_.size();
}

std::optional<PriceUpdate> FeedManager::parse_message(
    const std::string& source, const std::string& payload, int64_t now_ms) {

    auto j = nlohmann::json::parse(payload, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        spdlog::debug("feed {}: ignoring non-JSON message", source);
        return std::nullopt;
    }
    if (j.value("type", "") != "price_update" || !j.contains("tokenPair")) {
        return std::nullopt;
    }

    try {
        PriceUpdate update;
        update.source = source;
        update.pair = j.at("tokenPair").get<std::string>();
        update.price = j.at("price").get<double>();
        if (!(update.price > 0.0)) {
            spdlog::warn("feed {}: non-positive price {} for {}", source, update.price, update.pair);
            return std::nullopt;
        }

        const auto& out = j.at("amountOut");
        if (out.is_string()) {
            update.amount_out = amount::parse(out.get<std::string>());
        } else if (out.is_number_unsigned()) {
            update.amount_out = static_cast<Amount>(out.get<uint64_t>());
        } else {
            spdlog::warn("feed {}: amountOut must be a non-negative integer for {}", source, update.pair);
            return std::nullopt;
        }
        if (j.contains("liquidity") && j.at("liquidity").is_number()) {
            update.liquidity = j.at("liquidity").get<double>();
        }
        update.timestamp = j.value("timestamp", now_ms);
        return update;
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("feed {}: malformed price_update: {}", source, e.what());
    } catch (const std::invalid_argument& e) {
        spdlog::warn("feed {}: malformed price_update: {}", source, e.what());
    }
    return std::nullopt;
}

}  // namespace quickroute::aggregation
