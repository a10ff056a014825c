// QuickRoute - Feed Manager
// One push connection per source with exponential reconnect backoff,
// heartbeats and price_update dispatch

#pragma once

#include <quickroute/aggregation/feed_channel.hpp>
#include <quickroute/aggregation/types.hpp>
#include <quickroute/errors.hpp>
#include <quickroute/timer_queue.hpp>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace quickroute::aggregation {

struct FeedState {
    std::string source;
    std::string url;
    bool connected = false;
    bool inactive = false;           // reconnects exhausted for this session
    int reconnect_attempts = 0;      // consecutive failures since the last open
    int64_t last_ping = 0;
    int64_t last_message = 0;
    std::optional<int64_t> next_reconnect_at;
    std::vector<std::string> subscriptions;
};

class FeedManager {
public:
    using UpdateHandler = std::function<void(const PriceUpdate&)>;
    using ErrorHandler = std::function<void(const ErrorEvent&)>;
    using InactiveHandler = std::function<void(const std::string& source)>;

    FeedManager(TimerQueue& timers, FeedChannelFactory factory,
                int max_reconnect_attempts = 5, int64_t heartbeat_timeout_ms = 30000);
    ~FeedManager();

    FeedManager(const FeedManager&) = delete;
    FeedManager& operator=(const FeedManager&) = delete;

    void on_update(UpdateHandler handler);
    void on_error(ErrorHandler handler);
    void on_inactive(InactiveHandler handler);

    /// Track a source; ignored when it has no feed URL
    void add_source(const SourceInfo& source);

    void connect_all();
    void connect(const std::string& source);

    /// Remembered across reconnects and sent whenever the feed opens
    void subscribe(const std::string& source, const std::string& pair);

    /// Ping open feeds; close feeds silent for longer than the heartbeat timeout
    void heartbeat();

    void disconnect_all();

    [[nodiscard]] std::optional<FeedState> state(const std::string& source) const;
    [[nodiscard]] size_t active_count() const;
    [[nodiscard]] size_t total_count() const;

    /// {"type":"price_update","tokenPair":...,"price":...,"amountOut":...,"liquidity":...}
    [[nodiscard]] static std::optional<PriceUpdate> parse_message(
        const std::string& source, const std::string& payload, int64_t now_ms);

    // Delay before reconnect number attempts+1: 2^attempts seconds
    [[nodiscard]] static int64_t backoff_ms(int attempts) noexcept;

private:
    struct Connection {
        FeedState state;
        std::shared_ptr<FeedChannel> channel;
        uint64_t generation = 0;
        std::optional<TimerId> reconnect_timer;
    };

    void open_connection(const std::string& source);
    void handle_open(const std::string& source, uint64_t generation);
    void handle_message(const std::string& source, uint64_t generation, const std::string& payload);
    void handle_close(const std::string& source, uint64_t generation, const std::string& reason);
    void send_subscriptions(const std::shared_ptr<FeedChannel>& channel,
                            const std::vector<std::string>& pairs) const;

    TimerQueue& timers_;
    FeedChannelFactory factory_;
    int max_reconnect_attempts_;
    int64_t heartbeat_timeout_ms_;
    std::unordered_map<std::string, Connection> connections_;
    UpdateHandler update_handler_;
    ErrorHandler error_handler_;
    InactiveHandler inactive_handler_;
    bool stopped_ = false;
    mutable std::mutex mutex_;
    mutable std::mutex handlers_mutex_;
};

}  // namespace quickroute::aggregation
