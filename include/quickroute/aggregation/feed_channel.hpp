// QuickRoute - Feed Channel
// Push connection to one source's streaming endpoint

#pragma once

#include <functional>
#include <memory>
#include <string>

namespace quickroute::aggregation {

struct FeedHandlers {
    std::function<void()> on_open;
    std::function<void(const std::string& payload)> on_message;
    std::function<void(const std::string& reason)> on_close;   // close or failed connect
};

class FeedChannel {
public:
    virtual ~FeedChannel() = default;

    /// Begin connecting; outcome arrives through the handlers.
    /// Throws FeedDisconnected if the connection cannot even be attempted.
    virtual void open(const std::string& url, FeedHandlers handlers) = 0;

    virtual void send(const std::string& payload) = 0;

    virtual void close() = 0;
};

using FeedChannelFactory = std::function<std::unique_ptr<FeedChannel>()>;

// websocketpp client running on its own io thread
class WebSocketFeedChannel : public FeedChannel {
public:
    WebSocketFeedChannel();
    ~WebSocketFeedChannel() override;

    WebSocketFeedChannel(const WebSocketFeedChannel&) = delete;
    WebSocketFeedChannel& operator=(const WebSocketFeedChannel&) = delete;

    void open(const std::string& url, FeedHandlers handlers) override;
    void send(const std::string& payload) override;
    void close() override;

    static FeedChannelFactory factory();

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace quickroute::aggregation
