// QuickRoute - Test Doubles
// Scripted HTTP channel, hand-driven feed channels and token fixtures

#pragma once

#include <quickroute/aggregation/feed_channel.hpp>
#include <quickroute/aggregation/http_channel.hpp>
#include <quickroute/errors.hpp>
#include <quickroute/types.hpp>
#include <nlohmann/json.hpp>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace quickroute::testing {

inline Token token(const std::string& symbol, uint8_t decimals = 18, uint64_t chain = 1) {
    return Token{"0x" + symbol, symbol, chain, decimals};
}

/// Pool holding whole-token reserves of both sides
inline LiquidityPool pool(const std::string& address, const Token& a, const Token& b,
                          double reserve_a, double reserve_b, const std::string& source,
                          double tvl_usd = 50'000'000.0, uint32_t fee_pips = 3000) {
    LiquidityPool p;
    p.address = address;
    p.token0 = a;
    p.token1 = b;
    p.reserve0 = amount::from_units(reserve_a, a.decimals);
    p.reserve1 = amount::from_units(reserve_b, b.decimals);
    p.fee_pips = fee_pips;
    p.source = source;
    p.tvl_usd = tvl_usd;
    p.chain_id = a.chain_id;
    return p;
}

inline std::string quote_body(double price, const std::string& amount_out,
                              double liquidity = 1'000'000.0, double impact = 0.1) {
    return nlohmann::json{
        {"price", price},
        {"amountOut", amount_out},
        {"priceImpact", impact},
        {"liquidity", liquidity},
        {"gas", 150000}
    }.dump();
}

class FakeHttpChannel : public aggregation::HttpChannel {
public:
    struct Reply {
        long status = 200;
        std::string body;
        bool timeout = false;
        bool transport_error = false;

        static Reply ok(std::string b) { return Reply{200, std::move(b), false, false}; }
        static Reply timed_out() { return Reply{0, "", true, false}; }
        static Reply unreachable() { return Reply{0, "", false, true}; }
        static Reply status_only(long code) { return Reply{code, "{}", false, false}; }
    };

    /// Replies consumed in order; the last one repeats
    void script(const std::string& source, std::vector<Reply> replies) {
        std::lock_guard<std::mutex> lock(mutex_);
        scripts_[source] = std::deque<Reply>(replies.begin(), replies.end());
    }

    void always(const std::string& source, Reply reply) {
        script(source, {std::move(reply)});
    }

    aggregation::HttpResponse send(const std::string& source, const aggregation::HttpRequest& request,
                                   std::chrono::milliseconds) override {
        Reply reply;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            urls_[source].push_back(request.url);
            auto it = scripts_.find(source);
            if (it == scripts_.end() || it->second.empty()) {
                throw TransportError(source, "no scripted reply");
            }
            reply = it->second.front();
            if (it->second.size() > 1) {
                it->second.pop_front();
            }
        }

        if (reply.timeout) throw SourceTimeout(source, "scripted timeout");
        if (reply.transport_error) throw TransportError(source, "scripted transport failure");
        return aggregation::HttpResponse{reply.status, reply.body, 1.0};
    }

    size_t calls(const std::string& source) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = urls_.find(source);
        return it == urls_.end() ? 0 : it->second.size();
    }

    std::vector<std::string> urls(const std::string& source) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = urls_.find(source);
        return it == urls_.end() ? std::vector<std::string>{} : it->second;
    }

private:
    std::map<std::string, std::deque<Reply>> scripts_;
    std::map<std::string, std::vector<std::string>> urls_;
    mutable std::mutex mutex_;
};

// Feed channel whose lifecycle the test drives by hand
class FakeFeedChannel : public aggregation::FeedChannel {
public:
    void open(const std::string& url, aggregation::FeedHandlers handlers) override {
        url_ = url;
        handlers_ = std::move(handlers);
        opened_ = true;
    }

    void send(const std::string& payload) override { sent_.push_back(payload); }

    void close() override { closed_ = true; }

    void deliver_open() { handlers_.on_open(); }
    void deliver_message(const std::string& payload) { handlers_.on_message(payload); }
    void deliver_close(const std::string& reason = "remote closed") { handlers_.on_close(reason); }

    [[nodiscard]] const std::string& url() const noexcept { return url_; }
    [[nodiscard]] const std::vector<std::string>& sent() const noexcept { return sent_; }
    [[nodiscard]] bool opened() const noexcept { return opened_; }
    [[nodiscard]] bool closed() const noexcept { return closed_; }

private:
    std::string url_;
    aggregation::FeedHandlers handlers_;
    std::vector<std::string> sent_;
    bool opened_ = false;
    bool closed_ = false;
};

// Records every channel the feed manager creates
class FakeFeedHub {
public:
    aggregation::FeedChannelFactory factory() {
        return [this] {
            auto channel = std::make_unique<FakeFeedChannel>();
            channels_.push_back(channel.get());
            return channel;
        };
    }

    [[nodiscard]] size_t count() const noexcept { return channels_.size(); }
    [[nodiscard]] FakeFeedChannel& latest() { return *channels_.back(); }
    [[nodiscard]] FakeFeedChannel& at(size_t i) { return *channels_.at(i); }

private:
    std::vector<FakeFeedChannel*> channels_;
};

}  // namespace quickroute::testing
