// QuickRoute - websocketpp Feed Channel

#include <quickroute/aggregation/feed_channel.hpp>
#include <quickroute/errors.hpp>
#include <spdlog/spdlog.h>
#include <websocketpp/client.hpp>
#include <websocketpp/config/asio_no_tls_client.hpp>
#include <atomic>
#include <mutex>
#include <thread>

namespace quickroute::aggregation {

using WsClient = websocketpp::client<websocketpp::config::asio_client>;
using ConnectionHdl = websocketpp::connection_hdl;
using MessagePtr = websocketpp::config::asio_client::message_type::ptr;

class WebSocketFeedChannel::Impl {
public:
    Impl() {
        ws_client_.clear_access_channels(websocketpp::log::alevel::all);
        ws_client_.clear_error_channels(websocketpp::log::elevel::all);

        ws_client_.init_asio();

        ws_client_.set_open_handler([this](ConnectionHdl) {
            if (handlers_.on_open) handlers_.on_open();
        });

        ws_client_.set_close_handler([this](ConnectionHdl hdl) {
            auto con = ws_client_.get_con_from_hdl(hdl);
            notify_closed("closed: " + con->get_remote_reason());
        });

        ws_client_.set_fail_handler([this](ConnectionHdl hdl) {
            auto con = ws_client_.get_con_from_hdl(hdl);
            notify_closed("connect failed: " + con->get_ec().message());
        });

        ws_client_.set_message_handler([this](ConnectionHdl, MessagePtr msg) {
            if (handlers_.on_message) handlers_.on_message(msg->get_payload());
        });
    }

    ~Impl() {
        close();
    }

    void open(const std::string& url, FeedHandlers handlers) {
        handlers_ = std::move(handlers);

        websocketpp::lib::error_code ec;
        auto con = ws_client_.get_connection(url, ec);
        if (ec) {
            throw FeedDisconnected(url, "Failed to create connection: " + ec.message());
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            connection_ = con->get_handle();
        }
        ws_client_.connect(con);

        // Start IO thread
        io_thread_ = std::thread([this]() {
            ws_client_.run();
        });
    }

    void send(const std::string& payload) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (connection_.expired()) {
            return;
        }

        websocketpp::lib::error_code ec;
        ws_client_.send(connection_, payload, websocketpp::frame::opcode::text, ec);
        if (ec) {
            spdlog::warn("feed send failed: {}", ec.message());
        }
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!connection_.expired()) {
                websocketpp::lib::error_code ec;
                ws_client_.close(connection_, websocketpp::close::status::normal, "", ec);
                if (ec) {
                    spdlog::debug("feed close: {}", ec.message());
                }
            }
        }

        ws_client_.stop();

        if (io_thread_.joinable()) {
            if (io_thread_.get_id() == std::this_thread::get_id()) {
                io_thread_.detach();
            } else {
                io_thread_.join();
            }
        }
    }

private:
    void notify_closed(const std::string& reason) {
        // close and fail can both fire for one connection
        if (closed_.exchange(true)) return;
        if (handlers_.on_close) handlers_.on_close(reason);
    }

    WsClient ws_client_;
    ConnectionHdl connection_;
    FeedHandlers handlers_;
    std::thread io_thread_;
    std::atomic<bool> closed_{false};
    std::mutex mutex_;
};

WebSocketFeedChannel::WebSocketFeedChannel()
    : impl_(std::make_unique<Impl>()) {}

WebSocketFeedChannel::~WebSocketFeedChannel() = default;

void WebSocketFeedChannel::open(const std::string& url, FeedHandlers handlers) {
    impl_->open(url, std::move(handlers));
}

void WebSocketFeedChannel::send(const std::string& payload) {
    impl_->send(payload);
}

void WebSocketFeedChannel::close() {
    impl_->close();
}

FeedChannelFactory WebSocketFeedChannel::factory() {
    return [] { return std::make_unique<WebSocketFeedChannel>(); };
}

}  // namespace quickroute::aggregation
