// QuickRoute - Errors
// Exception taxonomy and the error events published for absorbed failures

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace quickroute {

enum class ErrorKind : uint8_t {
    SourceTimeout,
    SourceRateLimited,
    InvalidPriceData,
    NoValidPrices,
    FeedDisconnected,
    RouteNotFound,
    Transport,
    Config
};

inline constexpr const char* to_string(ErrorKind k) noexcept {
    switch (k) {
        case ErrorKind::SourceTimeout: return "source_timeout";
        case ErrorKind::SourceRateLimited: return "source_rate_limited";
        case ErrorKind::InvalidPriceData: return "invalid_price_data";
        case ErrorKind::NoValidPrices: return "no_valid_prices";
        case ErrorKind::FeedDisconnected: return "feed_disconnected";
        case ErrorKind::RouteNotFound: return "route_not_found";
        case ErrorKind::Transport: return "transport";
        case ErrorKind::Config: return "config";
    }
    return "unknown";
}

class EngineError : public std::runtime_error {
public:
    EngineError(ErrorKind kind, std::string source, const std::string& msg)
        : std::runtime_error(msg), kind_(kind), source_(std::move(source)) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::string& source() const noexcept { return source_; }

private:
    ErrorKind kind_;
    std::string source_;
};

class SourceTimeout : public EngineError {
public:
    SourceTimeout(std::string source, const std::string& msg)
        : EngineError(ErrorKind::SourceTimeout, std::move(source), msg) {}
};

class SourceRateLimited : public EngineError {
public:
    explicit SourceRateLimited(std::string source)
        : EngineError(ErrorKind::SourceRateLimited, source, "rate limit reached for " + source) {}
};

class InvalidPriceData : public EngineError {
public:
    InvalidPriceData(std::string source, const std::string& msg)
        : EngineError(ErrorKind::InvalidPriceData, std::move(source), msg) {}
};

class NoValidPrices : public EngineError {
public:
    explicit NoValidPrices(const std::string& pair)
        : EngineError(ErrorKind::NoValidPrices, "", "no valid prices for " + pair) {}
};

class FeedDisconnected : public EngineError {
public:
    FeedDisconnected(std::string source, const std::string& msg)
        : EngineError(ErrorKind::FeedDisconnected, std::move(source), msg) {}
};

class TransportError : public EngineError {
public:
    TransportError(std::string source, const std::string& msg)
        : EngineError(ErrorKind::Transport, std::move(source), msg) {}
};

class ConfigError : public EngineError {
public:
    explicit ConfigError(const std::string& msg)
        : EngineError(ErrorKind::Config, "", msg) {}
};

// Published on the error channel for every failure the engine absorbs
struct ErrorEvent {
    ErrorKind kind = ErrorKind::Transport;
    std::string source;
    std::string message;
    int64_t timestamp = 0;

    static ErrorEvent from(const EngineError& e, int64_t ts) {
        return ErrorEvent{e.kind(), e.source(), e.what(), ts};
    }
};

}  // namespace quickroute
