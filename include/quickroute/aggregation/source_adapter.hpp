// QuickRoute - Source Adapters
// One adapter per exchange: builds its quote request and maps its response

#pragma once

#include <quickroute/aggregation/http_channel.hpp>
#include <quickroute/aggregation/types.hpp>
#include <nlohmann/json_fwd.hpp>
#include <memory>
#include <string>
#include <string_view>

namespace quickroute::aggregation {

class SourceAdapter {
public:
    virtual ~SourceAdapter() = default;

    [[nodiscard]] virtual std::string_view kind() const = 0;

    [[nodiscard]] virtual HttpRequest build_request(const SourceInfo& source, const QuoteRequest& req) const = 0;

    /// Map a response body into a quote. The default mapper reads price,
    /// amountOut|outputAmount, priceImpact, liquidity, gas|gasEstimate,
    /// blockNumber, poolAddress, fee, spread and volume24h.
    /// Throws InvalidPriceData when required fields are missing or malformed.
    [[nodiscard]] virtual PriceData parse_response(const SourceInfo& source, const QuoteRequest& req,
                                                   const nlohmann::json& body, int64_t now_ms) const;
};

class UniswapV3Adapter : public SourceAdapter {
public:
    [[nodiscard]] std::string_view kind() const override { return "uniswap_v3"; }
    [[nodiscard]] HttpRequest build_request(const SourceInfo& source, const QuoteRequest& req) const override;
};

class JupiterAdapter : public SourceAdapter {
public:
    explicit JupiterAdapter(int slippage_bps = 50) : slippage_bps_(slippage_bps) {}

    [[nodiscard]] std::string_view kind() const override { return "jupiter"; }
    [[nodiscard]] HttpRequest build_request(const SourceInfo& source, const QuoteRequest& req) const override;

    // inAmount/outAmount strings, priceImpactPct as a fraction, routePlan[].swapInfo
    [[nodiscard]] PriceData parse_response(const SourceInfo& source, const QuoteRequest& req,
                                           const nlohmann::json& body, int64_t now_ms) const override;

private:
    int slippage_bps_;
};

class SushiSwapAdapter : public SourceAdapter {
public:
    [[nodiscard]] std::string_view kind() const override { return "sushiswap"; }
    [[nodiscard]] HttpRequest build_request(const SourceInfo& source, const QuoteRequest& req) const override;
};

class CurveAdapter : public SourceAdapter {
public:
    [[nodiscard]] std::string_view kind() const override { return "curve"; }
    [[nodiscard]] HttpRequest build_request(const SourceInfo& source, const QuoteRequest& req) const override;
};

class BalancerAdapter : public SourceAdapter {
public:
    [[nodiscard]] std::string_view kind() const override { return "balancer"; }
    [[nodiscard]] HttpRequest build_request(const SourceInfo& source, const QuoteRequest& req) const override;
};

class PancakeSwapAdapter : public SourceAdapter {
public:
    [[nodiscard]] std::string_view kind() const override { return "pancakeswap"; }
    [[nodiscard]] HttpRequest build_request(const SourceInfo& source, const QuoteRequest& req) const override;
};

// /quote?from=&to=&amount= against any endpoint speaking the default schema
class GenericAdapter : public SourceAdapter {
public:
    [[nodiscard]] std::string_view kind() const override { return "generic"; }
    [[nodiscard]] HttpRequest build_request(const SourceInfo& source, const QuoteRequest& req) const override;
};

/// Adapter for a source id; unknown ids get the generic adapter
std::unique_ptr<SourceAdapter> make_adapter(std::string_view source_id);

}  // namespace quickroute::aggregation
