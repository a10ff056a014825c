// QuickRoute - Source Adapters Implementation

#include <quickroute/aggregation/source_adapter.hpp>
#include <quickroute/config.hpp>
#include <quickroute/errors.hpp>
#include <nlohmann/json.hpp>

namespace quickroute::aggregation {

namespace {

constexpr uint64_t DEFAULT_GAS_ESTIMATE = 150000;
constexpr uint64_t SOLANA_COMPUTE_ESTIMATE = 5000;
constexpr double DEFAULT_FEE = 0.003;

HttpRequest get(const SourceInfo& source, const std::string& path_and_query) {
    HttpRequest req;
    req.url = source.api_endpoint + path_and_query;
    req.headers = source.headers;
    return req;
}

std::string amount_str(const QuoteRequest& req) {
    return amount::to_string(req.amount_in);
}

// Amounts arrive as decimal strings or JSON integers
Amount read_amount(const nlohmann::json& j) {
    if (j.is_string()) {
        return amount::parse(j.get<std::string>());
    }
    if (j.is_number_unsigned()) {
        return static_cast<Amount>(j.get<uint64_t>());
    }
    if (j.is_number_integer()) {
        auto v = j.get<int64_t>();
        if (v < 0) throw std::invalid_argument("negative amount");
        return static_cast<Amount>(v);
    }
    if (j.is_number_float()) {
        double v = j.get<double>();
        if (v < 0.0) throw std::invalid_argument("negative amount");
        return static_cast<Amount>(v);
    }
    throw std::invalid_argument("amount is not a number");
}

double read_number(const nlohmann::json& j) {
    if (j.is_string()) return std::stod(j.get<std::string>());
    return j.get<double>();
}

const nlohmann::json* field(const nlohmann::json& body, const char* a, const char* b = nullptr) {
    if (body.contains(a) && !body.at(a).is_null()) return &body.at(a);
    if (b && body.contains(b) && !body.at(b).is_null()) return &body.at(b);
    return nullptr;
}

}  // namespace

PriceData SourceAdapter::parse_response(const SourceInfo& source, const QuoteRequest& req,
                                        const nlohmann::json& body, int64_t now_ms) const {
    if (!body.is_object()) {
        throw InvalidPriceData(source.id, "response is not a JSON object");
    }

    PriceData q;
    q.source = source.id;
    q.token_in = req.token_in;
    q.token_out = req.token_out;
    q.timestamp = now_ms;
    q.confidence = source.reliability;
    q.metadata.source_name = source.name;

    try {
        const auto* price = field(body, "price");
        const auto* out = field(body, "amountOut", "outputAmount");
        if (!price || !out) {
            throw InvalidPriceData(source.id, "response lacks price or output amount");
        }
        q.price = read_number(*price);
        q.amount_out = read_amount(*out);

        if (const auto* v = field(body, "priceImpact")) q.price_impact = read_number(*v);
        if (const auto* v = field(body, "liquidity")) q.liquidity = read_number(*v);
        q.gas_estimate = DEFAULT_GAS_ESTIMATE;
        if (const auto* v = field(body, "gas", "gasEstimate")) {
            q.gas_estimate = static_cast<uint64_t>(read_number(*v));
        }
        if (const auto* v = field(body, "blockNumber")) {
            q.block_number = static_cast<uint64_t>(read_number(*v));
        }
        if (const auto* v = field(body, "poolAddress")) q.metadata.pool_address = v->get<std::string>();
        q.metadata.fee = DEFAULT_FEE;
        if (const auto* v = field(body, "fee")) q.metadata.fee = read_number(*v);
        if (const auto* v = field(body, "spread")) q.metadata.spread = read_number(*v);
        if (const auto* v = field(body, "volume24h")) q.metadata.volume_24h = read_number(*v);
    } catch (const nlohmann::json::exception& e) {
        throw InvalidPriceData(source.id, std::string("malformed quote: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw InvalidPriceData(source.id, std::string("malformed quote: ") + e.what());
    } catch (const std::out_of_range& e) {
        throw InvalidPriceData(source.id, std::string("malformed quote: ") + e.what());
    }
    return q;
}

HttpRequest UniswapV3Adapter::build_request(const SourceInfo& source, const QuoteRequest& req) const {
    return get(source, "/quote?tokenIn=" + req.token_in.address +
                       "&tokenOut=" + req.token_out.address +
                       "&amount=" + amount_str(req) +
                       "&chainId=" + std::to_string(req.token_in.chain_id));
}

HttpRequest JupiterAdapter::build_request(const SourceInfo& source, const QuoteRequest& req) const {
    return get(source, "/quote?inputMint=" + req.token_in.address +
                       "&outputMint=" + req.token_out.address +
                       "&amount=" + amount_str(req) +
                       "&slippageBps=" + std::to_string(slippage_bps_));
}

PriceData JupiterAdapter::parse_response(const SourceInfo& source, const QuoteRequest& req,
                                         const nlohmann::json& body, int64_t now_ms) const {
    if (!body.is_object()) {
        throw InvalidPriceData(source.id, "response is not a JSON object");
    }

    PriceData q;
    q.source = source.id;
    q.token_in = req.token_in;
    q.token_out = req.token_out;
    q.timestamp = now_ms;
    q.confidence = source.reliability;
    q.gas_estimate = SOLANA_COMPUTE_ESTIMATE;
    q.metadata.source_name = source.name;

    try {
        Amount in = body.contains("inAmount") ? read_amount(body.at("inAmount")) : req.amount_in;
        q.amount_out = read_amount(body.at("outAmount"));

        double in_units = amount::to_units(in, req.token_in.decimals);
        if (in_units > 0.0) {
            q.price = amount::to_units(q.amount_out, req.token_out.decimals) / in_units;
        }
        if (const auto* v = field(body, "priceImpactPct")) {
            q.price_impact = read_number(*v) * 100.0;
        }
        if (const auto* v = field(body, "contextSlot")) {
            q.block_number = v->get<uint64_t>();
        }

        const auto* plan = field(body, "routePlan");
        if (plan && plan->is_array() && !plan->empty()) {
            const auto& swap = plan->at(0).at("swapInfo");
            if (swap.contains("ammKey")) q.metadata.pool_address = swap.at("ammKey").get<std::string>();
            if (swap.contains("label")) q.metadata.source_name = swap.at("label").get<std::string>();
            if (swap.contains("feeAmount") && in > 0) {
                Amount fee = read_amount(swap.at("feeAmount"));
                q.metadata.fee = amount::to_double(fee) / amount::to_double(in);
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw InvalidPriceData(source.id, std::string("malformed Jupiter quote: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw InvalidPriceData(source.id, std::string("malformed Jupiter quote: ") + e.what());
    } catch (const std::out_of_range& e) {
        throw InvalidPriceData(source.id, std::string("malformed Jupiter quote: ") + e.what());
    }
    return q;
}

HttpRequest SushiSwapAdapter::build_request(const SourceInfo& source, const QuoteRequest& req) const {
    return get(source, "/swap?tokenIn=" + req.token_in.address +
                       "&tokenOut=" + req.token_out.address +
                       "&amount=" + amount_str(req) +
                       "&chainId=" + std::to_string(req.token_in.chain_id));
}

HttpRequest CurveAdapter::build_request(const SourceInfo& source, const QuoteRequest& req) const {
    return get(source, "/get_dy?from=" + req.token_in.address +
                       "&to=" + req.token_out.address +
                       "&amount=" + amount_str(req) +
                       "&chainId=" + std::to_string(req.token_in.chain_id));
}

HttpRequest BalancerAdapter::build_request(const SourceInfo& source, const QuoteRequest& req) const {
    return get(source, "/sor?sellToken=" + req.token_in.address +
                       "&buyToken=" + req.token_out.address +
                       "&sellAmount=" + amount_str(req) +
                       "&chainId=" + std::to_string(req.token_in.chain_id));
}

HttpRequest PancakeSwapAdapter::build_request(const SourceInfo& source, const QuoteRequest& req) const {
    return get(source, "/quote?tokenIn=" + req.token_in.address +
                       "&tokenOut=" + req.token_out.address +
                       "&amount=" + amount_str(req) +
                       "&chainId=" + std::to_string(req.token_in.chain_id));
}

HttpRequest GenericAdapter::build_request(const SourceInfo& source, const QuoteRequest& req) const {
    return get(source, "/quote?from=" + req.token_in.address +
                       "&to=" + req.token_out.address +
                       "&amount=" + amount_str(req));
}

std::unique_ptr<SourceAdapter> make_adapter(std::string_view source_id) {
    if (source_id == sources::UNISWAP_V3) return std::make_unique<UniswapV3Adapter>();
    if (source_id == sources::JUPITER) return std::make_unique<JupiterAdapter>();
    if (source_id == sources::SUSHISWAP) return std::make_unique<SushiSwapAdapter>();
    if (source_id == sources::CURVE) return std::make_unique<CurveAdapter>();
    if (source_id == sources::BALANCER) return std::make_unique<BalancerAdapter>();
    if (source_id == sources::PANCAKESWAP) return std::make_unique<PancakeSwapAdapter>();
    return std::make_unique<GenericAdapter>();
}

}  // namespace quickroute::aggregation
