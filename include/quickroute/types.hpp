// QuickRoute - Core Types
// Tokens, pools, quotes and 128-bit base-unit amounts shared by both subsystems

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace quickroute {

using U128 = unsigned __int128;

// Token amount in base units (wei, lamports, ...)
using Amount = U128;

namespace amount {

/// Parse a non-negative decimal integer string; throws std::invalid_argument
Amount parse(std::string_view s);

[[nodiscard]] std::string to_string(Amount a);

[[nodiscard]] double to_double(Amount a) noexcept;

/// Amount in whole token units, i.e. a / 10^decimals
[[nodiscard]] double to_units(Amount a, uint8_t decimals) noexcept;

/// Inverse of to_units, rounded to the nearest base unit; negative inputs give zero
[[nodiscard]] Amount from_units(double units, uint8_t decimals) noexcept;

[[nodiscard]] Amount pow10(uint8_t exponent) noexcept;

}  // namespace amount

struct Token {
    std::string address;
    std::string symbol;
    uint64_t chain_id = 1;
    uint8_t decimals = 18;

    bool operator==(const Token& other) const noexcept {
        return chain_id == other.chain_id && address == other.address;
    }
    bool operator!=(const Token& other) const noexcept { return !(*this == other); }
};

// Optional per-quote details reported by a source
struct QuoteMetadata {
    std::optional<std::string> pool_address;
    double fee = 0.003;          // fraction, 0.003 = 0.3%
    double spread = 0.0;
    double volume_24h = 0.0;
    std::string source_name;
};

// One normalized quote from one liquidity source
struct PriceData {
    std::string source;
    Token token_in;
    Token token_out;
    double price = 0.0;           // token_out units per token_in unit
    Amount amount_out = 0;
    double price_impact = 0.0;    // percent
    double liquidity = 0.0;       // USD
    uint64_t gas_estimate = 0;
    int64_t timestamp = 0;        // ms since epoch
    std::optional<uint64_t> block_number;
    double confidence = 0.0;      // 0..100
    QuoteMetadata metadata;

    /// Structural validation applied to every quote before aggregation
    [[nodiscard]] bool is_valid() const noexcept {
        return price > 0.0 && amount_out > 0 &&
               price_impact >= 0.0 && price_impact <= 100.0 &&
               liquidity >= 0.0 && gas_estimate > 0 &&
               confidence >= 0.0 && confidence <= 100.0 &&
               timestamp > 0;
    }
};

// Constant-product pool snapshot
struct LiquidityPool {
    std::string address;
    Token token0;
    Token token1;
    Amount reserve0 = 0;
    Amount reserve1 = 0;
    uint32_t fee_pips = 3000;     // millionths, 3000 = 0.3%
    std::string source;
    double tvl_usd = 0.0;
    uint64_t chain_id = 1;

    [[nodiscard]] double fee_rate() const noexcept {
        return static_cast<double>(fee_pips) / 1'000'000.0;
    }

    [[nodiscard]] bool contains(const Token& t) const noexcept {
        return token0 == t || token1 == t;
    }

    /// The token on the opposite side of `t`; `t` must be one of the pool's tokens
    [[nodiscard]] const Token& other(const Token& t) const noexcept {
        return token0 == t ? token1 : token0;
    }
};

// Cache / feed key for a directed pair: "<chain>-<in>-<out>"
inline std::string pair_key(const Token& in, const Token& out) {
    return std::to_string(in.chain_id) + "-" + in.address + "-" + out.address;
}

inline int64_t now_ms() noexcept {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

}  // namespace quickroute
