// QuickRoute - Constant-Product AMM Math
// Integer x*y=k swap simulation with floor rounding in the pool's favor

#pragma once

#include <quickroute/types.hpp>
#include <cstdint>

namespace quickroute::routing::amm {

inline constexpr uint32_t FEE_DENOMINATOR = 1'000'000;  // pips

/// floor(a * b / denominator) with a 256-bit intermediate.
/// Throws std::domain_error on a zero denominator and std::overflow_error
/// when the quotient does not fit 128 bits.
U128 mul_div(U128 a, U128 b, U128 denominator);

/// Fee fraction (0.003) to pips (3000), rounded to nearest
[[nodiscard]] uint32_t fee_to_pips(double fee) noexcept;

/// Output of swapping amount_in against (reserve_in, reserve_out).
/// out = floor(a' * reserve_out / (reserve_in + a')) with a' = amount_in * (1 - fee),
/// so (reserve_in + a') * (reserve_out - out) >= reserve_in * reserve_out.
/// Throws std::overflow_error only when reserve_in + a' exceeds 128 bits.
Amount get_amount_out(Amount amount_in, Amount reserve_in, Amount reserve_out, uint32_t fee_pips);

struct SwapQuote {
    Amount amount_out = 0;
    Amount reserve_in = 0;
    Amount reserve_out = 0;
    double spot_price = 0.0;        // reserve_out / reserve_in before the trade
    double execution_price = 0.0;   // amount_out / amount_in
    double price_impact = 0.0;      // percent below spot, fee included
};

SwapQuote quote(Amount amount_in, Amount reserve_in, Amount reserve_out, uint32_t fee_pips);

/// Swap `amount_in` of `token_in` through `pool`; throws std::invalid_argument
/// if the pool does not hold `token_in`
SwapQuote quote(const LiquidityPool& pool, const Token& token_in, Amount amount_in);

}  // namespace quickroute::routing::amm
