// QuickRoute - Constant-Product AMM Math Implementation

#include <quickroute/routing/amm.hpp>
#include <algorithm>
#include <array>
#include <cmath>
#include <stdexcept>

namespace quickroute::routing::amm {

namespace {

constexpr U128 U128_MAX = ~static_cast<U128>(0);

inline uint64_t lo64(U128 v) noexcept { return static_cast<uint64_t>(v); }
inline uint64_t hi64(U128 v) noexcept { return static_cast<uint64_t>(v >> 64); }

// Full 256-bit product as (high, low) 128-bit halves
std::pair<U128, U128> mul_wide(U128 a, U128 b) noexcept {
    U128 a0 = lo64(a), a1 = hi64(a);
    U128 b0 = lo64(b), b1 = hi64(b);

    U128 p00 = a0 * b0;
    U128 p01 = a0 * b1;
    U128 p10 = a1 * b0;
    U128 p11 = a1 * b1;

    U128 mid = static_cast<U128>(hi64(p00)) + lo64(p01) + lo64(p10);
    U128 low = (mid << 64) | lo64(p00);
    U128 high = p11 + hi64(p01) + hi64(p10) + hi64(mid);
    return {high, low};
}

}  // namespace

U128 mul_div(U128 a, U128 b, U128 denominator) {
    if (denominator == 0) {
        throw std::domain_error("mul_div by zero");
    }

    auto [high, low] = mul_wide(a, b);
    if (high == 0) {
        return low / denominator;
    }
    if (high >= denominator) {
        throw std::overflow_error("mul_div result exceeds 128 bits");
    }

    // Restoring long division of the 256-bit product; quotient fits 128 bits
    U128 remainder = high;
    U128 quotient = 0;
    for (int bit = 127; bit >= 0; --bit) {
        bool carry = (remainder >> 127) != 0;
        remainder = (remainder << 1) | ((low >> bit) & 1);
        quotient <<= 1;
        if (carry || remainder >= denominator) {
            remainder -= denominator;
            quotient |= 1;
        }
    }
    return quotient;
}

uint32_t fee_to_pips(double fee) noexcept {
    if (!(fee > 0.0)) return 0;
    double pips = std::round(fee * FEE_DENOMINATOR);
    return static_cast<uint32_t>(std::min(pips, static_cast<double>(FEE_DENOMINATOR - 1)));
}

Amount get_amount_out(Amount amount_in, Amount reserve_in, Amount reserve_out, uint32_t fee_pips) {
    if (fee_pips >= FEE_DENOMINATOR) {
        throw std::invalid_argument("fee must be below 100%");
    }
    if (amount_in == 0 || reserve_in == 0 || reserve_out == 0) {
        return 0;
    }

    const U128 fee_complement = FEE_DENOMINATOR - fee_pips;
    if (amount_in <= U128_MAX / FEE_DENOMINATOR && reserve_in <= U128_MAX / FEE_DENOMINATOR) {
        U128 amount_in_with_fee = amount_in * fee_complement;
        U128 scaled_reserve_in = reserve_in * FEE_DENOMINATOR;
        if (scaled_reserve_in <= U128_MAX - amount_in_with_fee) {
            return mul_div(amount_in_with_fee, reserve_out, scaled_reserve_in + amount_in_with_fee);
        }
    }

    // Reserves too deep to scale by the fee denominator: take the fee first.
    // Both floors round in the pool's favour.
    U128 net_in = mul_div(amount_in, fee_complement, FEE_DENOMINATOR);
    if (reserve_in > U128_MAX - net_in) {
        throw std::overflow_error("swap denominator overflows");
    }
    return mul_div(net_in, reserve_out, reserve_in + net_in);
}

SwapQuote quote(Amount amount_in, Amount reserve_in, Amount reserve_out, uint32_t fee_pips) {
    SwapQuote q;
    q.reserve_in = reserve_in;
    q.reserve_out = reserve_out;
    q.amount_out = get_amount_out(amount_in, reserve_in, reserve_out, fee_pips);

    if (reserve_in > 0) {
        q.spot_price = amount::to_double(reserve_out) / amount::to_double(reserve_in);
    }
    if (amount_in > 0) {
        q.execution_price = amount::to_double(q.amount_out) / amount::to_double(amount_in);
    }
    if (q.spot_price > 0.0) {
        q.price_impact = std::max(0.0, (q.spot_price - q.execution_price) / q.spot_price * 100.0);
    }
    return q;
}

SwapQuote quote(const LiquidityPool& pool, const Token& token_in, Amount amount_in) {
    if (pool.token0 == token_in) {
        return quote(amount_in, pool.reserve0, pool.reserve1, pool.fee_pips);
    }
    if (pool.token1 == token_in) {
        return quote(amount_in, pool.reserve1, pool.reserve0, pool.fee_pips);
    }
    throw std::invalid_argument("pool " + pool.address + " does not hold " + token_in.address);
}

}  // namespace quickroute::routing::amm
