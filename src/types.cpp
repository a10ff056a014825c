// QuickRoute - Core Types Implementation

#include <quickroute/types.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace quickroute::amount {

Amount parse(std::string_view s) {
    if (s.empty()) {
        throw std::invalid_argument("empty amount");
    }

    constexpr Amount max = ~static_cast<Amount>(0);
    Amount result = 0;
    for (char c : s) {
        if (c < '0' || c > '9') {
            throw std::invalid_argument("invalid amount: " + std::string(s));
        }
        auto digit = static_cast<Amount>(c - '0');
        if (result > (max - digit) / 10) {
            throw std::invalid_argument("amount overflows 128 bits: " + std::string(s));
        }
        result = result * 10 + digit;
    }
    return result;
}

std::string to_string(Amount a) {
    if (a == 0) return "0";

    std::string out;
    while (a > 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(a % 10)));
        a /= 10;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

double to_double(Amount a) noexcept {
    auto hi = static_cast<uint64_t>(a >> 64);
    auto lo = static_cast<uint64_t>(a);
    return static_cast<double>(hi) * 18446744073709551616.0 + static_cast<double>(lo);
}

Amount pow10(uint8_t exponent) noexcept {
    Amount result = 1;
    for (uint8_t i = 0; i < exponent && i < 38; ++i) {
        result *= 10;
    }
    return result;
}

double to_units(Amount a, uint8_t decimals) noexcept {
    // Split into whole and fractional parts so large balances keep their low digits
    Amount scale = pow10(decimals);
    Amount whole = a / scale;
    Amount frac = a % scale;
    return to_double(whole) + to_double(frac) / to_double(scale);
}

Amount from_units(double units, uint8_t decimals) noexcept {
    if (!(units > 0.0) || !std::isfinite(units)) return 0;

    long double scaled = static_cast<long double>(units) *
                         static_cast<long double>(to_double(pow10(decimals)));
    constexpr long double max = 3.4028236692093846e38L;
    if (scaled >= max) return ~static_cast<Amount>(0);
    return static_cast<Amount>(scaled + 0.5L);
}

}  // namespace quickroute::amount
