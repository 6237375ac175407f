// =============================================================================
// math.cpp - Overflow-checked integer arithmetic for the pool engine
// =============================================================================

#include "dexcore/math.hpp"

#include <limits>

namespace dexcore {
namespace amm_math {

namespace {

constexpr U128 AMOUNT_MAX = std::numeric_limits<Amount>::max();

// Number of significant bits in x
int bit_length(U128 x) {
    int bits = 0;
    while (x != 0) { x >>= 1; bits++; }
    return bits;
}

} // anonymous namespace

Amount narrow(U128 value) {
    if (value > AMOUNT_MAX) {
        throw ExchangeError(Error::ARITHMETIC_ERROR, "result does not fit in 64 bits");
    }
    return static_cast<Amount>(value);
}

Amount checked_add(Amount a, Amount b) {
    return narrow(static_cast<U128>(a) + b);
}

Amount checked_sub(Amount a, Amount b) {
    if (b > a) {
        throw ExchangeError(Error::ARITHMETIC_ERROR, "subtraction underflow");
    }
    return a - b;
}

Amount mul_div(Amount a, Amount b, U128 denom) {
    if (denom == 0) {
        throw ExchangeError(Error::ARITHMETIC_ERROR, "division by zero");
    }
    // (2^64 - 1)^2 < 2^128: the product cannot overflow
    U128 product = static_cast<U128>(a) * static_cast<U128>(b);
    return narrow(product / denom);
}

Amount isqrt(U128 x) {
    if (x < 2) return static_cast<Amount>(x);

    // Start above the root: 2^ceil(bits / 2)
    U128 z = U128(1) << ((bit_length(x) + 1) / 2);
    U128 y = (z + x / z) / 2;
    while (y < z) {
        z = y;
        y = (z + x / z) / 2;
    }
    return narrow(z);
}

Amount amount_in_after_fee(Amount amount_in, const FeeRate& fee) {
    if (fee.numerator >= fee.denominator) {
        throw ExchangeError(Error::ARITHMETIC_ERROR, "fee rate must be below 100%");
    }
    return mul_div(amount_in, fee.denominator - fee.numerator, fee.denominator);
}

Amount get_output_amount(Amount amount_in, Amount reserve_in, Amount reserve_out,
                         const FeeRate& fee) {
    if (reserve_in == 0 || reserve_out == 0) {
        throw ExchangeError(Error::INSUFFICIENT_LIQUIDITY, "pool has an empty reserve");
    }
    Amount in_after_fee = amount_in_after_fee(amount_in, fee);
    U128 denom = static_cast<U128>(reserve_in) + in_after_fee;
    return mul_div(reserve_out, in_after_fee, denom);
}

Amount get_output_amount_no_fee(Amount amount_in, Amount reserve_in, Amount reserve_out) {
    if (reserve_in == 0 || reserve_out == 0) {
        throw ExchangeError(Error::INSUFFICIENT_LIQUIDITY, "pool has an empty reserve");
    }
    U128 denom = static_cast<U128>(reserve_in) + amount_in;
    return mul_div(reserve_out, amount_in, denom);
}

} // namespace amm_math
} // namespace dexcore
