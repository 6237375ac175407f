#ifndef DEXCORE_MATH_HPP
#define DEXCORE_MATH_HPP

#include "types.hpp"

namespace dexcore {

// =============================================================================
// Checked Fixed-Point Arithmetic
//
// Every product is formed in 128 bits and narrowed only after the final
// division. Overflow, underflow, division by zero and lossy narrowing throw
// ExchangeError(ARITHMETIC_ERROR).
// =============================================================================

namespace amm_math {

// Narrow a widened value back to Amount
Amount narrow(U128 value);

Amount checked_add(Amount a, Amount b);
Amount checked_sub(Amount a, Amount b);

// floor(a * b / denom)
Amount mul_div(Amount a, Amount b, U128 denom);

// floor(sqrt(x)), Newton's method
Amount isqrt(U128 x);

// floor(sqrt(a * b)) without intermediate overflow
inline Amount sqrt_product(Amount a, Amount b) {
    return isqrt(static_cast<U128>(a) * static_cast<U128>(b));
}

// floor(amount_in * (denominator - numerator) / denominator)
Amount amount_in_after_fee(Amount amount_in, const FeeRate& fee);

// Constant-product output for an exact input:
//   floor(reserve_out * in_after_fee / (reserve_in + in_after_fee))
Amount get_output_amount(Amount amount_in, Amount reserve_in, Amount reserve_out,
                         const FeeRate& fee);

// Output the same input would buy with no fee
Amount get_output_amount_no_fee(Amount amount_in, Amount reserve_in, Amount reserve_out);

} // namespace amm_math

} // namespace dexcore

#endif // DEXCORE_MATH_HPP
