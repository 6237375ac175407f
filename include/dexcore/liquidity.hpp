#ifndef DEXCORE_LIQUIDITY_HPP
#define DEXCORE_LIQUIDITY_HPP

#include "pool.hpp"

namespace dexcore {

// =============================================================================
// Liquidity Results
// =============================================================================

struct AddLiquidityResult {
    Amount base_deposited;     // Base units actually taken
    Amount token_deposited;    // Token units actually taken
    Amount shares_minted;
    bool seeded;               // true when this deposit set the pool price
};

struct RemoveLiquidityResult {
    Amount base_out;
    Amount token_out;
    Amount shares_burned;
};

// =============================================================================
// Liquidity Engine
// =============================================================================

namespace liquidity {

// Deposit into the pool for `token`, creating or re-seeding it when it holds
// no reserves. On an initialized pool the deposit is cut down to the current
// reserve ratio; the excess on the non-binding side is not taken.
AddLiquidityResult add_liquidity(PoolLedger& store, const TokenId& token,
                                 const Address& provider,
                                 Amount base_desired, Amount token_desired,
                                 Amount min_shares);

// Burn shares for a proportional slice of both reserves (rounded down)
RemoveLiquidityResult remove_liquidity(PoolLedger& store, const TokenId& token,
                                       const Address& provider, Amount shares,
                                       Amount min_base, Amount min_token);

} // namespace liquidity

} // namespace dexcore

#endif // DEXCORE_LIQUIDITY_HPP
