#ifndef DEXCORE_SWAP_HPP
#define DEXCORE_SWAP_HPP

#include <variant>
#include <vector>

#include "pool.hpp"

namespace dexcore {

// =============================================================================
// Swap Routes (resolved once per request)
// =============================================================================

struct BaseToToken {
    TokenId token;
};

struct TokenToBase {
    TokenId token;
};

// token_in -> base on pool(token_in), then base -> token_out on pool(token_out)
struct TokenToToken {
    TokenId token_in;
    TokenId token_out;
};

using SwapRoute = std::variant<BaseToToken, TokenToBase, TokenToToken>;

// =============================================================================
// Swap Results
// =============================================================================

struct SwapLeg {
    TokenId pool;
    bool base_in;                  // true: base enters the pool and token leaves
    Amount amount_in;
    Amount amount_out;
    Amount base_reserve_before;
    Amount token_reserve_before;
};

struct SwapResult {
    Amount amount_in;
    Amount amount_out;
    std::vector<SwapLeg> legs;     // One leg, or two for token -> token
};

// =============================================================================
// Swap Engine
// =============================================================================

namespace swap_engine {

// Asset the caller pays in / receives (TokenId::base() for the base asset)
TokenId input_asset(const SwapRoute& route);
TokenId output_asset(const SwapRoute& route);

// Pools the route reads and writes, in hop order
std::vector<TokenId> route_pools(const SwapRoute& route);

// Compute every leg against current reserves without writing anything.
// Throws INVALID_TOKEN, ZERO_AMOUNT, POOL_NOT_FOUND, INSUFFICIENT_LIQUIDITY,
// ARITHMETIC_ERROR.
SwapResult quote(const PoolLedger& store, const SwapRoute& route, Amount amount_in,
                 const FeeRate& fee);

// quote(), enforce min_amount_out (SLIPPAGE_EXCEEDED), then commit all legs
SwapResult execute(PoolLedger& store, const SwapRoute& route, Amount amount_in,
                   Amount min_amount_out, const FeeRate& fee);

} // namespace swap_engine

} // namespace dexcore

#endif // DEXCORE_SWAP_HPP
