// =============================================================================
// liquidity.cpp - Proportional share minting and burning
// =============================================================================

#include "dexcore/liquidity.hpp"
#include "dexcore/math.hpp"
#include "dexcore/log.hpp"

#include <optional>

namespace dexcore {
namespace liquidity {

namespace {

struct Deposit {
    Amount base;
    Amount token;
    Amount shares;
};

// ceil(a * b / d) kept wide so an oversized side compares instead of throwing
inline U128 wide_mul_div_up(Amount a, Amount b, Amount d) {
    U128 product = static_cast<U128>(a) * static_cast<U128>(b);
    return product / d + (product % d != 0 ? 1 : 0);
}

// Match the desired amounts to the pool ratio. The binding side is used in
// full and mints floor(supply * amount / reserve); the other side is charged
// rounded up, so per-share claims on both reserves never drop. The base side
// is tried first, so when both sides bind equally the whole base amount is used.
std::optional<Deposit> match_ratio(const PoolState& pool, Amount base_desired,
                                   Amount token_desired) {
    U128 token_used = wide_mul_div_up(base_desired, pool.token_reserve, pool.base_reserve);
    if (token_used <= token_desired) {
        Amount shares = amm_math::mul_div(pool.share_supply, base_desired, pool.base_reserve);
        if (shares > 0) {
            return Deposit{base_desired, static_cast<Amount>(token_used), shares};
        }
    }

    U128 base_used = wide_mul_div_up(token_desired, pool.base_reserve, pool.token_reserve);
    if (base_used <= base_desired) {
        Amount shares = amm_math::mul_div(pool.share_supply, token_desired, pool.token_reserve);
        if (shares > 0) {
            return Deposit{static_cast<Amount>(base_used), token_desired, shares};
        }
    }

    return std::nullopt;
}

void check_min_shares(Amount shares, Amount min_shares) {
    if (shares < min_shares) {
        throw ExchangeError(Error::SLIPPAGE_EXCEEDED,
                            "would mint " + std::to_string(shares) + " shares, minimum " +
                            std::to_string(min_shares));
    }
}

} // anonymous namespace

// =============================================================================
// Add Liquidity
// =============================================================================

AddLiquidityResult add_liquidity(PoolLedger& store, const TokenId& token,
                                 const Address& provider,
                                 Amount base_desired, Amount token_desired,
                                 Amount min_shares) {
    if (base_desired == 0 || token_desired == 0) {
        throw ExchangeError(Error::ZERO_AMOUNT, "both assets must be deposited");
    }

    PoolState* pool = store.find_pool(token);

    // First deposit (or a drained pool): the contributed ratio sets the price
    if (!pool || !pool->initialized()) {
        Amount shares = amm_math::sqrt_product(base_desired, token_desired);
        check_min_shares(shares, min_shares);

        if (pool) {
            store.reseed_pool(token, base_desired, token_desired, provider);
        } else {
            store.create_pool(token, base_desired, token_desired, provider);
        }
        return AddLiquidityResult{base_desired, token_desired, shares, true};
    }

    std::optional<Deposit> deposit = match_ratio(*pool, base_desired, token_desired);
    if (!deposit) {
        throw ExchangeError(Error::RATIO_MISMATCH,
                            "deposit (" + std::to_string(base_desired) + ", " +
                            std::to_string(token_desired) + ") cannot match reserves of " +
                            token.to_string());
    }
    check_min_shares(deposit->shares, min_shares);

    // Validate every sum before the first write
    amm_math::checked_add(pool->base_reserve, deposit->base);
    amm_math::checked_add(pool->token_reserve, deposit->token);
    amm_math::checked_add(pool->share_supply, deposit->shares);

    store.apply_reserve_delta(token, deposit->base, deposit->token);
    store.mint_shares(token, provider, deposit->shares);

    log::get()->debug("Added liquidity to {}: base={} token={} shares={}",
                      token.to_string(), deposit->base, deposit->token, deposit->shares);

    return AddLiquidityResult{deposit->base, deposit->token, deposit->shares, false};
}

// =============================================================================
// Remove Liquidity
// =============================================================================

RemoveLiquidityResult remove_liquidity(PoolLedger& store, const TokenId& token,
                                       const Address& provider, Amount shares,
                                       Amount min_base, Amount min_token) {
    if (shares == 0) {
        throw ExchangeError(Error::ZERO_AMOUNT, "share amount must be positive");
    }

    const PoolState& pool = store.get_pool(token);
    Amount balance = pool.balance_of(provider);
    if (balance < shares) {
        throw ExchangeError(Error::INSUFFICIENT_SHARES,
                            "holder has " + std::to_string(balance) + " shares, needs " +
                            std::to_string(shares));
    }

    // shares == supply yields the whole reserves, leaving the pool at exactly zero
    Amount base_out = amm_math::mul_div(pool.base_reserve, shares, pool.share_supply);
    Amount token_out = amm_math::mul_div(pool.token_reserve, shares, pool.share_supply);

    if (base_out < min_base || token_out < min_token) {
        throw ExchangeError(Error::SLIPPAGE_EXCEEDED,
                            "would return (" + std::to_string(base_out) + ", " +
                            std::to_string(token_out) + "), minimum (" +
                            std::to_string(min_base) + ", " + std::to_string(min_token) + ")");
    }

    store.burn_shares(token, provider, shares);
    store.apply_reserve_delta(token, -static_cast<I128>(base_out), -static_cast<I128>(token_out));

    log::get()->debug("Removed liquidity from {}: base={} token={} shares={}",
                      token.to_string(), base_out, token_out, shares);

    return RemoveLiquidityResult{base_out, token_out, shares};
}

} // namespace liquidity
} // namespace dexcore
