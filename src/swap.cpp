// =============================================================================
// swap.cpp - Constant-product swaps with input-side fee
// =============================================================================

#include "dexcore/swap.hpp"
#include "dexcore/math.hpp"
#include "dexcore/log.hpp"

namespace dexcore {
namespace swap_engine {

namespace {

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

struct Hop {
    TokenId pool;
    bool base_in;
};

std::vector<Hop> resolve(const SwapRoute& route) {
    return std::visit(overloaded{
        [](const BaseToToken& r) { return std::vector<Hop>{{r.token, true}}; },
        [](const TokenToBase& r) { return std::vector<Hop>{{r.token, false}}; },
        [](const TokenToToken& r) {
            return std::vector<Hop>{{r.token_in, false}, {r.token_out, true}};
        },
    }, route);
}

void validate_route(const std::vector<Hop>& hops) {
    for (const auto& hop : hops) {
        if (hop.pool.is_base()) {
            throw ExchangeError(Error::INVALID_TOKEN, "the base asset has no pool");
        }
    }
    if (hops.size() == 2 && hops[0].pool == hops[1].pool) {
        throw ExchangeError(Error::INVALID_TOKEN,
                            "token -> token route needs two distinct pools, got " +
                            hops[0].pool.to_string() + " twice");
    }
}

SwapLeg quote_leg(const PoolLedger& store, const Hop& hop, Amount amount_in, const FeeRate& fee) {
    const PoolState& pool = store.get_pool(hop.pool);

    Amount reserve_in = hop.base_in ? pool.base_reserve : pool.token_reserve;
    Amount reserve_out = hop.base_in ? pool.token_reserve : pool.base_reserve;

    Amount amount_out = amm_math::get_output_amount(amount_in, reserve_in, reserve_out, fee);
    if (amount_out == 0) {
        throw ExchangeError(Error::INSUFFICIENT_LIQUIDITY,
                            "input " + std::to_string(amount_in) + " buys nothing from " +
                            hop.pool.to_string());
    }
    // The whole input, fee included, stays in the pool
    amm_math::checked_add(reserve_in, amount_in);

    return SwapLeg{hop.pool, hop.base_in, amount_in, amount_out,
                   pool.base_reserve, pool.token_reserve};
}

} // anonymous namespace

// =============================================================================
// Route Inspection
// =============================================================================

TokenId input_asset(const SwapRoute& route) {
    return std::visit(overloaded{
        [](const BaseToToken&) { return TokenId::base(); },
        [](const TokenToBase& r) { return r.token; },
        [](const TokenToToken& r) { return r.token_in; },
    }, route);
}

TokenId output_asset(const SwapRoute& route) {
    return std::visit(overloaded{
        [](const BaseToToken& r) { return r.token; },
        [](const TokenToBase&) { return TokenId::base(); },
        [](const TokenToToken& r) { return r.token_out; },
    }, route);
}

std::vector<TokenId> route_pools(const SwapRoute& route) {
    std::vector<TokenId> pools;
    for (auto& hop : resolve(route)) pools.push_back(std::move(hop.pool));
    return pools;
}

// =============================================================================
// Quote
// =============================================================================

SwapResult quote(const PoolLedger& store, const SwapRoute& route, Amount amount_in,
                 const FeeRate& fee) {
    std::vector<Hop> hops = resolve(route);
    validate_route(hops);

    if (amount_in == 0) {
        throw ExchangeError(Error::ZERO_AMOUNT, "swap input must be positive");
    }

    SwapResult result{amount_in, 0, {}};
    Amount leg_in = amount_in;
    for (const auto& hop : hops) {
        SwapLeg leg = quote_leg(store, hop, leg_in, fee);
        leg_in = leg.amount_out;
        result.legs.push_back(std::move(leg));
    }
    result.amount_out = leg_in;
    return result;
}

// =============================================================================
// Execute
// =============================================================================

SwapResult execute(PoolLedger& store, const SwapRoute& route, Amount amount_in,
                   Amount min_amount_out, const FeeRate& fee) {
    SwapResult result = quote(store, route, amount_in, fee);

    if (result.amount_out < min_amount_out) {
        throw ExchangeError(Error::SLIPPAGE_EXCEEDED,
                            "output " + std::to_string(result.amount_out) +
                            " below minimum " + std::to_string(min_amount_out));
    }

    // Every leg was validated against distinct pools, so no write below can fail
    for (const auto& leg : result.legs) {
        I128 in = static_cast<I128>(leg.amount_in);
        I128 out = static_cast<I128>(leg.amount_out);
        if (leg.base_in) {
            store.apply_reserve_delta(leg.pool, in, -out);
        } else {
            store.apply_reserve_delta(leg.pool, -out, in);
        }
        log::get()->debug("Swap leg on {}: {} {} in, {} out", leg.pool.to_string(),
                          leg.amount_in, leg.base_in ? "base" : "token", leg.amount_out);
    }

    return result;
}

} // namespace swap_engine
} // namespace dexcore
