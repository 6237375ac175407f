// dexcore - Liquidity engine tests

#include <catch2/catch.hpp>
#include <dexcore/liquidity.hpp>
#include <dexcore/math.hpp>

#include "memory_ledger.hpp"

using namespace dexcore;
using namespace dexcore::testing;

TEST_CASE("First deposit seeds the pool", "[liquidity]") {
    PoolLedger store;
    const TokenId tok = make_token(0x100);

    SECTION("Shares are floor(sqrt(base * token))") {
        AddLiquidityResult r = liquidity::add_liquidity(store, tok, ALICE, 100, 400, 0);
        REQUIRE(r.seeded);
        REQUIRE(r.base_deposited == 100);
        REQUIRE(r.token_deposited == 400);
        REQUIRE(r.shares_minted == 200);
        REQUIRE(store.get_pool(tok).share_token_id == 1);
    }

    SECTION("Minimum shares checked before the pool exists") {
        REQUIRE(error_of([&] { liquidity::add_liquidity(store, tok, ALICE, 100, 400, 201); }) ==
                Error::SLIPPAGE_EXCEEDED);
        REQUIRE_FALSE(store.pool_exists(tok));
    }

    SECTION("Zero amounts") {
        REQUIRE(error_of([&] { liquidity::add_liquidity(store, tok, ALICE, 0, 400, 0); }) ==
                Error::ZERO_AMOUNT);
        REQUIRE(error_of([&] { liquidity::add_liquidity(store, tok, ALICE, 100, 0, 0); }) ==
                Error::ZERO_AMOUNT);
    }
}

TEST_CASE("Deposits follow the reserve ratio", "[liquidity]") {
    PoolLedger store;
    const TokenId tok = make_token(0x100);
    liquidity::add_liquidity(store, tok, ALICE, 1000, 1000, 0);

    SECTION("Excess token is not taken") {
        AddLiquidityResult r = liquidity::add_liquidity(store, tok, BOB, 100, 300, 0);
        REQUIRE_FALSE(r.seeded);
        REQUIRE(r.base_deposited == 100);
        REQUIRE(r.token_deposited == 100);
        REQUIRE(r.shares_minted == 100);

        const PoolState& pool = store.get_pool(tok);
        REQUIRE(pool.base_reserve == 1100);
        REQUIRE(pool.token_reserve == 1100);
        REQUIRE(pool.share_supply == 1100);
        REQUIRE(pool.balance_of(BOB) == 100);
    }

    SECTION("Excess base is not taken") {
        AddLiquidityResult r = liquidity::add_liquidity(store, tok, BOB, 300, 100, 0);
        REQUIRE(r.base_deposited == 100);
        REQUIRE(r.token_deposited == 100);
        REQUIRE(r.shares_minted == 100);
    }

    SECTION("Minimum shares") {
        REQUIRE(error_of([&] { liquidity::add_liquidity(store, tok, BOB, 100, 100, 101); }) ==
                Error::SLIPPAGE_EXCEEDED);
        REQUIRE(store.get_pool(tok).base_reserve == 1000);
        REQUIRE(store.get_pool(tok).share_supply == 1000);
    }
}

TEST_CASE("Exact ratio uses the whole base amount", "[liquidity]") {
    PoolLedger store;
    const TokenId tok = make_token(0x100);
    liquidity::add_liquidity(store, tok, ALICE, 1000, 2000, 0);
    REQUIRE(store.get_pool(tok).share_supply == 1414);

    AddLiquidityResult r = liquidity::add_liquidity(store, tok, BOB, 100, 200, 0);
    REQUIRE(r.base_deposited == 100);
    REQUIRE(r.token_deposited == 200);
    REQUIRE(r.shares_minted == 141);
}

TEST_CASE("Deposit too small for the ratio", "[liquidity]") {
    PoolLedger store;
    const TokenId tok = make_token(0x100);
    liquidity::add_liquidity(store, tok, ALICE, 1000, 1, 0);

    REQUIRE(error_of([&] { liquidity::add_liquidity(store, tok, BOB, 1, 1, 0); }) ==
            Error::RATIO_MISMATCH);
    REQUIRE(store.get_pool(tok).base_reserve == 1000);
    REQUIRE(store.get_pool(tok).token_reserve == 1);
}

TEST_CASE("Non-binding side is charged rounded up", "[liquidity]") {
    PoolLedger store;
    const TokenId tok = make_token(0x100);
    liquidity::add_liquidity(store, tok, ALICE, 1000, 1, 0);
    REQUIRE(store.get_pool(tok).share_supply == 31);

    // 1999 base needs 1.999 token at the pool ratio
    AddLiquidityResult r = liquidity::add_liquidity(store, tok, BOB, 1999, 5, 0);
    REQUIRE(r.base_deposited == 1999);
    REQUIRE(r.token_deposited == 2);
    REQUIRE(r.shares_minted == 61);

    const PoolState& pool = store.get_pool(tok);
    REQUIRE(pool.base_reserve == 2999);
    REQUIRE(pool.token_reserve == 3);
    REQUIRE(pool.share_supply == 92);

    // Alice's claim per share did not shrink on either side
    REQUIRE(U128{pool.token_reserve} * 31 >= U128{1} * pool.share_supply);
    REQUIRE(U128{pool.base_reserve} * 31 >= U128{1000} * pool.share_supply);

    RemoveLiquidityResult out = liquidity::remove_liquidity(store, tok, ALICE, 31, 0, 0);
    REQUIRE(out.base_out >= 1000);
    REQUIRE(out.token_out >= 1);
}

TEST_CASE("Withdrawals", "[liquidity]") {
    PoolLedger store;
    const TokenId tok = make_token(0x100);
    liquidity::add_liquidity(store, tok, ALICE, 1000, 1000, 0);
    store.apply_reserve_delta(tok, 100, -90);

    SECTION("Proportional share of both reserves") {
        RemoveLiquidityResult r = liquidity::remove_liquidity(store, tok, ALICE, 500, 0, 0);
        REQUIRE(r.base_out == 550);
        REQUIRE(r.token_out == 455);
        REQUIRE(r.shares_burned == 500);

        const PoolState& pool = store.get_pool(tok);
        REQUIRE(pool.base_reserve == 550);
        REQUIRE(pool.token_reserve == 455);
        REQUIRE(pool.share_supply == 500);
    }

    SECTION("Full supply empties the pool exactly") {
        RemoveLiquidityResult r = liquidity::remove_liquidity(store, tok, ALICE, 1000, 0, 0);
        REQUIRE(r.base_out == 1100);
        REQUIRE(r.token_out == 910);

        const PoolState* pool = store.find_pool(tok);
        REQUIRE(pool != nullptr);
        REQUIRE(pool->base_reserve == 0);
        REQUIRE(pool->token_reserve == 0);
        REQUIRE(pool->share_supply == 0);
    }

    SECTION("Minimum outputs") {
        REQUIRE(error_of([&] { liquidity::remove_liquidity(store, tok, ALICE, 500, 551, 0); }) ==
                Error::SLIPPAGE_EXCEEDED);
        REQUIRE(error_of([&] { liquidity::remove_liquidity(store, tok, ALICE, 500, 0, 456); }) ==
                Error::SLIPPAGE_EXCEEDED);
        REQUIRE(store.get_pool(tok).share_supply == 1000);
    }

    SECTION("Rejected requests") {
        REQUIRE(error_of([&] { liquidity::remove_liquidity(store, tok, ALICE, 0, 0, 0); }) ==
                Error::ZERO_AMOUNT);
        REQUIRE(error_of([&] { liquidity::remove_liquidity(store, tok, ALICE, 1001, 0, 0); }) ==
                Error::INSUFFICIENT_SHARES);
        REQUIRE(error_of([&] { liquidity::remove_liquidity(store, tok, BOB, 1, 0, 0); }) ==
                Error::INSUFFICIENT_SHARES);
        REQUIRE(error_of([&] {
            liquidity::remove_liquidity(store, make_token(0x999), ALICE, 1, 0, 0);
        }) == Error::POOL_NOT_FOUND);
    }
}

TEST_CASE("Drained pool is re-seeded", "[liquidity]") {
    PoolLedger store;
    const TokenId tok = make_token(0x100);
    liquidity::add_liquidity(store, tok, ALICE, 1000, 1000, 0);
    liquidity::remove_liquidity(store, tok, ALICE, 1000, 0, 0);

    AddLiquidityResult r = liquidity::add_liquidity(store, tok, BOB, 100, 400, 0);
    REQUIRE(r.seeded);
    REQUIRE(r.shares_minted == 200);

    const PoolState& pool = store.get_pool(tok);
    REQUIRE(pool.share_token_id == 1);
    REQUIRE(pool.balance_of(BOB) == 200);
    REQUIRE(pool.balance_of(ALICE) == 0);
    REQUIRE(store.last_share_token_id() == 1);
}

TEST_CASE("Deposit then withdraw never returns more than deposited", "[liquidity][property]") {
    const Amount seeds[][2] = {{1000, 1000}, {1000, 2000}, {7, 1000003}, {999983, 13}};
    const Amount deposits[][2] = {{1, 1}, {100, 300}, {12345, 678}, {5000, 5000}};

    for (const auto& seed : seeds) {
        for (const auto& dep : deposits) {
            PoolLedger store;
            const TokenId tok = make_token(0x100);
            liquidity::add_liquidity(store, tok, ALICE, seed[0], seed[1], 0);

            AddLiquidityResult added{};
            Error err = error_of([&] {
                added = liquidity::add_liquidity(store, tok, BOB, dep[0], dep[1], 0);
            });
            if (err != Error::OK) {
                REQUIRE(err == Error::RATIO_MISMATCH);
                continue;
            }
            REQUIRE(added.base_deposited <= dep[0]);
            REQUIRE(added.token_deposited <= dep[1]);

            RemoveLiquidityResult removed =
                liquidity::remove_liquidity(store, tok, BOB, added.shares_minted, 0, 0);
            REQUIRE(removed.base_out <= added.base_deposited);
            REQUIRE(removed.token_out <= added.token_deposited);

            const PoolState& pool = store.get_pool(tok);
            REQUIRE(pool.base_reserve >= seed[0]);
            REQUIRE(pool.token_reserve >= seed[1]);
            REQUIRE(pool.share_supply == pool.balance_of(ALICE));
        }
    }
}

TEST_CASE("Deposits never dilute existing shares", "[liquidity][property]") {
    const Amount seeds[][2] = {{1000, 1}, {1000000, 1000}, {1000, 1000}, {7, 1000003},
                               {999983, 13}};
    const Amount deposits[][2] = {{1, 1}, {1999, 5}, {100, 300}, {12345, 678},
                                  {5000, 5000}, {1000000, 1}, {3, 999}};
    const Address providers[] = {BOB, CAROL};

    for (const auto& seed : seeds) {
        PoolLedger store;
        const TokenId tok = make_token(0x100);
        liquidity::add_liquidity(store, tok, ALICE, seed[0], seed[1], 0);

        size_t n = 0;
        for (const auto& dep : deposits) {
            const PoolState before = store.get_pool(tok);

            AddLiquidityResult added{};
            Error err = error_of([&] {
                added = liquidity::add_liquidity(store, tok, providers[n++ % 2], dep[0], dep[1], 0);
            });
            if (err != Error::OK) {
                REQUIRE(err == Error::RATIO_MISMATCH);
                REQUIRE(store.get_pool(tok).share_supply == before.share_supply);
                continue;
            }

            const PoolState& after = store.get_pool(tok);
            REQUIRE(after.share_supply == before.share_supply + added.shares_minted);

            // Reserve per share never drops on either side
            REQUIRE(U128{after.base_reserve} * before.share_supply >=
                    U128{before.base_reserve} * after.share_supply);
            REQUIRE(U128{after.token_reserve} * before.share_supply >=
                    U128{before.token_reserve} * after.share_supply);

            // One side is used in full and mints in proportion to it
            bool base_binds = added.base_deposited == dep[0] &&
                              added.shares_minted == amm_math::mul_div(before.share_supply, dep[0],
                                                                       before.base_reserve);
            bool token_binds = added.token_deposited == dep[1] &&
                               added.shares_minted == amm_math::mul_div(before.share_supply, dep[1],
                                                                        before.token_reserve);
            REQUIRE((base_binds || token_binds));
            REQUIRE(added.base_deposited <= dep[0]);
            REQUIRE(added.token_deposited <= dep[1]);
        }
    }
}
