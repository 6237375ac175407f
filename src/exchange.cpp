// =============================================================================
// exchange.cpp - Exchange: call dispatch, journaling and transfer effects
// =============================================================================

#include "dexcore/exchange.hpp"
#include "dexcore/log.hpp"

#include <exception>
#include <utility>

namespace dexcore {

namespace {

// Marks the exchange busy for the lifetime of one mutating call
class CallGuard {
public:
    explicit CallGuard(bool& flag) : flag_(flag) { flag_ = true; }
    ~CallGuard() { flag_ = false; }

    CallGuard(const CallGuard&) = delete;
    CallGuard& operator=(const CallGuard&) = delete;

private:
    bool& flag_;
};

std::string describe(const AssetTransfer& t) {
    return std::to_string(t.amount) + " " + t.asset.to_string() + " from " +
           addresses::to_hex(t.from) + " to " + addresses::to_hex(t.to);
}

} // anonymous namespace

Exchange::Exchange(PoolLedger& store, ITokenLedger& tokens, ExchangeConfig config)
    : store_(store)
    , tokens_(tokens)
    , config_(std::move(config)) {
    config_.validate();
}

// =============================================================================
// Call Framework
// =============================================================================

template <typename Body>
auto Exchange::run(const char* op, const std::vector<TokenId>& touched, Body&& body) {
    if (in_call_) {
        log::get()->warn("{} rejected: another exchange call is in progress", op);
        throw ExchangeError(Error::REENTRANCY,
                            std::string(op) + " called while another exchange call is in progress");
    }
    CallGuard guard(in_call_);

    PoolJournal journal = store_.snapshot(touched);
    size_t event_mark = events_.size();
    uint64_t swaps_mark = total_swaps_;
    uint64_t liquidity_mark = total_liquidity_ops_;

    auto rollback = [&]() {
        store_.restore(journal);
        events_.truncate(event_mark);
        total_swaps_ = swaps_mark;
        total_liquidity_ops_ = liquidity_mark;
    };

    try {
        std::vector<AssetTransfer> transfers;
        auto result = body(transfers);
        perform_transfers(transfers);
        return result;
    } catch (const ExchangeError& e) {
        rollback();
        if (e.code() == Error::TRANSFER_FAILED) {
            log::get()->error("{} rolled back: {}", op, e.what());
        } else {
            log::get()->warn("{} rejected: {}", op, e.what());
        }
        throw;
    } catch (...) {
        rollback();
        throw;
    }
}

void Exchange::perform_transfers(const std::vector<AssetTransfer>& transfers) {
    for (size_t i = 0; i < transfers.size(); ++i) {
        const AssetTransfer& t = transfers[i];
        if (t.amount == 0) continue;

        std::string reason = "rejected by token ledger";
        bool ok = false;
        try {
            ok = tokens_.transfer(t.asset, t.from, t.to, t.amount);
        } catch (const std::exception& e) {
            reason = e.what();
        } catch (...) {
            reason = "unknown exception from token ledger";
        }
        if (ok) continue;

        compensate(transfers, i);
        throw ExchangeError(Error::TRANSFER_FAILED,
                            "transfer of " + describe(t) + " failed: " + reason);
    }
}

// Reverse the first `done` transfers, newest first
void Exchange::compensate(const std::vector<AssetTransfer>& transfers, size_t done) {
    while (done > 0) {
        const AssetTransfer& t = transfers[--done];
        if (t.amount == 0) continue;

        bool ok = false;
        std::string reason = "rejected by token ledger";
        try {
            ok = tokens_.transfer(t.asset, t.to, t.from, t.amount);
        } catch (const std::exception& e) {
            reason = e.what();
        } catch (...) {
            reason = "unknown exception from token ledger";
        }
        if (!ok) {
            log::get()->critical("Compensation of {} failed: {}", describe(t), reason);
        }
    }
}

// =============================================================================
// Liquidity
// =============================================================================

AddLiquidityResult Exchange::deposit(const Address& caller, const TokenId& token,
                                     Amount base_amount, Amount token_amount,
                                     Amount min_shares,
                                     std::vector<AssetTransfer>& transfers) {
    AddLiquidityResult result = liquidity::add_liquidity(store_, token, caller, base_amount,
                                                         token_amount, min_shares);
    const PoolState* pool = store_.find_pool(token);

    events_.record(MintEvent{0, pool->share_token_id, result.shares_minted, caller});
    ++total_liquidity_ops_;

    transfers.push_back({TokenId::base(), caller, address(), result.base_deposited});
    transfers.push_back({token, caller, address(), result.token_deposited});
    return result;
}

AddLiquidityResult Exchange::create_pool(const Address& caller, const TokenId& token,
                                         Amount base_amount, Amount token_amount,
                                         Amount min_shares) {
    return run("create_pool", {token}, [&](std::vector<AssetTransfer>& transfers) {
        if (store_.pool_exists(token)) {
            throw ExchangeError(Error::POOL_EXISTS,
                                "pool already exists for " + token.to_string());
        }
        AddLiquidityResult result = deposit(caller, token, base_amount, token_amount,
                                            min_shares, transfers);
        log::get()->debug("Pool {} created by {}: reserves ({}, {})", token.to_string(),
                         addresses::to_hex(caller), result.base_deposited,
                         result.token_deposited);
        return result;
    });
}

AddLiquidityResult Exchange::add_liquidity(const Address& caller, const TokenId& token,
                                           Amount base_amount, Amount token_amount,
                                           Amount min_shares) {
    return run("add_liquidity", {token}, [&](std::vector<AssetTransfer>& transfers) {
        return deposit(caller, token, base_amount, token_amount, min_shares, transfers);
    });
}

RemoveLiquidityResult Exchange::remove_liquidity(const Address& caller, const TokenId& token,
                                                 Amount shares, Amount min_base,
                                                 Amount min_token) {
    return run("remove_liquidity", {token}, [&](std::vector<AssetTransfer>& transfers) {
        RemoveLiquidityResult result = liquidity::remove_liquidity(store_, token, caller, shares,
                                                                   min_base, min_token);
        const PoolState* pool = store_.find_pool(token);

        events_.record(BurnEvent{0, pool->share_token_id, result.shares_burned, caller});
        ++total_liquidity_ops_;

        transfers.push_back({token, address(), caller, result.token_out});
        transfers.push_back({TokenId::base(), address(), caller, result.base_out});
        return result;
    });
}

// =============================================================================
// Swaps
// =============================================================================

Amount Exchange::swap(const char* op, const Address& caller, const SwapRoute& route,
                      Amount amount_in, Amount min_amount_out) {
    return run(op, swap_engine::route_pools(route), [&](std::vector<AssetTransfer>& transfers) {
        SwapResult result = swap_engine::execute(store_, route, amount_in, min_amount_out,
                                                 config_.fee);

        bool double_swap = result.legs.size() > 1;
        for (const auto& leg : result.legs) {
            SwapEvent event{};
            event.holder = caller;
            event.action = leg.base_in ? SwapAction::BUY_TOKEN : SwapAction::SELL_TOKEN;
            event.double_swap = double_swap;
            event.token = leg.pool;
            event.base_amount = leg.base_in ? leg.amount_in : leg.amount_out;
            event.token_amount = leg.base_in ? leg.amount_out : leg.amount_in;
            event.base_reserve = leg.base_reserve_before;
            event.token_reserve = leg.token_reserve_before;
            events_.record(std::move(event));
        }
        ++total_swaps_;

        transfers.push_back({swap_engine::input_asset(route), caller, address(),
                             result.amount_in});
        transfers.push_back({swap_engine::output_asset(route), address(), caller,
                             result.amount_out});
        return result.amount_out;
    });
}

Amount Exchange::swap_exact_base_for_token(const Address& caller, const TokenId& token,
                                           Amount base_in, Amount min_token_out) {
    return swap("swap_exact_base_for_token", caller, BaseToToken{token}, base_in,
                min_token_out);
}

Amount Exchange::swap_exact_token_for_base(const Address& caller, const TokenId& token,
                                           Amount token_in, Amount min_base_out) {
    return swap("swap_exact_token_for_base", caller, TokenToBase{token}, token_in,
                min_base_out);
}

Amount Exchange::swap_exact_token_for_token(const Address& caller, const TokenId& token_in,
                                            const TokenId& token_out, Amount amount_in,
                                            Amount min_amount_out) {
    return swap("swap_exact_token_for_token", caller, TokenToToken{token_in, token_out},
                amount_in, min_amount_out);
}

// =============================================================================
// Quotes
// =============================================================================

Amount Exchange::quote_base_to_token(const TokenId& token, Amount base_in) const {
    return swap_engine::quote(store_, BaseToToken{token}, base_in, config_.fee).amount_out;
}

Amount Exchange::quote_token_to_base(const TokenId& token, Amount token_in) const {
    return swap_engine::quote(store_, TokenToBase{token}, token_in, config_.fee).amount_out;
}

Amount Exchange::quote_token_to_token(const TokenId& token_in, const TokenId& token_out,
                                      Amount amount_in) const {
    return swap_engine::quote(store_, TokenToToken{token_in, token_out}, amount_in,
                              config_.fee).amount_out;
}

// =============================================================================
// Share Tokens
// =============================================================================

void Exchange::transfer_shares(const Address& caller, const Address& from, const Address& to,
                               ShareTokenId share_token, Amount amount) {
    const TokenId* token = store_.token_for_share(share_token);
    std::vector<TokenId> touched;
    if (token) touched.push_back(*token);

    run("transfer_shares", touched, [&](std::vector<AssetTransfer>&) {
        if (caller != from && !store_.is_operator(from, caller)) {
            throw ExchangeError(Error::UNAUTHORIZED,
                                addresses::to_hex(caller) + " may not move shares of " +
                                addresses::to_hex(from));
        }
        store_.transfer_shares(share_token, from, to, amount);
        events_.record(ShareTransferEvent{0, share_token, amount, from, to});

        log::get()->debug("Moved {} of share token {} from {} to {}", amount, share_token,
                          addresses::to_hex(from), addresses::to_hex(to));
        return true;
    });
}

void Exchange::update_operator(const Address& caller, const Address& op, bool add) {
    run("update_operator", {}, [&](std::vector<AssetTransfer>&) {
        store_.set_operator(caller, op, add);
        events_.record(OperatorEvent{0, caller, op, add});
        return true;
    });
}

bool Exchange::is_operator(const Address& owner, const Address& op) const {
    return store_.is_operator(owner, op);
}

Amount Exchange::share_balance_of(ShareTokenId share_token, const Address& holder) const {
    return store_.share_balance(share_token, holder);
}

TokenId Exchange::pool_for_share_token(ShareTokenId share_token) const {
    const TokenId* token = store_.token_for_share(share_token);
    if (!token) {
        throw ExchangeError(Error::INVALID_TOKEN,
                            "unknown share token " + std::to_string(share_token));
    }
    return *token;
}

// =============================================================================
// Views
// =============================================================================

PoolView Exchange::make_view(const TokenId& token, const PoolState& pool,
                             const Address& holder) const {
    return PoolView{token,
                    pool.share_token_id,
                    pool.base_reserve,
                    pool.token_reserve,
                    pool.share_supply,
                    pool.balance_of(holder),
                    tokens_.balance_of(token, address())};
}

std::vector<PoolView> Exchange::view(const Address& holder,
                                     const std::optional<TokenId>& token) const {
    std::vector<PoolView> views;
    if (token) {
        const PoolState* pool = store_.find_pool(*token);
        if (!pool) {
            throw ExchangeError(Error::POOL_NOT_FOUND, "no pool for token " + token->to_string());
        }
        views.push_back(make_view(*token, *pool, holder));
        return views;
    }

    views.reserve(store_.size());
    for (const auto& [pool_token, pool] : store_.pools()) {
        views.push_back(make_view(pool_token, pool, holder));
    }
    return views;
}

Exchange::Stats Exchange::get_stats() const {
    return Stats{static_cast<uint64_t>(store_.size()), total_swaps_, total_liquidity_ops_};
}

} // namespace dexcore
