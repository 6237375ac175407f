// =============================================================================
// pool.cpp - PoolLedger: pool registry, reserves and share accounting
// =============================================================================

#include "dexcore/pool.hpp"
#include "dexcore/math.hpp"
#include "dexcore/log.hpp"

#include <limits>

namespace dexcore {

namespace {

constexpr I128 AMOUNT_MAX = static_cast<I128>(std::numeric_limits<Amount>::max());

} // anonymous namespace

// =============================================================================
// Internal Helpers
// =============================================================================

PoolState* PoolLedger::find_pool(const TokenId& token) {
    auto it = pools_.find(token);
    return it != pools_.end() ? &it->second : nullptr;
}

const PoolState* PoolLedger::find_pool(const TokenId& token) const {
    auto it = pools_.find(token);
    return it != pools_.end() ? &it->second : nullptr;
}

PoolState& PoolLedger::require_pool(const TokenId& token) {
    PoolState* pool = find_pool(token);
    if (!pool) {
        throw ExchangeError(Error::POOL_NOT_FOUND, "no pool for token " + token.to_string());
    }
    return *pool;
}

void PoolLedger::seed(PoolState& pool, Amount base_amount, Amount token_amount,
                      const Address& provider) {
    Amount shares = amm_math::sqrt_product(base_amount, token_amount);

    pool.base_reserve = base_amount;
    pool.token_reserve = token_amount;
    pool.share_supply = shares;
    pool.share_balances.clear();
    pool.share_balances[provider] = shares;
}

// =============================================================================
// Pool Lifecycle
// =============================================================================

PoolState& PoolLedger::create_pool(const TokenId& token, Amount base_amount,
                                   Amount token_amount, const Address& provider) {
    if (token.is_base()) {
        throw ExchangeError(Error::INVALID_TOKEN, "the base asset cannot be paired with itself");
    }
    if (pools_.find(token) != pools_.end()) {
        throw ExchangeError(Error::POOL_EXISTS, "pool already exists for " + token.to_string());
    }
    if (base_amount == 0 || token_amount == 0) {
        throw ExchangeError(Error::ZERO_AMOUNT, "both assets are required to create a pool");
    }

    PoolState state{};
    state.share_token_id = last_share_token_id_ + 1;
    seed(state, base_amount, token_amount, provider);

    last_share_token_id_ = state.share_token_id;
    share_tokens_[state.share_token_id] = token;
    PoolState& pool = pools_[token] = std::move(state);

    log::get()->debug("Created pool {} (share token {}) with reserves ({}, {}), {} shares",
                      token.to_string(), pool.share_token_id, base_amount, token_amount,
                      pool.share_supply);
    return pool;
}

PoolState& PoolLedger::reseed_pool(const TokenId& token, Amount base_amount,
                                   Amount token_amount, const Address& provider) {
    PoolState& pool = require_pool(token);
    if (pool.initialized() || pool.share_supply != 0) {
        throw ExchangeError(Error::POOL_EXISTS, "pool is still seeded: " + token.to_string());
    }
    if (base_amount == 0 || token_amount == 0) {
        throw ExchangeError(Error::ZERO_AMOUNT, "both assets are required to seed a pool");
    }

    seed(pool, base_amount, token_amount, provider);

    log::get()->debug("Re-seeded pool {} with reserves ({}, {}), {} shares",
                      token.to_string(), base_amount, token_amount, pool.share_supply);
    return pool;
}

const PoolState& PoolLedger::get_pool(const TokenId& token) const {
    const PoolState* pool = find_pool(token);
    if (!pool || !pool->initialized()) {
        throw ExchangeError(Error::POOL_NOT_FOUND, "no pool for token " + token.to_string());
    }
    return *pool;
}

bool PoolLedger::pool_exists(const TokenId& token) const {
    return pools_.find(token) != pools_.end();
}

// =============================================================================
// Reserves
// =============================================================================

void PoolLedger::apply_reserve_delta(const TokenId& token, I128 base_delta, I128 token_delta) {
    PoolState& pool = require_pool(token);

    I128 new_base = static_cast<I128>(pool.base_reserve) + base_delta;
    I128 new_token = static_cast<I128>(pool.token_reserve) + token_delta;

    if (new_base < 0 || new_token < 0) {
        throw ExchangeError(Error::INSUFFICIENT_RESERVE,
                            "reserve delta exceeds holdings of " + token.to_string());
    }
    if (new_base > AMOUNT_MAX || new_token > AMOUNT_MAX) {
        throw ExchangeError(Error::ARITHMETIC_ERROR,
                            "reserve overflow in " + token.to_string());
    }

    pool.base_reserve = static_cast<Amount>(new_base);
    pool.token_reserve = static_cast<Amount>(new_token);
}

// =============================================================================
// Shares
// =============================================================================

void PoolLedger::mint_shares(const TokenId& token, const Address& holder, Amount amount) {
    PoolState& pool = require_pool(token);
    Amount new_supply = amm_math::checked_add(pool.share_supply, amount);
    Amount new_balance = amm_math::checked_add(pool.balance_of(holder), amount);

    pool.share_supply = new_supply;
    pool.share_balances[holder] = new_balance;
}

void PoolLedger::burn_shares(const TokenId& token, const Address& holder, Amount amount) {
    PoolState& pool = require_pool(token);
    Amount balance = pool.balance_of(holder);
    if (balance < amount) {
        throw ExchangeError(Error::INSUFFICIENT_SHARES,
                            "holder has " + std::to_string(balance) + " shares, needs " +
                            std::to_string(amount));
    }

    pool.share_supply -= amount;
    if (balance == amount) {
        pool.share_balances.erase(holder);
    } else {
        pool.share_balances[holder] = balance - amount;
    }
}

void PoolLedger::transfer_shares(ShareTokenId share_token, const Address& from,
                                 const Address& to, Amount amount) {
    const TokenId* token = token_for_share(share_token);
    if (!token) {
        throw ExchangeError(Error::INVALID_TOKEN,
                            "unknown share token " + std::to_string(share_token));
    }
    if (amount == 0 || from == to) {
        return;
    }

    PoolState& pool = require_pool(*token);
    Amount from_balance = pool.balance_of(from);
    if (from_balance < amount) {
        throw ExchangeError(Error::INSUFFICIENT_SHARES,
                            "holder has " + std::to_string(from_balance) + " shares, needs " +
                            std::to_string(amount));
    }
    Amount to_balance = amm_math::checked_add(pool.balance_of(to), amount);

    if (from_balance == amount) {
        pool.share_balances.erase(from);
    } else {
        pool.share_balances[from] = from_balance - amount;
    }
    pool.share_balances[to] = to_balance;
}

Amount PoolLedger::share_balance(const TokenId& token, const Address& holder) const {
    const PoolState* pool = find_pool(token);
    return pool ? pool->balance_of(holder) : 0;
}

Amount PoolLedger::share_balance(ShareTokenId share_token, const Address& holder) const {
    const TokenId* token = token_for_share(share_token);
    if (!token) {
        throw ExchangeError(Error::INVALID_TOKEN,
                            "unknown share token " + std::to_string(share_token));
    }
    return share_balance(*token, holder);
}

const TokenId* PoolLedger::token_for_share(ShareTokenId share_token) const {
    auto it = share_tokens_.find(share_token);
    return it != share_tokens_.end() ? &it->second : nullptr;
}

// =============================================================================
// Operators
// =============================================================================

void PoolLedger::set_operator(const Address& owner, const Address& op, bool enabled) {
    if (enabled) {
        operators_[owner].insert(op);
        return;
    }
    auto it = operators_.find(owner);
    if (it == operators_.end()) return;
    it->second.erase(op);
    if (it->second.empty()) operators_.erase(it);
}

bool PoolLedger::is_operator(const Address& owner, const Address& op) const {
    auto it = operators_.find(owner);
    return it != operators_.end() && it->second.count(op) > 0;
}

// =============================================================================
// Journal
// =============================================================================

PoolJournal PoolLedger::snapshot(const std::vector<TokenId>& tokens) const {
    PoolJournal journal;
    journal.last_share_token_id = last_share_token_id_;
    for (const auto& token : tokens) {
        const PoolState* pool = find_pool(token);
        journal.pools[token] = pool ? std::optional<PoolState>{*pool} : std::nullopt;
    }
    return journal;
}

void PoolLedger::restore(const PoolJournal& journal) {
    for (const auto& [token, saved] : journal.pools) {
        if (saved) {
            pools_[token] = *saved;
            continue;
        }
        auto it = pools_.find(token);
        if (it != pools_.end()) {
            share_tokens_.erase(it->second.share_token_id);
            pools_.erase(it);
        }
    }
    last_share_token_id_ = journal.last_share_token_id;
}

} // namespace dexcore
