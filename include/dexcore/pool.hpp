#ifndef DEXCORE_POOL_HPP
#define DEXCORE_POOL_HPP

#include <map>
#include <set>
#include <optional>
#include <vector>

#include "types.hpp"

namespace dexcore {

// =============================================================================
// Pool State (one base/token reserve pair plus its share table)
// =============================================================================

struct PoolState {
    ShareTokenId share_token_id = 0;   // Sequential id of this pool's share token
    Amount base_reserve = 0;           // Base-asset units held
    Amount token_reserve = 0;          // Token units held
    Amount share_supply = 0;           // Sum of share_balances
    std::map<Address, Amount> share_balances;  // holder -> shares (no zero entries)

    // Zero reserves mean the pool is uninitialized (never seeded or drained)
    bool initialized() const { return base_reserve > 0 && token_reserve > 0; }

    Amount balance_of(const Address& holder) const {
        auto it = share_balances.find(holder);
        return it != share_balances.end() ? it->second : 0;
    }
};

// =============================================================================
// Pool Journal (pre-call copy of the pools a call may touch)
// =============================================================================

struct PoolJournal {
    std::map<TokenId, std::optional<PoolState>> pools;  // nullopt = was absent
    ShareTokenId last_share_token_id = 0;
};

// =============================================================================
// PoolLedger - Registry of pools keyed by token identity
//
// The persisted store of the exchange. Holds no locks: the host ledger runs
// one call to completion before starting the next.
// =============================================================================

class PoolLedger {
public:
    PoolLedger() = default;
    ~PoolLedger() = default;

    // Non-copyable
    PoolLedger(const PoolLedger&) = delete;
    PoolLedger& operator=(const PoolLedger&) = delete;

    // =========================================================================
    // Pool Lifecycle
    // =========================================================================

    // Create and seed a pool; initial shares floor(sqrt(base * token)) go to provider.
    // Throws POOL_EXISTS, ZERO_AMOUNT, INVALID_TOKEN.
    PoolState& create_pool(const TokenId& token, Amount base_amount, Amount token_amount,
                           const Address& provider);

    // Re-seed a drained (uninitialized) pool the same way create_pool seeds a new one
    PoolState& reseed_pool(const TokenId& token, Amount base_amount, Amount token_amount,
                           const Address& provider);

    // Initialized pool or POOL_NOT_FOUND
    const PoolState& get_pool(const TokenId& token) const;

    // Raw lookup including drained pools; nullptr if never created
    PoolState* find_pool(const TokenId& token);
    const PoolState* find_pool(const TokenId& token) const;

    bool pool_exists(const TokenId& token) const;

    // =========================================================================
    // Reserves
    // =========================================================================

    // Apply signed deltas; INSUFFICIENT_RESERVE if either reserve would go
    // negative, ARITHMETIC_ERROR on overflow. Nothing is written on failure.
    void apply_reserve_delta(const TokenId& token, I128 base_delta, I128 token_delta);

    // =========================================================================
    // Shares
    // =========================================================================

    void mint_shares(const TokenId& token, const Address& holder, Amount amount);
    void burn_shares(const TokenId& token, const Address& holder, Amount amount);

    // Move shares between holders of the same pool
    void transfer_shares(ShareTokenId share_token, const Address& from, const Address& to,
                         Amount amount);

    Amount share_balance(const TokenId& token, const Address& holder) const;
    Amount share_balance(ShareTokenId share_token, const Address& holder) const;

    // Pool token owning a share token id; nullptr if unknown
    const TokenId* token_for_share(ShareTokenId share_token) const;

    // =========================================================================
    // Operators (may move an owner's shares)
    // =========================================================================

    void set_operator(const Address& owner, const Address& op, bool enabled);
    bool is_operator(const Address& owner, const Address& op) const;

    // =========================================================================
    // Journal
    // =========================================================================

    PoolJournal snapshot(const std::vector<TokenId>& tokens) const;
    void restore(const PoolJournal& journal);

    // =========================================================================
    // Iteration
    // =========================================================================

    const std::map<TokenId, PoolState>& pools() const { return pools_; }
    size_t size() const { return pools_.size(); }
    ShareTokenId last_share_token_id() const { return last_share_token_id_; }

private:
    std::map<TokenId, PoolState> pools_;
    std::map<ShareTokenId, TokenId> share_tokens_;
    ShareTokenId last_share_token_id_ = 0;
    std::map<Address, std::set<Address>> operators_;  // owner -> operators

    PoolState& require_pool(const TokenId& token);
    void seed(PoolState& pool, Amount base_amount, Amount token_amount, const Address& provider);
};

} // namespace dexcore

#endif // DEXCORE_POOL_HPP
