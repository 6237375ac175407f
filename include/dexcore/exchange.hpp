#ifndef DEXCORE_EXCHANGE_HPP
#define DEXCORE_EXCHANGE_HPP

#include <optional>
#include <vector>

#include "types.hpp"
#include "config.hpp"
#include "pool.hpp"
#include "liquidity.hpp"
#include "swap.hpp"
#include "events.hpp"
#include "token_ledger.hpp"

namespace dexcore {

// =============================================================================
// Pool View (read-only snapshot for callers)
// =============================================================================

struct PoolView {
    TokenId token;
    ShareTokenId share_token_id;
    Amount base_reserve;
    Amount token_reserve;
    Amount share_supply;
    Amount holder_shares;
    Amount token_balance;     // Exchange's token holdings per the token ledger (diagnostic)
};

// =============================================================================
// Asset Transfer (external effect of a call)
// =============================================================================

struct AssetTransfer {
    TokenId asset;            // TokenId::base() for the base asset
    Address from;
    Address to;
    Amount amount;
};

// =============================================================================
// Exchange - Entry point for every caller request
//
// Each mutating call runs in two phases: compute and commit pool state and
// events, then issue the external transfers. A failure in either phase
// restores the journaled pools and drops the call's events, so no partial
// result is ever visible. A mutating call issued while another is
// in progress (from inside a transfer) fails with REENTRANCY; views and
// quotes stay available and see the committed state.
// =============================================================================

class Exchange {
public:
    Exchange(PoolLedger& store, ITokenLedger& tokens, ExchangeConfig config = {});
    ~Exchange() = default;

    // Non-copyable
    Exchange(const Exchange&) = delete;
    Exchange& operator=(const Exchange&) = delete;

    // =========================================================================
    // Liquidity
    // =========================================================================

    // First deposit for `token`; POOL_EXISTS if the token already has a pool
    AddLiquidityResult create_pool(const Address& caller, const TokenId& token,
                                   Amount base_amount, Amount token_amount,
                                   Amount min_shares);

    // Deposit into an existing pool, or create / re-seed it
    AddLiquidityResult add_liquidity(const Address& caller, const TokenId& token,
                                     Amount base_amount, Amount token_amount,
                                     Amount min_shares);

    RemoveLiquidityResult remove_liquidity(const Address& caller, const TokenId& token,
                                           Amount shares, Amount min_base, Amount min_token);

    // =========================================================================
    // Swaps (exact input)
    // =========================================================================

    Amount swap_exact_base_for_token(const Address& caller, const TokenId& token,
                                     Amount base_in, Amount min_token_out);

    Amount swap_exact_token_for_base(const Address& caller, const TokenId& token,
                                     Amount token_in, Amount min_base_out);

    Amount swap_exact_token_for_token(const Address& caller, const TokenId& token_in,
                                      const TokenId& token_out, Amount amount_in,
                                      Amount min_amount_out);

    // =========================================================================
    // Quotes (no state change)
    // =========================================================================

    Amount quote_base_to_token(const TokenId& token, Amount base_in) const;
    Amount quote_token_to_base(const TokenId& token, Amount token_in) const;
    Amount quote_token_to_token(const TokenId& token_in, const TokenId& token_out,
                                Amount amount_in) const;

    // =========================================================================
    // Share Tokens
    // =========================================================================

    // Allowed for the owner or one of its operators; UNAUTHORIZED otherwise
    void transfer_shares(const Address& caller, const Address& from, const Address& to,
                         ShareTokenId share_token, Amount amount);

    void update_operator(const Address& caller, const Address& op, bool add);
    bool is_operator(const Address& owner, const Address& op) const;

    Amount share_balance_of(ShareTokenId share_token, const Address& holder) const;

    // INVALID_TOKEN for an unknown share token
    TokenId pool_for_share_token(ShareTokenId share_token) const;

    // =========================================================================
    // Views
    // =========================================================================

    // One pool (POOL_NOT_FOUND if never created) or, without a token, every pool
    std::vector<PoolView> view(const Address& holder,
                               const std::optional<TokenId>& token = std::nullopt) const;

    const EventLog& events() const { return events_; }
    const ExchangeConfig& config() const { return config_; }
    const Address& address() const { return config_.exchange_address; }

    // =========================================================================
    // Statistics
    // =========================================================================

    struct Stats {
        uint64_t total_pools;
        uint64_t total_swaps;
        uint64_t total_liquidity_ops;
    };
    Stats get_stats() const;

private:
    PoolLedger& store_;
    ITokenLedger& tokens_;
    ExchangeConfig config_;
    EventLog events_;

    bool in_call_{false};

    uint64_t total_swaps_{0};
    uint64_t total_liquidity_ops_{0};

    // Journal `touched`, run `body` (which commits local state and lists its
    // transfers), then perform the transfers; roll back on any failure
    template <typename Body>
    auto run(const char* op, const std::vector<TokenId>& touched, Body&& body);

    void perform_transfers(const std::vector<AssetTransfer>& transfers);
    void compensate(const std::vector<AssetTransfer>& transfers, size_t done);

    AddLiquidityResult deposit(const Address& caller, const TokenId& token,
                               Amount base_amount, Amount token_amount, Amount min_shares,
                               std::vector<AssetTransfer>& transfers);

    Amount swap(const char* op, const Address& caller, const SwapRoute& route,
                Amount amount_in, Amount min_amount_out);

    PoolView make_view(const TokenId& token, const PoolState& pool, const Address& holder) const;
};

} // namespace dexcore

#endif // DEXCORE_EXCHANGE_HPP
