#ifndef DEXCORE_TOKEN_LEDGER_HPP
#define DEXCORE_TOKEN_LEDGER_HPP

#include "types.hpp"

namespace dexcore {

// =============================================================================
// Token Ledger Interface (external asset custody)
//
// The exchange moves assets only through this interface, and only after its
// own state has been committed. A rejected transfer (false or an exception)
// fails the whole enclosing call.
// =============================================================================

class ITokenLedger {
public:
    virtual ~ITokenLedger() = default;

    // Move `amount` of `asset` (TokenId::base() for the base asset).
    // Returns false if the transfer was rejected.
    virtual bool transfer(const TokenId& asset, const Address& from, const Address& to,
                          Amount amount) = 0;

    // Diagnostic views only, never control decisions
    virtual Amount balance_of(const TokenId& asset, const Address& holder) const = 0;
};

} // namespace dexcore

#endif // DEXCORE_TOKEN_LEDGER_HPP
