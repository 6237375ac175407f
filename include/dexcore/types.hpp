#ifndef DEXCORE_TYPES_HPP
#define DEXCORE_TYPES_HPP

#include <cstdint>
#include <array>
#include <string>
#include <vector>
#include <stdexcept>
#include <utility>

namespace dexcore {

// =============================================================================
// Ledger Addresses (20-byte account / contract addresses)
// =============================================================================

using Address = std::array<uint8_t, 20>;

namespace addresses {

// Default account of the exchange itself (counterparty of every transfer)
constexpr Address EXCHANGE = {0xee,0xee,0xee,0xee,0xee,0xee,0xee,0xee,0xee,0xee,
                              0xee,0xee,0xee,0xee,0xee,0xee,0xee,0xee,0xee,0xee};

constexpr bool is_zero(const Address& addr) {
    for (size_t i = 0; i < addr.size(); ++i) {
        if (addr[i] != 0) return false;
    }
    return true;
}

// Helper to build a test/fixture address ending in `n`
constexpr Address from_u16(uint16_t n) {
    Address addr = {};
    addr[18] = static_cast<uint8_t>((n >> 8) & 0xFF);
    addr[19] = static_cast<uint8_t>(n & 0xFF);
    return addr;
}

std::string to_hex(const Address& addr);

// Parses exactly 40 hex characters (optional 0x prefix); throws std::invalid_argument
Address from_hex(const std::string& hex);

} // namespace addresses

// =============================================================================
// Integer Widths
// =============================================================================

using Amount = uint64_t;           // Every reserve, share and transfer amount
using U128 = unsigned __int128;    // Widened intermediate for products
using I128 = __int128;             // Signed reserve deltas

using ShareTokenId = uint64_t;     // Sequential id of a pool's share token

// =============================================================================
// Token Identity (contract + token id)
// =============================================================================

struct TokenId {
    Address contract{};
    std::vector<uint8_t> id;

    TokenId() = default;
    TokenId(const Address& c, std::vector<uint8_t> token_id)
        : contract(c), id(std::move(token_id)) {}

    // The base asset: zero contract, empty id
    static TokenId base() { return TokenId{}; }

    bool is_base() const { return addresses::is_zero(contract) && id.empty(); }

    std::string to_string() const;

    bool operator==(const TokenId& other) const {
        return contract == other.contract && id == other.id;
    }
    bool operator!=(const TokenId& other) const { return !(*this == other); }
    bool operator<(const TokenId& other) const {
        if (contract != other.contract) return contract < other.contract;
        return id < other.id;
    }
};

// =============================================================================
// Fee Rate (fraction of the input kept by the pool)
// =============================================================================

struct FeeRate {
    uint32_t numerator = 100;       // 1%
    uint32_t denominator = 10000;

    bool valid() const { return denominator != 0 && numerator < denominator; }
};

// =============================================================================
// Error Codes
// =============================================================================

enum class Error : int32_t {
    OK = 0,
    POOL_NOT_FOUND = -1,
    POOL_EXISTS = -2,
    ZERO_AMOUNT = -3,
    INSUFFICIENT_RESERVE = -4,
    INSUFFICIENT_SHARES = -5,
    INSUFFICIENT_LIQUIDITY = -6,
    RATIO_MISMATCH = -7,
    SLIPPAGE_EXCEEDED = -8,
    ARITHMETIC_ERROR = -9,
    INVALID_TOKEN = -10,
    TRANSFER_FAILED = -20,
    REENTRANCY = -30,
    UNAUTHORIZED = -40
};

const char* error_name(Error code);

// Raised by every exchange operation; the call is aborted with no partial commit
class ExchangeError : public std::runtime_error {
public:
    ExchangeError(Error code, const std::string& msg)
        : std::runtime_error(std::string(error_name(code)) + ": " + msg), code_(code) {}

    Error code() const noexcept { return code_; }

private:
    Error code_;
};

} // namespace dexcore

#endif // DEXCORE_TYPES_HPP
