// =============================================================================
// types.cpp - Address / TokenId formatting and error names
// =============================================================================

#include "dexcore/types.hpp"

namespace dexcore {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

void append_hex(std::string& out, uint8_t b) {
    out.push_back(HEX_DIGITS[b >> 4]);
    out.push_back(HEX_DIGITS[b & 0x0F]);
}

} // anonymous namespace

// =============================================================================
// Addresses
// =============================================================================

namespace addresses {

std::string to_hex(const Address& addr) {
    std::string out;
    out.reserve(addr.size() * 2);
    for (uint8_t b : addr) append_hex(out, b);
    return out;
}

Address from_hex(const std::string& hex) {
    size_t start = 0;
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        start = 2;
    }
    if (hex.size() - start != 40) {
        throw std::invalid_argument("address must be 40 hex characters: " + hex);
    }

    Address addr{};
    for (size_t i = 0; i < addr.size(); ++i) {
        int hi = hex_value(hex[start + 2 * i]);
        int lo = hex_value(hex[start + 2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("invalid hex digit in address: " + hex);
        }
        addr[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return addr;
}

} // namespace addresses

// =============================================================================
// TokenId
// =============================================================================

std::string TokenId::to_string() const {
    if (is_base()) return "base";
    std::string out = addresses::to_hex(contract);
    out.push_back('/');
    for (uint8_t b : id) append_hex(out, b);
    return out;
}

// =============================================================================
// Errors
// =============================================================================

const char* error_name(Error code) {
    switch (code) {
        case Error::OK:                     return "OK";
        case Error::POOL_NOT_FOUND:         return "PoolNotFound";
        case Error::POOL_EXISTS:            return "PoolExists";
        case Error::ZERO_AMOUNT:            return "ZeroAmount";
        case Error::INSUFFICIENT_RESERVE:   return "InsufficientReserve";
        case Error::INSUFFICIENT_SHARES:    return "InsufficientShares";
        case Error::INSUFFICIENT_LIQUIDITY: return "InsufficientLiquidity";
        case Error::RATIO_MISMATCH:         return "RatioMismatch";
        case Error::SLIPPAGE_EXCEEDED:      return "SlippageExceeded";
        case Error::ARITHMETIC_ERROR:       return "ArithmeticError";
        case Error::INVALID_TOKEN:          return "InvalidToken";
        case Error::TRANSFER_FAILED:        return "TransferFailed";
        case Error::REENTRANCY:             return "Reentrancy";
        case Error::UNAUTHORIZED:           return "Unauthorized";
    }
    return "Unknown";
}

} // namespace dexcore
