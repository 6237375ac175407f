#ifndef DEXCORE_CONFIG_HPP
#define DEXCORE_CONFIG_HPP

#include <stdexcept>
#include <string>

#include "types.hpp"

namespace dexcore {

// Malformed or inconsistent configuration
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

// =============================================================================
// Exchange Configuration
//
// JSON layout:
//   {
//     "fee": { "numerator": 100, "denominator": 10000 },
//     "log_level": "info",
//     "exchange_address": "eeee...ee"
//   }
// Every key is optional; unknown keys are ignored.
//
// log_level configures the process-wide "dexcore" logger, not one exchange.
// Exchange never applies it; the host calls log::setup(config.log_level) once.
// =============================================================================

struct ExchangeConfig {
    FeeRate fee;                                   // Fixed for the exchange's lifetime
    std::string log_level = "info";                // Process-wide, see above
    Address exchange_address = addresses::EXCHANGE;

    // Load from a JSON file
    static ExchangeConfig from_file(const std::string& path);

    // Load from a JSON string
    static ExchangeConfig from_json(const std::string& content);

    // Throws ConfigError
    void validate() const;

    // Builder methods
    ExchangeConfig& with_fee(uint32_t numerator, uint32_t denominator) {
        fee.numerator = numerator;
        fee.denominator = denominator;
        return *this;
    }

    ExchangeConfig& with_log_level(std::string level) {
        log_level = std::move(level);
        return *this;
    }

    ExchangeConfig& with_exchange_address(const Address& address) {
        exchange_address = address;
        return *this;
    }
};

} // namespace dexcore

#endif // DEXCORE_CONFIG_HPP
