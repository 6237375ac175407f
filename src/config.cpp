// =============================================================================
// config.cpp - ExchangeConfig loading (JSON)
// =============================================================================

#include "dexcore/config.hpp"

#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <cstdint>

namespace dexcore {

using json = nlohmann::json;

namespace {

uint32_t read_u32(const json& j, const char* key, uint32_t fallback) {
    if (!j.contains(key)) return fallback;
    const json& v = j.at(key);
    if (!v.is_number_unsigned()) {
        throw ConfigError(std::string("'") + key + "' must be a non-negative integer");
    }
    uint64_t value = v.get<uint64_t>();
    if (value > UINT32_MAX) {
        throw ConfigError(std::string("'") + key + "' is out of range");
    }
    return static_cast<uint32_t>(value);
}

} // anonymous namespace

ExchangeConfig ExchangeConfig::from_file(const std::string& path) {
    std::ifstream file{path};
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

ExchangeConfig ExchangeConfig::from_json(const std::string& content) {
    json root;
    try {
        root = json::parse(content);
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("Invalid config JSON: ") + e.what());
    }
    if (!root.is_object()) {
        throw ConfigError("Config root must be a JSON object");
    }

    ExchangeConfig config;

    if (root.contains("fee")) {
        const json& fee = root.at("fee");
        if (!fee.is_object()) {
            throw ConfigError("'fee' must be an object");
        }
        config.fee.numerator = read_u32(fee, "numerator", config.fee.numerator);
        config.fee.denominator = read_u32(fee, "denominator", config.fee.denominator);
    }

    if (root.contains("log_level")) {
        if (!root.at("log_level").is_string()) {
            throw ConfigError("'log_level' must be a string");
        }
        config.log_level = root.at("log_level").get<std::string>();
    }

    if (root.contains("exchange_address")) {
        if (!root.at("exchange_address").is_string()) {
            throw ConfigError("'exchange_address' must be a hex string");
        }
        try {
            config.exchange_address =
                addresses::from_hex(root.at("exchange_address").get<std::string>());
        } catch (const std::invalid_argument& e) {
            throw ConfigError(e.what());
        }
    }

    config.validate();
    return config;
}

void ExchangeConfig::validate() const {
    if (fee.denominator == 0) {
        throw ConfigError("fee denominator must be positive");
    }
    if (fee.numerator >= fee.denominator) {
        throw ConfigError("fee numerator must be below the denominator");
    }
    if (addresses::is_zero(exchange_address)) {
        throw ConfigError("exchange address must not be zero");
    }
    static const char* const LEVELS[] = {"trace", "debug", "info", "warn", "error",
                                         "critical", "off"};
    for (const char* level : LEVELS) {
        if (log_level == level) return;
    }
    throw ConfigError("unknown log level: " + log_level);
}

} // namespace dexcore
