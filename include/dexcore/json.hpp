#ifndef DEXCORE_JSON_HPP
#define DEXCORE_JSON_HPP

#include <nlohmann/json_fwd.hpp>

#include "types.hpp"
#include "events.hpp"
#include "swap.hpp"
#include "exchange.hpp"

namespace dexcore {

// =============================================================================
// JSON Serialization (found by nlohmann::json through ADL)
//
// Addresses and token ids are rendered as lowercase hex; amounts as integers.
// =============================================================================

void to_json(nlohmann::json& j, const TokenId& token);
void to_json(nlohmann::json& j, const FeeRate& fee);
void to_json(nlohmann::json& j, const Event& event);
void to_json(nlohmann::json& j, const SwapLeg& leg);
void to_json(nlohmann::json& j, const SwapResult& result);
void to_json(nlohmann::json& j, const PoolView& view);
void to_json(nlohmann::json& j, const Exchange::Stats& stats);

// Whole event log as a JSON array
nlohmann::json events_to_json(const EventLog& log);

} // namespace dexcore

#endif // DEXCORE_JSON_HPP
