// =============================================================================
// json.cpp - nlohmann::json conversions for views, results and events
// =============================================================================

#include "dexcore/json.hpp"

#include <nlohmann/json.hpp>
#include <type_traits>
#include <variant>

namespace dexcore {

using json = nlohmann::json;

namespace {

std::string hex_bytes(const std::vector<uint8_t>& bytes) {
    static const char* const DIGITS = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (uint8_t b : bytes) {
        out.push_back(DIGITS[b >> 4]);
        out.push_back(DIGITS[b & 0x0f]);
    }
    return out;
}

const char* action_name(SwapAction action) {
    return action == SwapAction::BUY_TOKEN ? "buy_token" : "sell_token";
}

} // anonymous namespace

void to_json(json& j, const TokenId& token) {
    if (token.is_base()) {
        j = json{{"base", true}};
        return;
    }
    j = json{
        {"contract", addresses::to_hex(token.contract)},
        {"id", hex_bytes(token.id)}
    };
}

void to_json(json& j, const FeeRate& fee) {
    j = json{{"numerator", fee.numerator}, {"denominator", fee.denominator}};
}

void to_json(json& j, const Event& event) {
    j = std::visit([](const auto& e) -> json {
        using E = std::decay_t<decltype(e)>;
        json out{{"sequence", e.sequence}};
        if constexpr (std::is_same_v<E, SwapEvent>) {
            out["holder"] = addresses::to_hex(e.holder);
            out["action"] = action_name(e.action);
            out["double_swap"] = e.double_swap;
            out["token"] = e.token;
            out["base_amount"] = e.base_amount;
            out["token_amount"] = e.token_amount;
            out["base_reserve"] = e.base_reserve;
            out["token_reserve"] = e.token_reserve;
        } else if constexpr (std::is_same_v<E, ShareTransferEvent>) {
            out["share_token"] = e.share_token;
            out["amount"] = e.amount;
            out["from"] = addresses::to_hex(e.from);
            out["to"] = addresses::to_hex(e.to);
        } else if constexpr (std::is_same_v<E, OperatorEvent>) {
            out["owner"] = addresses::to_hex(e.owner);
            out["operator"] = addresses::to_hex(e.op);
            out["added"] = e.added;
        } else {
            // Mint / Burn
            out["share_token"] = e.share_token;
            out["amount"] = e.amount;
            out["owner"] = addresses::to_hex(e.owner);
        }
        return out;
    }, event);
    j["type"] = event_name(event);
}

void to_json(json& j, const SwapLeg& leg) {
    j = json{
        {"pool", leg.pool},
        {"base_in", leg.base_in},
        {"amount_in", leg.amount_in},
        {"amount_out", leg.amount_out},
        {"base_reserve_before", leg.base_reserve_before},
        {"token_reserve_before", leg.token_reserve_before}
    };
}

void to_json(json& j, const SwapResult& result) {
    j = json{
        {"amount_in", result.amount_in},
        {"amount_out", result.amount_out},
        {"legs", result.legs}
    };
}

void to_json(json& j, const PoolView& view) {
    j = json{
        {"token", view.token},
        {"share_token_id", view.share_token_id},
        {"base_reserve", view.base_reserve},
        {"token_reserve", view.token_reserve},
        {"share_supply", view.share_supply},
        {"holder_shares", view.holder_shares},
        {"token_balance", view.token_balance}
    };
}

void to_json(json& j, const Exchange::Stats& stats) {
    j = json{
        {"total_pools", stats.total_pools},
        {"total_swaps", stats.total_swaps},
        {"total_liquidity_ops", stats.total_liquidity_ops}
    };
}

json events_to_json(const EventLog& log) {
    json out = json::array();
    for (const auto& event : log.events()) {
        out.push_back(json(event));
    }
    return out;
}

} // namespace dexcore
