#ifndef DEXCORE_EVENTS_HPP
#define DEXCORE_EVENTS_HPP

#include <variant>
#include <vector>
#include <cstddef>

#include "types.hpp"

namespace dexcore {

// =============================================================================
// Event Types
// =============================================================================

enum class SwapAction : uint8_t {
    BUY_TOKEN = 0,    // base in, token out
    SELL_TOKEN = 1    // token in, base out
};

struct SwapEvent {
    uint64_t sequence;
    Address holder;
    SwapAction action;
    bool double_swap;          // Leg of a token -> token route
    TokenId token;
    Amount base_amount;
    Amount token_amount;
    Amount base_reserve;       // Reserves before the leg
    Amount token_reserve;
};

struct MintEvent {
    uint64_t sequence;
    ShareTokenId share_token;
    Amount amount;
    Address owner;
};

struct BurnEvent {
    uint64_t sequence;
    ShareTokenId share_token;
    Amount amount;
    Address owner;
};

struct ShareTransferEvent {
    uint64_t sequence;
    ShareTokenId share_token;
    Amount amount;
    Address from;
    Address to;
};

struct OperatorEvent {
    uint64_t sequence;
    Address owner;
    Address op;
    bool added;
};

using Event = std::variant<SwapEvent, MintEvent, BurnEvent, ShareTransferEvent, OperatorEvent>;

const char* event_name(const Event& event);

// =============================================================================
// EventLog - Append-only log; a failed call truncates back to its mark
// =============================================================================

class EventLog {
public:
    // Stamps the next sequence number (1-based) and appends
    template <typename E>
    void record(E event) {
        event.sequence = static_cast<uint64_t>(events_.size()) + 1;
        events_.emplace_back(std::move(event));
    }

    size_t size() const { return events_.size(); }
    void truncate(size_t size);

    const std::vector<Event>& events() const { return events_; }

private:
    std::vector<Event> events_;
};

} // namespace dexcore

#endif // DEXCORE_EVENTS_HPP
