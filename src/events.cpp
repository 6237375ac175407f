// =============================================================================
// events.cpp - Exchange event log
// =============================================================================

#include "dexcore/events.hpp"

namespace dexcore {

namespace {

struct EventNamer {
    const char* operator()(const SwapEvent&) const { return "swap"; }
    const char* operator()(const MintEvent&) const { return "mint"; }
    const char* operator()(const BurnEvent&) const { return "burn"; }
    const char* operator()(const ShareTransferEvent&) const { return "transfer"; }
    const char* operator()(const OperatorEvent&) const { return "update_operator"; }
};

} // anonymous namespace

const char* event_name(const Event& event) {
    return std::visit(EventNamer{}, event);
}

void EventLog::truncate(size_t size) {
    if (size < events_.size()) {
        events_.erase(events_.begin() + static_cast<std::ptrdiff_t>(size), events_.end());
    }
}

} // namespace dexcore
