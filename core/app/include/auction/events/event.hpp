#pragma once

#include "auction/events/room_events.hpp"

#include <cstdint>
#include <variant>

namespace auction {

// -----------------------------------------------------------------------------
// RoomEvent
// -----------------------------------------------------------------------------
// Responsibility: The single envelope for everything a room broadcasts. One
// variant lets the fan-out, the subscriber queues, the observer EventBus and
// the wire codec carry every event kind by value, with no base-class pointers.
// -----------------------------------------------------------------------------
using RoomEvent = std::variant<
    BidAcceptedEvent,
    AuctionOpenedEvent,
    AuctionClosedEvent>;

// Per-room sequence id of any room event.
inline std::uint64_t sequenceOf(const RoomEvent& event) {
  return std::visit([](const auto& e) { return e.sequence_id; }, event);
}

// Product id of any room event.
inline const domain::ProductId& productOf(const RoomEvent& event) {
  return std::visit(
      [](const auto& e) -> const domain::ProductId& { return e.product_id; },
      event);
}

}  // namespace auction
