#pragma once

#include "auction/domain/bid.hpp"
#include "auction/domain/types.hpp"

#include <cstdint>
#include <optional>

namespace auction {

// -----------------------------------------------------------------------------
// Room events
// -----------------------------------------------------------------------------
// Every event a room publishes carries a per-room sequence_id. The id is
// shared by all event kinds of one room and is assigned on the room's
// serialization point, so it is the room's total order: subscribers receive
// events in increasing sequence_id, and a snapshot's last_event_sequence
// tells a subscriber exactly where its live stream starts.
// -----------------------------------------------------------------------------

// -----------------------------------------------------------------------------
// BidAcceptedEvent
// -----------------------------------------------------------------------------
// Responsibility: A bid passed validation and is now the room's highest bid.
// bid.sequence is the accepted-bid counter (1, 2, 3, ...); sequence_id is the
// room-wide event counter and also covers lifecycle events.
// -----------------------------------------------------------------------------
struct BidAcceptedEvent {
  domain::ProductId product_id;
  domain::Bid bid;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// AuctionOpenedEvent
// -----------------------------------------------------------------------------
// Responsibility: Pending → Open transition. Published at most once per room.
// -----------------------------------------------------------------------------
struct AuctionOpenedEvent {
  domain::ProductId product_id;
  domain::Amount base_price{0};
  std::int64_t end_ms{0};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// Why a room closed. Both causes go through the same idempotent transition.
enum class CloseReason {
  EndTimeReached,
  Administrative,
};

inline const char* toString(CloseReason reason) {
  switch (reason) {
    case CloseReason::EndTimeReached: return "EndTimeReached";
    case CloseReason::Administrative: return "Administrative";
  }
  return "Unknown";
}

// -----------------------------------------------------------------------------
// AuctionClosedEvent
// -----------------------------------------------------------------------------
// Responsibility: Open/Pending → Closed transition. Published exactly once per
// room regardless of how many close triggers race. winning_bid is the final
// highest bid, empty if nobody bid.
// -----------------------------------------------------------------------------
struct AuctionClosedEvent {
  domain::ProductId product_id;
  std::optional<domain::Bid> winning_bid;
  CloseReason reason{CloseReason::EndTimeReached};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace auction
