#pragma once

#include "auction/domain/auction_status.hpp"
#include "auction/domain/bid.hpp"
#include "auction/domain/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace auction {
namespace domain {

// -----------------------------------------------------------------------------
// RoomSnapshot
// -----------------------------------------------------------------------------
//
// @brief  Consistent copy of a room's state, taken on the room's
//         serialization point.
//
// @details
// Returned by Room::attach() so a newly joined subscriber starts consistent:
// every event it later receives has sequence_id > last_event_sequence.
// recent_bids is the bounded tail of accepted bids, oldest first, so late
// joiners can render a short history without the persistence collaborator.
// -----------------------------------------------------------------------------
struct RoomSnapshot {
  ProductId product_id;
  AuctionStatus status{AuctionStatus::Pending};
  Amount base_price{0};
  std::int64_t start_ms{0};
  std::int64_t end_ms{0};
  std::optional<Bid> highest;
  std::vector<Bid> recent_bids;
  std::uint64_t last_event_sequence{0};
  std::size_t subscriber_count{0};
};

}  // namespace domain
}  // namespace auction
