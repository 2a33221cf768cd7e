#pragma once

#include "auction/domain/bid.hpp"
#include "auction/domain/types.hpp"

#include <optional>
#include <utility>

namespace auction {
namespace domain {

// -----------------------------------------------------------------------------
// RejectReason
// -----------------------------------------------------------------------------
// Every reason is recoverable by the caller: the client sees the reason and
// may resubmit. No rejection terminates a connection.
// -----------------------------------------------------------------------------
enum class RejectReason {
  AuctionNotOpen,   // Room is Pending or Closed
  AmountTooLow,     // Not above the current highest (or below base price)
  Unauthorized,     // No bidder identity, or connection not attached
  RoomUnavailable,  // Room torn down or could not sequence in time
  NotFound,         // Product unknown to the catalog
  InvalidPayload,   // Payload not decodable or amount not strictly positive
};

inline const char* toString(RejectReason reason) {
  switch (reason) {
    case RejectReason::AuctionNotOpen:  return "AuctionNotOpen";
    case RejectReason::AmountTooLow:    return "AmountTooLow";
    case RejectReason::Unauthorized:    return "Unauthorized";
    case RejectReason::RoomUnavailable: return "RoomUnavailable";
    case RejectReason::NotFound:        return "NotFound";
    case RejectReason::InvalidPayload:  return "InvalidPayload";
  }
  return "Unknown";
}

// -----------------------------------------------------------------------------
// BidResult
// -----------------------------------------------------------------------------
//
// @brief  Outcome of one bid submission: Accepted(bid) or Rejected(reason).
//
// @details
// current_highest carries the highest accepted amount at the moment the
// submission was sequenced, when known. It is always set for AmountTooLow
// rejections that follow an earlier accepted bid, so the bidder can retry
// informed. It is empty when no bid has been accepted yet or the room could
// not be reached.
// -----------------------------------------------------------------------------
struct BidResult {
  bool accepted{false};
  Bid bid{};                            // Valid only when accepted
  RejectReason reason{RejectReason::RoomUnavailable};  // Valid when rejected
  std::optional<Amount> current_highest;

  static BidResult accept(Bid bid) {
    BidResult result;
    result.accepted = true;
    result.current_highest = bid.amount;
    result.bid = std::move(bid);
    return result;
  }

  static BidResult reject(RejectReason reason,
                          std::optional<Amount> current_highest = std::nullopt) {
    BidResult result;
    result.accepted = false;
    result.reason = reason;
    result.current_highest = current_highest;
    return result;
  }
};

}  // namespace domain
}  // namespace auction
