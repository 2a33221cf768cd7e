#pragma once

#include "auction/domain/types.hpp"

namespace auction {
namespace domain {

// -----------------------------------------------------------------------------
// Bid
// -----------------------------------------------------------------------------
// Responsibility: One accepted bid. accepted_at and sequence are assigned by
// the BidSequencer, never by the client.
//
// Immutable once accepted: the room hands out copies (in events, snapshots
// and to the persistence collaborator) and never mutates them.
// -----------------------------------------------------------------------------
struct Bid {
  BidderId bidder_id;
  Amount amount{0};
  Timestamp accepted_at{};
  SequenceNumber sequence{0};
};

}  // namespace domain
}  // namespace auction
