#pragma once

#include "auction/domain/auction_status.hpp"
#include "auction/domain/bid.hpp"
#include "auction/domain/bid_result.hpp"
#include "auction/domain/types.hpp"

#include <cstddef>
#include <deque>
#include <optional>
#include <vector>

namespace auction {

// -----------------------------------------------------------------------------
// BidSequencer — validation and total ordering of one room's bids
// -----------------------------------------------------------------------------
//
// @brief  Decides Accepted/Rejected for each submission and, on acceptance,
//         assigns the next sequence number and the server-side timestamp.
//
// @details
// Validation, in order:
//   1. status must be Open                   → else AuctionNotOpen
//   2. amount > current highest amount, or
//      amount >= base price with no bid yet  → else AmountTooLow
//   3. bidder must be authenticated and the
//      connection still attached            → else Unauthorized
//
// The sequencer itself holds no lock. It is owned by a Room and only ever
// called on that room's serialization point, which is what makes "the
// current highest bid" race-free: two submissions are never validated at the
// same time, so whichever is sequenced first wins and the other sees the
// updated highest amount.
//
// Retained state: the current highest bid plus a bounded tail of recently
// accepted bids (oldest first) for late joiners' snapshots. Full history is
// the persistence collaborator's job.
// -----------------------------------------------------------------------------
class BidSequencer {
 public:
  BidSequencer(domain::Amount base_price, std::size_t recent_tail);

  // -------------------------------------------------------------------------
  // sequence(...)
  // -------------------------------------------------------------------------
  // @param  bidder      Identity from the auth collaborator (empty = none).
  // @param  amount      Offered amount in minor units.
  // @param  status      Room status at the moment of sequencing.
  // @param  attached    Whether the submitting connection is still attached.
  // @param  now         Server time stamped on an accepted bid.
  //
  // @return BidResult. Rejections carry the current highest amount when one
  //         exists.
  // -------------------------------------------------------------------------
  domain::BidResult sequence(const domain::BidderId& bidder,
                             domain::Amount amount,
                             domain::AuctionStatus status, bool attached,
                             Timestamp now);

  const std::optional<domain::Bid>& highest() const { return highest_; }

  std::optional<domain::Amount> highestAmount() const;

  // True if `amount` passes rule 2 against the current state.
  bool outbids(domain::Amount amount) const;

  // Smallest amount that would currently pass rule 2; nullopt once the
  // highest bid is the largest representable amount.
  std::optional<domain::Amount> minimumAcceptable() const;

  std::vector<domain::Bid> recentBids() const;

  domain::SequenceNumber lastSequence() const { return last_sequence_; }

 private:
  const domain::Amount base_price_;
  const std::size_t recent_tail_;

  std::optional<domain::Bid> highest_;
  std::deque<domain::Bid> recent_;
  domain::SequenceNumber last_sequence_{0};
};

}  // namespace auction
