#include "auction/room/bid_sequencer.hpp"

#include <limits>
#include <utility>

namespace auction {

BidSequencer::BidSequencer(domain::Amount base_price, std::size_t recent_tail)
    : base_price_(base_price), recent_tail_(recent_tail) {}

domain::BidResult BidSequencer::sequence(const domain::BidderId& bidder,
                                         domain::Amount amount,
                                         domain::AuctionStatus status,
                                         bool attached, Timestamp now) {
  using domain::BidResult;
  using domain::RejectReason;

  if (status != domain::AuctionStatus::Open) {
    return BidResult::reject(RejectReason::AuctionNotOpen, highestAmount());
  }

  if (!outbids(amount)) {
    return BidResult::reject(RejectReason::AmountTooLow, highestAmount());
  }

  if (bidder.empty() || !attached) {
    return BidResult::reject(RejectReason::Unauthorized, highestAmount());
  }

  domain::Bid bid;
  bid.bidder_id = bidder;
  bid.amount = amount;
  bid.accepted_at = now;
  bid.sequence = ++last_sequence_;

  highest_ = bid;
  if (recent_tail_ > 0) {
    recent_.push_back(bid);
    while (recent_.size() > recent_tail_) {
      recent_.pop_front();
    }
  }

  return BidResult::accept(std::move(bid));
}

std::optional<domain::Amount> BidSequencer::highestAmount() const {
  if (!highest_) {
    return std::nullopt;
  }
  return highest_->amount;
}

bool BidSequencer::outbids(domain::Amount amount) const {
  // Compared directly: highest + 1 does not exist once the highest bid is
  // the largest representable amount.
  return highest_ ? amount > highest_->amount : amount >= base_price_;
}

std::optional<domain::Amount> BidSequencer::minimumAcceptable() const {
  if (!highest_) {
    return base_price_;
  }
  if (highest_->amount == std::numeric_limits<domain::Amount>::max()) {
    return std::nullopt;
  }
  return highest_->amount + 1;
}

std::vector<domain::Bid> BidSequencer::recentBids() const {
  return std::vector<domain::Bid>(recent_.begin(), recent_.end());
}

}  // namespace auction
