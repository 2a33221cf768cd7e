// =============================================================================
// bid_sequencer_test.cpp
// =============================================================================
// Unit tests for auction::BidSequencer, the validation and ordering rules of
// a single room. Single-threaded: serialization is the Room's job, tested in
// room_test.cpp.
//
// Validates:
//   - Base 100: 90 too low, 100 accepted as #1, 100 again too low
//   - Boundaries: equal to highest is rejected; base price only before any bid
//   - Check order: status first, then amount, then identity
//   - Accepted bids get increasing sequence numbers and the server timestamp
//   - The recent-bid tail is bounded
//   - A highest bid at the largest representable amount cannot be beaten
// =============================================================================

#include "auction/room/bid_sequencer.hpp"
#include "auction/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <limits>

using auction::BidSequencer;
using auction::domain::AuctionStatus;
using auction::domain::RejectReason;

class BidSequencerTest : public ::testing::Test {
 protected:
  auction::domain::BidResult bid(const std::string& bidder,
                                 auction::domain::Amount amount,
                                 AuctionStatus status = AuctionStatus::Open,
                                 bool attached = true) {
    return sequencer.sequence(bidder, amount, status, attached,
                              auction::ms_to_timestamp(now_ms));
  }

  BidSequencer sequencer{100, 4};
  std::int64_t now_ms{10'000};
};

// -----------------------------------------------------------------------------
// 1. Base price, then strictly higher, step by step.
// -----------------------------------------------------------------------------
TEST_F(BidSequencerTest, BasePriceThenStrictlyHigher) {
  auto r1 = bid("alice", 90);
  EXPECT_FALSE(r1.accepted);
  EXPECT_EQ(r1.reason, RejectReason::AmountTooLow);
  EXPECT_FALSE(r1.current_highest.has_value());

  auto r2 = bid("alice", 100);
  ASSERT_TRUE(r2.accepted);
  EXPECT_EQ(r2.bid.amount, 100);
  EXPECT_EQ(r2.bid.sequence, 1u);
  EXPECT_EQ(r2.bid.bidder_id, "alice");

  auto r3 = bid("bob", 100);
  EXPECT_FALSE(r3.accepted);
  EXPECT_EQ(r3.reason, RejectReason::AmountTooLow);
  ASSERT_TRUE(r3.current_highest.has_value());
  EXPECT_EQ(*r3.current_highest, 100);
}

// -----------------------------------------------------------------------------
// 2. One above the highest is the smallest acceptable bid.
// -----------------------------------------------------------------------------
TEST_F(BidSequencerTest, StrictlyGreaterThanHighest) {
  EXPECT_EQ(sequencer.minimumAcceptable(), 100);
  ASSERT_TRUE(bid("alice", 150).accepted);
  EXPECT_EQ(sequencer.minimumAcceptable(), 151);

  EXPECT_FALSE(bid("bob", 150).accepted);
  auto r = bid("bob", 151);
  ASSERT_TRUE(r.accepted);
  EXPECT_EQ(r.bid.sequence, 2u);
  EXPECT_EQ(sequencer.highestAmount(), 151);
}

// -----------------------------------------------------------------------------
// 3. A closed or pending room rejects with AuctionNotOpen, even for a bid
//    that would otherwise be too low or unauthorized.
// Why: The status check comes first; clients must learn the auction is over
//      rather than be told to raise their bid.
// -----------------------------------------------------------------------------
TEST_F(BidSequencerTest, StatusCheckedFirst) {
  auto pending = bid("", 1, AuctionStatus::Pending, false);
  EXPECT_EQ(pending.reason, RejectReason::AuctionNotOpen);

  auto closed = bid("alice", 500, AuctionStatus::Closed);
  EXPECT_FALSE(closed.accepted);
  EXPECT_EQ(closed.reason, RejectReason::AuctionNotOpen);
  EXPECT_EQ(sequencer.lastSequence(), 0u);
}

// -----------------------------------------------------------------------------
// 4. Amount is checked before identity; identity failures are Unauthorized.
// -----------------------------------------------------------------------------
TEST_F(BidSequencerTest, AmountCheckedBeforeIdentity) {
  EXPECT_EQ(bid("", 50).reason, RejectReason::AmountTooLow);
  EXPECT_EQ(bid("", 200).reason, RejectReason::Unauthorized);
  EXPECT_EQ(bid("alice", 200, AuctionStatus::Open, false).reason,
            RejectReason::Unauthorized);
  EXPECT_FALSE(sequencer.highest().has_value());
}

// -----------------------------------------------------------------------------
// 5. Accepted bids carry the server timestamp and strictly increase.
// -----------------------------------------------------------------------------
TEST_F(BidSequencerTest, AcceptedBidsStrictlyIncrease) {
  auction::domain::Amount last_amount = 0;
  auction::domain::SequenceNumber last_seq = 0;

  for (int i = 0; i < 20; ++i) {
    now_ms += 5;
    auto r = bid("bidder-" + std::to_string(i % 3), 100 + i * 10);
    ASSERT_TRUE(r.accepted);
    EXPECT_GT(r.bid.amount, last_amount);
    EXPECT_EQ(r.bid.sequence, last_seq + 1);
    EXPECT_EQ(auction::timestamp_to_ms(r.bid.accepted_at), now_ms);
    last_amount = r.bid.amount;
    last_seq = r.bid.sequence;
  }
}

// -----------------------------------------------------------------------------
// 6. The recent tail keeps only the newest bids, oldest first.
// Why: Late joiners get this tail in their snapshot; it must stay bounded.
// -----------------------------------------------------------------------------
TEST_F(BidSequencerTest, RecentTailIsBounded) {
  for (int i = 0; i < 10; ++i) {
    ASSERT_TRUE(bid("alice", 100 + i).accepted);
  }

  auto recent = sequencer.recentBids();
  ASSERT_EQ(recent.size(), 4u);
  EXPECT_EQ(recent.front().amount, 106);
  EXPECT_EQ(recent.back().amount, 109);
  EXPECT_EQ(recent.back().sequence, 10u);
  EXPECT_EQ(sequencer.highest()->amount, 109);
}

// -----------------------------------------------------------------------------
// 7. A bid at the largest representable amount is final.
// Why: "one above the highest" does not exist there; a smaller bid must still
// be rejected as too low.
// -----------------------------------------------------------------------------
TEST_F(BidSequencerTest, MaximumAmountCannotBeBeaten) {
  constexpr auto kMax = std::numeric_limits<auction::domain::Amount>::max();

  ASSERT_TRUE(bid("alice", kMax).accepted);
  EXPECT_FALSE(sequencer.minimumAcceptable().has_value());

  auto low = bid("bob", 150);
  EXPECT_FALSE(low.accepted);
  EXPECT_EQ(low.reason, RejectReason::AmountTooLow);
  ASSERT_TRUE(low.current_highest.has_value());
  EXPECT_EQ(*low.current_highest, kMax);

  auto equal = bid("bob", kMax);
  EXPECT_FALSE(equal.accepted);
  EXPECT_EQ(equal.reason, RejectReason::AmountTooLow);

  EXPECT_EQ(sequencer.highestAmount(), kMax);
  EXPECT_EQ(sequencer.lastSequence(), 1u);
}
