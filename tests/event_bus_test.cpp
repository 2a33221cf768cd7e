// =============================================================================
// event_bus_test.cpp
// =============================================================================
// Unit tests for auction::EventBus (the server-wide room event observer bus).
//
// Validates:
//   - Generic subscription receives every room event type
//   - Typed subscription receives only the matching event type
//   - Multiple subscribers all receive the same published event
//   - Unsubscribe stops delivery; unknown ids are ignored
//   - A throwing observer is counted and does not starve the others
//   - Re-entrant publish (subscriber publishes inside callback) without deadlock
//   - Event payloads arrive intact through the variant dispatch path
//
// All tests are single-threaded. Cross-thread delivery from room shards is
// covered in room_test.cpp and auction_server_test.cpp.
// =============================================================================

#include "auction/eventbus/event_bus.hpp"
#include "auction/events/event.hpp"
#include "auction/events/room_events.hpp"
#include "auction/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

// =============================================================================
// Test fixture: provides a fresh EventBus for each test.
// =============================================================================
class EventBusTest : public ::testing::Test {
 protected:
  auction::EventBus bus;

  static auction::BidAcceptedEvent makeBid(const std::string& product,
                                           const std::string& bidder,
                                           auction::domain::Amount amount,
                                           std::uint64_t seq) {
    auction::BidAcceptedEvent e;
    e.product_id = product;
    e.bid.bidder_id = bidder;
    e.bid.amount = amount;
    e.bid.sequence = seq;
    e.bid.accepted_at = auction::ms_to_timestamp(1000);
    e.timestamp = e.bid.accepted_at;
    e.sequence_id = seq;
    return e;
  }

  static auction::AuctionOpenedEvent makeOpened(const std::string& product) {
    auction::AuctionOpenedEvent e;
    e.product_id = product;
    e.base_price = 100;
    e.end_ms = 60'000;
    e.sequence_id = 1;
    return e;
  }

  static auction::AuctionClosedEvent makeClosed(const std::string& product) {
    auction::AuctionClosedEvent e;
    e.product_id = product;
    e.reason = auction::CloseReason::EndTimeReached;
    e.sequence_id = 2;
    return e;
  }
};

// -----------------------------------------------------------------------------
// 1. A generic subscriber must be invoked for every event type.
// Why: The telemetry bridge to IpcServer subscribes generically. If the
//      variant dispatch skipped a type, operators would miss closes.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, GenericSubscriberReceivesAllEvents) {
  int call_count = 0;
  bus.subscribe([&call_count](const auction::RoomEvent&) { ++call_count; });

  bus.publish(makeOpened("lamp"));
  bus.publish(makeBid("lamp", "alice", 150, 1));
  bus.publish(makeClosed("lamp"));

  EXPECT_EQ(call_count, 3);
}

// -----------------------------------------------------------------------------
// 2. A typed subscriber must fire only for its registered event type.
// Why: main()'s closing-summary logger must not try to read a winner out of
//      a BidAcceptedEvent.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberFiltersCorrectly) {
  int closed_count = 0;
  bus.subscribe<auction::AuctionClosedEvent>(
      [&closed_count](const auction::AuctionClosedEvent&) { ++closed_count; });

  bus.publish(makeBid("lamp", "alice", 150, 1));
  bus.publish(makeClosed("lamp"));

  EXPECT_EQ(closed_count, 1);
}

// -----------------------------------------------------------------------------
// 3. Multiple subscribers must all receive the same published event.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, MultipleSubscribersAllReceive) {
  int count_a = 0;
  int count_b = 0;
  int count_c = 0;

  bus.subscribe<auction::BidAcceptedEvent>(
      [&count_a](const auction::BidAcceptedEvent&) { ++count_a; });
  bus.subscribe<auction::BidAcceptedEvent>(
      [&count_b](const auction::BidAcceptedEvent&) { ++count_b; });
  bus.subscribe([&count_c](const auction::RoomEvent&) { ++count_c; });

  bus.publish(makeBid("lamp", "alice", 150, 1));

  EXPECT_EQ(count_a, 1);
  EXPECT_EQ(count_b, 1);
  EXPECT_EQ(count_c, 1);
  EXPECT_EQ(bus.subscriberCount(), 3u);
}

// -----------------------------------------------------------------------------
// 4. After unsubscribe(id), the callback must not fire for future publishes.
// Why: AuctionServer::stop() unsubscribes the telemetry bridge before
//      destroying IpcServer; a late callback would touch a dead object.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnsubscribeStopsDelivery) {
  int call_count = 0;
  auto id = bus.subscribe<auction::BidAcceptedEvent>(
      [&call_count](const auction::BidAcceptedEvent&) { ++call_count; });

  bus.publish(makeBid("lamp", "alice", 150, 1));
  EXPECT_EQ(call_count, 1);

  EXPECT_TRUE(bus.unsubscribe(id));
  EXPECT_FALSE(bus.unsubscribe(id));

  bus.publish(makeBid("lamp", "bob", 160, 2));
  EXPECT_EQ(call_count, 1);
  EXPECT_EQ(bus.subscriberCount(), 0u);
}

// -----------------------------------------------------------------------------
// 5. Unsubscribing an unknown id and publishing to an empty bus are no-ops.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnknownIdAndEmptyBusAreHarmless) {
  EXPECT_FALSE(bus.unsubscribe(9999));
  EXPECT_NO_FATAL_FAILURE(bus.publish(makeOpened("lamp")));
}

// -----------------------------------------------------------------------------
// 6. An observer that throws is isolated.
// Why: rooms publish from inside their own task; an escaping exception would
//      skip the rest of the broadcast and the persistence hand-off.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, ThrowingObserverIsIsolated) {
  int after = 0;
  bus.subscribe([](const auction::RoomEvent&) {
    throw std::runtime_error("observer failed");
  });
  bus.subscribe([&after](const auction::RoomEvent&) { ++after; });

  EXPECT_NO_THROW(bus.publish(makeBid("lamp", "alice", 150, 1)));
  EXPECT_NO_THROW(bus.publish(makeOpened("lamp")));

  EXPECT_EQ(after, 2);
  EXPECT_EQ(bus.observerFailures(), 2u);
}

// -----------------------------------------------------------------------------
// 7. A subscriber that calls publish() inside its callback must not deadlock.
// Why: The subscriber list is copied before callbacks run. If the lock were
//      held across callbacks this test would hang forever.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, SubscriberCanPublishInsideCallback) {
  int closed_received = 0;

  bus.subscribe<auction::AuctionClosedEvent>(
      [&closed_received](const auction::AuctionClosedEvent&) {
        ++closed_received;
      });

  bus.subscribe<auction::BidAcceptedEvent>(
      [this](const auction::BidAcceptedEvent& e) {
        bus.publish(makeClosed(e.product_id));
      });

  bus.publish(makeBid("lamp", "alice", 150, 1));

  EXPECT_EQ(closed_received, 1);
}

// -----------------------------------------------------------------------------
// 8. Field values must survive publish → dispatch.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberReceivesCorrectData) {
  std::string product;
  std::string bidder;
  auction::domain::Amount amount = 0;
  std::uint64_t sequence_id = 0;

  bus.subscribe<auction::BidAcceptedEvent>(
      [&](const auction::BidAcceptedEvent& e) {
        product = e.product_id;
        bidder = e.bid.bidder_id;
        amount = e.bid.amount;
        sequence_id = e.sequence_id;
      });

  bus.publish(makeBid("vase", "carol", 2375, 7));

  EXPECT_EQ(product, "vase");
  EXPECT_EQ(bidder, "carol");
  EXPECT_EQ(amount, 2375);
  EXPECT_EQ(sequence_id, 7u);
  EXPECT_EQ(auction::sequenceOf(makeBid("vase", "carol", 2375, 7)), 7u);
  EXPECT_EQ(auction::productOf(makeClosed("vase")), "vase");
}
