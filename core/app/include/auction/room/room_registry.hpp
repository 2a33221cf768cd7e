#pragma once

#include "auction/catalog/i_auction_catalog.hpp"
#include "auction/concurrent/room_scheduler.hpp"
#include "auction/domain/room_limits.hpp"
#include "auction/domain/types.hpp"
#include "auction/eventbus/event_bus.hpp"
#include "auction/persistence/i_bid_recorder.hpp"
#include "auction/room/room.hpp"
#include "auction/time/i_time_provider.hpp"
#include "auction/timer/auction_timer.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace auction {

// -----------------------------------------------------------------------------
// RoomRegistry — process-wide product id → Room map
// -----------------------------------------------------------------------------
//
// @brief  Creates rooms lazily on first subscription and reclaims them once
//         their auction is closed and nobody is watching.
//
// @details
// This map is the only state shared across rooms. A single mutex guards it;
// getOrCreateRoom() does lookup, catalog fetch, creation and insertion under
// that one lock, so concurrent first-time callers for the same product all
// get the same Room and the catalog is consulted once per creation.
//
// On creation the registry arms the room's timers on the AuctionTimer: the
// end instant (→ close) and, for a Pending room, the start instant (→ open).
// Timer callbacks hold only a weak_ptr to the room.
//
// releaseIfEmpty() asks the room to retire itself. The check "Closed and no
// subscribers" runs on the room's own serialization point, ordered with
// attach(), so a subscriber that attaches first keeps the room alive and a
// subscriber that arrives after retirement is told RoomUnavailable and comes
// back here to get a fresh room. The retired room's entry is erased (and its
// timers cancelled) only if it is still the entry for that product.
//
// Subscriber count: each room mirrors its subscriber count atomically; the
// registry reads it through subscriberCount() rather than keeping a second
// counter that could drift from the room's real membership.
//
// Thread model:
//   All public methods are thread-safe. The registry lock is never held
//   while waiting on a room; room tasks take it only briefly (onRetired).
//
// Ownership:
//   Owned by AuctionServer. Rooms call back into the registry from their
//   shards, so the scheduler must be stopped before the registry is
//   destroyed.
// -----------------------------------------------------------------------------
class RoomRegistry {
 public:
  RoomRegistry(const IAuctionCatalog& catalog, RoomScheduler& scheduler,
               AuctionTimer& timer, const ITimeProvider& clock,
               EventBus& observers, IBidRecorder* recorder,
               domain::RoomLimits limits);

  // Cancels every armed timer; rooms still referenced elsewhere stay alive.
  ~RoomRegistry();

  RoomRegistry(const RoomRegistry&) = delete;
  RoomRegistry& operator=(const RoomRegistry&) = delete;

  // -------------------------------------------------------------------------
  // getOrCreateRoom(product_id)
  // -------------------------------------------------------------------------
  // @return The live room for product_id, created if absent; nullptr when
  //         the catalog does not know the product (NotFound).
  // -------------------------------------------------------------------------
  std::shared_ptr<Room> getOrCreateRoom(const domain::ProductId& product_id);

  // -------------------------------------------------------------------------
  // releaseIfEmpty(product_id)
  // -------------------------------------------------------------------------
  // @brief  Removes the room if it is Closed and has no open subscribers;
  //         otherwise no-op. Asynchronous: the decision is made on the
  //         room's serialization point. If the room's mailbox refuses the
  //         task, this is logged and the next call tries again.
  // -------------------------------------------------------------------------
  void releaseIfEmpty(const domain::ProductId& product_id);

  // Live room for product_id or nullptr. Never creates.
  std::shared_ptr<Room> findRoom(const domain::ProductId& product_id) const;

  std::size_t subscriberCount(const domain::ProductId& product_id) const;

  std::size_t roomCount() const;

  std::vector<std::shared_ptr<Room>> rooms() const;

  // Rooms ever created (monotonic), for tests and STATUS.
  std::uint64_t roomsCreated() const { return rooms_created_.load(); }

  // Drops every entry and cancels all timers. Used at shutdown.
  void clear();

 private:
  struct Entry {
    std::shared_ptr<Room> room;
    AuctionTimer::TimerId open_timer{0};
    AuctionTimer::TimerId close_timer{0};
  };

  Entry createEntry(const domain::AuctionInfo& info);
  void cancelTimers(const Entry& entry);

  // Runs on the retired room's shard.
  void onRetired(const std::shared_ptr<Room>& room);

  const IAuctionCatalog& catalog_;
  RoomScheduler& scheduler_;
  AuctionTimer& timer_;
  const ITimeProvider& clock_;
  EventBus& observers_;
  IBidRecorder* recorder_;
  const domain::RoomLimits limits_;

  mutable std::mutex mutex_;  // Protects rooms_
  std::unordered_map<domain::ProductId, Entry> rooms_;
  std::atomic<std::uint64_t> rooms_created_{0};
};

}  // namespace auction
