#pragma once

#include "auction/domain/types.hpp"
#include "auction/events/event.hpp"
#include "auction/room/connection_handle.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <vector>

namespace auction {

// -----------------------------------------------------------------------------
// BroadcastFanout — one room's subscriber set and event delivery
// -----------------------------------------------------------------------------
//
// @brief  Delivers each room event to every attached ConnectionHandle without
//         letting any one of them slow the others down.
//
// @details
// Membership is a map ConnectionId → weak_ptr<ConnectionHandle>: the room
// tracks who is attached but the transport owns the handles.
//
// publish(event) walks the set once and calls deliver() on each live handle.
// deliver() only try-pushes into the handle's bounded queue, so publish never
// waits. A handle that refuses (queue full) is closed and dropped from the
// set; so is one that has already expired or been closed by its owner.
// publish() reports every id it dropped so the room can account for the
// departure exactly once.
//
// Ordering: the owning room calls publish() from its serialization point in
// acceptance order, and every handle's queue is FIFO, so all subscribers see
// the same events in the same relative order.
//
// Thread model: not thread-safe. Owned by Room and only touched on the
// room's serialization point.
// -----------------------------------------------------------------------------
class BroadcastFanout {
 public:
  BroadcastFanout() = default;

  BroadcastFanout(const BroadcastFanout&) = delete;
  BroadcastFanout& operator=(const BroadcastFanout&) = delete;

  // @return false if the handle is already a member (or null).
  bool add(const std::shared_ptr<ConnectionHandle>& handle);

  // @return true only if the id was a member. Second call is a no-op.
  bool remove(domain::ConnectionId id);

  bool contains(domain::ConnectionId id) const;

  std::size_t size() const { return subscribers_.size(); }

  bool empty() const { return subscribers_.empty(); }

  // -------------------------------------------------------------------------
  // publish(event)
  // -------------------------------------------------------------------------
  // @return Ids removed during this publish (evicted slow consumers and
  //         handles that were already gone), in ascending id order.
  // -------------------------------------------------------------------------
  std::vector<domain::ConnectionId> publish(const RoomEvent& event);

  // Drops members whose handle has expired or been closed by its owner,
  // without delivering anything. @return the dropped ids.
  std::vector<domain::ConnectionId> prune();

  std::vector<domain::ConnectionId> members() const;

 private:
  // std::map keeps delivery order stable (ascending connection id), which
  // makes fan-out behaviour reproducible in tests.
  std::map<domain::ConnectionId, std::weak_ptr<ConnectionHandle>> subscribers_;
};

}  // namespace auction
