#pragma once

#include "auction/concurrent/thread_safe_queue.hpp"
#include "auction/domain/types.hpp"
#include "auction/events/event.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace auction {

// -----------------------------------------------------------------------------
// ConnectionHandle — one subscriber's channel as the room sees it
// -----------------------------------------------------------------------------
//
// @brief  Identity of a connection plus its bounded outbound event queue.
//
// @details
// Owned by the transport side (ConnectionHub keeps the shared_ptr); a Room
// holds only a std::weak_ptr in its subscriber set and never extends the
// handle's lifetime.
//
// deliver() is the room's only way to reach a subscriber. It never blocks:
// when the outbound queue is full the event is refused and the room evicts
// the handle, so one slow reader can never hold up a room or its other
// subscribers. The OutboundWriter on the other side drains the queue with
// nextEvent() and hands events to the transport.
//
// close() is idempotent. After it, deliver() refuses everything; events
// already queued can still be drained so the last messages are not lost.
//
// Thread model:
//   deliver()/close() from a room's shard, nextEvent() from the writer
//   thread, close() also from the hub. All methods are thread-safe.
// -----------------------------------------------------------------------------
class ConnectionHandle {
 public:
  ConnectionHandle(domain::ConnectionId id, domain::ProductId product_id,
                   domain::BidderId bidder_id, std::size_t outbound_capacity);

  ConnectionHandle(const ConnectionHandle&) = delete;
  ConnectionHandle& operator=(const ConnectionHandle&) = delete;

  domain::ConnectionId id() const { return id_; }
  const domain::ProductId& productId() const { return product_id_; }
  const domain::BidderId& bidderId() const { return bidder_id_; }

  // Spectator connections carry no bidder identity and may not bid.
  bool isAuthenticated() const { return !bidder_id_.empty(); }

  // -------------------------------------------------------------------------
  // deliver(event)
  // -------------------------------------------------------------------------
  // @return false when the handle is closed or its queue is full.
  // -------------------------------------------------------------------------
  bool deliver(const RoomEvent& event);

  // Waits up to timeout for the next queued event. Returns nullopt on
  // timeout, or at once when the handle is closed and drained.
  std::optional<RoomEvent> nextEvent(std::chrono::milliseconds timeout);

  std::optional<RoomEvent> tryNextEvent();

  // @return true for the call that actually closed the handle.
  bool close();

  bool isOpen() const { return !outbound_.closed(); }

  std::size_t queuedEvents() const { return outbound_.size(); }

  std::uint64_t deliveredCount() const { return delivered_.load(); }
  std::uint64_t droppedCount() const { return dropped_.load(); }

 private:
  const domain::ConnectionId id_;
  const domain::ProductId product_id_;
  const domain::BidderId bidder_id_;

  ThreadSafeQueue<RoomEvent> outbound_;

  std::atomic<std::uint64_t> delivered_{0};
  std::atomic<std::uint64_t> dropped_{0};
};

}  // namespace auction
