#pragma once

#include "auction/concurrent/sequence_generator.hpp"
#include "auction/domain/bid_result.hpp"
#include "auction/domain/room_limits.hpp"
#include "auction/domain/room_snapshot.hpp"
#include "auction/domain/types.hpp"
#include "auction/room/connection_handle.hpp"
#include "auction/room/room.hpp"
#include "auction/room/room_registry.hpp"
#include "auction/transport/i_transport.hpp"
#include "auction/transport/outbound_writer.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace auction {

// Outcome of ConnectionHub::onConnect().
struct ConnectResult {
  bool connected{false};
  domain::RejectReason reason{domain::RejectReason::NotFound};
  domain::ConnectionId connection_id{0};
  std::shared_ptr<ConnectionHandle> handle;
  domain::RoomSnapshot snapshot;  // Valid only when connected
};

// -----------------------------------------------------------------------------
// ConnectionHub — inbound half of the transport boundary
// -----------------------------------------------------------------------------
//
// @brief  Turns connect / message / disconnect notifications from a transport
//         into room operations, and runs one OutboundWriter per connection.
//
// @details
// Responsibilities:
//   1. onConnect(): resolve the room through the registry, create the
//      ConnectionHandle, attach it, send the snapshot through ITransport,
//      then start the connection's writer. A room that retires between
//      lookup and attach is looked up once more.
//   2. onMessage(): decode a bid payload and submit it to the connection's
//      room. Undecodable or non-positive amounts are InvalidPayload.
//   3. onDisconnect(): idempotent. Detaches from the room, stops the writer
//      and lets the registry reclaim the room if it is now empty and closed.
//   4. Slow-consumer eviction: when a room closes a handle, its writer exits
//      and the hub forgets the session and asks the transport to close.
//
// Session ids come from a SequenceGenerator and are never reused.
//
// Thread model:
//   All public methods are thread-safe. The session map is guarded by
//   mutex_, which is never held while waiting on a room or joining a writer.
//   Writers that exit on their own are parked and joined later from a hub
//   call, never from their own thread.
// -----------------------------------------------------------------------------
class ConnectionHub {
 public:
  ConnectionHub(RoomRegistry& registry, ITransport& transport,
                domain::RoomLimits limits);

  // Disconnects every remaining session.
  ~ConnectionHub();

  ConnectionHub(const ConnectionHub&) = delete;
  ConnectionHub& operator=(const ConnectionHub&) = delete;

  // bidder_id may be empty: such a connection may watch but not bid.
  ConnectResult onConnect(const domain::ProductId& product_id,
                          const domain::BidderId& bidder_id);

  // raw is a bid payload such as {"amount":150}.
  domain::BidResult onMessage(domain::ConnectionId connection,
                              const std::string& raw);

  // Already-decoded bid. Unknown or detached connections are Unauthorized.
  domain::BidResult submitBid(domain::ConnectionId connection,
                              domain::Amount amount);

  void onDisconnect(domain::ConnectionId connection);

  void disconnectAll();

  std::size_t connectionCount() const;

  std::shared_ptr<ConnectionHandle> findHandle(
      domain::ConnectionId connection) const;

  std::uint64_t evictedCount() const { return evicted_.load(); }

 private:
  struct Session {
    std::shared_ptr<ConnectionHandle> handle;
    std::shared_ptr<Room> room;
    std::unique_ptr<OutboundWriter> writer;
  };

  // Attach with one retry against a room retired in between.
  std::shared_ptr<Room> attachToRoom(
      const domain::ProductId& product_id,
      const std::shared_ptr<ConnectionHandle>& handle,
      Room::AttachResult& result);

  // Writer thread: the handle was closed from the room side.
  void onWriterExit(domain::ConnectionId connection);

  void reapFinishedWriters();

  RoomRegistry& registry_;
  ITransport& transport_;
  const domain::RoomLimits limits_;
  SequenceGenerator connection_ids_;

  mutable std::mutex mutex_;
  std::unordered_map<domain::ConnectionId, Session> sessions_;
  std::vector<std::unique_ptr<OutboundWriter>> finished_writers_;

  std::atomic<std::uint64_t> evicted_{0};
};

}  // namespace auction
