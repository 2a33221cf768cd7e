#pragma once

#include "auction/domain/room_snapshot.hpp"
#include "auction/domain/types.hpp"
#include "auction/events/event.hpp"

namespace auction {

// -----------------------------------------------------------------------------
// ITransport — outbound half of the transport boundary
// -----------------------------------------------------------------------------
//
// @brief  What the engine needs from whatever carries bytes to clients.
//
// @details
// The wire (ZeroMQ in BidGateway, anything else in an embedding) is outside
// the engine. The engine pushes three things out through this interface:
//
//   sendSnapshot() — once per connection, from ConnectionHub::onConnect(),
//                    before any room event for that connection.
//   send()         — each room event, from that connection's OutboundWriter.
//   close()        — when the engine drops a connection on its own (slow
//                    consumer eviction); not called for client disconnects.
//
// Thread-safety contract:
//   Methods are called from many threads (one writer thread per connection
//   plus the caller of onConnect). send() must not block beyond the
//   implementation's own bounded buffering; a slow client already has its
//   own bounded queue in front of this call.
// -----------------------------------------------------------------------------
class ITransport {
 public:
  virtual ~ITransport() = default;

  virtual void sendSnapshot(domain::ConnectionId connection,
                            const domain::RoomSnapshot& snapshot) = 0;

  virtual void send(domain::ConnectionId connection,
                    const RoomEvent& event) = 0;

  virtual void close(domain::ConnectionId connection) = 0;
};

}  // namespace auction
