#pragma once

#include "auction/concurrent/thread_safe_queue.hpp"
#include "auction/domain/types.hpp"
#include "auction/network/frame_backlog.hpp"
#include "auction/transport/connection_hub.hpp"
#include "auction/transport/i_transport.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <unordered_map>

namespace auction {

// -----------------------------------------------------------------------------
// BidGateway — ZeroMQ ROUTER front door for bidders and watchers
// -----------------------------------------------------------------------------
//
// @brief  Owns one ROUTER socket and the thread that uses it. Inbound frames
//         drive the ConnectionHub; outbound traffic from the engine arrives
//         through ITransport and is sent from the same thread.
//
// @details
// Clients are DEALER sockets. Each message is [identity][payload] on the
// ROUTER side, payload being one JSON frame (see MessageCodec):
//
//   join  → ConnectionHub::onConnect(); the snapshot frame comes back
//           through sendSnapshot(), or an error frame on failure.
//           A second join from the same identity leaves the first room.
//   bid   → ConnectionHub::submitBid(); replied with a bid_result frame.
//   leave → ConnectionHub::onDisconnect().
//   other → error frame (InvalidPayload).
//
// ZMQ sockets are not thread-safe, so send()/sendSnapshot()/close() only
// encode and enqueue; the gateway thread drains that queue between receive
// polls. Frames for a connection that already left are discarded.
//
// Back-pressure:
//   Each connection may have at most `outbound_capacity` frames waiting in
//   the gateway (FrameBacklog). send() on a connection at that bound throws,
//   so its OutboundWriter closes the handle and the hub evicts it, exactly as
//   if the room's own queue had overflowed. The socket is ROUTER_MANDATORY:
//   a peer that is gone or whose pipe is at the high-water mark makes the
//   send fail instead of silently dropping the frame, and the gateway then
//   disconnects that connection through the hub.
//
// Thread model:
//   start()/stop() from the owner (AuctionServer). ITransport methods from
//   any thread. Everything touching the socket or the identity maps runs on
//   the gateway thread.
//
// Ownership:
//   Must outlive the ConnectionHub it was started with, since the hub's
//   writers keep calling ITransport until the hub is destroyed.
// -----------------------------------------------------------------------------
class BidGateway final : public ITransport {
 public:
  explicit BidGateway(std::string endpoint = "tcp://127.0.0.1:5560",
                      std::size_t outbound_capacity = 256);

  ~BidGateway() override;

  BidGateway(const BidGateway&) = delete;
  BidGateway& operator=(const BidGateway&) = delete;

  // Binds the socket and spawns the gateway thread. Idempotent.
  // @throws zmq::error_t if the endpoint cannot be bound.
  void start(ConnectionHub& hub);

  // Joins the gateway thread and closes the socket. Connections are left to
  // the hub (AuctionServer disconnects them next).
  void stop();

  // --- ITransport -------------------------------------------------------------
  void sendSnapshot(domain::ConnectionId connection,
                    const domain::RoomSnapshot& snapshot) override;
  // @throws std::runtime_error when the connection's backlog is full.
  void send(domain::ConnectionId connection, const RoomEvent& event) override;
  void close(domain::ConnectionId connection) override;

  const std::string& endpoint() const { return endpoint_; }

  // Frames queued for the socket, across all connections.
  std::size_t pendingFrames() const { return backlog_.total(); }

 private:
  static constexpr int kPollTimeoutMs = 20;

  struct OutboundFrame {
    domain::ConnectionId connection{0};
    std::string payload;
    bool close_after{false};
    bool reserved{false};  // Holds a FrameBacklog slot.
  };

  void run();
  void processInbound();
  void processOutbound();

  void handleFrame(const std::string& identity, const std::string& payload);
  void handleJoin(const std::string& identity, const domain::ProductId& pid,
                  const domain::BidderId& bidder);
  void handleBid(const std::string& identity, domain::Amount amount);
  void handleLeave(const std::string& identity);

  // @return false if the peer could not take the frame (gone or at HWM).
  bool sendTo(const std::string& identity, const std::string& payload);
  void forget(domain::ConnectionId connection);
  void dropPeer(domain::ConnectionId connection);

  std::string endpoint_;
  ConnectionHub* hub_{nullptr};

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> socket_;

  // Gateway thread only.
  std::map<std::string, domain::ConnectionId> by_identity_;
  std::unordered_map<domain::ConnectionId, std::string> by_connection_;

  FrameBacklog backlog_;
  ThreadSafeQueue<OutboundFrame> outbound_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace auction
