#pragma once

#include "auction/concurrent/thread_safe_queue.hpp"
#include "auction/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace auction {

// -----------------------------------------------------------------------------
// IpcServer — operator surface: room telemetry out, admin commands in
// -----------------------------------------------------------------------------
//
// @brief  Runs a dedicated thread that streams every room event to external
//         subscribers (PUB socket) and answers admin commands from a REQ
//         client (REP socket).
//
// @details
// Two ZeroMQ sockets share one thread:
//
//   1. PUB socket (telemetry endpoint):
//      Each room event published on the server's observer EventBus is
//      pushed into a ThreadSafeQueue by pushTelemetry() and sent by the IPC
//      thread as two frames: the product id (the PUB topic, so a SUB can
//      follow a single auction) and the MessageCodec::encodeEvent() JSON.
//      Rooms never touch the socket and never wait for it.
//
//   2. REP socket (command endpoint):
//      One text command per request; the reply is whatever the command
//      handler returns (AuctionServer::executeCommand(): PING, STATUS,
//      ROOMS, CLOSE <product_id>). ZMQ_RCVTIMEO keeps the loop turning so
//      telemetry is drained between commands.
//
// A ZMQ error on the IPC thread is logged and ends the loop; bidding is not
// affected.
//
// Thread model:
//   start()/stop() from the owner. pushTelemetry() from any thread (room
//   shards, via the observer bus). The command handler runs on the IPC
//   thread.
//
// Ownership:
//   Owned by AuctionServer via std::unique_ptr; owns the ZMQ context, both
//   sockets, the telemetry queue and the worker thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  // No sockets are opened until start().
  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5561",
                     std::string pub_endpoint = "tcp://127.0.0.1:5562");

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // Binds both sockets and spawns the worker. Idempotent.
  // @throws zmq::error_t if an endpoint cannot be bound.
  void start();

  // Publishes what is still queued, joins the worker, closes the sockets.
  void stop();

  // Thread-safe, never blocks.
  void pushTelemetry(RoomEvent event);

  std::size_t pendingTelemetry() const { return telemetry_queue_.size(); }

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void processTelemetry();
  void processCommands();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<RoomEvent> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace auction
