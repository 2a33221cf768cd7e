#pragma once

#include "auction/domain/types.hpp"
#include "auction/room/connection_handle.hpp"
#include "auction/transport/i_transport.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <thread>

namespace auction {

// -----------------------------------------------------------------------------
// OutboundWriter — the outbound task of one connection
// -----------------------------------------------------------------------------
//
// @brief  Owns one thread that moves events from a ConnectionHandle's queue
//         to ITransport::send(), in queue order.
//
// @details
// This is the only place a connection's send path may wait, and it waits only
// on its own queue, never on a room. Rooms fill the queue with try-push;
// this thread empties it.
//
// Exit paths:
//   - stop(): requested by the hub (client disconnect or shutdown). Closes
//     the handle and joins. The exit callback is NOT invoked.
//   - The handle was closed by the room (slow-consumer eviction): the thread
//     sends what is left, then invokes the exit callback on its own thread
//     so the hub can forget the connection.
//   - A send threw (transport backlog full or peer gone): the handle is
//     closed, the rest of the queue is discarded, and the exit callback
//     runs the same way.
//
// Thread model:
//   start()/stop() from hub threads, never from inside the exit callback or
//   from ITransport::send().
// -----------------------------------------------------------------------------
class OutboundWriter {
 public:
  // Called on the writer thread when the connection ended without stop().
  using ExitCallback = std::function<void(domain::ConnectionId)>;

  OutboundWriter(std::shared_ptr<ConnectionHandle> handle,
                 ITransport& transport, ExitCallback on_exit);

  ~OutboundWriter();

  OutboundWriter(const OutboundWriter&) = delete;
  OutboundWriter& operator=(const OutboundWriter&) = delete;

  void start();
  void stop();

  // True once the thread has left its loop (join will not wait).
  bool finished() const { return finished_.load(); }

  domain::ConnectionId connectionId() const { return handle_->id(); }

 private:
  void run();

  std::shared_ptr<ConnectionHandle> handle_;
  ITransport& transport_;
  ExitCallback on_exit_;

  std::atomic<bool> stop_requested_{false};
  std::atomic<bool> finished_{false};
  std::thread thread_;
};

}  // namespace auction
