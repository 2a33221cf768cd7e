#pragma once

#include "auction/domain/types.hpp"

#include <cstddef>
#include <mutex>
#include <unordered_map>

namespace auction {

// -----------------------------------------------------------------------------
// FrameBacklog — per-connection count of frames waiting for the socket
// -----------------------------------------------------------------------------
//
// @brief  Bounds how many outbound frames one connection may have queued in
//         the gateway at any time.
//
// @details
// Writers reserve() a slot before they enqueue a frame and the gateway
// thread release()s it once the frame has left (or was discarded). A
// connection at capacity is refused, which its writer treats as a failed
// send: the handle is closed and the hub evicts the connection. The
// per-subscriber bound therefore holds end to end, not just inside the room.
//
// Thread model: all methods are thread-safe.
// -----------------------------------------------------------------------------
class FrameBacklog {
 public:
  // @param  capacity  Maximum frames per connection; 0 is treated as 1.
  explicit FrameBacklog(std::size_t capacity);

  FrameBacklog(const FrameBacklog&) = delete;
  FrameBacklog& operator=(const FrameBacklog&) = delete;

  // @return false if the connection already has `capacity` frames pending.
  bool reserve(domain::ConnectionId connection);

  // One frame left. Unknown connections are ignored.
  void release(domain::ConnectionId connection);

  // Drops all accounting for a connection that is gone.
  void forget(domain::ConnectionId connection);

  std::size_t pending(domain::ConnectionId connection) const;
  std::size_t total() const;
  std::size_t capacity() const { return capacity_; }

 private:
  const std::size_t capacity_;

  mutable std::mutex mutex_;
  std::unordered_map<domain::ConnectionId, std::size_t> pending_;
  std::size_t total_{0};
};

}  // namespace auction
