#pragma once

#include <cstddef>
#include <cstdint>

namespace auction {
namespace domain {

// -----------------------------------------------------------------------------
// RoomLimits — resource bounds applied to every room
// -----------------------------------------------------------------------------
//
// @brief  Plain configuration struct, immutable once the server starts.
//
// @details
//   outbound_queue_capacity  Events buffered per subscriber. A subscriber
//                            whose buffer is full when an event is fanned
//                            out is evicted (treated as a disconnect).
//   recent_bid_tail          Accepted bids retained per room for late
//                            joiners' snapshots.
//   submit_timeout_ms        How long a caller waits for the room's
//                            serialization point before the operation fails
//                            with RoomUnavailable.
//   mailbox_capacity         Tasks queued per scheduler shard before posts
//                            are refused.
//   shard_count              Scheduler shards; 0 = one per hardware thread.
// -----------------------------------------------------------------------------
struct RoomLimits {
  std::size_t outbound_queue_capacity{256};
  std::size_t recent_bid_tail{16};
  std::int64_t submit_timeout_ms{500};
  std::size_t mailbox_capacity{4096};
  std::size_t shard_count{0};
};

}  // namespace domain
}  // namespace auction
