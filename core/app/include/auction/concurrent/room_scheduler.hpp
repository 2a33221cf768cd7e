#pragma once

#include "auction/concurrent/task_loop_thread.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace auction {

// -----------------------------------------------------------------------------
// RoomScheduler — fixed pool of task loops shared by all rooms
// -----------------------------------------------------------------------------
//
// @brief  Owns N TaskLoopThreads ("shards") and pins each room to one of them
//         by hashing its product id.
//
// @details
// A dedicated thread per room would make thread count grow with the number
// of live auctions. Instead every room borrows the mailbox of one shard. All
// operations of a room go through that shard, so they are totally ordered;
// rooms on different shards run in parallel. Rooms sharing a shard only
// interleave: no room task ever waits on another room or on a subscriber.
//
// Thread model:
//   start()/stop() from the owning thread (AuctionServer). loopFor() is
//   thread-safe once started; the shard set never changes while running.
//
// Ownership:
//   Owned by AuctionServer. Rooms hold a TaskLoopThread& into this pool, so
//   the scheduler must outlive every room.
// -----------------------------------------------------------------------------
class RoomScheduler {
 public:
  // -------------------------------------------------------------------------
  // @param  shard_count       Number of loops. 0 picks
  //                           std::thread::hardware_concurrency() (min 1).
  // @param  mailbox_capacity  Per-shard mailbox bound (0 = unbounded).
  // -------------------------------------------------------------------------
  explicit RoomScheduler(std::size_t shard_count = 0,
                         std::size_t mailbox_capacity = 0);

  ~RoomScheduler();

  RoomScheduler(const RoomScheduler&) = delete;
  RoomScheduler& operator=(const RoomScheduler&) = delete;

  void start();

  // Stops every shard. Each shard drains the tasks it already accepted.
  void stop();

  // Returns the shard a product id is pinned to. Stable for the lifetime of
  // the scheduler.
  TaskLoopThread& loopFor(const std::string& product_id);

  std::size_t shardCount() const { return shards_.size(); }

 private:
  std::vector<std::unique_ptr<TaskLoopThread>> shards_;
};

}  // namespace auction
