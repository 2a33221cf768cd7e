#include "auction/concurrent/room_scheduler.hpp"

#include <functional>
#include <iostream>
#include <thread>

namespace auction {

RoomScheduler::RoomScheduler(std::size_t shard_count,
                             std::size_t mailbox_capacity) {
  if (shard_count == 0) {
    shard_count = std::thread::hardware_concurrency();
  }
  if (shard_count == 0) {
    shard_count = 1;
  }

  shards_.reserve(shard_count);
  for (std::size_t i = 0; i < shard_count; ++i) {
    shards_.push_back(std::make_unique<TaskLoopThread>(
        "shard-" + std::to_string(i), mailbox_capacity));
  }
}

RoomScheduler::~RoomScheduler() { stop(); }

void RoomScheduler::start() {
  for (auto& shard : shards_) {
    shard->start();
  }
  std::cout << "[RoomScheduler] started " << shards_.size() << " shard(s).\n";
}

void RoomScheduler::stop() {
  for (auto& shard : shards_) {
    shard->stop();
  }
}

TaskLoopThread& RoomScheduler::loopFor(const std::string& product_id) {
  const std::size_t index = std::hash<std::string>{}(product_id) % shards_.size();
  return *shards_[index];
}

}  // namespace auction
