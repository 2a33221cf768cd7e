#include "auction/network/frame_backlog.hpp"

namespace auction {

FrameBacklog::FrameBacklog(std::size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

bool FrameBacklog::reserve(domain::ConnectionId connection) {
  std::lock_guard lock(mutex_);
  std::size_t& count = pending_[connection];
  if (count >= capacity_) {
    return false;
  }
  ++count;
  ++total_;
  return true;
}

void FrameBacklog::release(domain::ConnectionId connection) {
  std::lock_guard lock(mutex_);
  auto it = pending_.find(connection);
  if (it == pending_.end()) {
    return;
  }
  --total_;
  if (--it->second == 0) {
    pending_.erase(it);
  }
}

void FrameBacklog::forget(domain::ConnectionId connection) {
  std::lock_guard lock(mutex_);
  auto it = pending_.find(connection);
  if (it == pending_.end()) {
    return;
  }
  total_ -= it->second;
  pending_.erase(it);
}

std::size_t FrameBacklog::pending(domain::ConnectionId connection) const {
  std::lock_guard lock(mutex_);
  auto it = pending_.find(connection);
  return it == pending_.end() ? 0 : it->second;
}

std::size_t FrameBacklog::total() const {
  std::lock_guard lock(mutex_);
  return total_;
}

}  // namespace auction
