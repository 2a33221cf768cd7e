#include "auction/room/broadcast_fanout.hpp"

namespace auction {

bool BroadcastFanout::add(const std::shared_ptr<ConnectionHandle>& handle) {
  if (!handle) {
    return false;
  }
  return subscribers_.emplace(handle->id(), handle).second;
}

bool BroadcastFanout::remove(domain::ConnectionId id) {
  return subscribers_.erase(id) > 0;
}

bool BroadcastFanout::contains(domain::ConnectionId id) const {
  return subscribers_.count(id) > 0;
}

std::vector<domain::ConnectionId> BroadcastFanout::publish(
    const RoomEvent& event) {
  std::vector<domain::ConnectionId> dropped;

  for (auto it = subscribers_.begin(); it != subscribers_.end();) {
    std::shared_ptr<ConnectionHandle> handle = it->second.lock();

    if (handle && handle->deliver(event)) {
      ++it;
      continue;
    }

    // Expired, closed by its owner, or full. A full queue means the reader
    // is not keeping up: close it so the writer side tears the connection
    // down instead of the room buffering for it.
    if (handle) {
      handle->close();
    }
    dropped.push_back(it->first);
    it = subscribers_.erase(it);
  }

  return dropped;
}

std::vector<domain::ConnectionId> BroadcastFanout::prune() {
  std::vector<domain::ConnectionId> dropped;

  for (auto it = subscribers_.begin(); it != subscribers_.end();) {
    std::shared_ptr<ConnectionHandle> handle = it->second.lock();
    if (handle && handle->isOpen()) {
      ++it;
      continue;
    }
    dropped.push_back(it->first);
    it = subscribers_.erase(it);
  }

  return dropped;
}

std::vector<domain::ConnectionId> BroadcastFanout::members() const {
  std::vector<domain::ConnectionId> ids;
  ids.reserve(subscribers_.size());
  for (const auto& [id, handle] : subscribers_) {
    ids.push_back(id);
  }
  return ids;
}

}  // namespace auction
