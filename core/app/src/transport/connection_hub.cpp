#include "auction/transport/connection_hub.hpp"

#include "auction/wire/message_codec.hpp"

#include <iostream>
#include <optional>
#include <utility>

namespace auction {

ConnectionHub::ConnectionHub(RoomRegistry& registry, ITransport& transport,
                             domain::RoomLimits limits)
    : registry_(registry), transport_(transport), limits_(limits) {}

ConnectionHub::~ConnectionHub() {
  disconnectAll();

  std::vector<std::unique_ptr<OutboundWriter>> remaining;
  {
    std::lock_guard lock(mutex_);
    remaining.swap(finished_writers_);
  }
  remaining.clear();
}

// -----------------------------------------------------------------------------
// onConnect()
// -----------------------------------------------------------------------------
ConnectResult ConnectionHub::onConnect(const domain::ProductId& product_id,
                                       const domain::BidderId& bidder_id) {
  reapFinishedWriters();

  ConnectResult result;
  const domain::ConnectionId id = connection_ids_.next_id();
  auto handle = std::make_shared<ConnectionHandle>(
      id, product_id, bidder_id, limits_.outbound_queue_capacity);

  Room::AttachResult attached;
  std::shared_ptr<Room> room = attachToRoom(product_id, handle, attached);
  if (!room) {
    result.reason = attached.reason;
    return result;
  }

  // Snapshot goes out before the writer exists, so nothing can overtake it.
  transport_.sendSnapshot(id, attached.snapshot);

  auto writer = std::make_unique<OutboundWriter>(
      handle, transport_,
      [this](domain::ConnectionId connection) { onWriterExit(connection); });
  OutboundWriter* writer_ptr = writer.get();

  {
    std::lock_guard lock(mutex_);
    Session session;
    session.handle = handle;
    session.room = room;
    session.writer = std::move(writer);
    sessions_.emplace(id, std::move(session));
  }
  writer_ptr->start();

  std::cout << "[ConnectionHub] connection " << id << " joined " << product_id
            << (handle->isAuthenticated() ? " as " + bidder_id
                                          : std::string(" (watch only)"))
            << ".\n";

  result.connected = true;
  result.connection_id = id;
  result.handle = std::move(handle);
  result.snapshot = std::move(attached.snapshot);
  return result;
}

std::shared_ptr<Room> ConnectionHub::attachToRoom(
    const domain::ProductId& product_id,
    const std::shared_ptr<ConnectionHandle>& handle,
    Room::AttachResult& result) {
  for (int attempt = 0; attempt < 2; ++attempt) {
    std::shared_ptr<Room> room = registry_.getOrCreateRoom(product_id);
    if (!room) {
      result.attached = false;
      result.reason = domain::RejectReason::NotFound;
      return nullptr;
    }

    result = room->attach(handle);
    if (result.attached) {
      return room;
    }
    if (!room->isRetired()) {
      // Timed out on a live room; a second try would wait again.
      break;
    }
  }

  std::cerr << "[ConnectionHub] attach to " << product_id
            << " failed: " << domain::toString(result.reason) << "\n";
  // A room created only for this attempt may already be reclaimable.
  registry_.releaseIfEmpty(product_id);
  return nullptr;
}

// -----------------------------------------------------------------------------
// onMessage() / submitBid()
// -----------------------------------------------------------------------------
domain::BidResult ConnectionHub::onMessage(domain::ConnectionId connection,
                                           const std::string& raw) {
  std::optional<domain::Amount> amount = MessageCodec::decodeBidAmount(raw);
  if (!amount) {
    return domain::BidResult::reject(domain::RejectReason::InvalidPayload);
  }
  return submitBid(connection, *amount);
}

domain::BidResult ConnectionHub::submitBid(domain::ConnectionId connection,
                                           domain::Amount amount) {
  if (amount <= 0) {
    return domain::BidResult::reject(domain::RejectReason::InvalidPayload);
  }

  std::shared_ptr<Room> room;
  std::shared_ptr<ConnectionHandle> handle;
  {
    std::lock_guard lock(mutex_);
    auto it = sessions_.find(connection);
    if (it == sessions_.end()) {
      return domain::BidResult::reject(domain::RejectReason::Unauthorized);
    }
    room = it->second.room;
    handle = it->second.handle;
  }

  return room->submitBid(connection, handle->bidderId(), amount);
}

// -----------------------------------------------------------------------------
// onDisconnect()
// -----------------------------------------------------------------------------
void ConnectionHub::onDisconnect(domain::ConnectionId connection) {
  Session session;
  {
    std::lock_guard lock(mutex_);
    auto it = sessions_.find(connection);
    if (it == sessions_.end()) {
      return;
    }
    session = std::move(it->second);
    sessions_.erase(it);
  }

  // Closed first: if the detach task is refused, the room still prunes the
  // handle before deciding on retirement.
  session.handle->close();
  session.room->detach(connection);
  session.writer->stop();
  reapFinishedWriters();

  std::cout << "[ConnectionHub] connection " << connection << " left "
            << session.room->productId() << ".\n";

  registry_.releaseIfEmpty(session.room->productId());
}

void ConnectionHub::disconnectAll() {
  std::vector<domain::ConnectionId> ids;
  {
    std::lock_guard lock(mutex_);
    ids.reserve(sessions_.size());
    for (const auto& [id, session] : sessions_) {
      ids.push_back(id);
    }
  }
  for (domain::ConnectionId id : ids) {
    onDisconnect(id);
  }
}

// -----------------------------------------------------------------------------
// onWriterExit(): runs on the exiting writer's thread
// -----------------------------------------------------------------------------
void ConnectionHub::onWriterExit(domain::ConnectionId connection) {
  std::shared_ptr<Room> room;
  {
    std::lock_guard lock(mutex_);
    auto it = sessions_.find(connection);
    if (it == sessions_.end()) {
      return;
    }
    room = std::move(it->second.room);
    finished_writers_.push_back(std::move(it->second.writer));
    sessions_.erase(it);
  }

  evicted_.fetch_add(1);
  std::cerr << "[ConnectionHub] connection " << connection
            << " dropped by room " << room->productId() << ".\n";

  // The room has already removed the handle; detach is a no-op there but
  // keeps the release path uniform.
  room->detach(connection);
  transport_.close(connection);
  registry_.releaseIfEmpty(room->productId());
}

void ConnectionHub::reapFinishedWriters() {
  std::vector<std::unique_ptr<OutboundWriter>> done;
  {
    std::lock_guard lock(mutex_);
    auto it = finished_writers_.begin();
    while (it != finished_writers_.end()) {
      if ((*it)->finished()) {
        done.push_back(std::move(*it));
        it = finished_writers_.erase(it);
      } else {
        ++it;
      }
    }
  }
  // Destroying an OutboundWriter joins its (already finished) thread.
  done.clear();
}

std::size_t ConnectionHub::connectionCount() const {
  std::lock_guard lock(mutex_);
  return sessions_.size();
}

std::shared_ptr<ConnectionHandle> ConnectionHub::findHandle(
    domain::ConnectionId connection) const {
  std::lock_guard lock(mutex_);
  auto it = sessions_.find(connection);
  return it == sessions_.end() ? nullptr : it->second.handle;
}

}  // namespace auction
