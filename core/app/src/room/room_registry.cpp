#include "auction/room/room_registry.hpp"

#include <iostream>
#include <utility>

namespace auction {

RoomRegistry::RoomRegistry(const IAuctionCatalog& catalog,
                           RoomScheduler& scheduler, AuctionTimer& timer,
                           const ITimeProvider& clock, EventBus& observers,
                           IBidRecorder* recorder, domain::RoomLimits limits)
    : catalog_(catalog),
      scheduler_(scheduler),
      timer_(timer),
      clock_(clock),
      observers_(observers),
      recorder_(recorder),
      limits_(limits) {}

RoomRegistry::~RoomRegistry() { clear(); }

// -----------------------------------------------------------------------------
// getOrCreateRoom()
// -----------------------------------------------------------------------------
std::shared_ptr<Room> RoomRegistry::getOrCreateRoom(
    const domain::ProductId& product_id) {
  std::lock_guard lock(mutex_);

  auto it = rooms_.find(product_id);
  if (it != rooms_.end()) {
    if (!it->second.room->isRetired()) {
      return it->second.room;
    }
    // Retired but its onRetired has not run yet: replace it now rather than
    // hand out a room that will refuse every operation.
    cancelTimers(it->second);
    rooms_.erase(it);
  }

  std::optional<domain::AuctionInfo> info = catalog_.fetchAuction(product_id);
  if (!info) {
    std::cerr << "[RoomRegistry] unknown product '" << product_id << "'.\n";
    return nullptr;
  }

  Entry entry = createEntry(*info);
  std::shared_ptr<Room> room = entry.room;
  rooms_.emplace(product_id, std::move(entry));
  rooms_created_.fetch_add(1);

  std::cout << "[RoomRegistry] created room for '" << product_id
            << "' status=" << domain::toString(room->status())
            << " (live rooms: " << rooms_.size() << ").\n";
  return room;
}

// -----------------------------------------------------------------------------
// createEntry(): construct the room and arm its timers. Registry lock held.
// -----------------------------------------------------------------------------
RoomRegistry::Entry RoomRegistry::createEntry(const domain::AuctionInfo& info) {
  Entry entry;
  entry.room = std::make_shared<Room>(
      info, scheduler_.loopFor(info.product_id), clock_, observers_, recorder_,
      limits_,
      [this](const domain::ProductId& id) { releaseIfEmpty(id); });

  std::weak_ptr<Room> weak = entry.room;

  if (entry.room->status() == domain::AuctionStatus::Pending) {
    entry.open_timer = timer_.schedule(info.start_ms, [weak] {
      if (auto room = weak.lock()) {
        room->open();
      }
    });
  }

  if (entry.room->status() != domain::AuctionStatus::Closed) {
    entry.close_timer = timer_.schedule(info.end_ms, [weak] {
      if (auto room = weak.lock()) {
        room->close(CloseReason::EndTimeReached);
      }
    });
  }

  return entry;
}

void RoomRegistry::cancelTimers(const Entry& entry) {
  if (entry.open_timer != 0) {
    timer_.cancel(entry.open_timer);
  }
  if (entry.close_timer != 0) {
    timer_.cancel(entry.close_timer);
  }
}

// -----------------------------------------------------------------------------
// releaseIfEmpty()
// -----------------------------------------------------------------------------
void RoomRegistry::releaseIfEmpty(const domain::ProductId& product_id) {
  std::shared_ptr<Room> room = findRoom(product_id);
  if (!room) {
    return;
  }

  // Pre-check on the status mirror only. The subscriber mirror may still
  // count a handle whose detach was refused by a full mailbox; the room's own
  // task prunes those and makes the authoritative check.
  if (room->status() != domain::AuctionStatus::Closed) {
    return;
  }

  const bool posted = room->tryRetire(
      [this](const std::shared_ptr<Room>& retired) { onRetired(retired); });
  if (!posted) {
    std::cerr << "[RoomRegistry] retirement of '" << product_id
              << "' deferred to the next release.\n";
  }
}

void RoomRegistry::onRetired(const std::shared_ptr<Room>& room) {
  std::lock_guard lock(mutex_);

  auto it = rooms_.find(room->productId());
  if (it == rooms_.end() || it->second.room != room) {
    return;
  }

  cancelTimers(it->second);
  rooms_.erase(it);

  std::cout << "[RoomRegistry] reclaimed room for '" << room->productId()
            << "' (live rooms: " << rooms_.size() << ").\n";
}

std::shared_ptr<Room> RoomRegistry::findRoom(
    const domain::ProductId& product_id) const {
  std::lock_guard lock(mutex_);
  auto it = rooms_.find(product_id);
  if (it == rooms_.end() || it->second.room->isRetired()) {
    return nullptr;
  }
  return it->second.room;
}

std::size_t RoomRegistry::subscriberCount(
    const domain::ProductId& product_id) const {
  std::shared_ptr<Room> room = findRoom(product_id);
  return room ? room->subscriberCount() : 0;
}

std::size_t RoomRegistry::roomCount() const {
  std::lock_guard lock(mutex_);
  return rooms_.size();
}

std::vector<std::shared_ptr<Room>> RoomRegistry::rooms() const {
  std::lock_guard lock(mutex_);
  std::vector<std::shared_ptr<Room>> out;
  out.reserve(rooms_.size());
  for (const auto& [id, entry] : rooms_) {
    out.push_back(entry.room);
  }
  return out;
}

void RoomRegistry::clear() {
  std::lock_guard lock(mutex_);
  for (const auto& [id, entry] : rooms_) {
    cancelTimers(entry);
  }
  rooms_.clear();
}

}  // namespace auction
