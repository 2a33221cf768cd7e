#pragma once

#include "auction/events/event.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace auction {

// -----------------------------------------------------------------------------
// EventBus — server-wide observer channel for room events
// -----------------------------------------------------------------------------
//
// @brief  Rooms publish every event here after their own subscribers have it.
//         Observers (main's log lines, admin telemetry) attach without the
//         room knowing about them.
//
// @details
// This is not the subscriber fan-out: per-connection delivery, ordering and
// slow-consumer eviction belong to BroadcastFanout. Observers run inline on
// the publishing room's shard, so they must be short and must not wait on
// other rooms.
//
// Isolation:
//   A room publishes from inside its own task. An observer that throws is
//   logged and counted in observerFailures(); the remaining observers still
//   run and the room's task carries on as if nothing happened.
//
// Thread model:
//   subscribe, unsubscribe and publish are safe from any thread. Events of
//   one room are published from that room's shard only, hence in sequence_id
//   order for every observer.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const RoomEvent&)>;

  using SubscriptionId = std::uint64_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // Callback sees every event.
  SubscriptionId subscribe(GenericCallback callback);

  // -------------------------------------------------------------------------
  // subscribe<EventType>(callback)
  // -------------------------------------------------------------------------
  // Callback sees only events holding an EventType, e.g.
  //   bus.subscribe<AuctionClosedEvent>([](const AuctionClosedEvent& e) {...});
  // -------------------------------------------------------------------------
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // -------------------------------------------------------------------------
  // unsubscribe(id)
  // -------------------------------------------------------------------------
  // @return false for an unknown (or already removed) id.
  //
  // A publish() already running on another thread may still deliver its one
  // event to the removed callback; later publishes never do.
  // -------------------------------------------------------------------------
  bool unsubscribe(SubscriptionId id);

  // Runs every current observer with `event`. Re-entrant: an observer may
  // publish, subscribe or unsubscribe.
  void publish(const RoomEvent& event);

  std::size_t subscriberCount() const;

  std::uint64_t observerFailures() const { return failures_.load(); }

 private:
  struct Observer {
    SubscriptionId id;
    std::shared_ptr<const GenericCallback> callback;
  };

  mutable std::mutex mutex_;  // Protects observers_ and next_id_
  SubscriptionId next_id_{1};
  std::vector<Observer> observers_;

  std::atomic<std::uint64_t> failures_{0};
};

template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback) {
  return subscribe(
      [cb = std::move(callback)](const RoomEvent& event) {
        if (const auto* typed = std::get_if<EventType>(&event)) {
          cb(*typed);
        }
      });
}

}  // namespace auction
