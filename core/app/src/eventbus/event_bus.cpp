#include "auction/eventbus/event_bus.hpp"

#include <algorithm>
#include <exception>
#include <iostream>

namespace auction {

EventBus::SubscriptionId EventBus::subscribe(GenericCallback callback) {
  auto shared = std::make_shared<const GenericCallback>(std::move(callback));

  std::lock_guard lock(mutex_);
  const SubscriptionId id = next_id_++;
  observers_.push_back(Observer{id, std::move(shared)});
  return id;
}

bool EventBus::unsubscribe(SubscriptionId id) {
  std::lock_guard lock(mutex_);
  auto it = std::find_if(observers_.begin(), observers_.end(),
                         [id](const Observer& o) { return o.id == id; });
  if (it == observers_.end()) {
    return false;
  }
  observers_.erase(it);
  return true;
}

// -----------------------------------------------------------------------------
// publish(): snapshot under the lock, invoke without it
// -----------------------------------------------------------------------------
void EventBus::publish(const RoomEvent& event) {
  std::vector<Observer> current;
  {
    std::lock_guard lock(mutex_);
    current = observers_;
  }

  for (const Observer& observer : current) {
    try {
      (*observer.callback)(event);
    } catch (const std::exception& e) {
      failures_.fetch_add(1);
      std::cerr << "[EventBus] observer " << observer.id << " threw on "
                << productOf(event) << " seq=" << sequenceOf(event) << ": "
                << e.what() << "\n";
    }
  }
}

std::size_t EventBus::subscriberCount() const {
  std::lock_guard lock(mutex_);
  return observers_.size();
}

}  // namespace auction
