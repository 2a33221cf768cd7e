#include "auction/room/connection_handle.hpp"

#include <utility>

namespace auction {

ConnectionHandle::ConnectionHandle(domain::ConnectionId id,
                                   domain::ProductId product_id,
                                   domain::BidderId bidder_id,
                                   std::size_t outbound_capacity)
    : id_(id),
      product_id_(std::move(product_id)),
      bidder_id_(std::move(bidder_id)),
      outbound_(outbound_capacity) {}

bool ConnectionHandle::deliver(const RoomEvent& event) {
  if (outbound_.try_push(event)) {
    delivered_.fetch_add(1);
    return true;
  }
  dropped_.fetch_add(1);
  return false;
}

std::optional<RoomEvent> ConnectionHandle::nextEvent(
    std::chrono::milliseconds timeout) {
  return outbound_.pop_for(timeout);
}

std::optional<RoomEvent> ConnectionHandle::tryNextEvent() {
  return outbound_.try_pop();
}

bool ConnectionHandle::close() { return outbound_.close(); }

}  // namespace auction
