#include "auction/room/room.hpp"

#include "auction/time/time_utils.hpp"

#include <iostream>

namespace auction {

Room::Room(domain::AuctionInfo info, TaskLoopThread& loop,
           const ITimeProvider& clock, EventBus& observers,
           IBidRecorder* recorder, const domain::RoomLimits& limits,
           ReleaseListener on_release)
    : info_(std::move(info)),
      loop_(loop),
      clock_(clock),
      observers_(observers),
      recorder_(recorder),
      limits_(limits),
      on_release_(std::move(on_release)),
      sequencer_(info_.base_price, limits.recent_bid_tail) {
  // Initial status straight from the clock. No events: nobody is attached.
  const std::int64_t now_ms = clock_.now_ms();
  if (now_ms >= info_.end_ms) {
    setStatus(domain::AuctionStatus::Closed);
  } else if (now_ms >= info_.start_ms) {
    setStatus(domain::AuctionStatus::Open);
  }
}

// -----------------------------------------------------------------------------
// attach()
// -----------------------------------------------------------------------------
Room::AttachResult Room::attach(const std::shared_ptr<ConnectionHandle>& handle) {
  auto result = call([this, handle] {
    AttachResult r;
    if (retired_ || !handle || !handle->isOpen()) {
      r.reason = domain::RejectReason::RoomUnavailable;
      return r;
    }

    applyClock();
    fanout_.add(handle);
    syncSubscriberCount();

    r.attached = true;
    r.snapshot = takeSnapshot();
    return r;
  });

  if (!result) {
    return AttachResult{};
  }
  return std::move(*result);
}

// -----------------------------------------------------------------------------
// detach()
// -----------------------------------------------------------------------------
void Room::detach(domain::ConnectionId id) {
  auto self = shared_from_this();
  const bool posted = loop_.post([self, id] {
    if (!self->fanout_.remove(id)) {
      return;
    }
    self->syncSubscriberCount();
    self->notifyRelease();
  });
  if (!posted) {
    std::cerr << "[Room " << info_.product_id << "] detach of connection "
              << id << " not posted; pruned once its handle is closed.\n";
  }
}

// -----------------------------------------------------------------------------
// submitBid()
// -----------------------------------------------------------------------------
domain::BidResult Room::submitBid(domain::ConnectionId connection,
                                  const domain::BidderId& bidder,
                                  domain::Amount amount) {
  auto result = call([this, connection, bidder, amount] {
    if (retired_) {
      return domain::BidResult::reject(domain::RejectReason::RoomUnavailable,
                                        sequencer_.highestAmount());
    }

    applyClock();

    domain::BidResult r = sequencer_.sequence(
        bidder, amount, status_, fanout_.contains(connection), now());
    if (!r.accepted) {
      return r;
    }

    BidAcceptedEvent event;
    event.product_id = info_.product_id;
    event.bid = r.bid;
    event.timestamp = r.bid.accepted_at;
    event.sequence_id = ++last_event_sequence_;
    broadcast(event);

    // Write-behind: the acceptance above is final whatever happens here.
    if (recorder_ != nullptr) {
      recorder_->recordBid(info_.product_id, r.bid);
    }
    return r;
  });

  if (!result) {
    return domain::BidResult::reject(domain::RejectReason::RoomUnavailable);
  }
  return std::move(*result);
}

// -----------------------------------------------------------------------------
// snapshot()
// -----------------------------------------------------------------------------
std::optional<domain::RoomSnapshot> Room::snapshot() {
  return call([this] {
    applyClock();
    return takeSnapshot();
  });
}

// -----------------------------------------------------------------------------
// open() / close()
// -----------------------------------------------------------------------------
void Room::open() {
  auto self = shared_from_this();
  const bool posted = loop_.post([self] {
    if (self->retired_) {
      return;
    }
    if (self->status_ == domain::AuctionStatus::Pending) {
      self->transitionToOpen();
    }
  });
  if (!posted) {
    std::cerr << "[Room " << info_.product_id
              << "] open not posted; will open on next operation.\n";
  }
}

bool Room::close(CloseReason reason) {
  auto self = shared_from_this();
  const bool posted = loop_.post([self, reason] {
    if (self->retired_) {
      return;
    }
    self->transitionToClosed(reason);
  });
  if (!posted) {
    std::cerr << "[Room " << info_.product_id << "] close ("
              << toString(reason) << ") not posted.\n";
  }
  return posted;
}

// -----------------------------------------------------------------------------
// tryRetire()
// -----------------------------------------------------------------------------
bool Room::tryRetire(RetiredCallback on_retired) {
  auto self = shared_from_this();
  const bool posted = loop_.post([self, on_retired = std::move(on_retired)] {
    if (self->retired_) {
      return;
    }
    self->applyClock();

    // Members whose detach never reached the room still count until here.
    if (!self->fanout_.prune().empty()) {
      self->syncSubscriberCount();
    }
    if (self->status_ != domain::AuctionStatus::Closed ||
        !self->fanout_.empty()) {
      return;
    }

    self->retired_ = true;
    self->retired_mirror_.store(true);
    if (on_retired) {
      on_retired(self);
    }
  });
  if (!posted) {
    std::cerr << "[Room " << info_.product_id
              << "] retirement check not posted.\n";
  }
  return posted;
}

// -----------------------------------------------------------------------------
// applyClock(): lazy transitions so a missed timer cannot keep a room open
// -----------------------------------------------------------------------------
void Room::applyClock() {
  const std::int64_t now_ms = clock_.now_ms();

  if (status_ == domain::AuctionStatus::Pending && now_ms >= info_.start_ms &&
      now_ms < info_.end_ms) {
    transitionToOpen();
  }
  if (status_ != domain::AuctionStatus::Closed && now_ms >= info_.end_ms) {
    transitionToClosed(CloseReason::EndTimeReached);
  }
}

void Room::transitionToOpen() {
  setStatus(domain::AuctionStatus::Open);

  AuctionOpenedEvent event;
  event.product_id = info_.product_id;
  event.base_price = info_.base_price;
  event.end_ms = info_.end_ms;
  event.timestamp = now();
  event.sequence_id = ++last_event_sequence_;

  std::cout << "[Room " << info_.product_id << "] opened (base_price="
            << info_.base_price << ", subscribers=" << fanout_.size()
            << ").\n";

  broadcast(event);
}

void Room::transitionToClosed(CloseReason reason) {
  if (status_ == domain::AuctionStatus::Closed) {
    return;
  }
  setStatus(domain::AuctionStatus::Closed);

  AuctionClosedEvent event;
  event.product_id = info_.product_id;
  event.winning_bid = sequencer_.highest();
  event.reason = reason;
  event.timestamp = now();
  event.sequence_id = ++last_event_sequence_;

  std::cout << "[Room " << info_.product_id << "] closed ("
            << toString(reason) << ", bids=" << sequencer_.lastSequence();
  if (event.winning_bid) {
    std::cout << ", winner=" << event.winning_bid->bidder_id
              << " amount=" << event.winning_bid->amount;
  }
  std::cout << ").\n";

  broadcast(event);
  notifyRelease();
}

// -----------------------------------------------------------------------------
// broadcast(): subscribers first, observers second
// -----------------------------------------------------------------------------
void Room::broadcast(const RoomEvent& event) {
  auto dropped = fanout_.publish(event);
  observers_.publish(event);

  if (!dropped.empty()) {
    onSubscribersDropped(dropped);
  }
}

void Room::onSubscribersDropped(const std::vector<domain::ConnectionId>& ids) {
  for (domain::ConnectionId id : ids) {
    std::cout << "[Room " << info_.product_id << "] dropped subscriber " << id
              << " (slow or disconnected).\n";
  }
  syncSubscriberCount();
  notifyRelease();
}

void Room::setStatus(domain::AuctionStatus status) {
  status_ = status;
  status_mirror_.store(status);
}

void Room::syncSubscriberCount() { subscriber_count_.store(fanout_.size()); }

void Room::notifyRelease() {
  if (on_release_) {
    on_release_(info_.product_id);
  }
}

domain::RoomSnapshot Room::takeSnapshot() const {
  domain::RoomSnapshot s;
  s.product_id = info_.product_id;
  s.status = status_;
  s.base_price = info_.base_price;
  s.start_ms = info_.start_ms;
  s.end_ms = info_.end_ms;
  s.highest = sequencer_.highest();
  s.recent_bids = sequencer_.recentBids();
  s.last_event_sequence = last_event_sequence_;
  s.subscriber_count = fanout_.size();
  return s;
}

Timestamp Room::now() const { return ms_to_timestamp(clock_.now_ms()); }

}  // namespace auction
