#pragma once

#include "auction/concurrent/task_loop_thread.hpp"
#include "auction/domain/auction_info.hpp"
#include "auction/domain/auction_status.hpp"
#include "auction/domain/bid_result.hpp"
#include "auction/domain/room_limits.hpp"
#include "auction/domain/room_snapshot.hpp"
#include "auction/eventbus/event_bus.hpp"
#include "auction/events/event.hpp"
#include "auction/persistence/i_bid_recorder.hpp"
#include "auction/room/bid_sequencer.hpp"
#include "auction/room/broadcast_fanout.hpp"
#include "auction/room/connection_handle.hpp"
#include "auction/time/i_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

namespace auction {

// -----------------------------------------------------------------------------
// Room — live state of one product's auction
// -----------------------------------------------------------------------------
//
// @brief  Per-product state machine holding the current highest bid, the set
//         of attached subscribers and the lifecycle status.
//
// @details
// Serialization point:
//   Every operation that reads or mutates room state runs as a task on the
//   TaskLoopThread the room is pinned to (a RoomScheduler shard). attach,
//   detach, submitBid, open, close, snapshot and retirement are therefore
//   totally ordered with respect to each other. The room's fields have no
//   lock; only the shard thread touches them.
//
//   attach(), submitBid() and snapshot() are synchronous for the caller: the
//   task is posted and the caller waits for its result, at most
//   RoomLimits::submit_timeout_ms. A task that has not started by then is
//   abandoned (it will not run when its turn comes) and the caller gets
//   RoomUnavailable; a task that has started is always awaited, since room
//   tasks never block.
//
//   detach(), open(), close() and tryRetire() are fire-and-forget posts.
//
// State machine (see AuctionStatus):
//   Pending → Open at start_ms, Open → Closed at end_ms or on an
//   administrative close, Pending → Closed if end_ms passes first. Closed is
//   terminal. Every transition happens at most once and publishes exactly one
//   event. Besides the timer-driven open()/close(), each task first compares
//   the clock with the window, so a late or missed timer cannot leave the
//   room accepting bids after end_ms.
//
// Events:
//   Each accepted bid and each transition gets the next per-room
//   sequence_id, is delivered to every subscriber through BroadcastFanout,
//   then published on the server-wide observer EventBus. Accepted bids are
//   also handed to the IBidRecorder (fire-and-forget).
//
// Reclamation:
//   Whenever a subscriber leaves and when the room closes, the room calls its
//   ReleaseListener (the registry's releaseIfEmpty). Retirement itself is a
//   room task: it first prunes handles their owners have closed, then
//   succeeds only if the room is Closed with no subscribers left, after
//   which every operation answers RoomUnavailable.
//
// Ownership:
//   Rooms must be owned by std::shared_ptr (tasks keep the room alive via
//   shared_from_this()). The registry owns one reference; connection
//   sessions hold others. The loop, clock, observer bus and recorder are
//   borrowed and must outlive the room.
// -----------------------------------------------------------------------------
class Room : public std::enable_shared_from_this<Room> {
 public:
  // Invoked on the room's shard with the room's product id.
  using ReleaseListener = std::function<void(const domain::ProductId&)>;

  // Invoked on the room's shard after a successful retirement.
  using RetiredCallback = std::function<void(const std::shared_ptr<Room>&)>;

  struct AttachResult {
    bool attached{false};
    domain::RejectReason reason{domain::RejectReason::RoomUnavailable};
    domain::RoomSnapshot snapshot;  // Valid only when attached
  };

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  info        Auction metadata, copied; immutable afterwards.
  // @param  loop        Serialization point (scheduler shard).
  // @param  clock       Time source for lifecycle decisions and bid stamps.
  // @param  observers   Server-wide bus every room event is published on.
  // @param  recorder    Persistence collaborator; may be null.
  // @param  limits      Queue/tail/timeout bounds.
  // @param  on_release  Called when the room may have become reclaimable.
  //
  // The initial status follows the clock (Pending, Open or Closed) without
  // publishing any event: nobody is attached yet.
  // -------------------------------------------------------------------------
  Room(domain::AuctionInfo info, TaskLoopThread& loop,
       const ITimeProvider& clock, EventBus& observers,
       IBidRecorder* recorder, const domain::RoomLimits& limits,
       ReleaseListener on_release = {});

  Room(const Room&) = delete;
  Room& operator=(const Room&) = delete;

  // -------------------------------------------------------------------------
  // attach(handle)
  // -------------------------------------------------------------------------
  // @brief  Adds a subscriber and returns the snapshot it starts from.
  //
  // @details
  // The handle joins the fan-out and the snapshot is taken in the same task,
  // so the first event the subscriber receives has sequence_id
  // snapshot.last_event_sequence + 1. Attaching to a Closed room is allowed
  // (the final state is readable); attaching to a retired room fails with
  // RoomUnavailable and the caller should ask the registry again.
  // -------------------------------------------------------------------------
  AttachResult attach(const std::shared_ptr<ConnectionHandle>& handle);

  // -------------------------------------------------------------------------
  // detach(id)
  // -------------------------------------------------------------------------
  // @brief  Removes a subscriber. Idempotent; unknown ids are ignored.
  //
  // @details
  // Fire-and-forget. If the room cannot take the task (mailbox full or
  // shutting down), the failure is logged and the membership stays until
  // the handle is closed by its owner: a closed handle is pruned on the next
  // publish and before any retirement check, so it never keeps a Closed
  // room alive.
  // -------------------------------------------------------------------------
  void detach(domain::ConnectionId id);

  // -------------------------------------------------------------------------
  // submitBid(connection, bidder, amount)
  // -------------------------------------------------------------------------
  // @brief  Sequences one bid. See BidSequencer for the validation rules.
  //
  // @return Accepted(bid) or Rejected(reason). RoomUnavailable when the room
  //         is retired or the task could not be sequenced in time.
  // -------------------------------------------------------------------------
  domain::BidResult submitBid(domain::ConnectionId connection,
                              const domain::BidderId& bidder,
                              domain::Amount amount);

  // Consistent snapshot, or nullopt if the room did not answer in time.
  std::optional<domain::RoomSnapshot> snapshot();

  // Pending → Open. No-op in any other state.
  void open();

  // -------------------------------------------------------------------------
  // close(reason)
  // -------------------------------------------------------------------------
  // @brief  → Closed. Idempotent: only the first close publishes
  //         AuctionClosedEvent, whichever trigger gets there first.
  // @return false if the task could not be posted.
  // -------------------------------------------------------------------------
  bool close(CloseReason reason);

  // Retires the room if it is Closed and has no open subscribers, then calls
  // on_retired. No-op otherwise. Returns false if the task could not be
  // posted; the caller may try again later.
  bool tryRetire(RetiredCallback on_retired);

  // --- Lock-free mirrors, readable from any thread ---------------------------
  domain::AuctionStatus status() const { return status_mirror_.load(); }
  std::size_t subscriberCount() const { return subscriber_count_.load(); }
  bool isRetired() const { return retired_mirror_.load(); }

  const domain::AuctionInfo& info() const { return info_; }
  const domain::ProductId& productId() const { return info_.product_id; }

 private:
  // --- Run on the serialization point only ----------------------------------
  void applyClock();
  void transitionToOpen();
  void transitionToClosed(CloseReason reason);
  void broadcast(const RoomEvent& event);
  void onSubscribersDropped(const std::vector<domain::ConnectionId>& ids);
  void setStatus(domain::AuctionStatus status);
  void syncSubscriberCount();
  void notifyRelease();
  domain::RoomSnapshot takeSnapshot() const;
  Timestamp now() const;

  // -------------------------------------------------------------------------
  // call(fn)
  // -------------------------------------------------------------------------
  // Runs fn on the serialization point and returns its result, or nullopt
  // if it could not be posted or did not start within the submit timeout.
  // -------------------------------------------------------------------------
  template <typename Fn>
  auto call(Fn fn) -> std::optional<std::invoke_result_t<Fn&>>;

  const domain::AuctionInfo info_;
  TaskLoopThread& loop_;
  const ITimeProvider& clock_;
  EventBus& observers_;
  IBidRecorder* recorder_;
  const domain::RoomLimits limits_;
  ReleaseListener on_release_;

  // --- Serialization-point state ----------------------------------------------
  domain::AuctionStatus status_{domain::AuctionStatus::Pending};
  BidSequencer sequencer_;
  BroadcastFanout fanout_;
  std::uint64_t last_event_sequence_{0};
  bool retired_{false};

  // --- Mirrors --------------------------------------------------------------
  std::atomic<domain::AuctionStatus> status_mirror_{
      domain::AuctionStatus::Pending};
  std::atomic<std::size_t> subscriber_count_{0};
  std::atomic<bool> retired_mirror_{false};
};

// -----------------------------------------------------------------------------
// call(): post-and-wait with abandonment
// -----------------------------------------------------------------------------
// The task and the caller race on `state`: the task moves it Queued→Running
// before doing anything, the caller moves it Queued→Abandoned on timeout.
// Exactly one side wins, so an abandoned operation never takes effect behind
// the caller's back.
// -----------------------------------------------------------------------------
template <typename Fn>
auto Room::call(Fn fn) -> std::optional<std::invoke_result_t<Fn&>> {
  using Result = std::invoke_result_t<Fn&>;

  if (loop_.isLoopThread()) {
    return fn();
  }

  enum : int { kQueued = 0, kRunning = 1, kAbandoned = 2 };

  struct Pending {
    std::atomic<int> state{kQueued};
    std::promise<Result> promise;
  };

  auto pending = std::make_shared<Pending>();
  std::future<Result> future = pending->promise.get_future();

  auto self = shared_from_this();
  const bool posted = loop_.post([self, pending, fn = std::move(fn)]() mutable {
    int expected = kQueued;
    if (!pending->state.compare_exchange_strong(expected, kRunning)) {
      return;
    }
    try {
      pending->promise.set_value(fn());
    } catch (...) {
      pending->promise.set_exception(std::current_exception());
    }
  });

  if (!posted) {
    return std::nullopt;
  }

  const auto timeout = std::chrono::milliseconds(limits_.submit_timeout_ms);
  if (future.wait_for(timeout) != std::future_status::ready) {
    int expected = kQueued;
    if (pending->state.compare_exchange_strong(expected, kAbandoned)) {
      return std::nullopt;
    }
  }
  return future.get();
}

}  // namespace auction
