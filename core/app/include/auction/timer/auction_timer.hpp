#pragma once

#include "auction/time/i_time_provider.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace auction {

// -----------------------------------------------------------------------------
// AuctionTimer — deadline scheduler shared by all rooms
// -----------------------------------------------------------------------------
//
// @brief  One worker thread that fires callbacks when the injected clock
//         reaches their deadline.
//
// @details
// Each room arms its own start/end deadlines here when it is created and
// cancels them when it is reclaimed. The timer only decides *when*; the
// callback a room registers just posts the transition onto the room's
// serialization point, where it is applied idempotently. A late, duplicate
// or racing firing therefore has no visible effect beyond the first.
//
// Deadlines are epoch milliseconds of the ITimeProvider. The worker re-reads
// now_ms() every kPollInterval instead of sleeping until the next deadline,
// so a SimulationTimeProvider that jumps forward is noticed just as quickly
// as the wall clock passing.
//
// Thread model:
//   schedule()/cancel() are safe from any thread, including from inside a
//   callback. Callbacks run on the timer thread, outside the internal lock,
//   in deadline order (ties in scheduling order).
//
// Ownership:
//   Owned by AuctionServer; holds a const reference to the clock.
// -----------------------------------------------------------------------------
class AuctionTimer {
 public:
  using TimerId = std::uint64_t;
  using Callback = std::function<void()>;

  explicit AuctionTimer(const ITimeProvider& clock);

  ~AuctionTimer();

  AuctionTimer(const AuctionTimer&) = delete;
  AuctionTimer& operator=(const AuctionTimer&) = delete;
  AuctionTimer(AuctionTimer&&) = delete;
  AuctionTimer& operator=(AuctionTimer&&) = delete;

  void start();

  // Joins the worker. Timers still pending are discarded without firing.
  void stop();

  // -------------------------------------------------------------------------
  // schedule(deadline_ms, callback)
  // -------------------------------------------------------------------------
  // @brief  Arms a one-shot timer. A deadline already in the past fires on
  //         the next poll.
  //
  // @return TimerId usable with cancel(). Ids are never reused.
  // -------------------------------------------------------------------------
  TimerId schedule(std::int64_t deadline_ms, Callback callback);

  // -------------------------------------------------------------------------
  // cancel(id)
  // -------------------------------------------------------------------------
  // @return true if the timer was pending and is now removed; false if it
  //         already fired, was cancelled before, or never existed.
  // -------------------------------------------------------------------------
  bool cancel(TimerId id);

  // Number of armed timers.
  std::size_t pending() const;

 private:
  void run();

  // Pops every entry whose deadline <= now and runs it outside the lock.
  void fireDue();

  struct Entry {
    TimerId id{0};
    Callback callback;
  };

  using Schedule = std::multimap<std::int64_t, Entry>;

  const ITimeProvider& clock_;

  mutable std::mutex mutex_;  // Protects schedule_, index_, next_id_
  std::condition_variable wake_cv_;
  Schedule schedule_;
  std::unordered_map<TimerId, Schedule::iterator> index_;
  TimerId next_id_{1};

  std::atomic<bool> running_{false};
  std::thread thread_;
};

}  // namespace auction
