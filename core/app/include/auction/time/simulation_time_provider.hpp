#pragma once

#include "auction/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace auction {

// -----------------------------------------------------------------------------
// SimulationTimeProvider — externally-driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose "current time" is set explicitly rather than
//         read from the system clock.
//
// @details
// Tests create auctions with fixed windows (e.g. start 1000, end 5000), set
// the clock inside the window, place bids, then advance_time(5000) and expect
// the AuctionTimer to close the room. Nothing waits on the wall clock beyond
// the timer's short polling interval.
//
// Storage is a std::atomic<int64_t>: one writer (the test or replay driver),
// many readers (shards and the timer thread), no mutex on the read path.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  // Starts at 0 ms unless told otherwise.
  explicit SimulationTimeProvider(std::int64_t initial_ms = 0)
      : current_time_ms_(initial_ms) {}

  std::int64_t now_ms() const override;

  // -------------------------------------------------------------------------
  // advance_time(new_time_ms)
  // -------------------------------------------------------------------------
  // @brief  Sets the simulated clock. Monotonicity is the caller's job; not
  //         enforcing it lets tests set arbitrary instants.
  //
  // Thread-safety: Safe from any thread; intended single writer.
  // -------------------------------------------------------------------------
  void advance_time(std::int64_t new_time_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace auction
