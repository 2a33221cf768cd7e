#pragma once

#include <cstdint>

namespace auction {

// -----------------------------------------------------------------------------
// ITimeProvider — abstract time source interface
// -----------------------------------------------------------------------------
//
// @brief  Pure virtual interface that abstracts "current time" away from
//         std::chrono::system_clock.
//
// @details
// Every time-dependent decision in the engine goes through this interface:
// whether a room is Pending, Open or Closed, when the AuctionTimer fires, and
// the accepted_at stamp of each bid.
//
//   - LiveTimeProvider       → delegates to std::chrono::system_clock.
//   - SimulationTimeProvider → returns a value set explicitly (tests, replay).
//
// Injecting the provider lets a test move an auction past its end time in one
// call instead of sleeping until the wall clock gets there.
//
// Why int64_t milliseconds:
//   Auction windows arrive from the catalog and over the wire as epoch
//   milliseconds; comparing integers avoids chrono conversions at every
//   boundary.
//
// Thread-safety contract:
//   Implementations MUST be safe for concurrent reads from multiple threads
//   (shards, timer thread, gateway thread).
//
// Ownership:
//   Components hold a const reference; the provider must outlive them.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @brief  Current time as milliseconds since the Unix epoch.
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // Side-effects:  None.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace auction
