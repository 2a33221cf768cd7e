#pragma once

#include "auction/domain/types.hpp"

#include <chrono>
#include <cstdint>

namespace auction {

// -----------------------------------------------------------------------------
// Time conversion utilities
// -----------------------------------------------------------------------------
// ITimeProvider speaks int64_t epoch milliseconds; bids and events carry a
// Timestamp (system_clock::time_point). These bridge the two. Stateless, safe
// from any thread.
// -----------------------------------------------------------------------------

// Epoch milliseconds → Timestamp. Inverse of timestamp_to_ms().
inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

// Timestamp → epoch milliseconds (truncating).
inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

}  // namespace auction
