#pragma once

#include <atomic>
#include <cstdint>

namespace auction {

// -----------------------------------------------------------------------------
// SequenceGenerator — thread-safe, monotonically increasing id source
// -----------------------------------------------------------------------------
//
// @brief  Hands out unique ids via an atomic counter. Starts at 1; 0 is
//         reserved as the "unset" sentinel.
//
// @details
// Used by ConnectionHub to number connections. Relaxed ordering is enough:
// the only requirement is uniqueness, there is no ordering relationship with
// other memory.
//
// Ownership:
//   Owned as a value member by its user and never copied (a copy would be a
//   second source handing out duplicate ids).
// -----------------------------------------------------------------------------
class SequenceGenerator {
 public:
  SequenceGenerator() = default;

  SequenceGenerator(const SequenceGenerator&) = delete;
  SequenceGenerator& operator=(const SequenceGenerator&) = delete;
  SequenceGenerator(SequenceGenerator&&) = delete;
  SequenceGenerator& operator=(SequenceGenerator&&) = delete;

  std::uint64_t next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

 private:
  std::atomic<std::uint64_t> next_id_{1};
};

}  // namespace auction
