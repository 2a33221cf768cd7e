#pragma once

#include "auction/time/i_time_provider.hpp"

namespace auction {

// -----------------------------------------------------------------------------
// LiveTimeProvider — wall-clock time implementation of ITimeProvider
// -----------------------------------------------------------------------------
//
// @brief  Returns real wall-clock time via std::chrono::system_clock.
//
// @details
// Used by the auction_server binary. Auction windows in the catalog are wall
// clock instants, so system_clock (not steady_clock) is the right source.
//
// Thread model: stateless, safe from any thread.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace auction
