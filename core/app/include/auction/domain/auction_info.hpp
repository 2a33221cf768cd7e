#pragma once

#include "auction/domain/types.hpp"

#include <cstdint>

namespace auction {
namespace domain {

// -----------------------------------------------------------------------------
// AuctionInfo
// -----------------------------------------------------------------------------
// Responsibility: The auction metadata the catalog collaborator returns for a
// product: base price and time window. Read once when a room is created and
// immutable afterwards.
//
// start_ms / end_ms are epoch milliseconds, the same unit ITimeProvider
// reports, so the room compares them directly with now_ms().
// -----------------------------------------------------------------------------
struct AuctionInfo {
  ProductId product_id;
  Amount base_price{0};
  std::int64_t start_ms{0};
  std::int64_t end_ms{0};

  bool isValid() const {
    return !product_id.empty() && base_price > 0 && start_ms < end_ms;
  }
};

}  // namespace domain
}  // namespace auction
