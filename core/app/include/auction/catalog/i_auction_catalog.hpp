#pragma once

#include "auction/domain/auction_info.hpp"
#include "auction/domain/types.hpp"

#include <optional>

namespace auction {

// -----------------------------------------------------------------------------
// IAuctionCatalog — product/auction metadata collaborator
// -----------------------------------------------------------------------------
//
// @brief  Read-only source of auction metadata (base price, time window).
//
// @details
// Product registration and storage live outside the engine. The RoomRegistry
// consults the catalog exactly once per room creation; after that the room
// works from its own copy of AuctionInfo.
//
// Thread-safety contract:
//   fetchAuction() may be called from any thread (whichever thread first
//   subscribes to a product). Implementations synchronize internally.
// -----------------------------------------------------------------------------
class IAuctionCatalog {
 public:
  virtual ~IAuctionCatalog() = default;

  // -------------------------------------------------------------------------
  // fetchAuction(product_id)
  // -------------------------------------------------------------------------
  // @return The auction for product_id, or std::nullopt when the product is
  //         unknown. The registry turns nullopt into a NotFound rejection.
  // -------------------------------------------------------------------------
  virtual std::optional<domain::AuctionInfo> fetchAuction(
      const domain::ProductId& product_id) const = 0;
};

}  // namespace auction
