#pragma once

#include "auction/catalog/i_auction_catalog.hpp"

#include <cstddef>
#include <shared_mutex>
#include <unordered_map>

namespace auction {

// -----------------------------------------------------------------------------
// InMemoryAuctionCatalog
// -----------------------------------------------------------------------------
//
// @brief  IAuctionCatalog backed by a hash map; filled from the configuration
//         file at startup (see loadServerConfig) or directly by tests.
//
// @details
// Lookups take a shared_lock so concurrent first subscriptions to different
// products never serialize on the catalog; registerAuction()/remove() take a
// unique_lock.
// -----------------------------------------------------------------------------
class InMemoryAuctionCatalog final : public IAuctionCatalog {
 public:
  InMemoryAuctionCatalog() = default;

  InMemoryAuctionCatalog(const InMemoryAuctionCatalog&) = delete;
  InMemoryAuctionCatalog& operator=(const InMemoryAuctionCatalog&) = delete;

  std::optional<domain::AuctionInfo> fetchAuction(
      const domain::ProductId& product_id) const override;

  // -------------------------------------------------------------------------
  // registerAuction(info)
  // -------------------------------------------------------------------------
  // @brief  Inserts or replaces the auction for info.product_id.
  // @return false (and nothing stored) when info.isValid() is false.
  // -------------------------------------------------------------------------
  bool registerAuction(const domain::AuctionInfo& info);

  // Removes a product; rooms already created keep their copy.
  bool remove(const domain::ProductId& product_id);

  std::size_t size() const;

 private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<domain::ProductId, domain::AuctionInfo> auctions_;
};

}  // namespace auction
