#include "auction/catalog/in_memory_auction_catalog.hpp"

#include <iostream>
#include <mutex>

namespace auction {

std::optional<domain::AuctionInfo> InMemoryAuctionCatalog::fetchAuction(
    const domain::ProductId& product_id) const {
  std::shared_lock lock(mutex_);
  auto it = auctions_.find(product_id);
  if (it == auctions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool InMemoryAuctionCatalog::registerAuction(const domain::AuctionInfo& info) {
  if (!info.isValid()) {
    std::cerr << "[AuctionCatalog] rejected invalid auction for product '"
              << info.product_id << "' (base_price=" << info.base_price
              << " start_ms=" << info.start_ms << " end_ms=" << info.end_ms
              << ")\n";
    return false;
  }

  std::unique_lock lock(mutex_);
  auctions_[info.product_id] = info;
  return true;
}

bool InMemoryAuctionCatalog::remove(const domain::ProductId& product_id) {
  std::unique_lock lock(mutex_);
  return auctions_.erase(product_id) > 0;
}

std::size_t InMemoryAuctionCatalog::size() const {
  std::shared_lock lock(mutex_);
  return auctions_.size();
}

}  // namespace auction
