// =============================================================================
// server_config_test.cpp
// =============================================================================
// Tests for parseServerConfig / loadServerConfig / loadCatalog.
//
// Validates:
//   - Defaults when the document is empty
//   - Endpoint, bid log and limits overrides
//   - Absolute and relative auction windows
//   - Malformed documents throw std::runtime_error
//   - loadCatalog registers only valid auctions
// =============================================================================

#include "auction/catalog/in_memory_auction_catalog.hpp"
#include "auction/config/server_config.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using auction::parseServerConfig;

// -----------------------------------------------------------------------------
// 1. An empty object yields the built-in defaults.
// -----------------------------------------------------------------------------
TEST(ServerConfigTest, Defaults) {
  auto config = parseServerConfig("{}", 0);
  EXPECT_EQ(config.gateway_endpoint, "tcp://127.0.0.1:5560");
  EXPECT_EQ(config.command_endpoint, "tcp://127.0.0.1:5561");
  EXPECT_EQ(config.telemetry_endpoint, "tcp://127.0.0.1:5562");
  EXPECT_TRUE(config.bid_log_path.empty());
  EXPECT_EQ(config.limits.outbound_queue_capacity, 256u);
  EXPECT_EQ(config.limits.submit_timeout_ms, 500);
  EXPECT_TRUE(config.auctions.empty());
}

// -----------------------------------------------------------------------------
// 2. Overrides, including an empty endpoint to disable a surface.
// -----------------------------------------------------------------------------
TEST(ServerConfigTest, Overrides) {
  auto config = parseServerConfig(R"({
    "gateway_endpoint": "tcp://0.0.0.0:7000",
    "telemetry_endpoint": "",
    "bid_log_path": "bids.jsonl",
    "limits": { "outbound_queue_capacity": 32, "shard_count": 3 }
  })",
                                  0);

  EXPECT_EQ(config.gateway_endpoint, "tcp://0.0.0.0:7000");
  EXPECT_EQ(config.command_endpoint, "tcp://127.0.0.1:5561");
  EXPECT_TRUE(config.telemetry_endpoint.empty());
  EXPECT_EQ(config.bid_log_path, "bids.jsonl");
  EXPECT_EQ(config.limits.outbound_queue_capacity, 32u);
  EXPECT_EQ(config.limits.shard_count, 3u);
  // Why: keys not given keep their defaults.
  EXPECT_EQ(config.limits.recent_bid_tail, 16u);
}

// -----------------------------------------------------------------------------
// 3. Absolute windows are taken as is; relative ones anchor at now_ms.
// -----------------------------------------------------------------------------
TEST(ServerConfigTest, AuctionWindows) {
  auto config = parseServerConfig(R"({
    "auctions": [
      { "product_id": "lamp", "base_price": 100,
        "start_ms": 1000, "end_ms": 60000 },
      { "product_id": "vase", "base_price": 250,
        "start_in_ms": 5000, "duration_ms": 30000 },
      { "product_id": "rug", "base_price": 50, "duration_ms": 10000 }
    ]
  })",
                                  100'000);

  ASSERT_EQ(config.auctions.size(), 3u);
  EXPECT_EQ(config.auctions[0].start_ms, 1'000);
  EXPECT_EQ(config.auctions[0].end_ms, 60'000);

  EXPECT_EQ(config.auctions[1].product_id, "vase");
  EXPECT_EQ(config.auctions[1].base_price, 250);
  EXPECT_EQ(config.auctions[1].start_ms, 105'000);
  EXPECT_EQ(config.auctions[1].end_ms, 135'000);

  EXPECT_EQ(config.auctions[2].start_ms, 100'000);
  EXPECT_EQ(config.auctions[2].end_ms, 110'000);
}

// -----------------------------------------------------------------------------
// 4. Malformed input surfaces as std::runtime_error.
// -----------------------------------------------------------------------------
TEST(ServerConfigTest, MalformedThrows) {
  EXPECT_THROW(parseServerConfig("{", 0), std::runtime_error);
  EXPECT_THROW(parseServerConfig("[]", 0), std::runtime_error);
  EXPECT_THROW(parseServerConfig(R"({"gateway_endpoint": 5})", 0),
               std::runtime_error);
  EXPECT_THROW(parseServerConfig(R"({"auctions":[{"base_price":1}]})", 0),
               std::runtime_error);
  EXPECT_THROW(
      parseServerConfig(
          R"({"auctions":[{"product_id":"x","base_price":1,"start_ms":5}]})",
          0),
      std::runtime_error);
  EXPECT_THROW(auction::loadServerConfig("/nonexistent/auction.json", 0),
               std::runtime_error);
}

// -----------------------------------------------------------------------------
// 5. loadCatalog skips invalid entries and counts the rest.
// -----------------------------------------------------------------------------
TEST(ServerConfigTest, LoadCatalogSkipsInvalid) {
  auto config = parseServerConfig(R"({
    "auctions": [
      { "product_id": "lamp", "base_price": 100, "start_ms": 0, "end_ms": 10 },
      { "product_id": "free", "base_price": 0, "start_ms": 0, "end_ms": 10 },
      { "product_id": "back", "base_price": 5, "start_ms": 10, "end_ms": 10 }
    ]
  })",
                                  0);

  auction::InMemoryAuctionCatalog catalog;
  EXPECT_EQ(auction::loadCatalog(config, catalog), 1u);
  EXPECT_EQ(catalog.size(), 1u);
  EXPECT_TRUE(catalog.fetchAuction("lamp").has_value());
  EXPECT_FALSE(catalog.fetchAuction("free").has_value());
}
