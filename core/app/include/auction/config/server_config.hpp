#pragma once

#include "auction/catalog/in_memory_auction_catalog.hpp"
#include "auction/domain/auction_info.hpp"
#include "auction/domain/room_limits.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace auction {

// -----------------------------------------------------------------------------
// ServerConfig
// -----------------------------------------------------------------------------
//
// @brief  Everything AuctionServer and main() need to come up.
//
// @details
// An empty endpoint disables that surface (tests run with all three empty
// and drive the ConnectionHub directly).
//
// JSON layout accepted by parseServerConfig():
//
//   {
//     "gateway_endpoint":   "tcp://127.0.0.1:5560",
//     "command_endpoint":   "tcp://127.0.0.1:5561",
//     "telemetry_endpoint": "tcp://127.0.0.1:5562",
//     "bid_log_path":       "accepted_bids.jsonl",
//     "limits": { "outbound_queue_capacity": 256, "recent_bid_tail": 16,
//                 "submit_timeout_ms": 500, "mailbox_capacity": 4096,
//                 "shard_count": 0 },
//     "auctions": [
//       { "product_id": "lamp", "base_price": 100,
//         "start_ms": 1700000000000, "end_ms": 1700000600000 },
//       { "product_id": "vase", "base_price": 250,
//         "start_in_ms": 0, "duration_ms": 600000 }
//     ]
//   }
//
// Every key is optional. An auction gives either an absolute window
// (start_ms/end_ms) or one relative to load time (start_in_ms/duration_ms).
// -----------------------------------------------------------------------------
struct ServerConfig {
  std::string gateway_endpoint{"tcp://127.0.0.1:5560"};
  std::string command_endpoint{"tcp://127.0.0.1:5561"};
  std::string telemetry_endpoint{"tcp://127.0.0.1:5562"};

  // main() appends accepted bids here as JSON lines; empty = log only.
  std::string bid_log_path;

  domain::RoomLimits limits;

  std::vector<domain::AuctionInfo> auctions;
};

// -----------------------------------------------------------------------------
// parseServerConfig(text, now_ms)
// -----------------------------------------------------------------------------
// @param  now_ms  Anchor for relative auction windows.
// @throws std::runtime_error on malformed JSON, wrong field types or an
//         auction without product_id.
// -----------------------------------------------------------------------------
ServerConfig parseServerConfig(const std::string& text, std::int64_t now_ms);

// Reads and parses a file. Throws std::runtime_error if it cannot be read.
ServerConfig loadServerConfig(const std::string& path, std::int64_t now_ms);

// Registers config.auctions in the catalog; returns how many were valid.
std::size_t loadCatalog(const ServerConfig& config,
                        InMemoryAuctionCatalog& catalog);

}  // namespace auction
