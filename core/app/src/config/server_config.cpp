#include "auction/config/server_config.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace auction {

namespace {

template <typename T>
void readIfPresent(const nlohmann::json& j, const char* key, T& out) {
  auto it = j.find(key);
  if (it != j.end()) {
    out = it->get<T>();
  }
}

domain::AuctionInfo parseAuction(const nlohmann::json& j,
                                 std::int64_t now_ms) {
  domain::AuctionInfo info;
  info.product_id = j.at("product_id").get<std::string>();
  info.base_price = j.at("base_price").get<domain::Amount>();

  if (j.contains("start_ms") || j.contains("end_ms")) {
    info.start_ms = j.at("start_ms").get<std::int64_t>();
    info.end_ms = j.at("end_ms").get<std::int64_t>();
  } else {
    info.start_ms = now_ms + j.value("start_in_ms", std::int64_t{0});
    info.end_ms = info.start_ms + j.at("duration_ms").get<std::int64_t>();
  }
  return info;
}

}  // namespace

// -----------------------------------------------------------------------------
// parseServerConfig()
// -----------------------------------------------------------------------------
ServerConfig parseServerConfig(const std::string& text, std::int64_t now_ms) {
  ServerConfig config;

  try {
    auto j = nlohmann::json::parse(text);
    if (!j.is_object()) {
      throw std::runtime_error("configuration root must be an object");
    }

    readIfPresent(j, "gateway_endpoint", config.gateway_endpoint);
    readIfPresent(j, "command_endpoint", config.command_endpoint);
    readIfPresent(j, "telemetry_endpoint", config.telemetry_endpoint);
    readIfPresent(j, "bid_log_path", config.bid_log_path);

    if (auto it = j.find("limits"); it != j.end()) {
      const auto& l = *it;
      readIfPresent(l, "outbound_queue_capacity",
                    config.limits.outbound_queue_capacity);
      readIfPresent(l, "recent_bid_tail", config.limits.recent_bid_tail);
      readIfPresent(l, "submit_timeout_ms", config.limits.submit_timeout_ms);
      readIfPresent(l, "mailbox_capacity", config.limits.mailbox_capacity);
      readIfPresent(l, "shard_count", config.limits.shard_count);
    }

    if (auto it = j.find("auctions"); it != j.end()) {
      for (const auto& entry : *it) {
        config.auctions.push_back(parseAuction(entry, now_ms));
      }
    }
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error(std::string("invalid configuration: ") +
                             e.what());
  }

  return config;
}

ServerConfig loadServerConfig(const std::string& path, std::int64_t now_ms) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("cannot open configuration file: " + path);
  }
  std::stringstream buffer;
  buffer << in.rdbuf();

  ServerConfig config = parseServerConfig(buffer.str(), now_ms);
  std::cout << "[ServerConfig] loaded " << path << " ("
            << config.auctions.size() << " auction(s)).\n";
  return config;
}

// -----------------------------------------------------------------------------
// loadCatalog()
// -----------------------------------------------------------------------------
std::size_t loadCatalog(const ServerConfig& config,
                        InMemoryAuctionCatalog& catalog) {
  std::size_t loaded = 0;
  for (const auto& info : config.auctions) {
    if (catalog.registerAuction(info)) {
      ++loaded;
    }
  }
  return loaded;
}

}  // namespace auction
