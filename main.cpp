// -----------------------------------------------------------------------------
// auction_server — single executable entry point.
//
//   1) Load the configuration (optional path argument; defaults otherwise)
//      and fill the in-memory catalog from its "auctions" array.
//   2) Create the AuctionServer on the live clock with a persistence sink
//      that appends accepted bids to bid_log_path as JSON lines.
//   3) Subscribe logging callbacks on the observer bus.
//   4) Start: BidGateway (ROUTER) for bidders, IpcServer for operators.
//   5) Wait for Ctrl-C, then shut down cleanly.
//
// Thread layout:
//   main thread       → waits for SIGINT
//   room shards       → every Room task
//   timer, recorder   → deadlines, persistence
//   gateway, ipc      → ZeroMQ sockets
// -----------------------------------------------------------------------------

#include "auction/catalog/in_memory_auction_catalog.hpp"
#include "auction/config/server_config.hpp"
#include "auction/engine/auction_server.hpp"
#include "auction/events/room_events.hpp"
#include "auction/time/live_time_provider.hpp"
#include "auction/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>

// -----------------------------------------------------------------------------
// Set by the SIGINT handler, polled by main(). A lock-free atomic store is
// async-signal-safe; everything else happens on the main thread.
// -----------------------------------------------------------------------------
static std::atomic<bool> g_shutdown_requested{false};

static void sigint_handler(int /*signum*/) {
  g_shutdown_requested.store(true);
}

int main(int argc, char** argv) {
  auction::LiveTimeProvider clock;

  // -------------------------------------------------------------------------
  // 1) Configuration and catalog
  // -------------------------------------------------------------------------
  auction::ServerConfig config;
  if (argc > 1) {
    try {
      config = auction::loadServerConfig(argv[1], clock.now_ms());
    } catch (const std::exception& e) {
      std::cerr << "[main] " << e.what() << "\n";
      return 1;
    }
  }

  auction::InMemoryAuctionCatalog catalog;
  const std::size_t loaded = auction::loadCatalog(config, catalog);
  std::cout << "[main] catalog: " << loaded << " auction(s).\n";

  // -------------------------------------------------------------------------
  // 2) Persistence sink (runs on the recorder thread only)
  // -------------------------------------------------------------------------
  std::unique_ptr<std::ofstream> bid_log;
  if (!config.bid_log_path.empty()) {
    bid_log = std::make_unique<std::ofstream>(config.bid_log_path,
                                              std::ios::app);
    if (!*bid_log) {
      std::cerr << "[main] cannot open bid log " << config.bid_log_path
                << "\n";
      return 1;
    }
  }

  auto sink = [&bid_log](const auction::domain::ProductId& product_id,
                         const auction::domain::Bid& bid) {
    if (!bid_log) {
      return;
    }
    nlohmann::json j;
    j["product_id"] = product_id;
    j["bidder"] = bid.bidder_id;
    j["amount"] = bid.amount;
    j["sequence"] = bid.sequence;
    j["timestamp_ms"] = auction::timestamp_to_ms(bid.accepted_at);
    *bid_log << j.dump() << "\n";
    bid_log->flush();
    if (!*bid_log) {
      throw std::runtime_error("bid log write failed");
    }
  };

  auction::AuctionServer server(clock, catalog, config, sink);

  // -------------------------------------------------------------------------
  // 3) Logging. Callbacks run on room shards; keep them short.
  // -------------------------------------------------------------------------
  static std::mutex log_mutex;

  server.eventBus().subscribe<auction::AuctionOpenedEvent>(
      [](const auction::AuctionOpenedEvent& e) {
        std::lock_guard lock(log_mutex);
        std::cout << "[Auction] opened " << e.product_id
                  << " base_price=" << e.base_price << " ends_at="
                  << e.end_ms << "\n";
      });

  server.eventBus().subscribe<auction::BidAcceptedEvent>(
      [](const auction::BidAcceptedEvent& e) {
        std::lock_guard lock(log_mutex);
        std::cout << "[Auction] " << e.product_id << " #" << e.bid.sequence
                  << " " << e.bid.bidder_id << " → " << e.bid.amount << "\n";
      });

  server.eventBus().subscribe<auction::AuctionClosedEvent>(
      [](const auction::AuctionClosedEvent& e) {
        std::lock_guard lock(log_mutex);
        std::cout << "[Auction] closed " << e.product_id << " ("
                  << auction::toString(e.reason) << ")";
        if (e.winning_bid) {
          std::cout << " winner=" << e.winning_bid->bidder_id
                    << " amount=" << e.winning_bid->amount;
        } else {
          std::cout << " no bids";
        }
        std::cout << "\n";
      });

  // -------------------------------------------------------------------------
  // 4) Start
  // -------------------------------------------------------------------------
  std::signal(SIGINT, sigint_handler);

  try {
    server.start();
  } catch (const std::exception& e) {
    std::cerr << "[main] failed to start: " << e.what() << "\n";
    return 1;
  }

  std::cout << "[main] running. Press Ctrl-C to stop.\n";

  // -------------------------------------------------------------------------
  // 5) Wait, then shut down
  // -------------------------------------------------------------------------
  while (!g_shutdown_requested.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::cout << "\n[main] SIGINT received. Shutting down...\n";
  server.stop();

  return 0;
}
