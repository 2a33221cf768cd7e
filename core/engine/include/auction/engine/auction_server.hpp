#pragma once

#include "auction/catalog/i_auction_catalog.hpp"
#include "auction/concurrent/room_scheduler.hpp"
#include "auction/config/server_config.hpp"
#include "auction/eventbus/event_bus.hpp"
#include "auction/network/bid_gateway.hpp"
#include "auction/network/ipc_server.hpp"
#include "auction/persistence/write_behind_recorder.hpp"
#include "auction/room/room_registry.hpp"
#include "auction/time/i_time_provider.hpp"
#include "auction/timer/auction_timer.hpp"
#include "auction/transport/connection_hub.hpp"
#include "auction/transport/i_transport.hpp"

#include <atomic>
#include <memory>
#include <optional>
#include <string>

namespace auction {

// -----------------------------------------------------------------------------
// AuctionServer
// -----------------------------------------------------------------------------
//
// @brief  Central orchestrator that owns the scheduler, timer, recorder,
//         registry, connection hub and the optional network surfaces.
//
// @details
// Gives main() and tests one lifecycle API (start/stop) so neither has to
// wire the internals by hand.
//
// Thread layout:
//
//   room shards (N)       → every Room task (RoomScheduler)
//   auction_timer         → open/close deadlines (AuctionTimer)
//   recorder              → persistence sink (WriteBehindRecorder)
//   writer per connection → ConnectionHandle queue → ITransport
//   bid_gateway           → ZMQ ROUTER (BidGateway), when enabled
//   ipc                   → ZMQ REP + PUB (IpcServer), when enabled
//
//   main thread           → server.start(), wait for shutdown, server.stop()
//
// Ownership:
//   AuctionServer
//    ├── clock_        (const ITimeProvider& — non-owning)
//    ├── catalog_      (const IAuctionCatalog& — non-owning)
//    ├── event_bus_    (EventBus — value member, outlives every room)
//    ├── recorder_     (unique_ptr<WriteBehindRecorder>)
//    ├── scheduler_    (unique_ptr<RoomScheduler>)
//    ├── timer_        (unique_ptr<AuctionTimer>)
//    ├── registry_     (unique_ptr<RoomRegistry>)
//    ├── gateway_      (unique_ptr<BidGateway> — only without an external
//    │                  transport and with a gateway endpoint)
//    ├── hub_          (unique_ptr<ConnectionHub>)
//    └── ipc_server_   (unique_ptr<IpcServer>)
//
// Components are heap-allocated so stop() controls the teardown order:
// network surfaces, hub (joins writers), timer, scheduler (drains room
// tasks), registry, recorder (drains pending records).
// -----------------------------------------------------------------------------
class AuctionServer {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  clock    Time source for every room and the timer. Tests pass a
  //                  SimulationTimeProvider; main() a LiveTimeProvider.
  // @param  catalog  Auction metadata source; must outlive the server.
  // @param  config   Endpoints and limits. Empty endpoints disable the
  //                  corresponding surface.
  // @param  sink     Persistence sink for accepted bids; empty = discard.
  //
  // Nothing is started here.
  // -------------------------------------------------------------------------
  AuctionServer(const ITimeProvider& clock, const IAuctionCatalog& catalog,
                ServerConfig config, WriteBehindRecorder::Sink sink = {});

  ~AuctionServer();

  AuctionServer(const AuctionServer&) = delete;
  AuctionServer& operator=(const AuctionServer&) = delete;

  // -------------------------------------------------------------------------
  // start(transport)
  // -------------------------------------------------------------------------
  // @param  transport  Outbound transport for connections. nullptr uses the
  //                    built-in BidGateway on config.gateway_endpoint.
  //
  // @throws std::invalid_argument if transport is null and no gateway
  //         endpoint is configured; zmq::error_t if an endpoint cannot be
  //         bound. Idempotent once running.
  // -------------------------------------------------------------------------
  void start(ITransport* transport = nullptr);

  // Idempotent; also called by the destructor.
  void stop();

  bool running() const { return running_.load(); }

  // Valid between start() and stop().
  ConnectionHub& connectionHub() { return *hub_; }
  RoomRegistry& registry() { return *registry_; }

  // Every room event, in per-room order. Subscribe before start() to see
  // everything.
  EventBus& eventBus() { return event_bus_; }

  // -------------------------------------------------------------------------
  // closeAuction(product_id)
  // -------------------------------------------------------------------------
  // @brief  Administrative close of a live room.
  // @return false if the product has no live room.
  // -------------------------------------------------------------------------
  bool closeAuction(const domain::ProductId& product_id);

  // -------------------------------------------------------------------------
  // executeCommand(cmd)
  // -------------------------------------------------------------------------
  // @brief  Admin command dispatcher behind IpcServer's REP socket.
  //
  //   PING               → {"status":"ok","response":"PONG"}
  //   STATUS             → rooms with status, highest bid, subscribers,
  //                        plus connection and recorder counters
  //   ROOMS              → live product ids
  //   CLOSE <product_id> → administrative close
  //
  // @return JSON text. Unknown commands answer {"status":"error",...}.
  // Thread-safety: callable from any thread while running.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);

  const ServerConfig& config() const { return config_; }

 private:
  std::string statusJson();

  const ITimeProvider& clock_;
  const IAuctionCatalog& catalog_;
  ServerConfig config_;
  WriteBehindRecorder::Sink sink_;

  EventBus event_bus_;
  std::optional<EventBus::SubscriptionId> telemetry_subscription_;

  std::unique_ptr<WriteBehindRecorder> recorder_;
  std::unique_ptr<RoomScheduler> scheduler_;
  std::unique_ptr<AuctionTimer> timer_;
  std::unique_ptr<RoomRegistry> registry_;
  std::unique_ptr<BidGateway> gateway_;
  std::unique_ptr<ConnectionHub> hub_;
  std::unique_ptr<IpcServer> ipc_server_;

  std::atomic<bool> running_{false};
};

}  // namespace auction
