#include "auction/engine/auction_server.hpp"

#include "auction/wire/message_codec.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <stdexcept>
#include <utility>

namespace auction {

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
AuctionServer::AuctionServer(const ITimeProvider& clock,
                             const IAuctionCatalog& catalog,
                             ServerConfig config,
                             WriteBehindRecorder::Sink sink)
    : clock_(clock),
      catalog_(catalog),
      config_(std::move(config)),
      sink_(std::move(sink)) {}

AuctionServer::~AuctionServer() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void AuctionServer::start(ITransport* transport) {
  if (running_) {
    return;
  }

  if (transport == nullptr && config_.gateway_endpoint.empty()) {
    throw std::invalid_argument(
        "AuctionServer::start: no transport and no gateway endpoint");
  }

  const domain::RoomLimits& limits = config_.limits;

  // ---  1) Background workers rooms depend on ---------------------------------
  recorder_ = std::make_unique<WriteBehindRecorder>(sink_);
  recorder_->start();

  scheduler_ = std::make_unique<RoomScheduler>(limits.shard_count,
                                               limits.mailbox_capacity);
  scheduler_->start();

  timer_ = std::make_unique<AuctionTimer>(clock_);
  timer_->start();

  // ---  2) Registry --------------------------------------------------------------
  registry_ = std::make_unique<RoomRegistry>(catalog_, *scheduler_, *timer_,
                                             clock_, event_bus_,
                                             recorder_.get(), limits);

  // ---  3) Transport boundary -------------------------------------------------
  if (transport == nullptr) {
    gateway_ = std::make_unique<BidGateway>(config_.gateway_endpoint,
                                            limits.outbound_queue_capacity);
    transport = gateway_.get();
  }
  hub_ = std::make_unique<ConnectionHub>(*registry_, *transport, limits);

  // ---  4) Admin surface (telemetry + commands) --------------------------------
  if (!config_.command_endpoint.empty() &&
      !config_.telemetry_endpoint.empty()) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        config_.command_endpoint, config_.telemetry_endpoint);
    ipc_server_->start();

    telemetry_subscription_ = event_bus_.subscribe(
        [this](const RoomEvent& e) { ipc_server_->pushTelemetry(e); });
  }

  // ---  5) Gateway LAST (clients start arriving) ---------------------------------
  if (gateway_) {
    gateway_->start(*hub_);
  }

  running_ = true;

  std::cout << "[AuctionServer] started. Shards: " << scheduler_->shardCount()
            << (gateway_ ? ", gateway" : "")
            << (ipc_server_ ? ", ipc" : "") << ".\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void AuctionServer::stop() {
  if (!running_) {
    return;
  }

  // ---  1) Stop inbound traffic ----------------------------------------------
  if (gateway_) {
    gateway_->stop();
  }

  // ---  2) Drop telemetry before the IPC thread goes away --------------------
  if (telemetry_subscription_) {
    event_bus_.unsubscribe(*telemetry_subscription_);
    telemetry_subscription_.reset();
  }
  ipc_server_.reset();

  // ---  3) Disconnect everyone (joins writer threads) ------------------------
  hub_.reset();
  gateway_.reset();

  // ---  4) No more deadlines, then drain room tasks ----------------------------
  timer_->stop();
  scheduler_->stop();

  // ---  5) Rooms are quiet; drop them -------------------------------------------
  registry_.reset();
  timer_.reset();
  scheduler_.reset();

  // ---  6) Flush persistence -------------------------------------------------------
  recorder_->stop();
  std::cout << "[AuctionServer] recorder flushed: " << recorder_->recorded()
            << " bid(s) recorded, " << recorder_->failed() << " failed.\n";
  recorder_.reset();

  running_ = false;

  std::cout << "[AuctionServer] stopped. All threads joined.\n";
}

// -----------------------------------------------------------------------------
// closeAuction()
// -----------------------------------------------------------------------------
bool AuctionServer::closeAuction(const domain::ProductId& product_id) {
  if (!running_) {
    return false;
  }
  auto room = registry_->findRoom(product_id);
  if (!room) {
    return false;
  }
  std::cout << "[AuctionServer] administrative close of " << product_id
            << ".\n";
  return room->close(CloseReason::Administrative);
}

// -----------------------------------------------------------------------------
// executeCommand(): admin requests from IpcServer
// -----------------------------------------------------------------------------
std::string AuctionServer::executeCommand(const std::string& cmd) {
  nlohmann::json response;

  if (!running_) {
    response["status"] = "error";
    response["response"] = "server not running";
    return response.dump();
  }

  static const std::string kClosePrefix = "CLOSE ";

  if (cmd == "PING") {
    response["status"] = "ok";
    response["response"] = "PONG";
  } else if (cmd == "STATUS") {
    return statusJson();
  } else if (cmd == "ROOMS") {
    nlohmann::json rooms = nlohmann::json::array();
    for (const auto& room : registry_->rooms()) {
      rooms.push_back(room->productId());
    }
    response["status"] = "ok";
    response["rooms"] = std::move(rooms);
  } else if (cmd.compare(0, kClosePrefix.size(), kClosePrefix) == 0) {
    const std::string product_id = cmd.substr(kClosePrefix.size());
    if (closeAuction(product_id)) {
      response["status"] = "ok";
      response["response"] = "Closing " + product_id;
    } else {
      response["status"] = "error";
      response["response"] = "No live room for " + product_id;
    }
  } else {
    response["status"] = "error";
    response["response"] = "Unknown command: " + cmd;
  }

  return response.dump();
}

std::string AuctionServer::statusJson() {
  nlohmann::json response;
  response["status"] = "ok";
  response["connections"] = hub_->connectionCount();
  response["evicted_connections"] = hub_->evictedCount();
  response["rooms_created"] = registry_->roomsCreated();
  response["bids_recorded"] = recorder_->recorded();
  response["record_failures"] = recorder_->failed();

  nlohmann::json rooms = nlohmann::json::array();
  for (const auto& room : registry_->rooms()) {
    nlohmann::json r;
    r["product_id"] = room->productId();

    if (auto snapshot = room->snapshot()) {
      r["status"] = domain::toString(snapshot->status);
      r["subscribers"] = snapshot->subscriber_count;
      r["last_event_sequence"] = snapshot->last_event_sequence;
      if (snapshot->highest) {
        r["highest"] = MessageCodec::bidToJson(*snapshot->highest);
      }
    } else {
      // Busy room: fall back to the lock-free mirrors.
      r["status"] = domain::toString(room->status());
      r["subscribers"] = room->subscriberCount();
    }
    rooms.push_back(std::move(r));
  }
  response["rooms"] = std::move(rooms);
  return response.dump();
}

}  // namespace auction
