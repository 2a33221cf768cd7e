#include "auction/network/bid_gateway.hpp"

#include "auction/wire/message_codec.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace auction {

BidGateway::BidGateway(std::string endpoint, std::size_t outbound_capacity)
    : endpoint_(std::move(endpoint)), backlog_(outbound_capacity) {}

BidGateway::~BidGateway() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void BidGateway::start(ConnectionHub& hub) {
  if (running_.load()) {
    return;
  }
  hub_ = &hub;

  context_ = std::make_unique<zmq::context_t>(1);
  socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::router);
  socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  socket_->set(zmq::sockopt::linger, 0);
  socket_->set(zmq::sockopt::router_mandatory, true);
  socket_->bind(endpoint_);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[BidGateway] listening on " << endpoint_ << "\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void BidGateway::stop() {
  if (!running_.load()) {
    if (thread_.joinable()) {
      thread_.join();
    }
    return;
  }

  running_.store(false);
  if (thread_.joinable()) {
    thread_.join();
  }

  socket_.reset();
  context_.reset();
  by_identity_.clear();
  by_connection_.clear();

  std::cout << "[BidGateway] stopped.\n";
}

// -----------------------------------------------------------------------------
// ITransport: encode here, send on the gateway thread
// -----------------------------------------------------------------------------
void BidGateway::sendSnapshot(domain::ConnectionId connection,
                              const domain::RoomSnapshot& snapshot) {
  // First frame of a connection: its backlog is empty, so this fits.
  const bool reserved = backlog_.reserve(connection);
  outbound_.push(OutboundFrame{
      connection, MessageCodec::encodeSnapshot(snapshot), false, reserved});
}

void BidGateway::send(domain::ConnectionId connection, const RoomEvent& event) {
  if (!backlog_.reserve(connection)) {
    throw std::runtime_error("gateway backlog full (" +
                             std::to_string(backlog_.capacity()) +
                             " frames)");
  }
  outbound_.push(
      OutboundFrame{connection, MessageCodec::encodeEvent(event), false, true});
}

// One per eviction, outside the per-connection bound.
void BidGateway::close(domain::ConnectionId connection) {
  outbound_.push(OutboundFrame{
      connection,
      MessageCodec::encodeError(domain::RejectReason::RoomUnavailable,
                                "disconnected: outbound queue overflow"),
      true, false});
}

// -----------------------------------------------------------------------------
// run(): alternate outbound drain and inbound poll
// -----------------------------------------------------------------------------
void BidGateway::run() {
  try {
    while (running_.load()) {
      processOutbound();
      processInbound();
    }
    processOutbound();
  } catch (const zmq::error_t& e) {
    std::cerr << "[BidGateway] socket error, gateway down: " << e.what()
              << "\n";
    running_.store(false);
  }
}

void BidGateway::processOutbound() {
  while (auto frame = outbound_.try_pop()) {
    if (frame->reserved) {
      backlog_.release(frame->connection);
    }

    auto it = by_connection_.find(frame->connection);
    if (it == by_connection_.end()) {
      continue;
    }
    const std::string identity = it->second;
    const bool sent = sendTo(identity, frame->payload);
    if (frame->close_after) {
      forget(frame->connection);
      backlog_.forget(frame->connection);
    } else if (!sent) {
      dropPeer(frame->connection);
    }
  }
}

void BidGateway::processInbound() {
  zmq::message_t identity;
  zmq::recv_result_t result;

  try {
    result = socket_->recv(identity, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }
  if (!result.has_value()) {
    return;
  }

  // DEALER clients send [payload]; some send [""][payload]. Take the last
  // part as the payload.
  std::string payload;
  while (socket_->get(zmq::sockopt::rcvmore)) {
    zmq::message_t part;
    if (!socket_->recv(part, zmq::recv_flags::none)) {
      return;
    }
    payload = part.to_string();
  }

  handleFrame(identity.to_string(), payload);
}

// -----------------------------------------------------------------------------
// handleFrame(): dispatch one decoded client frame
// -----------------------------------------------------------------------------
void BidGateway::handleFrame(const std::string& identity,
                             const std::string& payload) {
  auto msg = MessageCodec::decodeInbound(payload);
  if (!msg) {
    sendTo(identity,
           MessageCodec::encodeError(domain::RejectReason::InvalidPayload));
    return;
  }

  switch (msg->type) {
    case InboundMessage::Type::Join:
      handleJoin(identity, msg->product_id, msg->bidder_id);
      break;
    case InboundMessage::Type::Bid:
      handleBid(identity, msg->amount);
      break;
    case InboundMessage::Type::Leave:
      handleLeave(identity);
      break;
  }
}

void BidGateway::handleJoin(const std::string& identity,
                            const domain::ProductId& pid,
                            const domain::BidderId& bidder) {
  handleLeave(identity);

  ConnectResult result = hub_->onConnect(pid, bidder);
  if (!result.connected) {
    sendTo(identity, MessageCodec::encodeError(result.reason, pid));
    return;
  }

  // The snapshot already sits in outbound_ and is sent on the next drain,
  // ahead of any event for this connection.
  by_identity_[identity] = result.connection_id;
  by_connection_[result.connection_id] = identity;
}

void BidGateway::handleBid(const std::string& identity, domain::Amount amount) {
  auto it = by_identity_.find(identity);
  if (it == by_identity_.end()) {
    sendTo(identity,
           MessageCodec::encodeBidResult(domain::BidResult::reject(
               domain::RejectReason::Unauthorized)));
    return;
  }
  domain::BidResult result = hub_->submitBid(it->second, amount);
  sendTo(identity, MessageCodec::encodeBidResult(result));
}

void BidGateway::handleLeave(const std::string& identity) {
  auto it = by_identity_.find(identity);
  if (it == by_identity_.end()) {
    return;
  }
  const domain::ConnectionId connection = it->second;
  forget(connection);
  backlog_.forget(connection);
  hub_->onDisconnect(connection);
}

// -----------------------------------------------------------------------------
// helpers
// -----------------------------------------------------------------------------
bool BidGateway::sendTo(const std::string& identity,
                        const std::string& payload) {
  zmq::message_t id_part(identity.data(), identity.size());
  zmq::message_t body(payload.data(), payload.size());
  try {
    // With ROUTER_MANDATORY an unroutable peer throws EHOSTUNREACH and a
    // full pipe returns no result (EAGAIN) instead of dropping silently.
    if (!socket_->send(id_part,
                       zmq::send_flags::sndmore | zmq::send_flags::dontwait)) {
      std::cerr << "[BidGateway] peer at high-water mark, frame refused.\n";
      return false;
    }
    socket_->send(body, zmq::send_flags::dontwait);
    return true;
  } catch (const zmq::error_t& e) {
    std::cerr << "[BidGateway] send failed: " << e.what() << "\n";
    return false;
  }
}

// A joined peer that cannot take frames is treated like a leave.
void BidGateway::dropPeer(domain::ConnectionId connection) {
  if (by_connection_.count(connection) == 0) {
    return;
  }
  std::cerr << "[BidGateway] connection " << connection
            << " unreachable, disconnecting.\n";
  forget(connection);
  backlog_.forget(connection);
  hub_->onDisconnect(connection);
}

void BidGateway::forget(domain::ConnectionId connection) {
  auto it = by_connection_.find(connection);
  if (it == by_connection_.end()) {
    return;
  }
  by_identity_.erase(it->second);
  by_connection_.erase(it);
}

}  // namespace auction
