#include "auction/wire/message_codec.hpp"

#include "auction/time/time_utils.hpp"

#include <iostream>
#include <variant>

namespace auction {

namespace {

std::optional<domain::Amount> amountField(const nlohmann::json& j) {
  auto it = j.find("amount");
  if (it == j.end() || !it->is_number_integer()) {
    return std::nullopt;
  }
  return it->get<domain::Amount>();
}

}  // namespace

// -----------------------------------------------------------------------------
// decodeInbound()
// -----------------------------------------------------------------------------
std::optional<InboundMessage> MessageCodec::decodeInbound(
    const std::string& raw) {
  try {
    auto j = nlohmann::json::parse(raw);
    if (!j.is_object()) {
      return std::nullopt;
    }

    InboundMessage msg;
    const std::string type = j.value("type", std::string("bid"));

    if (type == "join") {
      msg.type = InboundMessage::Type::Join;
      msg.product_id = j.at("product_id").get<std::string>();
      msg.bidder_id = j.value("bidder_id", std::string());
      if (msg.product_id.empty()) {
        return std::nullopt;
      }
      return msg;
    }

    if (type == "leave") {
      msg.type = InboundMessage::Type::Leave;
      return msg;
    }

    if (type == "bid") {
      auto amount = amountField(j);
      if (!amount) {
        return std::nullopt;
      }
      msg.type = InboundMessage::Type::Bid;
      msg.amount = *amount;
      return msg;
    }

    std::cerr << "[MessageCodec] unknown frame type: " << type << "\n";
    return std::nullopt;
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[MessageCodec] malformed frame: " << e.what() << "\n";
    return std::nullopt;
  }
}

std::optional<domain::Amount> MessageCodec::decodeBidAmount(
    const std::string& raw) {
  try {
    auto j = nlohmann::json::parse(raw);
    if (!j.is_object()) {
      return std::nullopt;
    }
    return amountField(j);
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[MessageCodec] malformed bid payload: " << e.what() << "\n";
    return std::nullopt;
  }
}

// -----------------------------------------------------------------------------
// Room events
// -----------------------------------------------------------------------------
std::string MessageCodec::encodeEvent(const RoomEvent& event) {
  return eventToJson(event).dump();
}

nlohmann::json MessageCodec::eventToJson(const RoomEvent& event) {
  if (auto* e = std::get_if<BidAcceptedEvent>(&event)) {
    return bidAcceptedToJson(*e);
  }
  if (auto* e = std::get_if<AuctionOpenedEvent>(&event)) {
    return auctionOpenedToJson(*e);
  }
  return auctionClosedToJson(std::get<AuctionClosedEvent>(event));
}

nlohmann::json MessageCodec::bidToJson(const domain::Bid& bid) {
  nlohmann::json j;
  j["bidder"] = bid.bidder_id;
  j["amount"] = bid.amount;
  j["timestamp_ms"] = timestamp_to_ms(bid.accepted_at);
  j["sequence"] = bid.sequence;
  return j;
}

nlohmann::json MessageCodec::bidAcceptedToJson(const BidAcceptedEvent& e) {
  nlohmann::json j;
  j["type"] = "bid_accepted";
  j["product_id"] = e.product_id;
  j["sequence_id"] = e.sequence_id;
  j["timestamp_ms"] = timestamp_to_ms(e.timestamp);
  j["bid"] = bidToJson(e.bid);
  // An accepted bid is the new highest by construction.
  j["current_highest"] = e.bid.amount;
  return j;
}

nlohmann::json MessageCodec::auctionOpenedToJson(const AuctionOpenedEvent& e) {
  nlohmann::json j;
  j["type"] = "auction_opened";
  j["product_id"] = e.product_id;
  j["sequence_id"] = e.sequence_id;
  j["timestamp_ms"] = timestamp_to_ms(e.timestamp);
  j["base_price"] = e.base_price;
  j["end_ms"] = e.end_ms;
  return j;
}

nlohmann::json MessageCodec::auctionClosedToJson(const AuctionClosedEvent& e) {
  nlohmann::json j;
  j["type"] = "auction_closed";
  j["product_id"] = e.product_id;
  j["sequence_id"] = e.sequence_id;
  j["timestamp_ms"] = timestamp_to_ms(e.timestamp);
  j["reason"] = toString(e.reason);
  if (e.winning_bid) {
    j["winning_bid"] = bidToJson(*e.winning_bid);
  }
  return j;
}

// -----------------------------------------------------------------------------
// Replies
// -----------------------------------------------------------------------------
std::string MessageCodec::encodeBidResult(const domain::BidResult& result) {
  nlohmann::json j;
  j["type"] = "bid_result";
  j["accepted"] = result.accepted;
  if (result.accepted) {
    j["bid"] = bidToJson(result.bid);
  } else {
    j["reason"] = domain::toString(result.reason);
    if (result.current_highest) {
      j["current_highest"] = *result.current_highest;
    }
  }
  return j.dump();
}

std::string MessageCodec::encodeSnapshot(const domain::RoomSnapshot& s) {
  nlohmann::json j;
  j["type"] = "snapshot";
  j["product_id"] = s.product_id;
  j["status"] = domain::toString(s.status);
  j["base_price"] = s.base_price;
  j["start_ms"] = s.start_ms;
  j["end_ms"] = s.end_ms;
  j["last_event_sequence"] = s.last_event_sequence;
  j["subscriber_count"] = s.subscriber_count;
  if (s.highest) {
    j["highest"] = bidToJson(*s.highest);
  }

  nlohmann::json recent = nlohmann::json::array();
  for (const auto& bid : s.recent_bids) {
    recent.push_back(bidToJson(bid));
  }
  j["recent_bids"] = std::move(recent);
  return j.dump();
}

std::string MessageCodec::encodeError(domain::RejectReason reason,
                                      const std::string& detail) {
  nlohmann::json j;
  j["type"] = "error";
  j["reason"] = domain::toString(reason);
  if (!detail.empty()) {
    j["detail"] = detail;
  }
  return j.dump();
}

}  // namespace auction
