#pragma once

#include "auction/domain/bid.hpp"
#include "auction/domain/bid_result.hpp"
#include "auction/domain/room_snapshot.hpp"
#include "auction/domain/types.hpp"
#include "auction/events/event.hpp"
#include "auction/events/room_events.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace auction {

// One decoded client frame.
struct InboundMessage {
  enum class Type { Join, Bid, Leave };

  Type type{Type::Bid};
  domain::ProductId product_id;  // Join only
  domain::BidderId bidder_id;    // Join only; empty means watch only
  domain::Amount amount{0};      // Bid only
};

// -----------------------------------------------------------------------------
// MessageCodec — JSON wire format shared by every ZeroMQ surface
// -----------------------------------------------------------------------------
//
// @brief  Stateless encode/decode between engine types and JSON text.
//
// @details
// Inbound (client → server):
//   {"type":"join","product_id":"p1","bidder_id":"alice"}
//   {"type":"bid","amount":150}       or the bare form {"amount":150}
//   {"type":"leave"}
//
// Outbound (server → client / telemetry):
//   bid_accepted, auction_opened, auction_closed  — room events, each with
//                                                   product_id and
//                                                   sequence_id
//   bid_result                                    — reply to one bid
//   snapshot                                      — first frame after join
//   error                                         — join or frame failure
//
// Amounts are integers in minor currency units and timestamps are epoch
// milliseconds. Decoding never throws: malformed input yields nullopt and a
// log line, and the receive loop moves on to the next frame.
//
// Thread-safety: all functions are pure and may be called from any thread.
// -----------------------------------------------------------------------------
class MessageCodec {
 public:
  // -------------------------------------------------------------------------
  // decodeInbound(raw)
  // -------------------------------------------------------------------------
  // @return The decoded frame, or nullopt if it is not JSON, has an unknown
  //         "type", or misses a required field. A frame with "amount" and no
  //         "type" decodes as a bid.
  // -------------------------------------------------------------------------
  static std::optional<InboundMessage> decodeInbound(const std::string& raw);

  // -------------------------------------------------------------------------
  // decodeBidAmount(raw)
  // -------------------------------------------------------------------------
  // @return The "amount" field of a bid payload if it is present and an
  //         integer. Sign is not checked here.
  // -------------------------------------------------------------------------
  static std::optional<domain::Amount> decodeBidAmount(const std::string& raw);

  static std::string encodeEvent(const RoomEvent& event);
  static std::string encodeBidResult(const domain::BidResult& result);
  static std::string encodeSnapshot(const domain::RoomSnapshot& snapshot);
  static std::string encodeError(domain::RejectReason reason,
                                 const std::string& detail = {});

  static nlohmann::json bidToJson(const domain::Bid& bid);
  static nlohmann::json eventToJson(const RoomEvent& event);

 private:
  static nlohmann::json bidAcceptedToJson(const BidAcceptedEvent& e);
  static nlohmann::json auctionOpenedToJson(const AuctionOpenedEvent& e);
  static nlohmann::json auctionClosedToJson(const AuctionClosedEvent& e);
};

}  // namespace auction
