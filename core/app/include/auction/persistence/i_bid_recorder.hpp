#pragma once

#include "auction/domain/bid.hpp"
#include "auction/domain/types.hpp"

namespace auction {

// -----------------------------------------------------------------------------
// IBidRecorder — persistence collaborator
// -----------------------------------------------------------------------------
//
// @brief  Receives every accepted bid for durable history.
//
// @details
// Fire-and-forget from the room's point of view: the room calls recordBid()
// after the in-memory acceptance is final and never looks at the outcome.
// The in-memory room state is the source of truth for the live auction; a
// failed write is the recorder's problem to log and reconcile later, never a
// reason to roll back a bid that subscribers have already seen.
//
// Thread-safety contract:
//   recordBid() is called from scheduler shards (many rooms at once) and must
//   not block for long; WriteBehindRecorder provides that for slow sinks.
// -----------------------------------------------------------------------------
class IBidRecorder {
 public:
  virtual ~IBidRecorder() = default;

  virtual void recordBid(const domain::ProductId& product_id,
                         const domain::Bid& bid) = 0;
};

}  // namespace auction
