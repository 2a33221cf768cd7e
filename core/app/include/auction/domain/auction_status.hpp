#pragma once

namespace auction {
namespace domain {

// -----------------------------------------------------------------------------
// AuctionStatus — room lifecycle state machine
// -----------------------------------------------------------------------------
//
//   Pending ──(start time)──> Open ──(end time | admin close)──> Closed
//      │                                                           ▲
//      └──────────────(end time already passed)────────────────────┘
//
// Closed is terminal: no transition leaves it. Bids are only accepted while
// Open. Transitions are performed by the Room on its serialization point.
// -----------------------------------------------------------------------------
enum class AuctionStatus {
  Pending,  // Window not started yet; bids rejected
  Open,     // Bids accepted
  Closed,   // Terminal; bids rejected, final state still readable
};

inline const char* toString(AuctionStatus status) {
  switch (status) {
    case AuctionStatus::Pending: return "Pending";
    case AuctionStatus::Open:    return "Open";
    case AuctionStatus::Closed:  return "Closed";
  }
  return "Unknown";
}

}  // namespace domain
}  // namespace auction
