#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace auction {

// -----------------------------------------------------------------------------
// Timestamp
// -----------------------------------------------------------------------------
// Wall-clock instant used by bids and events. std::chrono::system_clock is
// used (not steady_clock) because timestamps are shown to clients and
// compared against auction start/end instants from the catalog.
// -----------------------------------------------------------------------------
using Timestamp = std::chrono::system_clock::time_point;

namespace domain {

// Product identifier; one room per product id.
using ProductId = std::string;

// Authenticated bidder identity supplied by the identity collaborator. An
// empty BidderId marks an unauthenticated (spectator) connection.
using BidderId = std::string;

// Transport-level connection id. 0 means "unset".
using ConnectionId = std::uint64_t;

// -----------------------------------------------------------------------------
// Amount
// -----------------------------------------------------------------------------
// Monetary amount in minor currency units (cents). An integer type keeps the
// "strictly greater than the current highest" rule exact; a floating point
// price would make equal-looking amounts compare unequal.
// -----------------------------------------------------------------------------
using Amount = std::int64_t;

// Per-room accepted-bid sequence number. The first accepted bid is 1.
using SequenceNumber = std::uint64_t;

}  // namespace domain
}  // namespace auction
