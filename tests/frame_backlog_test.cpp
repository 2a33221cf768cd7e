// =============================================================================
// frame_backlog_test.cpp
// =============================================================================
// Unit tests for auction::FrameBacklog, the per-connection bound on frames
// waiting in the gateway.
//
// Validates:
//   - A connection is refused once it has `capacity` frames pending
//   - release() frees one slot; forget() frees all of them
//   - One connection at its bound does not affect another
//   - Concurrent writers never exceed the bound
// =============================================================================

#include "auction/network/frame_backlog.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

// -----------------------------------------------------------------------------
// 1. Refused at capacity, accepted again after a release.
// -----------------------------------------------------------------------------
TEST(FrameBacklogTest, RefusesAtCapacity) {
  auction::FrameBacklog backlog(3);

  EXPECT_TRUE(backlog.reserve(1));
  EXPECT_TRUE(backlog.reserve(1));
  EXPECT_TRUE(backlog.reserve(1));
  EXPECT_FALSE(backlog.reserve(1));
  EXPECT_EQ(backlog.pending(1), 3u);

  backlog.release(1);
  EXPECT_EQ(backlog.pending(1), 2u);
  EXPECT_TRUE(backlog.reserve(1));
  EXPECT_FALSE(backlog.reserve(1));
}

// -----------------------------------------------------------------------------
// 2. Connections are bounded independently; forget() clears one of them.
// Why: one stalled peer must not refuse frames meant for anyone else.
// -----------------------------------------------------------------------------
TEST(FrameBacklogTest, PerConnectionAndForget) {
  auction::FrameBacklog backlog(2);

  ASSERT_TRUE(backlog.reserve(1));
  ASSERT_TRUE(backlog.reserve(1));
  EXPECT_FALSE(backlog.reserve(1));

  EXPECT_TRUE(backlog.reserve(2));
  EXPECT_EQ(backlog.total(), 3u);

  backlog.forget(1);
  EXPECT_EQ(backlog.pending(1), 0u);
  EXPECT_EQ(backlog.total(), 1u);

  // Late releases for a forgotten connection are ignored.
  backlog.release(1);
  EXPECT_EQ(backlog.total(), 1u);
  EXPECT_TRUE(backlog.reserve(1));
}

// -----------------------------------------------------------------------------
// 3. Capacity 0 still lets one frame through.
// -----------------------------------------------------------------------------
TEST(FrameBacklogTest, ZeroCapacityMeansOne) {
  auction::FrameBacklog backlog(0);
  EXPECT_EQ(backlog.capacity(), 1u);
  EXPECT_TRUE(backlog.reserve(9));
  EXPECT_FALSE(backlog.reserve(9));
}

// -----------------------------------------------------------------------------
// 4. Several writers racing on one connection get exactly `capacity` slots.
// -----------------------------------------------------------------------------
TEST(FrameBacklogTest, ConcurrentReserveNeverExceedsBound) {
  constexpr std::size_t kCapacity = 64;
  auction::FrameBacklog backlog(kCapacity);

  std::atomic<std::size_t> granted{0};
  std::vector<std::thread> writers;
  for (int t = 0; t < 4; ++t) {
    writers.emplace_back([&] {
      for (int i = 0; i < 100; ++i) {
        if (backlog.reserve(5)) {
          granted.fetch_add(1);
        }
      }
    });
  }
  for (auto& w : writers) w.join();

  EXPECT_EQ(granted.load(), kCapacity);
  EXPECT_EQ(backlog.pending(5), kCapacity);
}
