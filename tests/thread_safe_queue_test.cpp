// =============================================================================
// thread_safe_queue_test.cpp
// =============================================================================
// Unit tests for auction::ThreadSafeQueue<T>.
//
// Validates:
//   - FIFO ordering and non-blocking try_pop()
//   - Bounded try_push(): refuses at capacity, accepts again after a pop
//   - close(): wakes waiters, refuses new try_push, keeps queued items
//   - pop_for() timeout on an open, empty queue
//   - No lost or duplicated items under multi-producer / multi-consumer load
//
// Threads spawned by a test are joined before its assertions.
// =============================================================================

#include "auction/concurrent/thread_safe_queue.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <optional>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

class ThreadSafeQueueTest : public ::testing::Test {
 protected:
  auction::ThreadSafeQueue<int> queue;
};

// -----------------------------------------------------------------------------
// 1. Items come back in the order they were pushed.
// Why: Per-subscriber outbound queues carry room events; reordering here
//      would break the sequence_id order clients rely on.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, FIFOOrder) {
  EXPECT_TRUE(queue.empty());
  for (int i = 0; i < 50; ++i) {
    queue.push(i);
  }
  EXPECT_EQ(queue.size(), 50u);

  for (int i = 0; i < 50; ++i) {
    EXPECT_EQ(queue.pop(), i) << "FIFO violated at index " << i;
  }
  EXPECT_TRUE(queue.empty());
}

// -----------------------------------------------------------------------------
// 2. try_pop() returns nullopt on empty and the front item otherwise.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, TryPop) {
  EXPECT_FALSE(queue.try_pop().has_value());

  queue.push(99);
  auto value = queue.try_pop();
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(*value, 99);
  EXPECT_TRUE(queue.empty());
}

// -----------------------------------------------------------------------------
// 3. A bounded queue refuses try_push() at capacity without blocking.
// Why: This is the slow-consumer signal. A room must learn immediately that
//      a subscriber is full instead of waiting on it.
// -----------------------------------------------------------------------------
TEST(ThreadSafeQueueBoundedTest, TryPushRefusesAtCapacity) {
  auction::ThreadSafeQueue<int> bounded(2);
  EXPECT_EQ(bounded.capacity(), 2u);

  EXPECT_TRUE(bounded.try_push(1));
  EXPECT_TRUE(bounded.try_push(2));
  EXPECT_FALSE(bounded.try_push(3));
  EXPECT_EQ(bounded.size(), 2u);

  EXPECT_EQ(bounded.pop(), 1);
  EXPECT_TRUE(bounded.try_push(3));
  EXPECT_EQ(bounded.pop(), 2);
  EXPECT_EQ(bounded.pop(), 3);
}

// -----------------------------------------------------------------------------
// 4. close() is reported once, refuses try_push, keeps what was queued.
// Why: An evicted connection's writer must still drain the events that were
//      accepted before the eviction, then stop.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, CloseKeepsQueuedItems) {
  queue.push(1);
  queue.push(2);

  EXPECT_TRUE(queue.close());
  EXPECT_FALSE(queue.close());
  EXPECT_TRUE(queue.closed());
  EXPECT_FALSE(queue.try_push(3));

  EXPECT_EQ(queue.pop_for(10ms), std::optional<int>(1));
  EXPECT_EQ(queue.pop_for(10ms), std::optional<int>(2));
  EXPECT_FALSE(queue.pop_for(10ms).has_value());
}

// -----------------------------------------------------------------------------
// 5. close() wakes a consumer blocked in pop_for() well before its timeout.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, CloseWakesWaiter) {
  std::atomic<bool> returned{false};
  const auto started = std::chrono::steady_clock::now();

  std::thread consumer([this, &returned] {
    auto value = queue.pop_for(5s);
    EXPECT_FALSE(value.has_value());
    returned.store(true);
  });

  std::this_thread::sleep_for(20ms);
  EXPECT_FALSE(returned.load());

  queue.close();
  consumer.join();

  EXPECT_TRUE(returned.load());
  EXPECT_LT(std::chrono::steady_clock::now() - started, 2s);
}

// -----------------------------------------------------------------------------
// 6. pop_for() on an open, empty queue times out with nullopt.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, PopForTimesOut) {
  const auto started = std::chrono::steady_clock::now();
  EXPECT_FALSE(queue.pop_for(30ms).has_value());
  EXPECT_GE(std::chrono::steady_clock::now() - started, 25ms);
}

// -----------------------------------------------------------------------------
// 7. Blocking pop() wakes up on a push from another thread.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, BlockingPopWaitsForPush) {
  std::atomic<int> received{-1};
  std::thread consumer([this, &received] { received.store(queue.pop()); });

  std::this_thread::sleep_for(20ms);
  EXPECT_EQ(received.load(), -1);

  queue.push(77);
  consumer.join();
  EXPECT_EQ(received.load(), 77);
}

// -----------------------------------------------------------------------------
// 8. Multi-producer / multi-consumer: every item popped exactly once.
// Why: Shard mailboxes take posts from many connection threads at once.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, ConcurrentPushPop) {
  constexpr int kProducers = 4;
  constexpr int kConsumers = 4;
  constexpr int kPerProducer = 1000;
  constexpr int kTotal = kProducers * kPerProducer;

  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([this, p] {
      for (int i = p * kPerProducer; i < (p + 1) * kPerProducer; ++i) {
        queue.push(i);
      }
    });
  }

  std::atomic<int> consumed{0};
  std::vector<std::vector<int>> seen(kConsumers);
  std::vector<std::thread> consumers;
  for (int c = 0; c < kConsumers; ++c) {
    consumers.emplace_back([this, c, &consumed, &seen] {
      while (consumed.load() < kTotal) {
        if (auto item = queue.pop_for(1ms)) {
          seen[c].push_back(*item);
          consumed.fetch_add(1);
        }
      }
    });
  }

  for (auto& t : producers) t.join();
  for (auto& t : consumers) t.join();

  std::vector<int> all;
  for (const auto& v : seen) {
    all.insert(all.end(), v.begin(), v.end());
  }
  std::sort(all.begin(), all.end());

  ASSERT_EQ(static_cast<int>(all.size()), kTotal);
  for (int i = 0; i < kTotal; ++i) {
    EXPECT_EQ(all[i], i) << "Missing or duplicate item at index " << i;
  }
}
