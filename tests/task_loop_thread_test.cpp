// =============================================================================
// task_loop_thread_test.cpp
// =============================================================================
// Unit tests for auction::TaskLoopThread, auction::RoomScheduler and
// auction::SequenceGenerator, the serialization machinery under every room.
//
// Validates:
//   - Posted tasks run in FIFO order on one thread that is not the caller's
//   - A throwing task is logged and the loop keeps going
//   - post() refuses before start(), after stop(), and when the bounded
//     mailbox is full
//   - Tasks accepted before stop() still run
//   - isLoopThread() is false for every caller before start() and after
//     stop(), and safe to ask while start() is running
//   - RoomScheduler pins a product id to the same shard every time
//   - SequenceGenerator hands out unique ids under contention
// =============================================================================

#include "auction/concurrent/room_scheduler.hpp"
#include "auction/concurrent/sequence_generator.hpp"
#include "auction/concurrent/task_loop_thread.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

class TaskLoopThreadTest : public ::testing::Test {
 protected:
  void TearDown() override { loop.stop(); }

  auction::TaskLoopThread loop{"test-loop"};
};

// -----------------------------------------------------------------------------
// 1. Tasks run in post order, on the loop thread.
// Why: Room state has no lock; FIFO on one thread is the whole guarantee.
// -----------------------------------------------------------------------------
TEST_F(TaskLoopThreadTest, RunsTasksInOrderOnLoopThread) {
  loop.start();

  std::vector<int> order;
  std::promise<void> done;
  auto future = done.get_future();
  std::atomic<bool> on_loop{true};

  for (int i = 0; i < 100; ++i) {
    ASSERT_TRUE(loop.post([&, i] {
      if (!loop.isLoopThread()) {
        on_loop.store(false);
      }
      order.push_back(i);
      if (i == 99) {
        done.set_value();
      }
    }));
  }

  ASSERT_EQ(future.wait_for(1s), std::future_status::ready);
  EXPECT_TRUE(on_loop.load());
  EXPECT_FALSE(loop.isLoopThread());

  ASSERT_EQ(order.size(), 100u);
  for (int i = 0; i < 100; ++i) {
    EXPECT_EQ(order[i], i);
  }
}

// -----------------------------------------------------------------------------
// 2. A task that throws does not stop later tasks.
// Why: Many rooms share a shard; one bad task must not freeze them all.
// -----------------------------------------------------------------------------
TEST_F(TaskLoopThreadTest, ThrowingTaskDoesNotKillLoop) {
  loop.start();

  std::promise<void> done;
  auto future = done.get_future();

  loop.post([] { throw std::runtime_error("boom"); });
  loop.post([&done] { done.set_value(); });

  EXPECT_EQ(future.wait_for(1s), std::future_status::ready);
}

// -----------------------------------------------------------------------------
// 3. post() is refused when the loop is not running.
// -----------------------------------------------------------------------------
TEST_F(TaskLoopThreadTest, PostRefusedWhenNotRunning) {
  EXPECT_FALSE(loop.post([] {}));

  loop.start();
  EXPECT_TRUE(loop.running());
  loop.stop();

  EXPECT_FALSE(loop.running());
  EXPECT_FALSE(loop.post([] {}));
}

// -----------------------------------------------------------------------------
// 4. A full bounded mailbox refuses instead of blocking the poster.
// -----------------------------------------------------------------------------
TEST(TaskLoopThreadBoundedTest, FullMailboxRefusesPost) {
  auction::TaskLoopThread bounded("bounded", 2);
  bounded.start();

  std::promise<void> release;
  std::shared_future<void> gate = release.get_future().share();
  std::promise<void> blocked;
  auto blocked_future = blocked.get_future();

  // Occupy the worker so the mailbox can fill up.
  ASSERT_TRUE(bounded.post([gate, &blocked] {
    blocked.set_value();
    gate.wait();
  }));
  ASSERT_EQ(blocked_future.wait_for(1s), std::future_status::ready);

  EXPECT_TRUE(bounded.post([] {}));
  EXPECT_TRUE(bounded.post([] {}));
  EXPECT_FALSE(bounded.post([] {}));
  EXPECT_EQ(bounded.pendingTasks(), 2u);

  release.set_value();
  bounded.stop();
  EXPECT_EQ(bounded.pendingTasks(), 0u);
}

// -----------------------------------------------------------------------------
// 5. Tasks already in the mailbox when stop() is called still run.
// Why: A caller blocked in Room::call() on such a task must get its answer.
// -----------------------------------------------------------------------------
TEST_F(TaskLoopThreadTest, StopDrainsAcceptedTasks) {
  loop.start();

  std::promise<void> release;
  std::shared_future<void> gate = release.get_future().share();
  std::atomic<int> ran{0};

  loop.post([gate] { gate.wait(); });
  for (int i = 0; i < 10; ++i) {
    loop.post([&ran] { ran.fetch_add(1); });
  }

  std::thread stopper([this] { loop.stop(); });
  std::this_thread::sleep_for(20ms);
  release.set_value();
  stopper.join();

  EXPECT_EQ(ran.load(), 10);
}

// -----------------------------------------------------------------------------
// 6. RoomScheduler maps a product id to a stable shard.
// -----------------------------------------------------------------------------
TEST(RoomSchedulerTest, ProductPinnedToOneShard) {
  auction::RoomScheduler scheduler(4);
  EXPECT_EQ(scheduler.shardCount(), 4u);

  auction::TaskLoopThread& first = scheduler.loopFor("lamp");
  for (int i = 0; i < 10; ++i) {
    EXPECT_EQ(&scheduler.loopFor("lamp"), &first);
  }

  std::set<auction::TaskLoopThread*> distinct;
  for (int i = 0; i < 64; ++i) {
    distinct.insert(&scheduler.loopFor("product-" + std::to_string(i)));
  }
  EXPECT_GT(distinct.size(), 1u);
}

// -----------------------------------------------------------------------------
// 7. shard_count == 0 picks at least one shard; tasks run after start().
// -----------------------------------------------------------------------------
TEST(RoomSchedulerTest, AutoShardCountRunsTasks) {
  auction::RoomScheduler scheduler(0);
  EXPECT_GE(scheduler.shardCount(), 1u);
  scheduler.start();

  std::promise<void> done;
  auto future = done.get_future();
  ASSERT_TRUE(scheduler.loopFor("vase").post([&done] { done.set_value(); }));
  EXPECT_EQ(future.wait_for(1s), std::future_status::ready);

  scheduler.stop();
}

// -----------------------------------------------------------------------------
// 8. SequenceGenerator: ids start at 1 and are unique across threads.
// Why: Connection ids key the hub's session map and the room's fan-out.
// -----------------------------------------------------------------------------
TEST(SequenceGeneratorTest, UniqueAcrossThreads) {
  auction::SequenceGenerator ids;
  EXPECT_EQ(ids.next_id(), 1u);

  std::mutex mutex;
  std::set<std::uint64_t> seen;
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < 500; ++i) {
        auto id = ids.next_id();
        std::lock_guard lock(mutex);
        seen.insert(id);
      }
    });
  }
  for (auto& t : threads) t.join();

  EXPECT_EQ(seen.size(), 2000u);
  EXPECT_EQ(seen.count(1u), 0u);
}

// -----------------------------------------------------------------------------
// 9. isLoopThread() outside the worker's lifetime, and racing with start().
// Why: Room::call() asks it from client threads that may run while the
// scheduler is still starting.
// -----------------------------------------------------------------------------
TEST_F(TaskLoopThreadTest, IsLoopThreadOutsideWorkerLifetime) {
  EXPECT_FALSE(loop.isLoopThread());

  std::atomic<bool> go{false};
  std::atomic<bool> saw_loop_thread{false};
  std::thread asker([&] {
    while (!go.load()) {
      std::this_thread::yield();
    }
    for (int i = 0; i < 1000; ++i) {
      if (loop.isLoopThread()) {
        saw_loop_thread.store(true);
      }
    }
  });

  go.store(true);
  loop.start();
  asker.join();
  EXPECT_FALSE(saw_loop_thread.load());

  std::promise<bool> inside;
  auto future = inside.get_future();
  ASSERT_TRUE(loop.post([&] { inside.set_value(loop.isLoopThread()); }));
  ASSERT_EQ(future.wait_for(1s), std::future_status::ready);
  EXPECT_TRUE(future.get());

  loop.stop();
  EXPECT_FALSE(loop.isLoopThread());
}
