#pragma once

#include "auction/concurrent/thread_safe_queue.hpp"

#include <atomic>
#include <cstddef>
#include <functional>
#include <string>
#include <thread>

namespace auction {

// -----------------------------------------------------------------------------
// TaskLoopThread
// -----------------------------------------------------------------------------
// Responsibility: Owns a single worker thread that drains a bounded mailbox of
// tasks and runs them one at a time, in the order they were posted. Anything
// that runs on the loop is therefore serialized with everything else posted
// to the same loop.
//
// Why in architecture: This is the serialization point of a room. Every
// state-mutating room operation (attach, detach, submitBid, open, close,
// retire) is posted here as a task, so the room's state is only ever touched
// by this thread and needs no lock of its own.
//
// Thread model: The worker runs in the owned std::thread. start() and stop()
// may be called from any thread except the worker itself. post() is
// thread-safe.
// -----------------------------------------------------------------------------
class TaskLoopThread {
 public:
  using Task = std::function<void()>;

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  name              Used only to prefix log lines.
  // @param  mailbox_capacity  Maximum queued tasks; 0 = unbounded.
  // -------------------------------------------------------------------------
  explicit TaskLoopThread(std::string name = "loop",
                          std::size_t mailbox_capacity = 0);

  // Stops and joins the worker so it never outlives the mailbox.
  ~TaskLoopThread();

  TaskLoopThread(const TaskLoopThread&) = delete;
  TaskLoopThread& operator=(const TaskLoopThread&) = delete;
  TaskLoopThread(TaskLoopThread&&) = delete;
  TaskLoopThread& operator=(TaskLoopThread&&) = delete;

  // Starts the worker. Idempotent.
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // What: Stops accepting tasks, lets the worker run whatever is already in
  // the mailbox, then joins it. Idempotent.
  // -------------------------------------------------------------------------
  void stop();

  // -------------------------------------------------------------------------
  // post(task)
  // -------------------------------------------------------------------------
  // What: Enqueues a task for the worker. Never blocks.
  // Output: false if the loop is not running or the mailbox is full; the
  // task is then dropped and the caller decides how to report it.
  // -------------------------------------------------------------------------
  bool post(Task task);

  // True when called from this loop's worker thread.
  bool isLoopThread() const;

  bool running() const { return running_.load(); }

  std::size_t pendingTasks() const { return mailbox_.size(); }

 private:
  void run();
  void runTask(Task& task);

  std::string name_;
  ThreadSafeQueue<Task> mailbox_;

  // running_ gates post(); the worker exits its loop when it turns false.
  std::atomic<bool> running_{false};

  std::thread thread_;

  // Set by the worker itself, so isLoopThread() never reads thread_ while
  // start() is assigning it.
  std::atomic<std::thread::id> worker_id_{};
};

}  // namespace auction
