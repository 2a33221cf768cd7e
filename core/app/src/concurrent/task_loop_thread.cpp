#include "auction/concurrent/task_loop_thread.hpp"

#include <chrono>
#include <exception>
#include <iostream>
#include <utility>

namespace auction {

namespace {

// How long the worker waits on an empty mailbox before re-checking
// running_. Short enough that stop() is responsive.
constexpr auto kIdleWaitTimeout = std::chrono::milliseconds(10);

}  // namespace

TaskLoopThread::TaskLoopThread(std::string name, std::size_t mailbox_capacity)
    : name_(std::move(name)), mailbox_(mailbox_capacity) {}

TaskLoopThread::~TaskLoopThread() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void TaskLoopThread::start() {
  if (thread_.joinable()) {
    return;
  }

  // running_ must be true before the thread exists so the first loop check
  // and any post() racing with start() both see it.
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void TaskLoopThread::stop() {
  if (!thread_.joinable()) {
    return;
  }

  running_.store(false);
  thread_.join();
}

// -----------------------------------------------------------------------------
// post()
// -----------------------------------------------------------------------------
bool TaskLoopThread::post(Task task) {
  if (!running_.load()) {
    return false;
  }
  return mailbox_.try_push(std::move(task));
}

bool TaskLoopThread::isLoopThread() const {
  return std::this_thread::get_id() == worker_id_.load();
}

// -----------------------------------------------------------------------------
// run() — worker loop
// -----------------------------------------------------------------------------
void TaskLoopThread::run() {
  worker_id_.store(std::this_thread::get_id());

  while (running_.load()) {
    std::optional<Task> task = mailbox_.pop_for(kIdleWaitTimeout);
    if (task) {
      runTask(*task);
    }
  }

  // Drain: tasks accepted before stop() still run, so a caller waiting on a
  // posted task's result is never left without an answer.
  while (std::optional<Task> task = mailbox_.try_pop()) {
    runTask(*task);
  }
  worker_id_.store(std::thread::id{});
}

// -----------------------------------------------------------------------------
// runTask(): a throwing task must not take the loop (and every room pinned
// to it) down with it.
// -----------------------------------------------------------------------------
void TaskLoopThread::runTask(Task& task) {
  try {
    task();
  } catch (const std::exception& e) {
    std::cerr << "[TaskLoopThread:" << name_ << "] task failed: " << e.what()
              << "\n";
  }
}

}  // namespace auction
