#include "auction/timer/auction_timer.hpp"

#include <chrono>
#include <exception>
#include <iostream>
#include <utility>
#include <vector>

namespace auction {

namespace {

// How often the worker re-reads the clock. Bounds how late a deadline can
// fire and how quickly a simulated clock jump is noticed.
constexpr auto kPollInterval = std::chrono::milliseconds(5);

}  // namespace

AuctionTimer::AuctionTimer(const ITimeProvider& clock) : clock_(clock) {}

AuctionTimer::~AuctionTimer() { stop(); }

void AuctionTimer::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

void AuctionTimer::stop() {
  if (!thread_.joinable()) {
    return;
  }

  running_.store(false);
  wake_cv_.notify_all();
  thread_.join();

  std::lock_guard lock(mutex_);
  if (!schedule_.empty()) {
    std::cout << "[AuctionTimer] stopped with " << schedule_.size()
              << " pending timer(s) discarded.\n";
  }
  schedule_.clear();
  index_.clear();
}

AuctionTimer::TimerId AuctionTimer::schedule(std::int64_t deadline_ms,
                                             Callback callback) {
  TimerId id = 0;
  {
    std::lock_guard lock(mutex_);
    id = next_id_++;
    auto it = schedule_.emplace(deadline_ms, Entry{id, std::move(callback)});
    index_.emplace(id, it);
  }
  wake_cv_.notify_all();
  return id;
}

bool AuctionTimer::cancel(TimerId id) {
  std::lock_guard lock(mutex_);
  auto found = index_.find(id);
  if (found == index_.end()) {
    return false;
  }
  schedule_.erase(found->second);
  index_.erase(found);
  return true;
}

std::size_t AuctionTimer::pending() const {
  std::lock_guard lock(mutex_);
  return schedule_.size();
}

// -----------------------------------------------------------------------------
// run() — worker loop
// -----------------------------------------------------------------------------
void AuctionTimer::run() {
  while (running_.load()) {
    fireDue();

    std::unique_lock lock(mutex_);
    wake_cv_.wait_for(lock, kPollInterval,
                      [this] { return !running_.load(); });
  }
}

// -----------------------------------------------------------------------------
// fireDue()
// -----------------------------------------------------------------------------
void AuctionTimer::fireDue() {
  std::vector<Entry> due;
  {
    std::lock_guard lock(mutex_);
    const std::int64_t now = clock_.now_ms();
    auto end = schedule_.upper_bound(now);
    for (auto it = schedule_.begin(); it != end; ++it) {
      index_.erase(it->second.id);
      due.push_back(std::move(it->second));
    }
    schedule_.erase(schedule_.begin(), end);
  }

  // Callbacks run without the lock so they may schedule or cancel.
  for (auto& entry : due) {
    try {
      entry.callback();
    } catch (const std::exception& e) {
      std::cerr << "[AuctionTimer] timer " << entry.id
                << " callback failed: " << e.what() << "\n";
    }
  }
}

}  // namespace auction
