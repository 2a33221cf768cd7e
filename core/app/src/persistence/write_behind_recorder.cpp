#include "auction/persistence/write_behind_recorder.hpp"

#include <chrono>
#include <exception>
#include <iostream>
#include <utility>

namespace auction {

namespace {

constexpr auto kIdleWaitTimeout = std::chrono::milliseconds(10);

}  // namespace

WriteBehindRecorder::WriteBehindRecorder(Sink sink, std::size_t capacity)
    : sink_(std::move(sink)), queue_(capacity == 0 ? 1 : capacity) {}

WriteBehindRecorder::~WriteBehindRecorder() { stop(); }

void WriteBehindRecorder::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

void WriteBehindRecorder::stop() {
  if (!thread_.joinable()) {
    return;
  }
  running_.store(false);
  thread_.join();
}

void WriteBehindRecorder::recordBid(const domain::ProductId& product_id,
                                    const domain::Bid& bid) {
  if (!queue_.try_push(Record{product_id, bid})) {
    failed_.fetch_add(1);
    std::cerr << "[WriteBehindRecorder] backlog full, dropped bid seq="
              << bid.sequence << " product=" << product_id << "\n";
  }
}

void WriteBehindRecorder::run() {
  while (running_.load()) {
    if (auto record = queue_.pop_for(kIdleWaitTimeout)) {
      write(*record);
    }
  }

  // Drain what was accepted before stop().
  while (auto record = queue_.try_pop()) {
    write(*record);
  }
}

void WriteBehindRecorder::write(const Record& record) {
  if (!sink_) {
    recorded_.fetch_add(1);
    return;
  }

  try {
    sink_(record.product_id, record.bid);
    recorded_.fetch_add(1);
  } catch (const std::exception& e) {
    failed_.fetch_add(1);
    std::cerr << "[WriteBehindRecorder] failed to record bid seq="
              << record.bid.sequence << " product=" << record.product_id
              << ": " << e.what() << "\n";
  }
}

}  // namespace auction
