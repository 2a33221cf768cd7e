#pragma once

#include "auction/concurrent/thread_safe_queue.hpp"
#include "auction/persistence/i_bid_recorder.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <thread>

namespace auction {

// -----------------------------------------------------------------------------
// WriteBehindRecorder — asynchronous IBidRecorder decorator
// -----------------------------------------------------------------------------
//
// @brief  Queues accepted bids and hands them to a downstream sink on its own
//         thread, so rooms never wait on persistence.
//
// @details
// recordBid() only try_pushes onto a bounded ThreadSafeQueue and never blocks
// the room. History is best effort: when storage falls so far behind that
// the queue is full, the record is dropped, logged to stderr and counted in
// failed(). The worker pops each record and calls the sink. A sink that
// throws is counted the same way and the worker moves on to the next record.
// Bidders never see persistence errors.
//
// Thread model:
//   recordBid() from any thread. The sink runs only on the worker thread, so
//   it needs no synchronization of its own.
//
// Lifecycle:
//   start() spawns the worker; stop() lets it drain what is already queued,
//   then joins. Records pushed after stop() stay queued until the next
//   start().
// -----------------------------------------------------------------------------
class WriteBehindRecorder final : public IBidRecorder {
 public:
  using Sink =
      std::function<void(const domain::ProductId&, const domain::Bid&)>;

  static constexpr std::size_t kDefaultCapacity = 65536;

  // @param  capacity  Maximum records waiting for the sink; must be > 0.
  explicit WriteBehindRecorder(Sink sink,
                               std::size_t capacity = kDefaultCapacity);

  ~WriteBehindRecorder() override;

  WriteBehindRecorder(const WriteBehindRecorder&) = delete;
  WriteBehindRecorder& operator=(const WriteBehindRecorder&) = delete;

  void start();
  void stop();

  void recordBid(const domain::ProductId& product_id,
                 const domain::Bid& bid) override;

  // Records the sink accepted, and records lost (sink threw or the queue
  // was full). Monotonic counters.
  std::uint64_t recorded() const { return recorded_.load(); }
  std::uint64_t failed() const { return failed_.load(); }

  std::size_t backlog() const { return queue_.size(); }

 private:
  struct Record {
    domain::ProductId product_id;
    domain::Bid bid;
  };

  void run();
  void write(const Record& record);

  Sink sink_;
  ThreadSafeQueue<Record> queue_;

  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> recorded_{0};
  std::atomic<std::uint64_t> failed_{0};
  std::thread thread_;
};

}  // namespace auction
