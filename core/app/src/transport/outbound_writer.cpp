#include "auction/transport/outbound_writer.hpp"

#include <chrono>
#include <exception>
#include <iostream>
#include <utility>

namespace auction {

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(20);

}  // namespace

OutboundWriter::OutboundWriter(std::shared_ptr<ConnectionHandle> handle,
                               ITransport& transport, ExitCallback on_exit)
    : handle_(std::move(handle)),
      transport_(transport),
      on_exit_(std::move(on_exit)) {}

OutboundWriter::~OutboundWriter() { stop(); }

void OutboundWriter::start() {
  if (thread_.joinable()) {
    return;
  }
  thread_ = std::thread([this] { run(); });
}

void OutboundWriter::stop() {
  stop_requested_.store(true);
  handle_->close();
  if (thread_.joinable()) {
    thread_.join();
  }
}

// -----------------------------------------------------------------------------
// run() — drain loop
// -----------------------------------------------------------------------------
void OutboundWriter::run() {
  bool transport_failed = false;

  while (true) {
    std::optional<RoomEvent> event = handle_->nextEvent(kPollInterval);

    if (event) {
      if (transport_failed) {
        // The connection is being torn down; discard the rest.
        continue;
      }
      try {
        transport_.send(handle_->id(), *event);
      } catch (const std::exception& e) {
        std::cerr << "[OutboundWriter] send to connection " << handle_->id()
                  << " failed: " << e.what() << "\n";
        transport_failed = true;
        handle_->close();
      }
      continue;
    }

    // nextEvent() returns nullopt at once when closed and drained.
    if (!handle_->isOpen() || stop_requested_.load()) {
      break;
    }
  }

  if (!stop_requested_.load() && on_exit_) {
    on_exit_(handle_->id());
  }
  finished_.store(true);
}

}  // namespace auction
