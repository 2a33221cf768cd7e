#include "auction/network/ipc_server.hpp"

#include "auction/wire/message_codec.hpp"

#include <iostream>
#include <utility>

namespace auction {

IpcServer::IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void IpcServer::start() {
  if (running_.load()) {
    return;
  }
  if (thread_.joinable()) {
    thread_.join();  // Left over from a loop that ended on a socket error
  }

  context_ = std::make_unique<zmq::context_t>(1);
  cmd_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  pub_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

  cmd_socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  cmd_socket_->set(zmq::sockopt::linger, 0);
  pub_socket_->set(zmq::sockopt::linger, 0);
  cmd_socket_->bind(cmd_endpoint_);
  pub_socket_->bind(pub_endpoint_);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] started. CMD=" << cmd_endpoint_
            << " PUB=" << pub_endpoint_ << "\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void IpcServer::stop() {
  if (!running_.load()) {
    if (thread_.joinable()) {
      thread_.join();
    }
    return;
  }

  running_.store(false);
  if (thread_.joinable()) {
    thread_.join();
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] stopped.\n";
}

void IpcServer::pushTelemetry(RoomEvent event) {
  telemetry_queue_.push(std::move(event));
}

// -----------------------------------------------------------------------------
// run()
// -----------------------------------------------------------------------------
void IpcServer::run() {
  try {
    while (running_.load()) {
      processTelemetry();
      processCommands();
    }
    processTelemetry();
  } catch (const zmq::error_t& e) {
    std::cerr << "[IpcServer] socket error, admin surface down: " << e.what()
              << "\n";
    running_.store(false);
  }
}

// -----------------------------------------------------------------------------
// processTelemetry(): [product_id][json] per event
// -----------------------------------------------------------------------------
void IpcServer::processTelemetry() {
  while (auto event = telemetry_queue_.try_pop()) {
    const domain::ProductId& topic = productOf(*event);
    const std::string json = MessageCodec::encodeEvent(*event);

    zmq::message_t topic_frame(topic.data(), topic.size());
    zmq::message_t body(json.data(), json.size());
    // No subscriber connected: PUB drops silently, which is what we want.
    pub_socket_->send(topic_frame,
                      zmq::send_flags::sndmore | zmq::send_flags::dontwait);
    pub_socket_->send(body, zmq::send_flags::dontwait);
  }
}

// -----------------------------------------------------------------------------
// processCommands(): one request, one reply
// -----------------------------------------------------------------------------
void IpcServer::processCommands() {
  zmq::message_t request;
  zmq::recv_result_t result;

  try {
    result = cmd_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }

  if (!result.has_value()) {
    return;
  }

  std::string response;
  try {
    response = command_handler_(request.to_string());
  } catch (const std::exception& e) {
    std::cerr << "[IpcServer] command failed: " << e.what() << "\n";
    response = R"({"status":"error","response":"internal error"})";
  }

  // REP must answer every request before it can receive the next one.
  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

}  // namespace auction
