#include "copytrader/network/ipc_server.hpp"
#include "copytrader/persistence/record_codec.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <iostream>
#include <utility>

namespace copytrader {

// -----------------------------------------------------------------------------
// Constructor: store parameters for deferred socket creation
// -----------------------------------------------------------------------------
IpcServer::IpcServer(CommandHandler command_handler,
                     const ITimeProvider& clock, std::string cmd_endpoint,
                     std::string pub_endpoint,
                     std::size_t telemetry_capacity)
    : command_handler_(std::move(command_handler)),
      clock_(clock),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)),
      telemetry_queue_(telemetry_capacity) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): create sockets and spawn worker thread
// -----------------------------------------------------------------------------
void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);

  if (!cmd_endpoint_.empty()) {
    cmd_socket_ =
        std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
    cmd_socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
    cmd_socket_->bind(cmd_endpoint_);
  }
  if (!pub_endpoint_.empty()) {
    pub_socket_ =
        std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);
    pub_socket_->bind(pub_endpoint_);
  }

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] started. CMD="
            << (cmd_endpoint_.empty() ? "disabled" : cmd_endpoint_)
            << " PUB=" << (pub_endpoint_.empty() ? "disabled" : pub_endpoint_)
            << "\n";
}

// -----------------------------------------------------------------------------
// stop(): signal and join
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

// -----------------------------------------------------------------------------
// ITradeSink: called by the session under its lock, so enqueue and return
// -----------------------------------------------------------------------------
void IpcServer::saveFill(const domain::Fill& fill,
                         domain::PositionAction action, double realized_pnl,
                         double unrealized_pnl) {
  FillRecord record;
  record.time_ms = clock_.now_ms();
  record.fill = fill;
  record.action = action;
  record.realized_pnl = realized_pnl;
  record.unrealized_pnl = unrealized_pnl;
  pushTelemetry(std::move(record));
}

void IpcServer::saveAccount(const AccountSnapshot& snapshot) {
  pushTelemetry(snapshot);
}

void IpcServer::pushTelemetry(TelemetryEvent event) {
  telemetry_queue_.push(std::move(event));
}

// -----------------------------------------------------------------------------
// run(): combined poll/drain loop
// -----------------------------------------------------------------------------
void IpcServer::run() {
  while (running_.load()) {
    processTelemetry();
    if (cmd_socket_) {
      processCommands();
    } else {
      std::this_thread::sleep_for(std::chrono::milliseconds(kPollTimeoutMs));
    }
  }

  // Final drain: publish whatever the last commits produced.
  processTelemetry();
}

void IpcServer::processTelemetry() {
  std::uint64_t dropped = telemetry_queue_.dropped();
  if (dropped != reported_drops_) {
    std::cerr << "[IpcServer] telemetry queue full, dropped "
              << (dropped - reported_drops_) << " oldest event(s)\n";
    reported_drops_ = dropped;
  }

  for (const auto& event : telemetry_queue_.drain()) {
    if (!pub_socket_) {
      continue;
    }
    std::string json_str;
    try {
      json_str = formatTelemetry(event);
    } catch (const nlohmann::json::exception& e) {
      std::cerr << "[IpcServer] cannot encode telemetry: " << e.what()
                << "\n";
      continue;
    }
    zmq::message_t msg(json_str.data(), json_str.size());
    pub_socket_->send(msg, zmq::send_flags::dontwait);
  }
}

// -----------------------------------------------------------------------------
// processCommands(): poll REP socket and dispatch
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

  std::string cmd(static_cast<const char*>(request.data()), request.size());
  std::string response = command_handler_(cmd);

  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

// -----------------------------------------------------------------------------
// formatTelemetry(): tag the record with its type
// -----------------------------------------------------------------------------
std::string IpcServer::formatTelemetry(const TelemetryEvent& event) {
  nlohmann::json j;
  if (auto* record = std::get_if<FillRecord>(&event)) {
    j = fillRecordToJson(*record);
    j["type"] = "fill";
  } else {
    j = accountSnapshotToJson(std::get<AccountSnapshot>(event));
    j["type"] = "account";
  }
  return j.dump();
}

}  // namespace copytrader
