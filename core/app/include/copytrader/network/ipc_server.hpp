#pragma once

#include "copytrader/concurrent/bounded_queue.hpp"
#include "copytrader/events/telemetry_event.hpp"
#include "copytrader/persistence/i_trade_sink.hpp"
#include "copytrader/time/i_time_provider.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace copytrader {

// -----------------------------------------------------------------------------
// IpcServer - ZeroMQ command and telemetry endpoint
// -----------------------------------------------------------------------------
//
// @brief  Runs a dedicated thread that answers status commands (REP socket)
//         and broadcasts committed fills and account snapshots (PUB socket).
//
// @details
// Two sockets share one worker thread:
//
//   1. REP socket (default tcp://127.0.0.1:5556):
//      Each request is a command string ("PING", "STATUS", "TRADES 5").
//      It is forwarded to command_handler_ (bound to
//      CopyTradingEngine::executeCommand()) and the JSON reply is sent back.
//
//   2. PUB socket (default tcp://127.0.0.1:5557):
//      Publishes one JSON message per TelemetryEvent:
//        {"type":"fill", ...fill record fields...}
//        {"type":"account", ...account snapshot fields...}
//
// The server is an ITradeSink: PaperTradingSession calls saveFill() and
// saveAccount() while holding its lock, so both only enqueue. Encoding and
// socket I/O happen on the IPC thread.
//
// An empty endpoint disables that socket. With no PUB socket, queued
// telemetry is drained and discarded.
//
// Thread model:
//   start() and stop() are called from the owning thread. saveFill() and
//   saveAccount() are safe from any thread. command_handler_ runs on the
//   IPC thread.
//
// Ownership:
//   Owned by CopyTradingEngine via std::unique_ptr. Owns the ZMQ context,
//   sockets, queue and worker thread. Holds a reference to the clock.
// -----------------------------------------------------------------------------
class IpcServer final : public ITradeSink {
 public:
  static constexpr std::size_t kDefaultTelemetryCapacity = 4096;

  using CommandHandler = std::function<std::string(const std::string&)>;

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  command_handler  Invoked for each REP request; returns JSON.
  // @param  clock            Stamps fill records with their publish time.
  // @param  cmd_endpoint     REP bind address, empty to disable.
  // @param  pub_endpoint     PUB bind address, empty to disable.
  // @param  telemetry_capacity  Events held for a slow PUB side before the
  //                             oldest are dropped.
  //
  // No sockets are opened here. Call start().
  // -------------------------------------------------------------------------
  IpcServer(CommandHandler command_handler, const ITimeProvider& clock,
            std::string cmd_endpoint = "tcp://127.0.0.1:5556",
            std::string pub_endpoint = "tcp://127.0.0.1:5557",
            std::size_t telemetry_capacity = kDefaultTelemetryCapacity);

  ~IpcServer() override;

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // @brief  Binds the enabled sockets and spawns the worker thread.
  //
  // Idempotent. Throws zmq::error_t if a bind fails (address in use).
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // @brief  Signals the worker, joins it after a final telemetry drain and
  //         closes the sockets. Idempotent; safe if never started.
  // -------------------------------------------------------------------------
  void stop();

  // ITradeSink: enqueue only.
  void saveFill(const domain::Fill& fill, domain::PositionAction action,
                double realized_pnl, double unrealized_pnl) override;
  void saveAccount(const AccountSnapshot& snapshot) override;

  void pushTelemetry(TelemetryEvent event);

  // Events waiting for the worker. For tests and shutdown diagnostics.
  std::size_t pendingTelemetry() const { return telemetry_queue_.size(); }

  // Events evicted because the queue was full.
  std::uint64_t droppedTelemetry() const { return telemetry_queue_.dropped(); }

  // Converts a telemetry event to its wire JSON.
  static std::string formatTelemetry(const TelemetryEvent& event);

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void processTelemetry();
  void processCommands();

  CommandHandler command_handler_;
  const ITimeProvider& clock_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  BoundedQueue<TelemetryEvent> telemetry_queue_;
  std::uint64_t reported_drops_{0};  // worker thread only
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace copytrader
