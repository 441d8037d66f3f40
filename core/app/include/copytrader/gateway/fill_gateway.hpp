#pragma once

#include "copytrader/domain/fill.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <string>
#include <vector>

namespace copytrader {

// -----------------------------------------------------------------------------
// FillGateway - ZeroMQ bridge for the followed account's fills
// -----------------------------------------------------------------------------
//
// @brief  Listens on a ZeroMQ SUB socket for JSON-encoded venue fills and
//         hands each decoded message to a batch sink.
//
// @details
// An external watcher polls the venue for the followed account and
// publishes what it sees on tcp://127.0.0.1:5555. A message is either one
// fill object or an array of them (see codec/fill_codec.hpp for the
// layout). Each message becomes exactly one sink call, so the ordering the
// publisher saw is the ordering the engine processes.
//
// Malformed messages (bad JSON, missing fields, unknown side code,
// non-positive price) are logged to stderr and skipped whole.
//
// Thread model:
//   run() blocks the calling thread; main() runs it on the main thread.
//   stop() may be called from any thread, including a signal handler: it
//   only stores an atomic flag, observed within kRecvTimeoutMs.
//
// Ownership:
//   Owns the zmq::context_t and zmq::socket_t (RAII). Holds a copy of the
//   sink callback.
// -----------------------------------------------------------------------------
class FillGateway {
 public:
  using BatchSink = std::function<void(std::vector<domain::Fill>)>;

  explicit FillGateway(BatchSink sink,
                       const std::string& endpoint = "tcp://127.0.0.1:5555");

  ~FillGateway() = default;

  FillGateway(const FillGateway&) = delete;
  FillGateway& operator=(const FillGateway&) = delete;
  FillGateway(FillGateway&&) = delete;
  FillGateway& operator=(FillGateway&&) = delete;

  // Blocking recv loop. Returns after stop(), at once if stop() already ran.
  void run();

  void stop();

  // -------------------------------------------------------------------------
  // handlePayload(payload)
  // -------------------------------------------------------------------------
  // @brief  Decodes one message and forwards it to the sink.
  //
  // @return false if the payload was malformed and dropped.
  //
  // Called by run() for every message; public so the decode-and-dispatch
  // path can be exercised without a publisher.
  // -------------------------------------------------------------------------
  bool handlePayload(const std::string& payload);

 private:
  static constexpr int kRecvTimeoutMs = 100;

  BatchSink sink_;

  zmq::context_t context_{1};
  zmq::socket_t socket_{context_, zmq::socket_type::sub};

  std::atomic<bool> running_{false};
};

}  // namespace copytrader
