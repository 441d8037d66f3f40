#include "copytrader/gateway/fill_gateway.hpp"
#include "copytrader/codec/fill_codec.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <stdexcept>
#include <utility>

namespace copytrader {

// -----------------------------------------------------------------------------
// Constructor: create ZMQ SUB socket with receive timeout
// -----------------------------------------------------------------------------
FillGateway::FillGateway(BatchSink sink, const std::string& endpoint)
    : sink_(std::move(sink)) {
  socket_.set(zmq::sockopt::subscribe, "");

  // Without a receive timeout recv() never returns on a quiet feed and
  // stop() would never be observed.
  socket_.set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);

  socket_.connect(endpoint);

  // Armed here, not in run(): a stop() that lands between signal handler
  // installation and run() must still end the loop.
  running_.store(true);
}

// -----------------------------------------------------------------------------
// run(): blocking recv loop
// -----------------------------------------------------------------------------
void FillGateway::run() {
  while (running_.load()) {
    zmq::message_t msg;
    zmq::recv_result_t result;

    try {
      result = socket_.recv(msg, zmq::recv_flags::none);
    } catch (const zmq::error_t& e) {
      // A signal interrupted recv; loop round and re-check the flag.
      if (e.num() == EINTR) {
        continue;
      }
      throw;
    }

    if (!result.has_value()) {
      continue;
    }

    handlePayload(msg.to_string());
  }
}

void FillGateway::stop() { running_.store(false); }

bool FillGateway::handlePayload(const std::string& payload) {
  std::vector<domain::Fill> fills;
  try {
    fills = codec::decodeFills(payload);
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[FillGateway] JSON error: " << e.what()
              << " payload: " << payload << "\n";
    return false;
  } catch (const std::invalid_argument& e) {
    std::cerr << "[FillGateway] invalid fill: " << e.what()
              << " payload: " << payload << "\n";
    return false;
  }

  if (!fills.empty()) {
    sink_(std::move(fills));
  }
  return true;
}

}  // namespace copytrader
