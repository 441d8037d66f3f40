#pragma once

#include "copytrader/config/app_config.hpp"
#include "copytrader/domain/fill.hpp"
#include "copytrader/ingest/fill_filter.hpp"
#include "copytrader/network/ipc_server.hpp"
#include "copytrader/persistence/jsonl_trade_store.hpp"
#include "copytrader/session/paper_trading_session.hpp"
#include "copytrader/time/i_time_provider.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace copytrader {

// -----------------------------------------------------------------------------
// CopyTradingEngine
// -----------------------------------------------------------------------------
//
// @brief  Root object of the copy trader: wires ingestion, the paper
//         trading session, persistence and the IPC server.
//
// @details
// Provides a start/stop lifecycle so main() and tests can run the whole
// stack without wiring internals.
//
// Data flow:
//
//   FillGateway (main thread)
//        │ submitFills(batch)
//        ▼
//   FillFilter ──► PaperTradingSession::processFill (per fill)
//                        │ ITradeSink
//                        ├──► JsonlTradeStore   (fills/, accounts/)
//                        └──► IpcServer queue   (PUB telemetry)
//
//   IpcServer thread ──► executeCommand("STATUS" | "TRADES n" | "PING")
//
// Every summary_interval committed trades the portfolio summary is printed;
// stop() prints it once more together with the most recent trades.
//
// Thread model:
//   Constructed, started and stopped on the main thread. submitFills() may
//   be called from any thread; batches are serialized by ingest_mutex_ so
//   the filter sees them in submission order. executeCommand() runs on the
//   IPC thread and only uses the session's locking readers.
//
// Ownership:
//   CopyTradingEngine
//    ├── config_        (AppConfig, value)
//    ├── clock_         (ITimeProvider&, non-owning)
//    ├── session_       (PaperTradingSession, value)
//    ├── filter_        (FillFilter, value)
//    ├── store_         (unique_ptr<JsonlTradeStore>, if persistence on)
//    └── ipc_server_    (unique_ptr<IpcServer>, when an endpoint is set)
//
// The store and server are attached to the session as sinks in start() and
// detached in stop() before they are destroyed.
// -----------------------------------------------------------------------------
class CopyTradingEngine {
 public:
  CopyTradingEngine(const AppConfig& config, const ITimeProvider& clock);

  ~CopyTradingEngine();

  CopyTradingEngine(const CopyTradingEngine&) = delete;
  CopyTradingEngine& operator=(const CopyTradingEngine&) = delete;
  CopyTradingEngine(CopyTradingEngine&&) = delete;
  CopyTradingEngine& operator=(CopyTradingEngine&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // @brief  Opens the trade store and binds the IPC server, then attaches
  //         both to the session. Idempotent.
  //
  // Side-effects: May create data_dir lazily on first write, binds sockets.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // @brief  Detaches and destroys the sinks, then prints the final summary
  //         and the last recent_trades_count trades. Idempotent.
  // -------------------------------------------------------------------------
  void stop();

  // -------------------------------------------------------------------------
  // submitFills(batch)
  // -------------------------------------------------------------------------
  // @brief  Filters one delivered batch and feeds the survivors to the
  //         session in order.
  //
  // @return Number of fills that passed the filter.
  // -------------------------------------------------------------------------
  std::size_t submitFills(const std::vector<domain::Fill>& batch);

  // Handles an IPC command and returns a JSON response string.
  std::string executeCommand(const std::string& cmd);

  PaperTradingSession& session() { return session_; }
  const PaperTradingSession& session() const { return session_; }
  const AppConfig& config() const { return config_; }
  bool isRunning() const { return running_; }

 private:
  AppConfig config_;
  const ITimeProvider& clock_;

  PaperTradingSession session_;

  std::mutex ingest_mutex_;
  FillFilter filter_;
  int last_summary_trades_{0};

  std::unique_ptr<JsonlTradeStore> store_;
  std::unique_ptr<IpcServer> ipc_server_;

  bool running_{false};
};

}  // namespace copytrader
