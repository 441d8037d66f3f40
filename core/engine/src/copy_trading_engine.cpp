#include "copytrader/engine/copy_trading_engine.hpp"
#include "copytrader/persistence/record_codec.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <sstream>
#include <stdexcept>

namespace copytrader {

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
CopyTradingEngine::CopyTradingEngine(const AppConfig& config,
                                     const ITimeProvider& clock)
    : config_(config),
      clock_(clock),
      session_(config.capital, config.aggregation, clock),
      filter_(config.feed.copy_threshold, config.feed.max_fills_per_batch,
              config.feed.dedup_window_ms) {}

CopyTradingEngine::~CopyTradingEngine() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void CopyTradingEngine::start() {
  if (running_) {
    return;
  }

  // ---  1) Persistence -----------------------------------------------------
  if (config_.persistence.enabled) {
    store_ = std::make_unique<JsonlTradeStore>(
        resolveDataDir(config_.persistence), clock_);
    session_.attachSink(*store_);
  }

  // ---  2) IPC server (commands + telemetry) -------------------------------
  if (config_.ipc.enabled()) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        clock_, config_.ipc.command_endpoint, config_.ipc.publish_endpoint);
    ipc_server_->start();
    session_.attachSink(*ipc_server_);
  }

  running_ = true;

  const auto& limits = config_.capital;
  std::cout << "[CopyTradingEngine] started. bankroll=$" << limits.bankroll
            << " leverage=" << limits.leverage << "x sizing="
            << (limits.dynamicSizingActive() ? "dynamic" : "validate")
            << " persistence="
            << (store_ ? store_->dataDir().string() : std::string("off"))
            << "\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void CopyTradingEngine::stop() {
  if (!running_) {
    return;
  }

  // ---  1) Stop IPC first: its thread calls executeCommand() ---------------
  if (ipc_server_) {
    session_.detachSink(*ipc_server_);
    ipc_server_.reset();
  }

  // ---  2) Persistence ------------------------------------------------------
  if (store_) {
    session_.detachSink(*store_);
    store_.reset();
  }

  running_ = false;

  // ---  3) Final report ----------------------------------------------------
  session_.printPortfolioSummary(std::cout);
  session_.printRecentTrades(std::cout, config_.reporting.recent_trades_count);

  std::cout << "[CopyTradingEngine] stopped.\n";
}

// -----------------------------------------------------------------------------
// submitFills(batch)
// -----------------------------------------------------------------------------
std::size_t CopyTradingEngine::submitFills(
    const std::vector<domain::Fill>& batch) {
  std::lock_guard lock(ingest_mutex_);

  std::vector<domain::Fill> accepted = filter_.filter(batch);
  for (const auto& fill : accepted) {
    session_.processFill(fill);
  }

  int interval = config_.reporting.summary_interval;
  if (interval > 0) {
    int trades = session_.totalTrades();
    if (trades / interval > last_summary_trades_ / interval) {
      session_.printPortfolioSummary(std::cout);
    }
    last_summary_trades_ = trades;
  }
  return accepted.size();
}

// -----------------------------------------------------------------------------
// executeCommand(): handle IPC command requests
// -----------------------------------------------------------------------------
std::string CopyTradingEngine::executeCommand(const std::string& cmd) {
  std::istringstream in(cmd);
  std::string verb;
  in >> verb;

  nlohmann::json response;

  if (verb == "PING") {
    response["status"] = "ok";
    response["response"] = "PONG";
  } else if (verb == "STATUS") {
    PortfolioSummary s = session_.summary();
    response["status"] = "ok";
    response["total_realized_pnl"] = s.total_realized_pnl;
    response["total_unrealized_pnl"] = s.total_unrealized_pnl;
    response["total_pnl"] = s.total_pnl;
    response["total_trades"] = s.total_trades;
    response["active_positions"] = s.active_positions;
    response["available_capital"] = s.available_capital;
    response["max_exposure"] = s.max_exposure;
    response["current_exposure"] = s.current_exposure;

    nlohmann::json positions_json = nlohmann::json::array();
    for (const auto& pos : s.positions) {
      nlohmann::json p;
      p["coin"] = pos.coin;
      p["size"] = pos.size;
      p["avg_entry_price"] = pos.avg_entry_price;
      p["last_price"] = pos.last_price;
      p["realized_pnl"] = pos.realized_pnl;
      p["unrealized_pnl"] = pos.unrealized_pnl;
      positions_json.push_back(std::move(p));
    }
    response["positions"] = std::move(positions_json);
  } else if (verb == "TRADES") {
    std::string arg;
    std::string extra;
    long long count = 10;
    if (in >> arg) {
      std::size_t used = 0;
      try {
        count = std::stoll(arg, &used);
      } catch (const std::logic_error&) {
        count = -1;
      }
      if (used != arg.size() || in >> extra) {
        count = -1;
      }
    }

    if (count < 0) {
      response["status"] = "error";
      response["response"] = "Usage: TRADES [n]";
    } else {
      nlohmann::json trades_json = nlohmann::json::array();
      for (const auto& trade :
           session_.recentTrades(static_cast<std::size_t>(count))) {
        trades_json.push_back(paperTradeToJson(trade));
      }
      response["status"] = "ok";
      response["trades"] = std::move(trades_json);
    }
  } else {
    response["status"] = "error";
    response["response"] = "Unknown command: " + cmd;
  }

  try {
    return response.dump();
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[CopyTradingEngine] cannot encode response: " << e.what()
              << "\n";
    return R"({"status":"error","response":"encoding failed"})";
  }
}

}  // namespace copytrader
