#pragma once

#include "copytrader/aggregation/aggregation_settings.hpp"
#include "copytrader/aggregation/fill_aggregator.hpp"
#include "copytrader/domain/capital_limits.hpp"
#include "copytrader/domain/fill.hpp"
#include "copytrader/domain/paper_trade.hpp"
#include "copytrader/domain/position.hpp"
#include "copytrader/persistence/i_trade_sink.hpp"
#include "copytrader/reporting/portfolio_summary.hpp"
#include "copytrader/risk/exposure_guard.hpp"
#include "copytrader/time/i_time_provider.hpp"

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace copytrader {

// -----------------------------------------------------------------------------
// PaperTradingSession - the paper portfolio and its single entry point
// -----------------------------------------------------------------------------
//
// @brief  Owns every position, the pending aggregation buffers, the trade
//         history and the session totals, and sequences one fill at a time
//         through aggregation, capital checks, classification, PnL and the
//         ledger update.
//
// @details
// processFill() runs the whole pipeline under one mutex:
//
//   1. Zero-size fills are ignored.
//   2. FillAggregator buffers the fill; if no threshold is met, return.
//   3. A batch whose signed sizes cancel out is dropped (nothing to trade).
//   4. ExposureGuard applies the configured policy:
//        dynamic sizing  → resize to min(base, remaining) / vwap; a zero
//                          size skips the commit,
//        hard validation → reject if the resulting position would breach
//                          max exposure.
//      A skipped or rejected batch leaves no position, no trade record and
//      no count behind; its buffer is already cleared.
//   5. classifyAction(old, new).
//   6. realizedPnl() against the pre-trade position.
//   7. applyTrade() on the ledger.
//   8. last_price = last fill price of the batch.
//   9. Session totals and an appended PaperTrade record.
//  10. Trade line logged; attached ITradeSinks called. Sink failures are
//      logged and never undo steps 1–9.
//
// ProcessFill never throws for data-driven conditions and returns nothing:
// outcomes are observable only through the session state.
//
// Concurrency:
//   A single std::mutex protects all state and is held for the whole of
//   processFill(), including the sink calls. Commits are therefore
//   serialized globally, which keeps the cross-instrument exposure check
//   exact. Readers take the same mutex for the duration of their copy.
//
// Ownership:
//   Created once per session and passed by reference; there are no hidden
//   singletons, so independent sessions can coexist (tests rely on this).
//   Holds a reference to the clock and non-owning pointers to sinks; both
//   must outlive the session or be detached first.
// -----------------------------------------------------------------------------
class PaperTradingSession {
 public:
  PaperTradingSession(const domain::CapitalLimits& limits,
                      const AggregationSettings& aggregation,
                      const ITimeProvider& clock);

  PaperTradingSession(const PaperTradingSession&) = delete;
  PaperTradingSession& operator=(const PaperTradingSession&) = delete;
  PaperTradingSession(PaperTradingSession&&) = delete;
  PaperTradingSession& operator=(PaperTradingSession&&) = delete;

  // -------------------------------------------------------------------------
  // processFill(fill)
  // -------------------------------------------------------------------------
  // @brief  Feeds one fill through the pipeline described above.
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // Side-effects:  May create/modify a position, append a trade record,
  //                log one line and invoke the attached sinks.
  // -------------------------------------------------------------------------
  void processFill(const domain::Fill& fill);

  // Registers a persistence/telemetry hook. Not owned.
  void attachSink(ITradeSink& sink);
  void detachSink(ITradeSink& sink);

  // --- Read-only accessors (each takes the session lock) ---------------------
  std::optional<domain::Position> position(const std::string& coin) const;
  std::vector<domain::Position> positions() const;
  std::vector<domain::PaperTrade> tradeHistory() const;
  std::vector<domain::PaperTrade> recentTrades(std::size_t count) const;
  int totalTrades() const;
  double totalRealizedPnl() const;
  double availableCapital() const;
  double maxExposure() const;
  double currentExposure() const;
  double pendingVolume(const std::string& coin) const;
  std::size_t pendingFillCount(const std::string& coin) const;
  std::int64_t startTimeMs() const { return start_time_ms_; }
  const domain::CapitalLimits& limits() const { return guard_.limits(); }

  // -------------------------------------------------------------------------
  // summary()
  // -------------------------------------------------------------------------
  // @brief  Consistent snapshot of totals, capital, exposure and open
  //         positions, computed at call time.
  // -------------------------------------------------------------------------
  PortfolioSummary summary() const;

  // Reporting hooks. Pure readers.
  void printPortfolioSummary(std::ostream& os) const;
  void printRecentTrades(std::ostream& os, std::size_t count) const;

  // --- Run-time aggregation tuning -------------------------------------------
  void setVolumeThreshold(double threshold);
  void setMinTradeIntervalMs(std::int64_t interval_ms);

 private:
  // Steps 3–10. Caller holds mutex_.
  void commit(const AggregatedTrade& batch);

  // Returns the signed size to trade, or 0 if the batch must not commit.
  // Caller holds mutex_.
  double sizeTrade(const AggregatedTrade& batch) const;

  void notifySinks(const AggregatedTrade& batch,
                   const domain::PaperTrade& trade);

  AccountSnapshot buildAccountSnapshot() const;
  double totalUnrealizedPnl() const;

  mutable std::mutex mutex_;

  const ITimeProvider& clock_;
  const ExposureGuard guard_;
  FillAggregator aggregator_;

  PositionMap positions_;
  std::vector<domain::PaperTrade> trade_history_;
  double total_realized_pnl_{0.0};
  int total_trades_{0};
  const std::int64_t start_time_ms_;

  std::vector<ITradeSink*> sinks_;
};

}  // namespace copytrader
