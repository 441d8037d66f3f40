#include "copytrader/session/paper_trading_session.hpp"
#include "copytrader/accounting/action_classifier.hpp"
#include "copytrader/accounting/pnl_calculator.hpp"
#include "copytrader/accounting/position_ledger.hpp"
#include "copytrader/reporting/portfolio_reporter.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <iostream>

namespace copytrader {

PaperTradingSession::PaperTradingSession(const domain::CapitalLimits& limits,
                                         const AggregationSettings& aggregation,
                                         const ITimeProvider& clock)
    : clock_(clock),
      guard_(limits),
      aggregator_(aggregation, clock),
      start_time_ms_(clock.now_ms()) {}

// -----------------------------------------------------------------------------
// processFill
// -----------------------------------------------------------------------------
void PaperTradingSession::processFill(const domain::Fill& fill) {
  std::lock_guard lock(mutex_);

  if (fill.size == 0.0) {
    return;
  }

  auto batch = aggregator_.addFill(fill);
  if (!batch) {
    return;
  }
  commit(*batch);
}

void PaperTradingSession::attachSink(ITradeSink& sink) {
  std::lock_guard lock(mutex_);
  if (std::find(sinks_.begin(), sinks_.end(), &sink) == sinks_.end()) {
    sinks_.push_back(&sink);
  }
}

void PaperTradingSession::detachSink(ITradeSink& sink) {
  std::lock_guard lock(mutex_);
  sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), &sink), sinks_.end());
}

// -----------------------------------------------------------------------------
// sizeTrade: capital policy for one committed batch
// -----------------------------------------------------------------------------
double PaperTradingSession::sizeTrade(const AggregatedTrade& batch) const {
  if (guard_.limits().dynamicSizingActive()) {
    double quantity = guard_.calculateDynamicTradeSize(
        positions_, total_realized_pnl_, batch.vwap);
    if (quantity <= 0.0) {
      std::cerr << "[PaperTradingSession] No exposure headroom for "
                << batch.coin << ", skipping batch of " << batch.fills.size()
                << " fills" << std::endl;
      return 0.0;
    }
    return batch.signed_size < 0.0 ? -quantity : quantity;
  }

  double old_size = 0.0;
  auto it = positions_.find(batch.coin);
  if (it != positions_.end()) {
    old_size = it->second.size;
  }

  double resulting = old_size + batch.signed_size;
  if (!guard_.validatePositionSize(positions_, total_realized_pnl_,
                                   batch.coin, resulting, batch.vwap)) {
    std::cerr << "[PaperTradingSession] Rejected " << batch.coin
              << " trade of " << batch.signed_size << " @ " << batch.vwap
              << ": exceeds max exposure "
              << guard_.maxExposure(positions_, total_realized_pnl_)
              << std::endl;
    return 0.0;
  }
  return batch.signed_size;
}

// -----------------------------------------------------------------------------
// commit
// -----------------------------------------------------------------------------
void PaperTradingSession::commit(const AggregatedTrade& batch) {
  if (batch.signed_size == 0.0) {
    std::cerr << "[PaperTradingSession] " << batch.coin << " batch of "
              << batch.fills.size() << " fills nets to zero, nothing to trade"
              << std::endl;
    return;
  }

  double trade_size = sizeTrade(batch);
  if (trade_size == 0.0) {
    return;
  }

  auto [it, inserted] = positions_.try_emplace(batch.coin);
  domain::Position& pos = it->second;
  if (inserted) {
    pos.coin = batch.coin;
  }

  double old_size = pos.size;
  double new_size = old_size + trade_size;
  domain::PositionAction action =
      accounting::classifyAction(old_size, new_size);

  // The venue figure covers the followed account's quantity. A resized
  // paper trade only realizes its own share of it.
  double venue_pnl = batch.venue_closed_pnl;
  if (trade_size != batch.signed_size) {
    venue_pnl *= std::abs(trade_size) / std::abs(batch.signed_size);
  }

  double realized = accounting::realizedPnl(pos, trade_size, batch.vwap,
                                            venue_pnl, action);

  accounting::applyTrade(pos, trade_size, batch.vwap, realized,
                         clock_.now_ms());
  pos.last_price = batch.last_price;

  total_realized_pnl_ += realized;
  ++total_trades_;

  domain::PaperTrade trade;
  trade.timestamp_ms = batch.last_fill_time_ms;
  trade.coin = batch.coin;
  trade.action = action;
  trade.side = trade_size < 0.0 ? domain::Side::Sell : domain::Side::Buy;
  trade.size = std::abs(trade_size);
  trade.price = batch.vwap;
  trade.realized_pnl = realized;
  trade.position_size = pos.size;
  trade.unrealized_pnl = accounting::unrealizedPnl(pos);
  trade_history_.push_back(trade);

  std::cout << "[PaperTradingSession] " << reporting::formatTradeLine(trade)
            << std::endl;

  notifySinks(batch, trade);
}

// -----------------------------------------------------------------------------
// notifySinks: persistence and telemetry, after the state is final
// -----------------------------------------------------------------------------
void PaperTradingSession::notifySinks(const AggregatedTrade& batch,
                                      const domain::PaperTrade& trade) {
  if (sinks_.empty()) {
    return;
  }

  AccountSnapshot snapshot = buildAccountSnapshot();
  for (ITradeSink* sink : sinks_) {
    try {
      for (const auto& fill : batch.fills) {
        sink->saveFill(fill, trade.action, trade.realized_pnl,
                       trade.unrealized_pnl);
      }
      sink->saveAccount(snapshot);
    } catch (const std::exception& e) {
      std::cerr << "[PaperTradingSession] Trade sink failed for "
                << trade.coin << ": " << e.what() << std::endl;
    }
  }
}

double PaperTradingSession::totalUnrealizedPnl() const {
  double unrealized = 0.0;
  for (const auto& [coin, pos] : positions_) {
    if (!pos.isFlat()) {
      unrealized += accounting::unrealizedPnl(pos);
    }
  }
  return unrealized;
}

AccountSnapshot PaperTradingSession::buildAccountSnapshot() const {
  AccountSnapshot snapshot;
  snapshot.time_ms = clock_.now_ms();
  snapshot.realized_pnl = total_realized_pnl_;
  snapshot.unrealized_pnl = totalUnrealizedPnl();
  snapshot.total_pnl = snapshot.realized_pnl + snapshot.unrealized_pnl;
  snapshot.num_trades = total_trades_;
  snapshot.available_capital =
      guard_.availableCapital(positions_, total_realized_pnl_);
  snapshot.exposure = ExposureGuard::currentExposure(positions_);

  for (const auto& [coin, pos] : positions_) {
    if (pos.isFlat()) {
      continue;
    }
    PositionSnapshot p;
    p.coin = coin;
    p.size = pos.size;
    p.avg_price = pos.avg_entry_price;
    p.last_price = pos.last_price;
    p.realized_pnl = pos.realized_pnl;
    p.unrealized_pnl = accounting::unrealizedPnl(pos);
    p.market_value = pos.size * pos.last_price;
    snapshot.positions.push_back(p);
  }
  std::sort(snapshot.positions.begin(), snapshot.positions.end(),
            [](const PositionSnapshot& a, const PositionSnapshot& b) {
              return a.coin < b.coin;
            });
  return snapshot;
}

// --- Read-only accessors -----------------------------------------------------

std::optional<domain::Position> PaperTradingSession::position(
    const std::string& coin) const {
  std::lock_guard lock(mutex_);
  auto it = positions_.find(coin);
  if (it == positions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<domain::Position> PaperTradingSession::positions() const {
  std::lock_guard lock(mutex_);
  std::vector<domain::Position> out;
  out.reserve(positions_.size());
  for (const auto& [coin, pos] : positions_) {
    out.push_back(pos);
  }
  std::sort(out.begin(), out.end(),
            [](const domain::Position& a, const domain::Position& b) {
              return a.coin < b.coin;
            });
  return out;
}

std::vector<domain::PaperTrade> PaperTradingSession::tradeHistory() const {
  std::lock_guard lock(mutex_);
  return trade_history_;
}

std::vector<domain::PaperTrade> PaperTradingSession::recentTrades(
    std::size_t count) const {
  std::lock_guard lock(mutex_);
  std::size_t n = std::min(count, trade_history_.size());
  return std::vector<domain::PaperTrade>(trade_history_.end() - n,
                                         trade_history_.end());
}

int PaperTradingSession::totalTrades() const {
  std::lock_guard lock(mutex_);
  return total_trades_;
}

double PaperTradingSession::totalRealizedPnl() const {
  std::lock_guard lock(mutex_);
  return total_realized_pnl_;
}

double PaperTradingSession::availableCapital() const {
  std::lock_guard lock(mutex_);
  return guard_.availableCapital(positions_, total_realized_pnl_);
}

double PaperTradingSession::maxExposure() const {
  std::lock_guard lock(mutex_);
  return guard_.maxExposure(positions_, total_realized_pnl_);
}

double PaperTradingSession::currentExposure() const {
  std::lock_guard lock(mutex_);
  return ExposureGuard::currentExposure(positions_);
}

double PaperTradingSession::pendingVolume(const std::string& coin) const {
  std::lock_guard lock(mutex_);
  return aggregator_.pendingVolume(coin);
}

std::size_t PaperTradingSession::pendingFillCount(
    const std::string& coin) const {
  std::lock_guard lock(mutex_);
  return aggregator_.pendingFillCount(coin);
}

// -----------------------------------------------------------------------------
// summary
// -----------------------------------------------------------------------------
PortfolioSummary PaperTradingSession::summary() const {
  std::lock_guard lock(mutex_);

  PortfolioSummary s;
  s.session_start_ms = start_time_ms_;
  s.as_of_ms = clock_.now_ms();
  s.total_realized_pnl = total_realized_pnl_;
  s.total_unrealized_pnl = totalUnrealizedPnl();
  s.total_pnl = s.total_realized_pnl + s.total_unrealized_pnl;
  s.total_trades = total_trades_;
  s.avg_pnl_per_trade =
      total_trades_ > 0 ? s.total_realized_pnl / total_trades_ : 0.0;
  s.bankroll = guard_.limits().bankroll;
  s.leverage = guard_.limits().leverage;
  s.available_capital =
      guard_.availableCapital(positions_, total_realized_pnl_);
  s.max_exposure = s.available_capital * s.leverage;
  s.current_exposure = ExposureGuard::currentExposure(positions_);

  for (const auto& [coin, pos] : positions_) {
    if (pos.isFlat()) {
      continue;
    }
    PositionSummary p;
    p.coin = coin;
    p.size = pos.size;
    p.avg_entry_price = pos.avg_entry_price;
    p.last_price = pos.last_price;
    p.realized_pnl = pos.realized_pnl;
    p.unrealized_pnl = accounting::unrealizedPnl(pos);
    if (pos.avg_entry_price != 0.0) {
      p.unrealized_pct =
          (pos.last_price - pos.avg_entry_price) / pos.avg_entry_price * 100.0;
    }
    s.positions.push_back(p);
  }
  s.active_positions = static_cast<int>(s.positions.size());
  std::sort(s.positions.begin(), s.positions.end(),
            [](const PositionSummary& a, const PositionSummary& b) {
              return a.coin < b.coin;
            });
  return s;
}

void PaperTradingSession::printPortfolioSummary(std::ostream& os) const {
  reporting::printPortfolioSummary(os, summary());
}

void PaperTradingSession::printRecentTrades(std::ostream& os,
                                            std::size_t count) const {
  reporting::printRecentTrades(os, recentTrades(count), count);
}

void PaperTradingSession::setVolumeThreshold(double threshold) {
  std::lock_guard lock(mutex_);
  aggregator_.setVolumeThreshold(threshold);
}

void PaperTradingSession::setMinTradeIntervalMs(std::int64_t interval_ms) {
  std::lock_guard lock(mutex_);
  aggregator_.setMinTradeIntervalMs(interval_ms);
}

}  // namespace copytrader
