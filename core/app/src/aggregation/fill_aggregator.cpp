#include "copytrader/aggregation/fill_aggregator.hpp"
#include "copytrader/codec/decimal.hpp"

#include <cmath>
#include <iostream>
#include <utility>

namespace copytrader {

FillAggregator::FillAggregator(const AggregationSettings& settings,
                               const ITimeProvider& clock)
    : settings_(settings), clock_(clock) {}

// -----------------------------------------------------------------------------
// addFill: decay, buffer, threshold test
// -----------------------------------------------------------------------------
std::optional<AggregatedTrade> FillAggregator::addFill(
    const domain::Fill& fill) {
  const std::int64_t now = clock_.now_ms();

  auto it = pending_.find(fill.coin);
  if (it != pending_.end() && !applyVolumeDecay(fill.coin, it->second, now)) {
    pending_.erase(it);
    it = pending_.end();
  }

  if (it == pending_.end()) {
    PendingState fresh;
    fresh.started_ms = now;
    it = pending_.emplace(fill.coin, std::move(fresh)).first;
  }

  PendingState& state = it->second;
  state.fills.push_back(fill);
  state.volume += fill.notional();

  bool by_volume = state.volume >= settings_.volume_threshold;
  bool by_time = (now - state.started_ms) >= settings_.min_trade_interval_ms;

  if (!by_volume && !by_time) {
    return std::nullopt;
  }

  AggregatedTrade trade = aggregate(fill.coin, std::move(state.fills));
  pending_.erase(it);
  return trade;
}

// -----------------------------------------------------------------------------
// applyVolumeDecay: exponential decay past the 10 s gate
// -----------------------------------------------------------------------------
bool FillAggregator::applyVolumeDecay(const std::string& coin,
                                      PendingState& state,
                                      std::int64_t now_ms) {
  if (state.volume == 0.0) {
    return !state.fills.empty();
  }

  if (now_ms - state.started_ms < kDecayGateMs) {
    return true;
  }

  // The exponent is the age of the whole buffer, re-applied on every fill.
  double minutes = static_cast<double>(now_ms - state.started_ms) / 60000.0;
  state.volume *= std::pow(1.0 - settings_.volume_decay_rate, minutes);

  if (state.volume < kDecayFloor) {
    std::cerr << "[FillAggregator] pending volume for " << coin
              << " decayed away; dropping " << state.fills.size()
              << " buffered fill(s).\n";
    return false;
  }
  return true;
}

// -----------------------------------------------------------------------------
// aggregate: batch totals
// -----------------------------------------------------------------------------
AggregatedTrade FillAggregator::aggregate(const std::string& coin,
                                          std::vector<domain::Fill> fills) {
  AggregatedTrade trade;
  trade.coin = coin;

  for (const auto& fill : fills) {
    double signed_size = fill.signedSize();
    trade.signed_size += signed_size;
    trade.gross_quantity += std::abs(signed_size);
    trade.notional += std::abs(signed_size) * fill.price;
    trade.last_price = fill.price;
    trade.last_fill_time_ms = fill.time_ms;
    trade.venue_closed_pnl += codec::parseClosedPnl(fill.closed_pnl);
  }

  if (trade.gross_quantity > 0.0) {
    trade.vwap = trade.notional / trade.gross_quantity;
  }

  trade.fills = std::move(fills);
  return trade;
}

void FillAggregator::setVolumeThreshold(double threshold) {
  settings_.volume_threshold = threshold;
}

void FillAggregator::setMinTradeIntervalMs(std::int64_t interval_ms) {
  settings_.min_trade_interval_ms = interval_ms;
}

double FillAggregator::pendingVolume(const std::string& coin) const {
  auto it = pending_.find(coin);
  return it == pending_.end() ? 0.0 : it->second.volume;
}

std::size_t FillAggregator::pendingFillCount(const std::string& coin) const {
  auto it = pending_.find(coin);
  return it == pending_.end() ? 0 : it->second.fills.size();
}

}  // namespace copytrader
