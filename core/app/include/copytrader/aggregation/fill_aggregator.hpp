#pragma once

#include "copytrader/aggregation/aggregation_settings.hpp"
#include "copytrader/domain/fill.hpp"
#include "copytrader/time/i_time_provider.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace copytrader {

// -----------------------------------------------------------------------------
// AggregatedTrade - a batch of fills committed as one ledger update
// -----------------------------------------------------------------------------
//
// @details
//   signed_size      = sum(+/- fill.size)
//   gross_quantity   = sum(|fill.size|)
//   notional         = sum(|fill.size| * fill.price)
//   vwap             = notional / gross_quantity
//   last_price       = price of the last fill in the batch
//   venue_closed_pnl = sum(parseClosedPnl(fill.closed_pnl)), unparsable → 0
//
// fills keeps the raw batch so the persistence hook can record each one.
// -----------------------------------------------------------------------------
struct AggregatedTrade {
  std::string coin;
  std::vector<domain::Fill> fills;
  double signed_size{0.0};
  double gross_quantity{0.0};
  double notional{0.0};
  double vwap{0.0};
  double last_price{0.0};
  double venue_closed_pnl{0.0};
  std::int64_t last_fill_time_ms{0};

  domain::Side side() const {
    return signed_size < 0.0 ? domain::Side::Sell : domain::Side::Buy;
  }
};

// -----------------------------------------------------------------------------
// FillAggregator - per-instrument buffering of bursty fill streams
// -----------------------------------------------------------------------------
//
// @brief  Buffers fills per instrument and releases them as one
//         AggregatedTrade once a dollar-volume or time threshold is met.
//
// @details
// For each incoming fill on instrument I:
//
//   1. If I has pending fills, decay its pending volume (see below). A
//      buffer whose volume decays under $1 is dropped entirely: those
//      fills are discarded, never committed retroactively.
//   2. If I's buffer is now empty, accumulation starts at now().
//   3. Append the fill and add its dollar volume (size * price).
//   4. Commit when pending volume >= volume_threshold, or when
//      now() - accumulation start >= min_trade_interval_ms.
//
// Decay rule:
//   Nothing decays until 10 seconds have passed since accumulation began,
//   so a burst of sub-second fills never decays against itself. After
//   that, every arriving fill multiplies the pending volume by
//   (1 - volume_decay_rate)^minutes, where minutes is the time elapsed since
//   accumulation start. The factor is re-applied to the already decayed
//   volume, so older fills lose weight faster than a single exponential.
//
// Invariant: a non-empty buffer always carries volume > 0; an empty buffer
// has no entry at all.
//
// Thread model:
//   NOT internally synchronized. Owned by PaperTradingSession and only
//   touched under the session mutex.
// -----------------------------------------------------------------------------
class FillAggregator {
 public:
  static constexpr std::int64_t kDecayGateMs = 10000;
  static constexpr double kDecayFloor = 1.0;

  FillAggregator(const AggregationSettings& settings,
                 const ITimeProvider& clock);

  FillAggregator(const FillAggregator&) = delete;
  FillAggregator& operator=(const FillAggregator&) = delete;

  // -------------------------------------------------------------------------
  // addFill(fill)
  // -------------------------------------------------------------------------
  // @brief  Buffers a fill and returns the committed batch when a threshold
  //         is met.
  //
  // @param  fill  A fill with size > 0 (the session filters zero sizes).
  //
  // @return The aggregated batch for fill.coin if it was committed, in
  //         which case that instrument's buffer is cleared; std::nullopt if
  //         the fill was absorbed into the pending buffer.
  // -------------------------------------------------------------------------
  std::optional<AggregatedTrade> addFill(const domain::Fill& fill);

  void setVolumeThreshold(double threshold);
  void setMinTradeIntervalMs(std::int64_t interval_ms);
  const AggregationSettings& settings() const { return settings_; }

  double pendingVolume(const std::string& coin) const;
  std::size_t pendingFillCount(const std::string& coin) const;

  // Builds the batch totals described on AggregatedTrade.
  static AggregatedTrade aggregate(const std::string& coin,
                                   std::vector<domain::Fill> fills);

 private:
  struct PendingState {
    std::vector<domain::Fill> fills;
    double volume{0.0};
    std::int64_t started_ms{0};
  };

  // Decays state.volume in place. Returns false if the buffer decayed away.
  bool applyVolumeDecay(const std::string& coin, PendingState& state,
                        std::int64_t now_ms);

  AggregationSettings settings_;
  const ITimeProvider& clock_;
  std::unordered_map<std::string, PendingState> pending_;
};

}  // namespace copytrader
