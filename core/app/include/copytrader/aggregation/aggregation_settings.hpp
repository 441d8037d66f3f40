#pragma once

#include <cstdint>

namespace copytrader {

// -----------------------------------------------------------------------------
// AggregationSettings - when buffered fills are committed as one trade
// -----------------------------------------------------------------------------
//
// @brief  Thresholds consumed by FillAggregator.
//
// @details
// Pending fills for an instrument are committed when EITHER
//   pending dollar volume >= volume_threshold, OR
//   time since accumulation began >= min_trade_interval_ms.
//
// volume_threshold == 0 commits every fill immediately, which is what the
// deterministic tests use (see immediate()).
//
// volume_decay_rate is the fraction of pending volume lost per minute once
// the 10-second decay gate has passed: volume *= (1 - rate)^minutes.
// -----------------------------------------------------------------------------
struct AggregationSettings {
  std::int64_t min_trade_interval_ms{60000};  // 1 minute
  double volume_threshold{1000.0};            // $1000
  double volume_decay_rate{0.5};              // 50% per minute

  // Commit-on-every-fill settings for tests and replays.
  static AggregationSettings immediate() {
    AggregationSettings s;
    s.min_trade_interval_ms = 1;
    s.volume_threshold = 0.0;
    return s;
  }
};

}  // namespace copytrader
