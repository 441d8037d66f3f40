#pragma once

#include <optional>

namespace copytrader {
namespace domain {

// -----------------------------------------------------------------------------
// CapitalLimits - bankroll and leverage ceiling for one paper session
// -----------------------------------------------------------------------------
//
// @brief  Immutable capital parameters consumed by ExposureGuard.
//
// @details
// available capital = bankroll + realized PnL + unrealized PnL
// max exposure      = available capital * leverage
//
// Two sizing policies exist:
//
//   Dynamic sizing - every committed trade is resized to
//     min(base_notional, remaining capacity) / price.
//     Active when dynamic_sizing is true AND base_notional is set and > 0.
//
//   Hard validation - the trade keeps its copied size and is rejected
//     outright if the resulting exposure would exceed max exposure.
//     Used whenever dynamic sizing is not active.
//
// Thread model:
//   Plain value type, copied into the session at construction.
// -----------------------------------------------------------------------------
struct CapitalLimits {
  /// External capital backing the paper portfolio. Must be > 0.
  double bankroll{10000.0};

  /// Multiplier applied to available capital. Must be >= 1.
  double leverage{1.0};

  /// Target notional per copied trade for dynamic sizing (e.g. $1000).
  std::optional<double> base_notional;

  /// When false, hard validation is used even if base_notional is set.
  bool dynamic_sizing{true};

  bool dynamicSizingActive() const {
    return dynamic_sizing && base_notional.has_value() && *base_notional > 0.0;
  }
};

}  // namespace domain
}  // namespace copytrader
