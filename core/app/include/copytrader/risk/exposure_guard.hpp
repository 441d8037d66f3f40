#pragma once

#include "copytrader/domain/capital_limits.hpp"
#include "copytrader/domain/position.hpp"

#include <string>
#include <unordered_map>

namespace copytrader {

// Per-instrument positions, keyed by coin.
using PositionMap = std::unordered_map<std::string, domain::Position>;

// -----------------------------------------------------------------------------
// ExposureGuard - capital and leverage ceiling
// -----------------------------------------------------------------------------
//
// @brief  Derives available capital and maximum exposure from the current
//         ledger, and applies one of the two sizing policies to a candidate
//         trade.
//
// @details
//   availableCapital = bankroll + total realized PnL
//                      + sum(unrealized PnL of open positions)
//   maxExposure      = availableCapital * leverage
//   currentExposure  = sum(|size| * last_price of open positions)
//
// Capital is re-derived from the ledger on every call and never cached:
// a profitable session expands its capacity and a losing one contracts it
// automatically.
//
// Policies:
//   validatePositionSize()      - hard accept/reject.
//   calculateDynamicTradeSize() - shrink to fit, floor at zero.
//
// The guard holds no reference to the ledger. Callers pass the position
// map and realized total they are about to mutate, under their own lock.
//
// Thread model:
//   Immutable after construction; all methods are const and reentrant.
// -----------------------------------------------------------------------------
class ExposureGuard {
 public:
  explicit ExposureGuard(const domain::CapitalLimits& limits);

  double availableCapital(const PositionMap& positions,
                          double total_realized_pnl) const;

  double maxExposure(const PositionMap& positions,
                     double total_realized_pnl) const;

  // Gross notional of all open positions except exclude_coin (if given).
  static double currentExposure(const PositionMap& positions,
                                const std::string& exclude_coin = {});

  // -------------------------------------------------------------------------
  // validatePositionSize(positions, total_realized_pnl, coin, size, price)
  // -------------------------------------------------------------------------
  // @brief  Hard validation: would holding |size| of coin at price breach
  //         the leverage ceiling?
  //
  // @param  size   The candidate position size for coin (signed or not; only
  //                its magnitude matters).
  // @param  price  Price used to value the candidate.
  //
  // @return true when
  //           currentExposure(excluding coin) + |size * price|
  //             <= maxExposure,
  //         false otherwise.
  // -------------------------------------------------------------------------
  bool validatePositionSize(const PositionMap& positions,
                            double total_realized_pnl, const std::string& coin,
                            double size, double price) const;

  // -------------------------------------------------------------------------
  // calculateDynamicTradeSize(positions, total_realized_pnl, price)
  // -------------------------------------------------------------------------
  // @brief  Dynamic sizing: quantity worth min(base_notional, remaining
  //         capacity) at price.
  //
  // @return Unsigned quantity, >= 0.
  //         remaining = maxExposure - currentExposure
  //         result    = min(base_notional, max(remaining, 0)) / price
  //         Returns 0 when no capacity remains, when price <= 0, or when no
  //         base notional is configured.
  // -------------------------------------------------------------------------
  double calculateDynamicTradeSize(const PositionMap& positions,
                                   double total_realized_pnl,
                                   double price) const;

  const domain::CapitalLimits& limits() const { return limits_; }

 private:
  const domain::CapitalLimits limits_;
};

}  // namespace copytrader
