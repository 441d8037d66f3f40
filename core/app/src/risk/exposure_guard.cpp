#include "copytrader/risk/exposure_guard.hpp"
#include "copytrader/accounting/pnl_calculator.hpp"

#include <algorithm>
#include <cmath>

namespace copytrader {

ExposureGuard::ExposureGuard(const domain::CapitalLimits& limits)
    : limits_(limits) {}

// -----------------------------------------------------------------------------
// availableCapital: bankroll plus realized and floating PnL
// -----------------------------------------------------------------------------
double ExposureGuard::availableCapital(const PositionMap& positions,
                                       double total_realized_pnl) const {
  double unrealized = 0.0;
  for (const auto& [coin, pos] : positions) {
    if (!pos.isFlat()) {
      unrealized += accounting::unrealizedPnl(pos);
    }
  }
  return limits_.bankroll + total_realized_pnl + unrealized;
}

double ExposureGuard::maxExposure(const PositionMap& positions,
                                  double total_realized_pnl) const {
  return availableCapital(positions, total_realized_pnl) * limits_.leverage;
}

// -----------------------------------------------------------------------------
// currentExposure: mark-to-last-trade gross notional
// -----------------------------------------------------------------------------
double ExposureGuard::currentExposure(const PositionMap& positions,
                                      const std::string& exclude_coin) {
  double exposure = 0.0;
  for (const auto& [coin, pos] : positions) {
    if (pos.isFlat() || (!exclude_coin.empty() && coin == exclude_coin)) {
      continue;
    }
    exposure += std::abs(pos.size) * pos.last_price;
  }
  return exposure;
}

// -----------------------------------------------------------------------------
// validatePositionSize: hard accept/reject policy
// -----------------------------------------------------------------------------
bool ExposureGuard::validatePositionSize(const PositionMap& positions,
                                         double total_realized_pnl,
                                         const std::string& coin, double size,
                                         double price) const {
  double other_exposure = currentExposure(positions, coin);
  double candidate = std::abs(size * price);
  return other_exposure + candidate <=
         maxExposure(positions, total_realized_pnl);
}

// -----------------------------------------------------------------------------
// calculateDynamicTradeSize: shrink-to-fit policy
// -----------------------------------------------------------------------------
double ExposureGuard::calculateDynamicTradeSize(const PositionMap& positions,
                                                double total_realized_pnl,
                                                double price) const {
  if (price <= 0.0 || !limits_.base_notional.has_value()) {
    return 0.0;
  }

  double remaining = maxExposure(positions, total_realized_pnl) -
                     currentExposure(positions);
  if (remaining <= 0.0) {
    return 0.0;
  }

  double notional = std::min(*limits_.base_notional, remaining);
  return std::max(notional, 0.0) / price;
}

}  // namespace copytrader
