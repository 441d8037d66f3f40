#include "copytrader/accounting/pnl_calculator.hpp"

#include <algorithm>
#include <cmath>

namespace copytrader {
namespace accounting {

// -----------------------------------------------------------------------------
// realizedPnl: venue figure when available, local VWAP math otherwise
// -----------------------------------------------------------------------------
double realizedPnl(const domain::Position& position, double signed_trade_size,
                   double exec_price, double venue_closed_pnl,
                   domain::PositionAction action) {
  // Building a position is never a disposal event. Venue noise on
  // size-increasing trades is ignored.
  if (!domain::isDisposal(action)) {
    return 0.0;
  }

  if (venue_closed_pnl != 0.0) {
    return venue_closed_pnl;
  }

  // Only a trade against the open direction can realize anything.
  bool opposes_position = (position.size > 0.0 && signed_trade_size < 0.0) ||
                          (position.size < 0.0 && signed_trade_size > 0.0);
  if (!opposes_position || position.avg_entry_price == 0.0) {
    return 0.0;
  }

  double reduced_qty =
      std::min(std::abs(signed_trade_size), std::abs(position.size));

  // direction_sign: +1 when reducing a long, -1 when reducing a short.
  double direction_sign = (position.size > 0.0) ? 1.0 : -1.0;
  double pnl_per_unit =
      (exec_price - position.avg_entry_price) * direction_sign;

  return pnl_per_unit * reduced_qty;
}

// -----------------------------------------------------------------------------
// unrealizedPnl: signed size carries the direction
// -----------------------------------------------------------------------------
double unrealizedPnl(const domain::Position& position) {
  if (position.size == 0.0 || position.avg_entry_price == 0.0) {
    return 0.0;
  }
  return (position.last_price - position.avg_entry_price) * position.size;
}

}  // namespace accounting
}  // namespace copytrader
