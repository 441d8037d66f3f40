#pragma once

#include "copytrader/domain/position.hpp"
#include "copytrader/domain/position_action.hpp"

namespace copytrader {
namespace accounting {

// -----------------------------------------------------------------------------
// realizedPnl(position, signed_trade_size, exec_price, venue_closed_pnl,
//             action)
// -----------------------------------------------------------------------------
//
// @brief  Realized PnL produced by applying a trade to a position.
//
// @param  position           Position state BEFORE the trade.
// @param  signed_trade_size  +qty for buys, -qty for sells.
// @param  exec_price         Execution price (VWAP for aggregated trades).
// @param  venue_closed_pnl   Closed PnL reported by the venue, 0 if absent
//                            or unparsable.
// @param  action             Classified transition of this trade.
//
// @return Realized PnL in quote currency.
//
// @details
// Open and Add never realize PnL, whatever the venue reports.
//
// For Reduce, Close and Reverse a non-zero venue figure is taken verbatim.
// Otherwise the PnL is computed against the average entry price:
//
//   reduced = min(|signed_trade_size|, |position.size|)
//   long:   (exec_price - avg_entry_price) * reduced
//   short:  (avg_entry_price - exec_price) * reduced
//
// On a reversal only the closing part (|position.size|) realizes PnL; the
// remainder opens the new exposure.
//
// Thread-safety: Pure function.
// -----------------------------------------------------------------------------
double realizedPnl(const domain::Position& position, double signed_trade_size,
                   double exec_price, double venue_closed_pnl,
                   domain::PositionAction action);

// -----------------------------------------------------------------------------
// unrealizedPnl(position)
// -----------------------------------------------------------------------------
//
// @brief  Mark-to-market PnL of the open exposure at position.last_price.
//
// @return 0 when flat or when no entry price is known; otherwise
//         (last_price - avg_entry_price) * size. The sign of size makes the
//         formula direction-agnostic: shorts gain as the price falls.
// -----------------------------------------------------------------------------
double unrealizedPnl(const domain::Position& position);

}  // namespace accounting
}  // namespace copytrader
