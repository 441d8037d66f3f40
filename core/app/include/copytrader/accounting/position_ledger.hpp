#pragma once

#include "copytrader/domain/position.hpp"

#include <cstdint>

namespace copytrader {
namespace accounting {

// -----------------------------------------------------------------------------
// applyTrade(position, signed_trade_size, price, realized_pnl, now_ms)
// -----------------------------------------------------------------------------
//
// @brief  Core ledger update: applies one committed trade to a position
//         in place.
//
// @param  pos                Position to update.
// @param  signed_trade_size  +qty for buys, -qty for sells. Must be non-zero.
// @param  price              Execution price of the trade.
// @param  realized_pnl       Value returned by realizedPnl() for this trade,
//                            computed against the pre-trade state.
// @param  now_ms             Clock reading used as open time for new
//                            exposure.
//
// @details
// new_size = old_size + signed_trade_size, then exactly one of:
//
//   Close (new_size == 0):
//     avg_entry_price = 0, total_cost_basis = 0
//
//   Open (old_size == 0):
//     avg_entry_price  = price
//     total_cost_basis = price * |signed_trade_size|
//     open_time_ms     = now_ms
//
//   Reverse (signs of old_size and new_size differ):
//     The surviving quantity is a fresh position at the trade price; the
//     prior cost basis is discarded.
//     avg_entry_price  = price
//     total_cost_basis = price * |new_size|
//     open_time_ms     = now_ms
//
//   Add (same direction, size increasing):
//     total_cost_basis += price * |signed_trade_size|
//     avg_entry_price   = total_cost_basis / |new_size|
//
//   Reduce (same direction, size decreasing):
//     avg_entry_price and total_cost_basis unchanged.
//
// realized_pnl is accumulated into pos.realized_pnl and trade_count is
// incremented in every case. last_price is NOT touched here; the session
// sets it from the batch's last fill.
//
// Not idempotent: the caller must apply each committed trade exactly once.
//
// Thread model: Called only by PaperTradingSession under its mutex.
// -----------------------------------------------------------------------------
void applyTrade(domain::Position& pos, double signed_trade_size, double price,
                double realized_pnl, std::int64_t now_ms);

}  // namespace accounting
}  // namespace copytrader
