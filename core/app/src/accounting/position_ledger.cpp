#include "copytrader/accounting/position_ledger.hpp"

#include <cmath>

namespace copytrader {
namespace accounting {

// -----------------------------------------------------------------------------
// applyTrade: cost-basis bookkeeping for the five transitions
// -----------------------------------------------------------------------------
void applyTrade(domain::Position& pos, double signed_trade_size, double price,
                double realized_pnl, std::int64_t now_ms) {
  const double old_size = pos.size;
  const double new_size = old_size + signed_trade_size;

  pos.realized_pnl += realized_pnl;

  if (new_size == 0.0) {
    // ----- Close: fully flat -------------------------------------------------
    pos.avg_entry_price = 0.0;
    pos.total_cost_basis = 0.0;
  } else if (old_size == 0.0) {
    // ----- Open: first exposure ---------------------------------------------
    pos.avg_entry_price = price;
    pos.total_cost_basis = price * std::abs(signed_trade_size);
    pos.open_time_ms = now_ms;
  } else if ((old_size > 0.0 && new_size < 0.0) ||
             (old_size < 0.0 && new_size > 0.0)) {
    // ----- Reverse: the remainder is a brand new position --------------------
    pos.avg_entry_price = price;
    pos.total_cost_basis = price * std::abs(new_size);
    pos.open_time_ms = now_ms;
  } else if ((old_size > 0.0 && signed_trade_size > 0.0) ||
             (old_size < 0.0 && signed_trade_size < 0.0)) {
    // ----- Add: volume-weighted average -------------------------------------
    pos.total_cost_basis += price * std::abs(signed_trade_size);
    pos.avg_entry_price = pos.total_cost_basis / std::abs(new_size);
  }
  // Reduce: cost basis of the remaining lot is unchanged.

  pos.size = new_size;
  ++pos.trade_count;
}

}  // namespace accounting
}  // namespace copytrader
