#pragma once

#include <cstdint>
#include <string>

namespace copytrader {
namespace domain {

// -----------------------------------------------------------------------------
// Position - per-instrument paper trading state
// -----------------------------------------------------------------------------
//
// @brief  Tracks the signed size, cost basis, average entry price and
//         realized PnL for a single instrument.
//
// @details
// Sign convention for size:
//   positive → long
//   negative → short
//   zero     → flat
//
// Invariants (maintained by applyTrade() in accounting/position_ledger.hpp):
//   size == 0  <=>  avg_entry_price == 0  <=>  total_cost_basis == 0
//   avg_entry_price == total_cost_basis / |size|   whenever size != 0
//
// avg_entry_price describes only the currently open exposure. It moves on
// same-direction adds, stays put on reductions, and is reset on open,
// reversal and close.
//
// last_price is the most recent traded price and is what unrealized PnL and
// exposure are marked against. It is deliberately kept separate from
// avg_entry_price.
//
// A position is created lazily on the first committed trade for its
// instrument and is never deleted; a flat position keeps its realized_pnl
// and trade_count so history stays attributable.
//
// Ownership:
//   PaperTradingSession owns the authoritative copies. Everything else
//   receives value snapshots.
// -----------------------------------------------------------------------------
struct Position {
  std::string coin;                 // Instrument identifier
  double size{0.0};                 // Signed: +long, -short, 0=flat
  double avg_entry_price{0.0};      // VWAP of the open exposure
  double total_cost_basis{0.0};     // |cost| of the open exposure
  double realized_pnl{0.0};         // Cumulative realized PnL
  double last_price{0.0};           // Mark price for unrealized PnL
  std::int64_t open_time_ms{0};     // When the current exposure was opened
  int trade_count{0};               // Committed trades applied

  bool isFlat() const { return size == 0.0; }
};

}  // namespace domain
}  // namespace copytrader
