#pragma once

#include "copytrader/domain/fill.hpp"
#include "copytrader/domain/position_action.hpp"

#include <cstdint>
#include <string>

namespace copytrader {
namespace domain {

// -----------------------------------------------------------------------------
// PaperTrade - append-only record of one committed (possibly batched) trade
// -----------------------------------------------------------------------------
//
// @brief  What the paper portfolio did in response to one batch of fills.
//
// @details
// One record is appended per committed batch, in processing order. Records
// are immutable once appended; consumers receive copies.
//
// size is the absolute traded quantity (after any dynamic resizing) and side
// carries the direction. price is the volume-weighted average execution
// price of the batch. position_size and unrealized_pnl are snapshots taken
// immediately after the ledger update.
// -----------------------------------------------------------------------------
struct PaperTrade {
  std::int64_t timestamp_ms{0};               // Last fill in the batch
  std::string coin;
  PositionAction action{PositionAction::Open};
  Side side{Side::Buy};
  double size{0.0};                           // |traded quantity|
  double price{0.0};                          // VWAP of the batch
  double realized_pnl{0.0};                   // Realized by this trade
  double position_size{0.0};                  // Signed size after the trade
  double unrealized_pnl{0.0};                 // Mark-to-market after the trade
};

}  // namespace domain
}  // namespace copytrader
