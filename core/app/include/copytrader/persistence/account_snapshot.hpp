#pragma once

#include "copytrader/domain/fill.hpp"
#include "copytrader/domain/position_action.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace copytrader {

// -----------------------------------------------------------------------------
// PositionSnapshot / AccountSnapshot - state handed to the persistence hook
// -----------------------------------------------------------------------------
//
// @details
// Built by PaperTradingSession under its lock after each committed trade.
// Only open positions are listed. Values are copies, so sinks may keep or
// forward them to another thread (the IPC telemetry queue does).
// -----------------------------------------------------------------------------
struct PositionSnapshot {
  std::string coin;
  double size{0.0};
  double avg_price{0.0};
  double last_price{0.0};
  double realized_pnl{0.0};
  double unrealized_pnl{0.0};
  double market_value{0.0};     // size * last_price (signed)
};

struct AccountSnapshot {
  std::int64_t time_ms{0};
  double total_pnl{0.0};         // realized + unrealized
  double realized_pnl{0.0};
  double unrealized_pnl{0.0};
  int num_trades{0};
  double available_capital{0.0};
  double exposure{0.0};
  std::vector<PositionSnapshot> positions;
};

// One raw fill of a committed batch, with the outcome of that batch.
struct FillRecord {
  std::int64_t time_ms{0};       // When the record was written
  domain::Fill fill;
  domain::PositionAction action{domain::PositionAction::Open};
  double realized_pnl{0.0};
  double unrealized_pnl{0.0};
};

}  // namespace copytrader
