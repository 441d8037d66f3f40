#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace copytrader {

// -----------------------------------------------------------------------------
// PortfolioSummary - read-only snapshot for reporting
// -----------------------------------------------------------------------------
//
// @details
// Produced by PaperTradingSession::summary() under the session lock, then
// rendered without holding it. Unrealized figures are marked at each
// position's last_price at snapshot time. positions lists open positions
// only, sorted by coin so reports are stable.
// -----------------------------------------------------------------------------
struct PositionSummary {
  std::string coin;
  double size{0.0};
  double avg_entry_price{0.0};
  double last_price{0.0};
  double realized_pnl{0.0};
  double unrealized_pnl{0.0};
  double unrealized_pct{0.0};   // (last - avg) / avg * 100
};

struct PortfolioSummary {
  std::int64_t session_start_ms{0};
  std::int64_t as_of_ms{0};
  double total_realized_pnl{0.0};
  double total_unrealized_pnl{0.0};
  double total_pnl{0.0};
  int total_trades{0};
  int active_positions{0};
  double avg_pnl_per_trade{0.0};   // 0 when no trades
  double bankroll{0.0};
  double leverage{1.0};
  double available_capital{0.0};
  double max_exposure{0.0};
  double current_exposure{0.0};
  std::vector<PositionSummary> positions;
};

}  // namespace copytrader
