#pragma once

#include "copytrader/domain/paper_trade.hpp"
#include "copytrader/reporting/portfolio_summary.hpp"

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace copytrader {
namespace reporting {

// -----------------------------------------------------------------------------
// Human-readable rendering of session state
// -----------------------------------------------------------------------------
//
// All functions are pure formatters over snapshots; none of them touch a
// session. Money is printed with two decimals.
// -----------------------------------------------------------------------------

// One line per committed trade, e.g.
//   "REDUCE SELL 1.00 BTC @ $58000.00 | Position: +2.00 BTC |
//    Realized: $4666.67 | Unrealized: $9333.33"
std::string formatTradeLine(const domain::PaperTrade& trade);

// Multi-line portfolio report: duration, PnL totals, capital and exposure,
// then one line per open position.
void printPortfolioSummary(std::ostream& os, const PortfolioSummary& summary);

// "LAST n TRADES" table. Prints nothing when trades is empty.
void printRecentTrades(std::ostream& os,
                       const std::vector<domain::PaperTrade>& trades,
                       std::size_t requested);

// "1h02m03s" style duration.
std::string formatDuration(std::int64_t elapsed_ms);

}  // namespace reporting
}  // namespace copytrader
