#include "copytrader/reporting/portfolio_reporter.hpp"
#include "copytrader/time/time_utils.hpp"

#include <iomanip>
#include <sstream>

namespace copytrader {
namespace reporting {

namespace {

std::string signedQuantity(double size) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(2);
  if (size > 0.0) {
    out << '+';
  }
  out << size;
  return out.str();
}

}  // namespace

std::string formatTradeLine(const domain::PaperTrade& trade) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(2);

  out << domain::actionToString(trade.action) << ' '
      << domain::sideToString(trade.side) << ' ' << trade.size << ' '
      << trade.coin << " @ $" << trade.price << " | ";

  if (trade.position_size == 0.0) {
    out << "Position: FLAT";
  } else {
    out << "Position: " << signedQuantity(trade.position_size) << ' '
        << trade.coin;
  }

  out << " | ";
  if (trade.realized_pnl != 0.0) {
    out << "Realized: $" << trade.realized_pnl << " | ";
  }
  out << "Unrealized: $" << trade.unrealized_pnl;
  return out.str();
}

std::string formatDuration(std::int64_t elapsed_ms) {
  std::int64_t total_seconds = elapsed_ms > 0 ? elapsed_ms / 1000 : 0;
  std::int64_t hours = total_seconds / 3600;
  std::int64_t minutes = (total_seconds % 3600) / 60;
  std::int64_t seconds = total_seconds % 60;

  std::ostringstream out;
  if (hours > 0) {
    out << hours << 'h' << std::setw(2) << std::setfill('0') << minutes
        << 'm' << std::setw(2) << seconds << 's';
  } else if (minutes > 0) {
    out << minutes << 'm' << std::setw(2) << std::setfill('0') << seconds
        << 's';
  } else {
    out << seconds << 's';
  }
  return out.str();
}

// -----------------------------------------------------------------------------
// printPortfolioSummary
// -----------------------------------------------------------------------------
void printPortfolioSummary(std::ostream& os, const PortfolioSummary& summary) {
  const std::string rule(80, '=');

  std::ostringstream out;
  out << std::fixed << std::setprecision(2);

  out << '\n' << rule << '\n'
      << "PAPER TRADING PORTFOLIO SUMMARY\n"
      << rule << '\n'
      << "Session Duration:     "
      << formatDuration(summary.as_of_ms - summary.session_start_ms) << '\n'
      << "Total Realized PnL:   $" << summary.total_realized_pnl << '\n'
      << "Total Unrealized PnL: $" << summary.total_unrealized_pnl << '\n'
      << "Total Portfolio PnL:  $" << summary.total_pnl << '\n'
      << "Total Trades:         " << summary.total_trades << '\n'
      << "Active Positions:     " << summary.active_positions << '\n';

  if (summary.total_trades > 0) {
    out << "Avg PnL per Trade:    $" << summary.avg_pnl_per_trade << '\n';
  }

  out << "Available Capital:    $" << summary.available_capital
      << " (bankroll $" << summary.bankroll << ", leverage "
      << summary.leverage << "x)\n"
      << "Exposure:             $" << summary.current_exposure << " / $"
      << summary.max_exposure << '\n';

  if (!summary.positions.empty()) {
    out << "\nACTIVE POSITIONS:\n" << std::string(60, '-') << '\n';
    for (const auto& pos : summary.positions) {
      out << std::left << std::setw(8) << pos.coin << std::right << " | "
          << signedQuantity(pos.size) << " | Avg: $" << pos.avg_entry_price
          << " | Last: $" << pos.last_price << " | PnL: $"
          << pos.unrealized_pnl << " (" << pos.unrealized_pct << "%)\n";
    }
  }

  out << rule << '\n';
  os << out.str();
}

// -----------------------------------------------------------------------------
// printRecentTrades
// -----------------------------------------------------------------------------
void printRecentTrades(std::ostream& os,
                       const std::vector<domain::PaperTrade>& trades,
                       std::size_t requested) {
  if (trades.empty()) {
    return;
  }

  std::ostringstream out;
  out << std::fixed << std::setprecision(2);
  out << "\nLAST " << requested << " TRADES:\n" << std::string(80, '-') << '\n';

  for (const auto& trade : trades) {
    out << format_utc(trade.timestamp_ms, "%H:%M:%S") << " | "
        << domain::actionToString(trade.action) << ' '
        << domain::sideToString(trade.side) << ' ' << trade.size << ' '
        << trade.coin << " @ $" << trade.price << " | PnL: $"
        << trade.realized_pnl << '\n';
  }
  os << out.str();
}

}  // namespace reporting
}  // namespace copytrader
