// =============================================================================
// paper_trading_session_test.cpp
// =============================================================================
// Unit and property tests for copytrader::PaperTradingSession.
//
// Validates:
//   - The five transitions end to end (open, add, reduce, reverse, close)
//   - Venue closed PnL vs local fallback, including malformed strings
//   - Hard exposure validation and dynamic sizing outcomes
//   - Zero-size fills and net-zero batches leave no trace
//   - Conservation, flat and exposure-bound properties over a sequence
//   - Sink fan-out order and isolation from sink failures
//   - Concurrent processFill callers
//   - Finite results at 1e9-scale quantities and prices
//
// Design: every test owns its session and a SimulationTimeProvider.
// AggregationSettings::immediate() commits each fill on arrival unless a
// test is specifically about buffering.
// =============================================================================

#include "copytrader/session/paper_trading_session.hpp"
#include "copytrader/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <vector>

using copytrader::AccountSnapshot;
using copytrader::AggregationSettings;
using copytrader::ITradeSink;
using copytrader::PaperTradingSession;
using copytrader::SimulationTimeProvider;
using copytrader::domain::CapitalLimits;
using copytrader::domain::Fill;
using copytrader::domain::PositionAction;
using copytrader::domain::Side;

namespace {

Fill makeFill(const std::string& coin, Side side, double size, double price,
              const std::string& closed_pnl = "0", std::int64_t time_ms = 0) {
  Fill fill;
  fill.coin = coin;
  fill.side = side;
  fill.size = size;
  fill.price = price;
  fill.closed_pnl = closed_pnl;
  fill.time_ms = time_ms;
  return fill;
}

CapitalLimits hardLimits(double bankroll, double leverage) {
  CapitalLimits l;
  l.bankroll = bankroll;
  l.leverage = leverage;
  l.dynamic_sizing = false;
  return l;
}

struct SavedFill {
  Fill fill;
  PositionAction action;
  double realized;
  double unrealized;
};

class RecordingSink : public ITradeSink {
 public:
  void saveFill(const Fill& fill, PositionAction action, double realized_pnl,
                double unrealized_pnl) override {
    fills.push_back({fill, action, realized_pnl, unrealized_pnl});
    order.push_back('F');
  }
  void saveAccount(const AccountSnapshot& snapshot) override {
    accounts.push_back(snapshot);
    order.push_back('A');
  }

  std::vector<SavedFill> fills;
  std::vector<AccountSnapshot> accounts;
  std::string order;
};

class ThrowingSink : public ITradeSink {
 public:
  void saveFill(const Fill&, PositionAction, double, double) override {
    throw std::runtime_error("disk full");
  }
  void saveAccount(const AccountSnapshot&) override {
    throw std::runtime_error("disk full");
  }
};

}  // namespace

class PaperTradingSessionTest : public ::testing::Test {
 protected:
  SimulationTimeProvider clock{1700000000000};
};

// -----------------------------------------------------------------------------
// 1. Open + add: volume-weighted entry
// -----------------------------------------------------------------------------
TEST_F(PaperTradingSessionTest, OpenThenAddBlendsEntryPrice) {
  PaperTradingSession session(hardLimits(1e9, 1.0),
                              AggregationSettings::immediate(), clock);

  session.processFill(makeFill("BTC", Side::Buy, 2.0, 50000.0));
  session.processFill(makeFill("BTC", Side::Buy, 1.0, 60000.0));

  auto pos = session.position("BTC");
  ASSERT_TRUE(pos.has_value());
  EXPECT_DOUBLE_EQ(pos->size, 3.0);
  EXPECT_NEAR(pos->avg_entry_price, 53333.3333, 1e-3);
  EXPECT_NEAR(pos->avg_entry_price, pos->total_cost_basis / 3.0,
              1e-6 * pos->avg_entry_price);
  EXPECT_DOUBLE_EQ(pos->last_price, 60000.0);

  auto history = session.tradeHistory();
  ASSERT_EQ(history.size(), 2u);
  EXPECT_EQ(history[0].action, PositionAction::Open);
  EXPECT_EQ(history[1].action, PositionAction::Add);
  EXPECT_EQ(session.totalTrades(), 2);
  EXPECT_DOUBLE_EQ(session.totalRealizedPnl(), 0.0);
}

// -----------------------------------------------------------------------------
// 2. Reduce with local PnL, then reverse
// -----------------------------------------------------------------------------
TEST_F(PaperTradingSessionTest, ReduceThenReverse) {
  PaperTradingSession session(hardLimits(1e9, 1.0),
                              AggregationSettings::immediate(), clock);

  session.processFill(makeFill("BTC", Side::Buy, 2.0, 50000.0));
  session.processFill(makeFill("BTC", Side::Buy, 1.0, 60000.0));
  double avg = session.position("BTC")->avg_entry_price;

  // Reduce: no venue figure, so realized = (58000 - avg) * 1.
  session.processFill(makeFill("BTC", Side::Sell, 1.0, 58000.0));
  auto pos = session.position("BTC");
  EXPECT_DOUBLE_EQ(pos->size, 2.0);
  EXPECT_DOUBLE_EQ(pos->avg_entry_price, avg);
  EXPECT_NEAR(pos->realized_pnl, 4666.67, 0.01);

  auto reduce = session.tradeHistory().back();
  EXPECT_EQ(reduce.action, PositionAction::Reduce);
  EXPECT_EQ(reduce.side, Side::Sell);
  EXPECT_NEAR(reduce.realized_pnl, 4666.67, 0.01);
  EXPECT_NEAR(reduce.unrealized_pnl, 9333.33, 0.01);
  EXPECT_DOUBLE_EQ(reduce.position_size, 2.0);

  // Reverse: sell 4 from +2 leaves -2 opened at the trade price.
  session.processFill(makeFill("BTC", Side::Sell, 4.0, 62000.0));
  pos = session.position("BTC");
  EXPECT_DOUBLE_EQ(pos->size, -2.0);
  EXPECT_DOUBLE_EQ(pos->avg_entry_price, 62000.0);
  EXPECT_DOUBLE_EQ(pos->total_cost_basis, 124000.0);

  auto reverse = session.tradeHistory().back();
  EXPECT_EQ(reverse.action, PositionAction::Reverse);
  EXPECT_NEAR(reverse.realized_pnl, 2.0 * (62000.0 - avg), 1e-6);
}

TEST_F(PaperTradingSessionTest, CloseReturnsToFlat) {
  PaperTradingSession session(hardLimits(1e9, 1.0),
                              AggregationSettings::immediate(), clock);

  session.processFill(makeFill("ETH", Side::Sell, 2.0, 3000.0));
  session.processFill(makeFill("ETH", Side::Buy, 2.0, 2900.0));

  auto pos = session.position("ETH");
  ASSERT_TRUE(pos.has_value());
  EXPECT_DOUBLE_EQ(pos->size, 0.0);
  EXPECT_DOUBLE_EQ(pos->avg_entry_price, 0.0);
  EXPECT_DOUBLE_EQ(pos->total_cost_basis, 0.0);
  EXPECT_DOUBLE_EQ(pos->realized_pnl, 200.0);
  EXPECT_EQ(session.tradeHistory().back().action, PositionAction::Close);
  EXPECT_DOUBLE_EQ(session.tradeHistory().back().unrealized_pnl, 0.0);
}

// -----------------------------------------------------------------------------
// 3. Venue closed PnL
// -----------------------------------------------------------------------------
TEST_F(PaperTradingSessionTest, VenueClosedPnlOverridesLocalOnDisposal) {
  PaperTradingSession session(hardLimits(1e9, 1.0),
                              AggregationSettings::immediate(), clock);

  // Venue noise on an opening fill is ignored.
  session.processFill(makeFill("BTC", Side::Buy, 1.0, 100.0, "999"));
  EXPECT_DOUBLE_EQ(session.totalRealizedPnl(), 0.0);

  session.processFill(makeFill("BTC", Side::Sell, 0.5, 120.0, "7.25"));
  EXPECT_DOUBLE_EQ(session.totalRealizedPnl(), 7.25);
}

TEST_F(PaperTradingSessionTest, MalformedVenuePnlFallsBackToLocal) {
  PaperTradingSession session(hardLimits(1e9, 1.0),
                              AggregationSettings::immediate(), clock);

  session.processFill(makeFill("BTC", Side::Buy, 1.0, 100.0));
  session.processFill(makeFill("BTC", Side::Sell, 0.5, 120.0, "12abc"));
  EXPECT_DOUBLE_EQ(session.totalRealizedPnl(), 10.0);

  session.processFill(makeFill("BTC", Side::Sell, 0.5, 140.0, ""));
  EXPECT_DOUBLE_EQ(session.totalRealizedPnl(), 30.0);
}

// -----------------------------------------------------------------------------
// 4. Hard validation
// -----------------------------------------------------------------------------
TEST_F(PaperTradingSessionTest, OversizedTradeIsRejectedWithoutTrace) {
  PaperTradingSession session(hardLimits(1000.0, 2.0),
                              AggregationSettings::immediate(), clock);
  EXPECT_DOUBLE_EQ(session.maxExposure(), 2000.0);

  session.processFill(makeFill("BTC", Side::Buy, 0.02, 50000.0));
  ASSERT_TRUE(session.position("BTC").has_value());
  EXPECT_EQ(session.totalTrades(), 1);

  // $1500 more on a new instrument breaches $2000.
  session.processFill(makeFill("ETH", Side::Buy, 0.5, 3000.0));
  EXPECT_FALSE(session.position("ETH").has_value());
  EXPECT_EQ(session.totalTrades(), 1);
  EXPECT_EQ(session.tradeHistory().size(), 1u);
  EXPECT_EQ(session.pendingFillCount("ETH"), 0u);
}

// -----------------------------------------------------------------------------
// 5. Dynamic sizing
// -----------------------------------------------------------------------------
TEST_F(PaperTradingSessionTest, DynamicSizingResizesToHeadroom) {
  CapitalLimits limits;
  limits.bankroll = 500.0;
  limits.leverage = 1.0;
  limits.base_notional = 1000.0;
  PaperTradingSession session(limits, AggregationSettings::immediate(), clock);

  // The followed account bought 50; we can only afford $500 worth.
  session.processFill(makeFill("SOL", Side::Buy, 50.0, 100.0));
  auto pos = session.position("SOL");
  ASSERT_TRUE(pos.has_value());
  EXPECT_DOUBLE_EQ(pos->size, 5.0);
  EXPECT_DOUBLE_EQ(session.tradeHistory().back().size, 5.0);

  // No headroom left: the next instrument is skipped entirely.
  session.processFill(makeFill("AVAX", Side::Buy, 1.0, 30.0));
  EXPECT_FALSE(session.position("AVAX").has_value());
  EXPECT_EQ(session.totalTrades(), 1);
}

TEST_F(PaperTradingSessionTest, DynamicSizingKeepsTradeDirection) {
  CapitalLimits limits;
  limits.bankroll = 10000.0;
  limits.leverage = 2.0;
  limits.base_notional = 1000.0;
  PaperTradingSession session(limits, AggregationSettings::immediate(), clock);

  session.processFill(makeFill("ETH", Side::Sell, 3.0, 4000.0));
  auto pos = session.position("ETH");
  ASSERT_TRUE(pos.has_value());
  EXPECT_DOUBLE_EQ(pos->size, -0.25);
  EXPECT_EQ(session.tradeHistory().back().side, Side::Sell);
}

TEST_F(PaperTradingSessionTest, ResizedCloseRealizesItsShareOfVenuePnl) {
  CapitalLimits limits;
  limits.bankroll = 10000.0;
  limits.leverage = 2.0;
  limits.base_notional = 1000.0;
  PaperTradingSession session(limits, AggregationSettings::immediate(), clock);

  // The followed account trades 10 BTC; the paper book trades $1000 worth.
  session.processFill(makeFill("BTC", Side::Buy, 10.0, 50000.0));
  ASSERT_DOUBLE_EQ(session.position("BTC")->size, 0.02);

  session.processFill(makeFill("BTC", Side::Sell, 10.0, 51000.0, "10000"));

  double paper_qty = 1000.0 / 51000.0;
  double share = 10000.0 * paper_qty / 10.0;
  EXPECT_NEAR(session.tradeHistory().back().size, paper_qty, 1e-12);
  EXPECT_NEAR(session.tradeHistory().back().realized_pnl, share, 1e-9);
  EXPECT_NEAR(session.totalRealizedPnl(), share, 1e-9);
  EXPECT_LT(session.totalRealizedPnl(), 20.0);
  EXPECT_LT(session.availableCapital(), 10100.0);
}

TEST_F(PaperTradingSessionTest, UnresizedTradeKeepsFullVenuePnl) {
  PaperTradingSession session(hardLimits(1e9, 1.0),
                              AggregationSettings::immediate(), clock);

  session.processFill(makeFill("BTC", Side::Buy, 10.0, 50000.0));
  session.processFill(makeFill("BTC", Side::Sell, 10.0, 51000.0, "10000"));

  EXPECT_DOUBLE_EQ(session.totalRealizedPnl(), 10000.0);
}

// -----------------------------------------------------------------------------
// 6. Inputs that must leave no trace
// -----------------------------------------------------------------------------
TEST_F(PaperTradingSessionTest, ZeroSizeFillIsIgnored) {
  PaperTradingSession session(hardLimits(1e9, 1.0),
                              AggregationSettings::immediate(), clock);

  session.processFill(makeFill("BTC", Side::Buy, 0.0, 50000.0));
  EXPECT_FALSE(session.position("BTC").has_value());
  EXPECT_EQ(session.totalTrades(), 0);
  EXPECT_EQ(session.pendingFillCount("BTC"), 0u);
}

TEST_F(PaperTradingSessionTest, NetZeroBatchIsDropped) {
  AggregationSettings agg;
  agg.volume_threshold = 2000.0;
  agg.min_trade_interval_ms = 600000;
  PaperTradingSession session(hardLimits(1e9, 1.0), agg, clock);

  session.processFill(makeFill("BTC", Side::Buy, 10.0, 100.0));
  EXPECT_EQ(session.pendingFillCount("BTC"), 1u);
  session.processFill(makeFill("BTC", Side::Sell, 10.0, 100.0));

  EXPECT_FALSE(session.position("BTC").has_value());
  EXPECT_EQ(session.totalTrades(), 0);
  EXPECT_EQ(session.pendingFillCount("BTC"), 0u);
}

// -----------------------------------------------------------------------------
// 7. Aggregation through the session
// -----------------------------------------------------------------------------
TEST_F(PaperTradingSessionTest, BufferedFillsCommitAsOneTrade) {
  AggregationSettings agg;
  agg.volume_threshold = 1000.0;
  agg.min_trade_interval_ms = 600000;
  PaperTradingSession session(hardLimits(1e9, 1.0), agg, clock);

  session.processFill(makeFill("BTC", Side::Buy, 1.0, 400.0, "0", 1));
  session.processFill(makeFill("BTC", Side::Buy, 1.0, 500.0, "0", 2));
  EXPECT_EQ(session.totalTrades(), 0);
  EXPECT_DOUBLE_EQ(session.pendingVolume("BTC"), 900.0);

  session.processFill(makeFill("BTC", Side::Buy, 2.0, 600.0, "0", 3));
  ASSERT_EQ(session.totalTrades(), 1);

  auto trade = session.tradeHistory().back();
  EXPECT_DOUBLE_EQ(trade.size, 4.0);
  EXPECT_DOUBLE_EQ(trade.price, (400.0 + 500.0 + 1200.0) / 4.0);
  EXPECT_EQ(trade.timestamp_ms, 3);

  auto pos = session.position("BTC");
  EXPECT_DOUBLE_EQ(pos->avg_entry_price, 525.0);
  EXPECT_DOUBLE_EQ(pos->last_price, 600.0);
}

TEST_F(PaperTradingSessionTest, SettersAdjustAggregationAtRunTime) {
  AggregationSettings agg;
  agg.volume_threshold = 1e6;
  agg.min_trade_interval_ms = 600000;
  PaperTradingSession session(hardLimits(1e9, 1.0), agg, clock);

  session.processFill(makeFill("BTC", Side::Buy, 1.0, 100.0));
  EXPECT_EQ(session.totalTrades(), 0);

  session.setVolumeThreshold(0.0);
  session.processFill(makeFill("BTC", Side::Buy, 1.0, 100.0));
  EXPECT_EQ(session.totalTrades(), 1);

  session.setVolumeThreshold(1e6);
  session.setMinTradeIntervalMs(0);
  session.processFill(makeFill("BTC", Side::Buy, 1.0, 100.0));
  EXPECT_EQ(session.totalTrades(), 2);
}

// -----------------------------------------------------------------------------
// 8. Properties over a mixed sequence
// -----------------------------------------------------------------------------
TEST_F(PaperTradingSessionTest, ConservationFlatAndExposureBound) {
  PaperTradingSession session(hardLimits(100000.0, 3.0),
                              AggregationSettings::immediate(), clock);

  const std::vector<Fill> sequence = {
      makeFill("BTC", Side::Buy, 1.0, 50000.0),
      makeFill("ETH", Side::Sell, 10.0, 3000.0),
      makeFill("BTC", Side::Buy, 0.5, 50000.0),
      makeFill("ETH", Side::Buy, 4.0, 3000.0),
      makeFill("BTC", Side::Sell, 2.0, 50000.0),     // reverse
      makeFill("SOL", Side::Buy, 5000.0, 100.0),     // too big, rejected
      makeFill("ETH", Side::Buy, 6.0, 3000.0),       // close
      makeFill("BTC", Side::Buy, 0.5, 50000.0, "12.5"),  // close
      makeFill("SOL", Side::Buy, 100.0, 100.0),
      makeFill("SOL", Side::Sell, 40.0, 100.0),
  };

  for (const auto& fill : sequence) {
    session.processFill(fill);

    for (const auto& pos : session.positions()) {
      bool flat = pos.size == 0.0;
      EXPECT_EQ(flat, pos.avg_entry_price == 0.0) << pos.coin;
      EXPECT_EQ(flat, pos.total_cost_basis == 0.0) << pos.coin;
    }

    EXPECT_LE(session.currentExposure(),
              session.maxExposure() * (1.0 + 1e-9));
  }

  EXPECT_DOUBLE_EQ(session.position("SOL")->size, 60.0);

  double history_sum = 0.0;
  for (const auto& trade : session.tradeHistory()) {
    history_sum += trade.realized_pnl;
  }
  double position_sum = 0.0;
  for (const auto& pos : session.positions()) {
    position_sum += pos.realized_pnl;
  }

  EXPECT_NEAR(history_sum, position_sum, 1e-9);
  EXPECT_NEAR(history_sum, session.totalRealizedPnl(), 1e-9);
  EXPECT_EQ(session.totalTrades(),
            static_cast<int>(session.tradeHistory().size()));
  EXPECT_EQ(session.totalTrades(), 9);
}

// -----------------------------------------------------------------------------
// 9. Extreme magnitudes stay finite
// -----------------------------------------------------------------------------
TEST_F(PaperTradingSessionTest, BillionScaleValuesStayFinite) {
  PaperTradingSession session(hardLimits(1e30, 1.0),
                              AggregationSettings::immediate(), clock);

  session.processFill(makeFill("BIG", Side::Buy, 1e9, 1e9));
  session.processFill(makeFill("BIG", Side::Buy, 1e9, 2e9));
  session.processFill(makeFill("BIG", Side::Sell, 3e9, 1.5e9));

  auto pos = session.position("BIG");
  ASSERT_TRUE(pos.has_value());
  EXPECT_TRUE(std::isfinite(pos->size));
  EXPECT_TRUE(std::isfinite(pos->avg_entry_price));
  EXPECT_TRUE(std::isfinite(pos->total_cost_basis));
  EXPECT_TRUE(std::isfinite(pos->realized_pnl));
  EXPECT_TRUE(std::isfinite(session.totalRealizedPnl()));
  EXPECT_TRUE(std::isfinite(session.availableCapital()));
  EXPECT_DOUBLE_EQ(pos->size, -1e9);
  EXPECT_DOUBLE_EQ(pos->avg_entry_price, 1.5e9);
}

// -----------------------------------------------------------------------------
// 10. Sinks
// -----------------------------------------------------------------------------
TEST_F(PaperTradingSessionTest, SinkReceivesEachFillThenAccount) {
  AggregationSettings agg;
  agg.volume_threshold = 1000.0;
  agg.min_trade_interval_ms = 600000;
  PaperTradingSession session(hardLimits(1e9, 1.0), agg, clock);

  RecordingSink sink;
  session.attachSink(sink);

  session.processFill(makeFill("BTC", Side::Buy, 1.0, 600.0));
  session.processFill(makeFill("BTC", Side::Buy, 1.0, 600.0));

  EXPECT_EQ(sink.order, "FFA");
  ASSERT_EQ(sink.fills.size(), 2u);
  EXPECT_EQ(sink.fills[0].action, PositionAction::Open);
  ASSERT_EQ(sink.accounts.size(), 1u);
  EXPECT_EQ(sink.accounts[0].num_trades, 1);
  ASSERT_EQ(sink.accounts[0].positions.size(), 1u);
  EXPECT_DOUBLE_EQ(sink.accounts[0].positions[0].size, 2.0);
  EXPECT_DOUBLE_EQ(sink.accounts[0].exposure, 1200.0);

  session.detachSink(sink);
  session.processFill(makeFill("BTC", Side::Sell, 2.0, 600.0));
  EXPECT_EQ(sink.accounts.size(), 1u);
}

TEST_F(PaperTradingSessionTest, FailingSinkNeverUndoesAccounting) {
  PaperTradingSession session(hardLimits(1e9, 1.0),
                              AggregationSettings::immediate(), clock);

  ThrowingSink broken;
  RecordingSink healthy;
  session.attachSink(broken);
  session.attachSink(healthy);

  session.processFill(makeFill("BTC", Side::Buy, 1.0, 50000.0));

  EXPECT_EQ(session.totalTrades(), 1);
  ASSERT_TRUE(session.position("BTC").has_value());
  EXPECT_DOUBLE_EQ(session.position("BTC")->size, 1.0);
  EXPECT_EQ(healthy.accounts.size(), 1u);
}

// -----------------------------------------------------------------------------
// 11. Concurrency
// -----------------------------------------------------------------------------
TEST_F(PaperTradingSessionTest, ConcurrentCallersAreSerialized) {
  PaperTradingSession session(hardLimits(1e12, 1.0),
                              AggregationSettings::immediate(), clock);

  constexpr int kThreads = 8;
  constexpr int kFillsPerThread = 200;

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&session, t] {
      std::string own = "COIN" + std::to_string(t);
      for (int i = 0; i < kFillsPerThread; ++i) {
        session.processFill(makeFill("SHARED", Side::Buy, 1.0, 10.0));
        session.processFill(makeFill(own, Side::Buy, 1.0, 10.0));
      }
    });
  }
  for (auto& th : threads) {
    th.join();
  }

  EXPECT_EQ(session.totalTrades(), kThreads * kFillsPerThread * 2);
  EXPECT_DOUBLE_EQ(session.position("SHARED")->size,
                   kThreads * kFillsPerThread);
  EXPECT_EQ(session.position("SHARED")->trade_count,
            kThreads * kFillsPerThread);
  for (int t = 0; t < kThreads; ++t) {
    EXPECT_DOUBLE_EQ(session.position("COIN" + std::to_string(t))->size,
                     kFillsPerThread);
  }
}

// -----------------------------------------------------------------------------
// 12. Reporting readers
// -----------------------------------------------------------------------------
TEST_F(PaperTradingSessionTest, SummaryAndRecentTrades) {
  PaperTradingSession session(hardLimits(10000.0, 2.0),
                              AggregationSettings::immediate(), clock);

  session.processFill(makeFill("ETH", Side::Buy, 1.0, 3000.0));
  session.processFill(makeFill("BTC", Side::Buy, 0.1, 50000.0));
  session.processFill(makeFill("ETH", Side::Sell, 0.5, 3200.0));
  clock.advance_by(65000);

  auto summary = session.summary();
  EXPECT_EQ(summary.total_trades, 3);
  EXPECT_EQ(summary.active_positions, 2);
  EXPECT_EQ(summary.as_of_ms - summary.session_start_ms, 65000);
  ASSERT_EQ(summary.positions.size(), 2u);
  EXPECT_EQ(summary.positions[0].coin, "BTC");
  EXPECT_EQ(summary.positions[1].coin, "ETH");
  EXPECT_NEAR(summary.total_realized_pnl, 100.0, 1e-9);
  // ETH: 0.5 left at avg 3000, marked at 3200.
  EXPECT_NEAR(summary.total_unrealized_pnl, 100.0, 1e-9);
  EXPECT_NEAR(summary.total_pnl, 200.0, 1e-9);
  EXPECT_NEAR(summary.available_capital, 10200.0, 1e-9);
  EXPECT_NEAR(summary.max_exposure, 20400.0, 1e-9);

  auto recent = session.recentTrades(2);
  ASSERT_EQ(recent.size(), 2u);
  EXPECT_EQ(recent[0].coin, "BTC");
  EXPECT_EQ(recent[1].action, PositionAction::Reduce);
  EXPECT_EQ(session.recentTrades(50).size(), 3u);

  std::ostringstream report;
  session.printPortfolioSummary(report);
  EXPECT_NE(report.str().find("PAPER TRADING PORTFOLIO SUMMARY"),
            std::string::npos);
  EXPECT_NE(report.str().find("Total Trades:         3"), std::string::npos);

  std::ostringstream trades;
  session.printRecentTrades(trades, 2);
  EXPECT_NE(trades.str().find("LAST 2 TRADES"), std::string::npos);
  EXPECT_NE(trades.str().find("REDUCE SELL 0.50 ETH"), std::string::npos);
}
