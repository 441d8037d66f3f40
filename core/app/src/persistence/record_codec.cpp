#include "copytrader/persistence/record_codec.hpp"

namespace copytrader {

nlohmann::json fillRecordToJson(const FillRecord& record) {
  const domain::Fill& fill = record.fill;

  nlohmann::json j;
  j["time"] = record.time_ms;
  j["coin"] = fill.coin;
  j["side"] = domain::sideToVenueCode(fill.side);
  j["size"] = fill.size;
  j["price"] = fill.price;
  j["action"] = domain::actionToString(record.action);
  j["realized_pnl"] = record.realized_pnl;
  j["unrealized_pnl"] = record.unrealized_pnl;
  j["volume_usd"] = fill.notional();
  j["hash"] = fill.hash;
  return j;
}

nlohmann::json accountSnapshotToJson(const AccountSnapshot& snapshot) {
  nlohmann::json positions = nlohmann::json::object();
  for (const auto& pos : snapshot.positions) {
    positions[pos.coin] = {
        {"size", pos.size},
        {"avg_price", pos.avg_price},
        {"last_price", pos.last_price},
        {"realized", pos.realized_pnl},
        {"unrealized", pos.unrealized_pnl},
        {"market_val", pos.market_value},
    };
  }

  nlohmann::json j;
  j["time"] = snapshot.time_ms;
  j["total_pnl"] = snapshot.total_pnl;
  j["realized_pnl"] = snapshot.realized_pnl;
  j["unrealized_pnl"] = snapshot.unrealized_pnl;
  j["num_trades"] = snapshot.num_trades;
  j["available_capital"] = snapshot.available_capital;
  j["exposure"] = snapshot.exposure;
  j["positions"] = std::move(positions);
  return j;
}

nlohmann::json paperTradeToJson(const domain::PaperTrade& trade) {
  nlohmann::json j;
  j["time"] = trade.timestamp_ms;
  j["coin"] = trade.coin;
  j["action"] = domain::actionToString(trade.action);
  j["side"] = domain::sideToString(trade.side);
  j["size"] = trade.size;
  j["price"] = trade.price;
  j["realized_pnl"] = trade.realized_pnl;
  j["position_size"] = trade.position_size;
  j["unrealized_pnl"] = trade.unrealized_pnl;
  return j;
}

}  // namespace copytrader
