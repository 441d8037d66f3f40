#pragma once

#include "copytrader/domain/paper_trade.hpp"
#include "copytrader/persistence/account_snapshot.hpp"

#include <nlohmann/json.hpp>

namespace copytrader {

// -----------------------------------------------------------------------------
// JSON encoders shared by the JSON-lines store, IPC telemetry and IPC
// command responses.
// -----------------------------------------------------------------------------
nlohmann::json fillRecordToJson(const FillRecord& record);
nlohmann::json accountSnapshotToJson(const AccountSnapshot& snapshot);
nlohmann::json paperTradeToJson(const domain::PaperTrade& trade);

}  // namespace copytrader
