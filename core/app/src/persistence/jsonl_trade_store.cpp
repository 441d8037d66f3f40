#include "copytrader/persistence/jsonl_trade_store.hpp"
#include "copytrader/persistence/record_codec.hpp"
#include "copytrader/time/time_utils.hpp"

#include <fstream>
#include <iostream>
#include <system_error>
#include <utility>

namespace copytrader {

JsonlTradeStore::JsonlTradeStore(std::filesystem::path data_dir,
                                 const ITimeProvider& clock)
    : data_dir_(std::move(data_dir)), clock_(clock) {}

// -----------------------------------------------------------------------------
// saveFill: one line per raw fill of a committed batch
// -----------------------------------------------------------------------------
void JsonlTradeStore::saveFill(const domain::Fill& fill,
                               domain::PositionAction action,
                               double realized_pnl, double unrealized_pnl) {
  FillRecord record;
  record.time_ms = clock_.now_ms();
  record.fill = fill;
  record.action = action;
  record.realized_pnl = realized_pnl;
  record.unrealized_pnl = unrealized_pnl;

  appendLine(dailyFile("fills"), fillRecordToJson(record));
}

// -----------------------------------------------------------------------------
// saveAccount: one line per committed trade
// -----------------------------------------------------------------------------
void JsonlTradeStore::saveAccount(const AccountSnapshot& snapshot) {
  appendLine(dailyFile("accounts"), accountSnapshotToJson(snapshot));
}

std::filesystem::path JsonlTradeStore::dailyFile(const char* subdir) const {
  return data_dir_ / subdir / (format_utc(clock_.now_ms(), "%Y%m%d") + ".jl");
}

// -----------------------------------------------------------------------------
// appendLine: create directories, append, close
// -----------------------------------------------------------------------------
bool JsonlTradeStore::appendLine(const std::filesystem::path& file,
                                 const nlohmann::json& record) {
  std::lock_guard lock(mutex_);

  std::error_code ec;
  std::filesystem::create_directories(file.parent_path(), ec);
  if (ec) {
    std::cerr << "[JsonlTradeStore] cannot create " << file.parent_path()
              << ": " << ec.message() << "\n";
    return false;
  }

  std::string line;
  try {
    line = record.dump();
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[JsonlTradeStore] cannot serialize record: " << e.what()
              << "\n";
    return false;
  }

  std::ofstream out(file, std::ios::out | std::ios::app);
  if (!out) {
    std::cerr << "[JsonlTradeStore] cannot open " << file << "\n";
    return false;
  }

  out << line << '\n';
  if (!out.flush()) {
    std::cerr << "[JsonlTradeStore] write failed for " << file << "\n";
    return false;
  }
  return true;
}

}  // namespace copytrader
