#pragma once

#include "copytrader/persistence/i_trade_sink.hpp"
#include "copytrader/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <mutex>

namespace copytrader {

// -----------------------------------------------------------------------------
// JsonlTradeStore - append-only daily JSON-lines files
// -----------------------------------------------------------------------------
//
// @brief  ITradeSink that appends one JSON object per line to
//           <data_dir>/fills/YYYYMMDD.jl     (one line per raw fill)
//           <data_dir>/accounts/YYYYMMDD.jl  (one line per committed trade)
//         The date is the UTC date of the write.
//
// @details
// Directories are created on demand. Every write opens, appends and closes
// the file, so a crash loses at most the line being written and external
// tools can tail the files safely.
//
// Failures (unwritable directory, full disk, ...) are logged on std::cerr
// and swallowed. Persistence is a side channel; it must never stall or
// corrupt the accounting path.
//
// Thread model:
//   A private mutex serializes appends, so the store may be shared by
//   several sessions. In the engine it is only called under the session
//   lock.
// -----------------------------------------------------------------------------
class JsonlTradeStore final : public ITradeSink {
 public:
  JsonlTradeStore(std::filesystem::path data_dir, const ITimeProvider& clock);

  void saveFill(const domain::Fill& fill, domain::PositionAction action,
                double realized_pnl, double unrealized_pnl) override;

  void saveAccount(const AccountSnapshot& snapshot) override;

  // Path of today's file in the given subdirectory ("fills" / "accounts").
  std::filesystem::path dailyFile(const char* subdir) const;

  const std::filesystem::path& dataDir() const { return data_dir_; }

 private:
  // Returns false (after logging) if the line could not be written.
  bool appendLine(const std::filesystem::path& file,
                  const nlohmann::json& record);

  std::filesystem::path data_dir_;
  const ITimeProvider& clock_;
  std::mutex mutex_;
};

}  // namespace copytrader
