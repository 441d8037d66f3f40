#pragma once

#include "copytrader/domain/fill.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace copytrader {

// -----------------------------------------------------------------------------
// FillFilter - ingestion gate in front of the session
// -----------------------------------------------------------------------------
//
// @brief  Selects which incoming venue fills are copied.
//
// @details
// filter() applies, in order:
//   1. Window pruning: remembered hashes whose fill time is older than
//      (newest fill time seen) - dedup_window_ms are forgotten.
//   2. Duplicate drop: a fill whose hash was already accepted is skipped.
//   3. Copy threshold: fills with size * price below copy_threshold are
//      skipped and not remembered.
//   4. Batch cap: at most max_per_batch fills are accepted; the remainder
//      is deferred and not remembered, so a later delivery can still pass.
//
// Fills without a hash cannot be deduplicated and are always eligible.
//
// Thread model:
//   Not thread-safe. Owned by CopyTradingEngine and called under its
//   ingest lock.
// -----------------------------------------------------------------------------
class FillFilter {
 public:
  FillFilter(double copy_threshold, std::size_t max_per_batch,
             std::int64_t dedup_window_ms);

  std::vector<domain::Fill> filter(const std::vector<domain::Fill>& batch);

  std::size_t seenCount() const { return seen_.size(); }

 private:
  void prune();

  double copy_threshold_;
  std::size_t max_per_batch_;
  std::int64_t dedup_window_ms_;
  std::int64_t newest_time_ms_{0};

  // hash -> fill time
  std::unordered_map<std::string, std::int64_t> seen_;
};

}  // namespace copytrader
