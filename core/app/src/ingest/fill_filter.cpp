#include "copytrader/ingest/fill_filter.hpp"

#include <algorithm>
#include <iostream>

namespace copytrader {

FillFilter::FillFilter(double copy_threshold, std::size_t max_per_batch,
                       std::int64_t dedup_window_ms)
    : copy_threshold_(copy_threshold),
      max_per_batch_(max_per_batch),
      dedup_window_ms_(dedup_window_ms) {}

void FillFilter::prune() {
  std::int64_t cutoff = newest_time_ms_ - dedup_window_ms_;
  for (auto it = seen_.begin(); it != seen_.end();) {
    if (it->second < cutoff) {
      it = seen_.erase(it);
    } else {
      ++it;
    }
  }
}

std::vector<domain::Fill> FillFilter::filter(
    const std::vector<domain::Fill>& batch) {
  for (const auto& fill : batch) {
    newest_time_ms_ = std::max(newest_time_ms_, fill.time_ms);
  }
  prune();

  std::vector<domain::Fill> accepted;
  std::size_t duplicates = 0;
  std::size_t below_threshold = 0;
  std::size_t deferred = 0;

  for (const auto& fill : batch) {
    if (!fill.hash.empty() && seen_.count(fill.hash) > 0) {
      ++duplicates;
      continue;
    }
    if (fill.notional() < copy_threshold_) {
      ++below_threshold;
      continue;
    }
    if (accepted.size() >= max_per_batch_) {
      ++deferred;
      continue;
    }
    if (!fill.hash.empty()) {
      seen_.emplace(fill.hash, fill.time_ms);
    }
    accepted.push_back(fill);
  }

  if (deferred > 0) {
    std::cout << "[FillFilter] Batch cap " << max_per_batch_ << " reached, "
              << deferred << " fills deferred" << std::endl;
  }
  if (duplicates > 0 || below_threshold > 0) {
    std::cout << "[FillFilter] Skipped " << duplicates << " duplicate and "
              << below_threshold << " below-threshold fills" << std::endl;
  }
  return accepted;
}

}  // namespace copytrader
