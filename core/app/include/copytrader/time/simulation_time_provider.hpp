#pragma once

#include "copytrader/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace copytrader {

// -----------------------------------------------------------------------------
// SimulationTimeProvider - externally driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose current time is set explicitly by its owner.
//
// @details
// Lets tests walk the fill aggregator through its 10-second decay gate and
// minimum trade interval without sleeping, and lets a replay harness feed
// historical fills with their own timestamps.
//
// Storage is a std::atomic<int64_t>: a single writer (the test or replay
// driver) and any number of readers need visibility, not mutual exclusion.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  // -------------------------------------------------------------------------
  // advance_time(new_time_ms)
  // -------------------------------------------------------------------------
  // @brief  Sets the clock to an absolute time.
  //
  // @details
  // Monotonicity is the caller's responsibility and is not enforced; tests
  // occasionally rewind on purpose.
  // -------------------------------------------------------------------------
  void advance_time(std::int64_t new_time_ms);

  // Moves the clock forward by delta_ms.
  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace copytrader
