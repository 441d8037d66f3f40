#pragma once

#include <cstdint>

namespace copytrader {

// -----------------------------------------------------------------------------
// ITimeProvider - abstract wall-clock source
// -----------------------------------------------------------------------------
//
// @brief  Supplies "now" in epoch milliseconds to every component that needs
//         a clock reading.
//
// @details
// The fill aggregator measures how long volume has been accumulating and
// how much of it has decayed; the session stamps open times. Reading
// std::chrono::system_clock directly would make those paths untestable, so
// the clock is injected:
//
//   - LiveTimeProvider       → std::chrono::system_clock (production).
//   - SimulationTimeProvider → value set by the caller (tests, replays).
//
// Thread-safety contract:
//   Implementations must allow concurrent now_ms() calls from any thread.
//
// Ownership:
//   Components hold a const reference; the provider must outlive them.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // Current time in milliseconds since the Unix epoch.
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace copytrader
