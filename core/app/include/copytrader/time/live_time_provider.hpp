#pragma once

#include "copytrader/time/i_time_provider.hpp"

namespace copytrader {

// -----------------------------------------------------------------------------
// LiveTimeProvider - system clock
// -----------------------------------------------------------------------------
// Used by the copytrader executable. Stateless; safe from any thread.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace copytrader
