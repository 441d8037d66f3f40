#pragma once

#include "copytrader/domain/position_action.hpp"

namespace copytrader {
namespace accounting {

// -----------------------------------------------------------------------------
// classifyAction(old_size, new_size)
// -----------------------------------------------------------------------------
//
// @brief  Maps a before/after signed position size pair to one of the five
//         position transitions.
//
// @param  old_size  Signed position size before the trade.
// @param  new_size  Signed position size after the trade.
//
// @return The PositionAction describing the transition.
//
// @details
// Rules, first match wins:
//   1. old == 0, new != 0              → Open
//   2. old != 0, new == 0              → Close
//   3. both non-zero, signs differ     → Reverse
//   4. same sign, |new| > |old|        → Add
//   5. same sign, |new| < |old|        → Reduce
//
// The remaining inputs (old == new, including 0 → 0) describe a trade that
// did not change the position. The session never commits such a trade, so
// the classifier reports Add for them: a non-disposal action that cannot
// realize PnL.
//
// Thread-safety: Pure function.
// -----------------------------------------------------------------------------
domain::PositionAction classifyAction(double old_size, double new_size);

}  // namespace accounting
}  // namespace copytrader
