#include "copytrader/accounting/action_classifier.hpp"

#include <cmath>

namespace copytrader {
namespace accounting {

domain::PositionAction classifyAction(double old_size, double new_size) {
  using domain::PositionAction;

  if (old_size == 0.0 && new_size != 0.0) {
    return PositionAction::Open;
  }

  if (old_size != 0.0 && new_size == 0.0) {
    return PositionAction::Close;
  }

  if ((old_size > 0.0 && new_size < 0.0) ||
      (old_size < 0.0 && new_size > 0.0)) {
    return PositionAction::Reverse;
  }

  // Same sign from here on.
  if (std::abs(new_size) > std::abs(old_size)) {
    return PositionAction::Add;
  }

  if (std::abs(new_size) < std::abs(old_size)) {
    return PositionAction::Reduce;
  }

  // Unchanged size. Never committed by the session.
  return PositionAction::Add;
}

}  // namespace accounting
}  // namespace copytrader
