#pragma once

namespace copytrader {
namespace domain {

// -----------------------------------------------------------------------------
// PositionAction - the five position transitions
// -----------------------------------------------------------------------------
//
// @brief  Classifies what a committed trade did to a position.
//
// @details
//   Open    - flat → long/short
//   Add     - same direction, |size| grows
//   Reduce  - same direction, |size| shrinks but stays non-zero
//   Close   - long/short → flat
//   Reverse - long → short or short → long in one trade
//
// Only Reduce, Close and Reverse can realize PnL.
// -----------------------------------------------------------------------------
enum class PositionAction {
  Open,
  Add,
  Reduce,
  Close,
  Reverse,
};

inline const char* actionToString(PositionAction action) {
  switch (action) {
    case PositionAction::Open:    return "OPEN";
    case PositionAction::Add:     return "ADD";
    case PositionAction::Reduce:  return "REDUCE";
    case PositionAction::Close:   return "CLOSE";
    case PositionAction::Reverse: return "REVERSE";
  }
  return "UNKNOWN";
}

// True for the transitions that dispose of existing exposure.
inline bool isDisposal(PositionAction action) {
  return action == PositionAction::Reduce ||
         action == PositionAction::Close ||
         action == PositionAction::Reverse;
}

}  // namespace domain
}  // namespace copytrader
