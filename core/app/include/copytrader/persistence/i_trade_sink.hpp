#pragma once

#include "copytrader/domain/fill.hpp"
#include "copytrader/domain/position_action.hpp"
#include "copytrader/persistence/account_snapshot.hpp"

namespace copytrader {

// -----------------------------------------------------------------------------
// ITradeSink - side-effecting consumer of committed trades
// -----------------------------------------------------------------------------
//
// @brief  Persistence hook invoked by PaperTradingSession after every
//         committed trade: saveFill() once per raw fill in the batch, then
//         saveAccount() once.
//
// @details
// Calls happen under the session mutex, so implementations must return
// promptly and must never call back into the session.
//
// Sinks are fire-and-forget from the session's point of view. They are
// expected to handle their own failures; anything that still escapes as a
// std::exception is caught and logged by the session and never rolls back
// accounting state.
//
// Implementations:
//   JsonlTradeStore - daily JSON-lines files on disk.
//   IpcServer's telemetry sink - JSON broadcast on the PUB socket.
// -----------------------------------------------------------------------------
class ITradeSink {
 public:
  virtual ~ITradeSink() = default;

  virtual void saveFill(const domain::Fill& fill,
                        domain::PositionAction action, double realized_pnl,
                        double unrealized_pnl) = 0;

  virtual void saveAccount(const AccountSnapshot& snapshot) = 0;
};

}  // namespace copytrader
