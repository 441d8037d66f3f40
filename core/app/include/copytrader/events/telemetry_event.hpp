#pragma once

#include "copytrader/persistence/account_snapshot.hpp"

#include <variant>

namespace copytrader {

// -----------------------------------------------------------------------------
// TelemetryEvent - what the IPC server broadcasts on its PUB socket
// -----------------------------------------------------------------------------
//
// @details
// A closed set of value types. FillRecord is published once per raw fill
// of a committed batch; AccountSnapshot once per commit, after the fills.
// Being a std::variant, records are moved through BoundedQueue without
// slicing or heap allocation per event.
// -----------------------------------------------------------------------------
using TelemetryEvent = std::variant<FillRecord, AccountSnapshot>;

}  // namespace copytrader
