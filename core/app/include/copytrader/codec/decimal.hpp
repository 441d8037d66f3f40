#pragma once

#include <string>

namespace copytrader {
namespace codec {

// -----------------------------------------------------------------------------
// parseClosedPnl(text)
// -----------------------------------------------------------------------------
//
// @brief  Parses the venue's string-encoded closed PnL.
//
// @return The parsed value, or 0.0 when text is empty, not entirely a
//         decimal number (surrounding whitespace allowed), or not finite.
//
// @details
// A malformed figure is never an error: accounting falls back to the
// locally computed realized PnL, which is what a 0 from here triggers.
// -----------------------------------------------------------------------------
double parseClosedPnl(const std::string& text);

// -----------------------------------------------------------------------------
// parseDecimal(text, out)
// -----------------------------------------------------------------------------
// Strict variant used for required fields (size, price). Returns false
// instead of falling back, leaving out untouched.
// -----------------------------------------------------------------------------
bool parseDecimal(const std::string& text, double& out);

}  // namespace codec
}  // namespace copytrader
