#pragma once

#include <cstdint>
#include <string>

namespace copytrader {
namespace domain {

// -----------------------------------------------------------------------------
// Side - direction of an executed trade
// -----------------------------------------------------------------------------
//
// @brief  Closed enumeration replacing the venue's two-letter side codes.
//
// @details
// The venue reports "B" for a buy (bid side taken) and "A" for a sell (ask
// side taken). Codes are converted exactly once, at the decoding boundary
// (see codec/fill_codec.hpp); nothing downstream ever compares strings.
// -----------------------------------------------------------------------------
enum class Side {
  Buy,
  Sell,
};

// Returns +1.0 for Buy and -1.0 for Sell.
inline double sideSign(Side side) { return side == Side::Buy ? 1.0 : -1.0; }

inline const char* sideToString(Side side) {
  switch (side) {
    case Side::Buy:  return "BUY";
    case Side::Sell: return "SELL";
  }
  return "UNKNOWN";
}

// Venue wire code for the side ("B" / "A").
inline const char* sideToVenueCode(Side side) {
  return side == Side::Buy ? "B" : "A";
}

// -----------------------------------------------------------------------------
// Fill - one executed trade report from the monitored account
// -----------------------------------------------------------------------------
//
// @brief  Immutable value describing a single execution, exactly as the
//         venue reported it.
//
// @details
// size is always non-negative; the direction lives in side. closed_pnl is
// kept in its raw string form because the venue encodes decimals as strings
// and may send garbage; it is parsed with parseClosedPnl() at the point of
// use, where a parse failure means 0.
//
// hash uniquely identifies the fill and is used upstream of the accounting
// core (FillFilter) for idempotent ingestion. time_ms is the venue's
// execution timestamp in epoch milliseconds.
//
// Thread model:
//   Plain value type. Copied freely between the feed thread and the
//   session under its lock.
// -----------------------------------------------------------------------------
struct Fill {
  std::string coin;              // Instrument identifier (e.g. "BTC")
  Side side{Side::Buy};          // Buy or Sell
  double size{0.0};              // Executed quantity, >= 0
  double price{0.0};             // Execution price, > 0
  std::string closed_pnl{"0"};   // Venue-reported closed PnL (raw decimal)
  std::int64_t time_ms{0};       // Execution time, epoch milliseconds
  std::string hash;              // Unique content hash

  // Informational venue fields, carried through for persistence.
  std::string direction;         // e.g. "Open Long", "Close Short"
  double start_position{0.0};    // Venue position before this fill
  std::int64_t order_id{0};
  bool crossed{false};
  std::string fee{"0"};

  // Signed quantity: +size for Buy, -size for Sell.
  double signedSize() const { return sideSign(side) * size; }

  // Dollar volume of this fill.
  double notional() const { return size * price; }
};

}  // namespace domain
}  // namespace copytrader
