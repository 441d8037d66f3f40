#pragma once

#include "copytrader/domain/fill.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace copytrader {
namespace codec {

// -----------------------------------------------------------------------------
// Venue fill decoding
// -----------------------------------------------------------------------------
//
// @brief  Turns the venue's JSON fill objects into domain::Fill.
//
// @details
// Expected object (numeric fields may arrive as strings or numbers):
//   {
//     "coin": "BTC", "side": "B", "sz": "0.5", "px": "60000.0",
//     "time": 1700000000000, "closedPnl": "0.0", "hash": "0xabc...",
//     "dir": "Open Long", "startPosition": "0.0", "oid": 123,
//     "crossed": true, "fee": "0.01"
//   }
//
// Only coin, side, sz, px and time are required. Errors are reported by
// throwing nlohmann::json::exception (missing key / wrong type) or
// std::invalid_argument (bad side code, unparsable or out-of-range number).
// Callers at the network boundary catch both.
// -----------------------------------------------------------------------------

// "B" -> Buy, "A" -> Sell. Throws std::invalid_argument otherwise.
domain::Side parseSide(const std::string& code);

domain::Fill decodeFill(const nlohmann::json& object);

// Accepts one fill object or an array of them.
std::vector<domain::Fill> decodeFills(const std::string& payload);

}  // namespace codec
}  // namespace copytrader
