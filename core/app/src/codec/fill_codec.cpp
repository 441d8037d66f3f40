#include "copytrader/codec/fill_codec.hpp"
#include "copytrader/codec/decimal.hpp"

#include <stdexcept>

namespace copytrader {
namespace codec {

namespace {

// Venue numbers come either as JSON numbers or as decimal strings.
double numberField(const nlohmann::json& object, const char* key) {
  const auto& value = object.at(key);
  if (value.is_number()) {
    return value.get<double>();
  }
  double out = 0.0;
  if (!parseDecimal(value.get<std::string>(), out)) {
    throw std::invalid_argument(std::string("invalid number in field '") +
                                key + "'");
  }
  return out;
}

std::string decimalText(const nlohmann::json& value) {
  if (value.is_string()) {
    return value.get<std::string>();
  }
  if (value.is_number()) {
    return value.dump();
  }
  return "0";
}

}  // namespace

domain::Side parseSide(const std::string& code) {
  if (code == "B") {
    return domain::Side::Buy;
  }
  if (code == "A") {
    return domain::Side::Sell;
  }
  throw std::invalid_argument("unknown side code '" + code + "'");
}

domain::Fill decodeFill(const nlohmann::json& object) {
  domain::Fill fill;
  fill.coin = object.at("coin").get<std::string>();
  fill.side = parseSide(object.at("side").get<std::string>());
  fill.size = numberField(object, "sz");
  fill.price = numberField(object, "px");
  fill.time_ms = object.at("time").get<std::int64_t>();

  if (fill.coin.empty()) {
    throw std::invalid_argument("empty coin");
  }
  if (fill.size < 0.0) {
    throw std::invalid_argument("negative size for " + fill.coin);
  }
  if (fill.price <= 0.0) {
    throw std::invalid_argument("non-positive price for " + fill.coin);
  }

  if (auto it = object.find("closedPnl"); it != object.end()) {
    fill.closed_pnl = decimalText(*it);
  }
  if (auto it = object.find("hash"); it != object.end() && it->is_string()) {
    fill.hash = it->get<std::string>();
  }
  if (auto it = object.find("dir"); it != object.end() && it->is_string()) {
    fill.direction = it->get<std::string>();
  }
  if (auto it = object.find("startPosition"); it != object.end()) {
    fill.start_position = parseClosedPnl(decimalText(*it));
  }
  if (auto it = object.find("oid"); it != object.end() && it->is_number()) {
    fill.order_id = it->get<std::int64_t>();
  }
  if (auto it = object.find("crossed");
      it != object.end() && it->is_boolean()) {
    fill.crossed = it->get<bool>();
  }
  if (auto it = object.find("fee"); it != object.end()) {
    fill.fee = decimalText(*it);
  }
  return fill;
}

std::vector<domain::Fill> decodeFills(const std::string& payload) {
  auto json = nlohmann::json::parse(payload);

  std::vector<domain::Fill> fills;
  if (json.is_array()) {
    fills.reserve(json.size());
    for (const auto& object : json) {
      fills.push_back(decodeFill(object));
    }
  } else {
    fills.push_back(decodeFill(json));
  }
  return fills;
}

}  // namespace codec
}  // namespace copytrader
