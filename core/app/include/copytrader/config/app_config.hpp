#pragma once

#include "copytrader/aggregation/aggregation_settings.hpp"
#include "copytrader/domain/capital_limits.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace copytrader {

// -----------------------------------------------------------------------------
// AppConfig - everything the executable reads from its JSON config file
// -----------------------------------------------------------------------------
//
// @details
// Layout (every section and key optional; defaults shown):
//
//   {
//     "capital":     { "bankroll": 10000, "leverage": 1.0,
//                      "base_notional": 500, "dynamic_sizing": true },
//     "aggregation": { "min_trade_interval_ms": 60000,
//                      "volume_threshold": 1000, "volume_decay_rate": 0.5 },
//     "feed":        { "endpoint": "tcp://127.0.0.1:5555",
//                      "copy_threshold": 1000, "max_fills_per_batch": 50,
//                      "dedup_window_ms": 7200000 },
//     "ipc":         { "command_endpoint": "tcp://127.0.0.1:5556",
//                      "publish_endpoint": "tcp://127.0.0.1:5557" },
//     "persistence": { "enabled": true, "data_dir": "data/copytrader" },
//     "reporting":   { "summary_interval": 10, "recent_trades_count": 10 }
//   }
//
// base_notional has no default; without it dynamic sizing stays off and
// the hard exposure check applies.
// -----------------------------------------------------------------------------
struct FeedConfig {
  std::string endpoint{"tcp://127.0.0.1:5555"};
  double copy_threshold{1000.0};
  std::size_t max_fills_per_batch{50};
  std::int64_t dedup_window_ms{7200000};
};

struct IpcConfig {
  std::string command_endpoint{"tcp://127.0.0.1:5556"};
  std::string publish_endpoint{"tcp://127.0.0.1:5557"};

  bool enabled() const {
    return !command_endpoint.empty() || !publish_endpoint.empty();
  }
};

struct PersistenceConfig {
  bool enabled{true};
  std::string data_dir{"data/copytrader"};
};

struct ReportingConfig {
  int summary_interval{10};
  std::size_t recent_trades_count{10};
};

struct AppConfig {
  domain::CapitalLimits capital;
  AggregationSettings aggregation;
  FeedConfig feed;
  IpcConfig ipc;
  PersistenceConfig persistence;
  ReportingConfig reporting;
};

// -----------------------------------------------------------------------------
// appConfigFromJson(root)
// -----------------------------------------------------------------------------
// @brief  Builds and validates an AppConfig from a parsed document.
//
// @throws std::invalid_argument naming the offending key when a value has
//         the wrong type or is out of range.
// -----------------------------------------------------------------------------
AppConfig appConfigFromJson(const nlohmann::json& root);

// Reads and parses path, then appConfigFromJson(). Throws
// std::invalid_argument if the file cannot be opened or parsed.
AppConfig loadAppConfig(const std::filesystem::path& path);

// Relative data_dir is placed under $PREFIX when that variable is set.
std::filesystem::path resolveDataDir(const PersistenceConfig& persistence);

}  // namespace copytrader
