#include "copytrader/config/app_config.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace copytrader {

namespace {

// Reads section[key] into out when present. Type errors are rethrown as
// std::invalid_argument carrying the dotted key name.
template <typename T>
void readKey(const nlohmann::json& section, const char* section_name,
             const char* key, T& out) {
  auto it = section.find(key);
  if (it == section.end() || it->is_null()) {
    return;
  }
  try {
    out = it->get<T>();
  } catch (const nlohmann::json::exception& e) {
    throw std::invalid_argument(std::string(section_name) + "." + key +
                                ": " + e.what());
  }
}

const nlohmann::json& sectionOf(const nlohmann::json& root, const char* name) {
  static const nlohmann::json kEmpty = nlohmann::json::object();
  auto it = root.find(name);
  if (it == root.end() || it->is_null()) {
    return kEmpty;
  }
  if (!it->is_object()) {
    throw std::invalid_argument(std::string(name) + ": expected an object");
  }
  return *it;
}

void require(bool ok, const char* key, const char* rule) {
  if (!ok) {
    throw std::invalid_argument(std::string(key) + ": " + rule);
  }
}

}  // namespace

AppConfig appConfigFromJson(const nlohmann::json& root) {
  if (!root.is_object()) {
    throw std::invalid_argument("config root must be a JSON object");
  }

  AppConfig config;

  // --- capital -------------------------------------------------------------
  const auto& capital = sectionOf(root, "capital");
  readKey(capital, "capital", "bankroll", config.capital.bankroll);
  readKey(capital, "capital", "leverage", config.capital.leverage);
  readKey(capital, "capital", "dynamic_sizing", config.capital.dynamic_sizing);
  double base_notional = 0.0;
  auto base_it = capital.find("base_notional");
  if (base_it != capital.end() && !base_it->is_null()) {
    readKey(capital, "capital", "base_notional", base_notional);
    require(base_notional > 0.0, "capital.base_notional", "must be > 0");
    config.capital.base_notional = base_notional;
  }
  require(config.capital.bankroll > 0.0, "capital.bankroll", "must be > 0");
  require(config.capital.leverage >= 1.0, "capital.leverage", "must be >= 1");

  // --- aggregation ---------------------------------------------------------
  const auto& aggregation = sectionOf(root, "aggregation");
  readKey(aggregation, "aggregation", "min_trade_interval_ms",
          config.aggregation.min_trade_interval_ms);
  readKey(aggregation, "aggregation", "volume_threshold",
          config.aggregation.volume_threshold);
  readKey(aggregation, "aggregation", "volume_decay_rate",
          config.aggregation.volume_decay_rate);
  require(config.aggregation.min_trade_interval_ms >= 0,
          "aggregation.min_trade_interval_ms", "must be >= 0");
  require(config.aggregation.volume_threshold >= 0.0,
          "aggregation.volume_threshold", "must be >= 0");
  require(config.aggregation.volume_decay_rate >= 0.0 &&
              config.aggregation.volume_decay_rate <= 1.0,
          "aggregation.volume_decay_rate", "must be within [0, 1]");

  // --- feed ----------------------------------------------------------------
  const auto& feed = sectionOf(root, "feed");
  readKey(feed, "feed", "endpoint", config.feed.endpoint);
  readKey(feed, "feed", "copy_threshold", config.feed.copy_threshold);
  readKey(feed, "feed", "max_fills_per_batch", config.feed.max_fills_per_batch);
  readKey(feed, "feed", "dedup_window_ms", config.feed.dedup_window_ms);
  require(!config.feed.endpoint.empty(), "feed.endpoint", "must not be empty");
  require(config.feed.copy_threshold >= 0.0, "feed.copy_threshold",
          "must be >= 0");
  require(config.feed.max_fills_per_batch > 0, "feed.max_fills_per_batch",
          "must be > 0");
  require(config.feed.dedup_window_ms >= 0, "feed.dedup_window_ms",
          "must be >= 0");

  // --- ipc -----------------------------------------------------------------
  const auto& ipc = sectionOf(root, "ipc");
  readKey(ipc, "ipc", "command_endpoint", config.ipc.command_endpoint);
  readKey(ipc, "ipc", "publish_endpoint", config.ipc.publish_endpoint);

  // --- persistence ---------------------------------------------------------
  const auto& persistence = sectionOf(root, "persistence");
  readKey(persistence, "persistence", "enabled", config.persistence.enabled);
  readKey(persistence, "persistence", "data_dir", config.persistence.data_dir);
  require(!config.persistence.enabled || !config.persistence.data_dir.empty(),
          "persistence.data_dir", "must not be empty when enabled");

  // --- reporting -----------------------------------------------------------
  const auto& reporting = sectionOf(root, "reporting");
  readKey(reporting, "reporting", "summary_interval",
          config.reporting.summary_interval);
  readKey(reporting, "reporting", "recent_trades_count",
          config.reporting.recent_trades_count);
  require(config.reporting.summary_interval >= 0,
          "reporting.summary_interval", "must be >= 0");

  return config;
}

AppConfig loadAppConfig(const std::filesystem::path& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::invalid_argument("cannot open config file " + path.string());
  }

  nlohmann::json root;
  try {
    root = nlohmann::json::parse(in);
  } catch (const nlohmann::json::exception& e) {
    throw std::invalid_argument("cannot parse " + path.string() + ": " +
                                e.what());
  }
  return appConfigFromJson(root);
}

std::filesystem::path resolveDataDir(const PersistenceConfig& persistence) {
  std::filesystem::path dir(persistence.data_dir);
  if (dir.is_absolute()) {
    return dir;
  }
  const char* prefix = std::getenv("PREFIX");
  if (prefix == nullptr || *prefix == '\0') {
    return dir;
  }
  return std::filesystem::path(prefix) / dir;
}

}  // namespace copytrader
