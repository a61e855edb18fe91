#pragma once

#include <cctype>
#include <cstdint>
#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <unordered_map>

using json = nlohmann::json;

enum class WinRatePolicy : uint8_t { MarkToLastPrice = 0, ResolvedOnly = 1 };

struct SmartMoneyWeights {
  double win_rate = 0.5;
  double volume = 0.3;
  double recency = 0.2;
};

struct Config {
  std::string db_path;
  std::string rpc_url;
  std::string rpc_api_key;
  int api_port = 0;
  int sync_batch_size = 0;
  int64_t initial_block = 0;
  int rpc_timeout_seconds = 30;
  int poll_interval_seconds = 2;
  int max_poll_interval_seconds = 30;
  int backoff_initial_ms = 500;
  int backoff_max_ms = 60000;
  double arbitrage_threshold = 0.02;
  int smart_money_min_trades = 5;
  SmartMoneyWeights smart_money_weights;
  WinRatePolicy win_rate_policy = WinRatePolicy::MarkToLastPrice;
  std::string market_metadata_path;

  static Config load(const std::string &path) {
    std::ifstream f(path);
    if (!f.is_open())
      throw std::runtime_error("无法打开配置文件: " + path);

    json j;
    try {
      f >> j;
    } catch (const json::parse_error &e) {
      throw std::runtime_error("配置文件不是合法 JSON: " + std::string(e.what()));
    }
    return from_json(j);
  }

  static Config from_json(const json &j) {
    auto require = [&](const char *key) -> const json & {
      if (!j.contains(key))
        throw std::runtime_error(std::string("配置文件缺少必填字段: ") + key);
      return j.at(key);
    };

    auto read = [&](const char *key, auto fallback) {
      using T = decltype(fallback);
      if (!j.contains(key))
        return fallback;
      try {
        return j.at(key).get<T>();
      } catch (const json::exception &) {
        throw std::runtime_error(std::string("配置字段类型错误: ") + key);
      }
    };

    Config config;
    try {
      config.db_path = require("db_path").get<std::string>();
      config.rpc_url = require("rpc_url").get<std::string>();
      config.api_port = require("api_port").get<int>();
      config.sync_batch_size = require("sync_batch_size").get<int>();
      config.initial_block = require("initial_block").get<int64_t>();
    } catch (const json::exception &e) {
      throw std::runtime_error("配置字段类型错误: " + std::string(e.what()));
    }

    config.rpc_api_key = read("rpc_api_key", std::string());
    config.rpc_timeout_seconds = read("rpc_timeout_seconds", 30);
    config.poll_interval_seconds = read("poll_interval_seconds", 2);
    config.max_poll_interval_seconds = read("max_poll_interval_seconds", 30);
    config.backoff_initial_ms = read("backoff_initial_ms", 500);
    config.backoff_max_ms = read("backoff_max_ms", 60000);
    config.arbitrage_threshold = read("arbitrage_threshold", 0.02);
    config.smart_money_min_trades = read("smart_money_min_trades", 5);
    config.market_metadata_path = read("market_metadata_path", std::string());

    if (j.contains("smart_money_weights")) {
      const auto &w = j.at("smart_money_weights");
      config.smart_money_weights.win_rate = w.value("win_rate", 0.5);
      config.smart_money_weights.volume = w.value("volume", 0.3);
      config.smart_money_weights.recency = w.value("recency", 0.2);
    }

    std::string policy = read("win_rate_policy", std::string("mark_to_last_price"));
    if (policy == "mark_to_last_price") {
      config.win_rate_policy = WinRatePolicy::MarkToLastPrice;
    } else if (policy == "resolved_only") {
      config.win_rate_policy = WinRatePolicy::ResolvedOnly;
    } else {
      throw std::runtime_error("未知 win_rate_policy: " + policy);
    }

    config.validate();
    return config;
  }

  void validate() const {
    if (sync_batch_size < 1)
      throw std::runtime_error("sync_batch_size 必须 >= 1");
    if (initial_block < 0)
      throw std::runtime_error("initial_block 必须 >= 0");
    if (rpc_timeout_seconds < 1)
      throw std::runtime_error("rpc_timeout_seconds 必须 >= 1");
    if (poll_interval_seconds < 1 || max_poll_interval_seconds < poll_interval_seconds)
      throw std::runtime_error("max_poll_interval_seconds 必须 >= poll_interval_seconds >= 1");
    if (backoff_initial_ms < 1 || backoff_max_ms < backoff_initial_ms)
      throw std::runtime_error("backoff_max_ms 必须 >= backoff_initial_ms >= 1");
    if (arbitrage_threshold < 0.0)
      throw std::runtime_error("arbitrage_threshold 必须 >= 0");
    if (smart_money_min_trades < 1)
      throw std::runtime_error("smart_money_min_trades 必须 >= 1");
  }
};

// condition_id -> slug, 来自 Gamma 导出的市场元数据
inline std::unordered_map<std::string, std::string> load_market_slugs(const std::string &path) {
  std::unordered_map<std::string, std::string> slugs;
  if (path.empty())
    return slugs;

  std::ifstream f(path);
  if (!f.is_open())
    throw std::runtime_error("无法打开市场元数据文件: " + path);

  json j;
  try {
    f >> j;
  } catch (const json::parse_error &e) {
    throw std::runtime_error("市场元数据不是合法 JSON: " + std::string(e.what()));
  }
  if (!j.is_object())
    throw std::runtime_error("市场元数据必须是 {condition_id: slug} 对象");

  for (const auto &item : j.items()) {
    if (!item.value().is_string())
      continue;
    std::string id = item.key();
    for (auto &c : id)
      c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    slugs[id] = item.value().get<std::string>();
  }
  return slugs;
}
