#pragma once

#include <algorithm>
#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <set>
#include <string>
#include <vector>

#include "../core/errors.hpp"
#include "../core/types.hpp"
#include "../infra/rpc_client.hpp"
#include "event_decoder.hpp"

using json = nlohmann::json;

// ============================================================================
// LogSource - 按区块范围取原始日志
// 失败抛 FetchError {Timeout, RateLimited, Invalid}
// ============================================================================
class LogSource {
public:
  virtual ~LogSource() = default;

  // [from_block, to_block], 按 (block_number, log_index) 排序
  virtual std::vector<RawLog> fetch_logs(int64_t from_block, int64_t to_block) = 0;
  virtual int64_t head_block() = 0;
};

inline void sort_logs(std::vector<RawLog> &logs) {
  std::stable_sort(logs.begin(), logs.end(), [](const RawLog &a, const RawLog &b) {
    if (a.block_number != b.block_number)
      return a.block_number < b.block_number;
    return a.log_index < b.log_index;
  });
}

// ============================================================================
// RpcLogSource - eth_getLogs over JSON-RPC
// ============================================================================
class RpcLogSource : public LogSource {
public:
  explicit RpcLogSource(RpcClient &rpc) : rpc_(rpc) {}

  int64_t head_block() override { return rpc_.eth_blockNumber(); }

  std::vector<RawLog> fetch_logs(int64_t from_block, int64_t to_block) override {
    if (from_block > to_block) {
      throw FetchError(FetchErrorKind::Invalid,
                       "bad range " + std::to_string(from_block) + ".." + std::to_string(to_block));
    }

    static const std::vector<std::string> ex_topics = {topics::ORDER_FILL, topics::TOKEN_REGISTER};
    static const std::vector<std::string> ct_topics = {topics::CONDITION_RESOLVE};

    std::vector<json> results = rpc_.eth_getLogs_batch(
        {{contracts::CTF_EXCHANGE, from_block, to_block, ex_topics},
         {contracts::NEG_RISK_CTF_EXCHANGE, from_block, to_block, ex_topics},
         {contracts::CONDITIONAL_TOKENS, from_block, to_block, ct_topics}});

    std::vector<RawLog> logs;
    std::set<int64_t> missing_ts;
    for (const auto &r : results) {
      if (!r.is_array())
        throw FetchError(FetchErrorKind::Timeout, "eth_getLogs result is not an array");
      for (const auto &entry : r) {
        // 被重组移除的日志不处理
        if (entry.is_object() && entry.contains("removed") && entry["removed"].is_boolean() &&
            entry["removed"].get<bool>())
          continue;
        RawLog log = parse_log(entry);
        if (log.block_timestamp == 0)
          missing_ts.insert(log.block_number);
        logs.push_back(std::move(log));
      }
    }

    if (!missing_ts.empty()) {
      std::vector<int64_t> blocks(missing_ts.begin(), missing_ts.end());
      std::vector<int64_t> stamps = rpc_.eth_getBlockTimestamps(blocks);
      std::map<int64_t, int64_t> ts_by_block;
      for (size_t i = 0; i < blocks.size(); ++i)
        ts_by_block[blocks[i]] = stamps[i];
      for (auto &log : logs) {
        if (log.block_timestamp == 0)
          log.block_timestamp = ts_by_block[log.block_number];
      }
    }

    sort_logs(logs);
    return logs;
  }

  static RawLog parse_log(const json &entry) {
    try {
      RawLog log;
      log.address = entry.at("address").get<std::string>();
      for (const auto &t : entry.at("topics"))
        log.topics.push_back(t.get<std::string>());
      log.data = entry.at("data").get<std::string>();
      log.tx_hash = entry.at("transactionHash").get<std::string>();
      log.block_number = RpcClient::from_hex(entry.at("blockNumber").get<std::string>());
      log.log_index = RpcClient::from_hex(entry.at("logIndex").get<std::string>());
      if (entry.contains("blockTimestamp") && entry["blockTimestamp"].is_string())
        log.block_timestamp = RpcClient::from_hex(entry["blockTimestamp"].get<std::string>());
      return log;
    } catch (const json::exception &e) {
      throw FetchError(FetchErrorKind::Timeout, "malformed log entry: " + std::string(e.what()));
    }
  }

private:
  RpcClient &rpc_;
};
