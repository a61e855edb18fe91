#pragma once

#include <optional>
#include <vector>

#include "../core/types.hpp"

// 一个已应用批次的持久化内容
struct AppliedBatch {
  int64_t from_block = 0;
  int64_t to_block = 0;
  std::vector<Market> markets;
  std::vector<MarketResolved> resolutions;
  std::vector<Trade> trades;

  bool empty() const { return markets.empty() && resolutions.empty() && trades.empty(); }
};

// ============================================================================
// BatchStore - 游标与已应用事件的持久化
// commit 原子写入批次内容和游标; 失败抛 PersistenceError, 不留部分写入
// ============================================================================
class BatchStore {
public:
  virtual ~BatchStore() = default;

  virtual std::optional<IndexCursor> load_cursor() = 0;
  virtual void commit(const AppliedBatch &batch, const IndexCursor &cursor) = 0;

  // 启动重放用: 市场含结算状态, 交易按 (block_number, log_index) 排序
  virtual std::vector<Market> load_markets() = 0;
  virtual std::vector<Trade> load_trades() = 0;
};
