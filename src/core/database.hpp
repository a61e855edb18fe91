#pragma once

#include <duckdb.hpp>
#include <fcntl.h>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <sys/file.h>
#include <unistd.h>
#include <vector>

#include "errors.hpp"
#include "../sync/batch_store.hpp"

// ============================================================================
// Database - DuckDB 实现的 BatchStore
// 单写者: <db_path>.lock 上的 flock
// ============================================================================
class Database : public BatchStore {
public:
  explicit Database(const std::string &path) : db_path_(path) {
    lock_path_ = path + ".lock";
    lock_fd_ = open(lock_path_.c_str(), O_CREAT | O_RDWR, 0666);
    if (lock_fd_ < 0)
      throw PersistenceError("无法创建锁文件: " + lock_path_);
    if (flock(lock_fd_, LOCK_EX | LOCK_NB) != 0) {
      close(lock_fd_);
      throw PersistenceError("数据库已被其他进程占用: " + db_path_);
    }

    try {
      db_ = std::make_unique<duckdb::DuckDB>(path);
      read_conn_ = std::make_unique<duckdb::Connection>(*db_);
      write_conn_ = std::make_unique<duckdb::Connection>(*db_);
    } catch (const std::exception &e) {
      flock(lock_fd_, LOCK_UN);
      close(lock_fd_);
      throw PersistenceError("无法打开数据库 " + db_path_ + ": " + e.what());
    }
  }

  ~Database() override {
    if (lock_fd_ >= 0) {
      flock(lock_fd_, LOCK_UN);
      close(lock_fd_);
    }
  }

  Database(const Database &) = delete;
  Database &operator=(const Database &) = delete;

  void init_schema() {
    std::lock_guard<std::mutex> lock(write_mutex_);
    run(R"(
      CREATE TABLE IF NOT EXISTS sync_state (
        key TEXT PRIMARY KEY,
        value TEXT
      )
    )");

    run(R"(
      CREATE TABLE IF NOT EXISTS market (
        condition_id TEXT PRIMARY KEY,
        exchange TEXT NOT NULL,
        slug TEXT NOT NULL,
        token0 TEXT NOT NULL,
        token1 TEXT NOT NULL,
        created_block BIGINT NOT NULL,
        created_log_index BIGINT NOT NULL,
        resolved BOOLEAN NOT NULL,
        winning_outcome INTEGER NOT NULL,
        payouts TEXT NOT NULL,
        resolved_block BIGINT NOT NULL
      )
    )");

    run(R"(
      CREATE TABLE IF NOT EXISTS trade (
        tx_hash TEXT NOT NULL,
        log_index BIGINT NOT NULL,
        block_number BIGINT NOT NULL,
        block_timestamp BIGINT NOT NULL,
        maker TEXT NOT NULL,
        taker TEXT NOT NULL,
        token_id TEXT NOT NULL,
        condition_id TEXT NOT NULL,
        outcome_index INTEGER NOT NULL,
        side INTEGER NOT NULL,
        price_e6 BIGINT NOT NULL,
        size BIGINT NOT NULL,
        usdc BIGINT NOT NULL,
        fee BIGINT NOT NULL,
        PRIMARY KEY (tx_hash, log_index)
      )
    )");

    run("CREATE INDEX IF NOT EXISTS idx_trade_block ON trade(block_number, log_index)");
    run("CREATE INDEX IF NOT EXISTS idx_trade_maker ON trade(maker)");
    run("CREATE INDEX IF NOT EXISTS idx_trade_taker ON trade(taker)");
  }

  std::optional<IndexCursor> load_cursor() override {
    std::lock_guard<std::mutex> lock(read_mutex_);
    auto result = read_conn_->Query(
        "SELECT key, value FROM sync_state WHERE key IN ('last_block', 'last_log_index')");
    check(*result, "load_cursor");

    IndexCursor cursor;
    bool has_block = false;
    for (size_t row = 0; row < result->RowCount(); ++row) {
      std::string key = result->GetValue(0, row).ToString();
      int64_t value = std::stoll(result->GetValue(1, row).ToString());
      if (key == "last_block") {
        cursor.block_number = value;
        has_block = true;
      } else {
        cursor.log_index = value;
      }
    }
    if (!has_block)
      return std::nullopt;
    return cursor;
  }

  // 同一事务: 市场 -> 结算 -> 交易 -> 游标
  void commit(const AppliedBatch &batch, const IndexCursor &cursor) override {
    std::lock_guard<std::mutex> lock(write_mutex_);

    run("BEGIN TRANSACTION");
    try {
      if (!batch.markets.empty()) {
        std::string sql = "INSERT OR IGNORE INTO market (condition_id, exchange, slug, token0, token1, "
                          "created_block, created_log_index, resolved, winning_outcome, payouts, "
                          "resolved_block) VALUES ";
        for (size_t i = 0; i < batch.markets.size(); ++i) {
          const auto &m = batch.markets[i];
          if (i > 0)
            sql += ", ";
          sql += "(" + quote(m.condition_id) + ", " + quote(m.exchange) + ", " + quote(m.slug) + ", " +
                 quote(m.outcome_tokens.at(0)) + ", " + quote(m.outcome_tokens.at(1)) + ", " +
                 std::to_string(m.created_block) + ", " + std::to_string(m.created_log_index) +
                 ", false, -1, '', 0)";
        }
        run(sql);
      }

      for (const auto &r : batch.resolutions) {
        run("UPDATE market SET resolved = true, winning_outcome = " + std::to_string(r.winning_outcome) +
            ", payouts = " + quote(join_payouts(r.payouts)) +
            ", resolved_block = " + std::to_string(r.block_number) +
            " WHERE condition_id = " + quote(r.condition_id) + " AND NOT resolved");
      }

      if (!batch.trades.empty()) {
        std::string sql = "INSERT OR IGNORE INTO trade (tx_hash, log_index, block_number, block_timestamp, "
                          "maker, taker, token_id, condition_id, outcome_index, side, price_e6, size, "
                          "usdc, fee) VALUES ";
        for (size_t i = 0; i < batch.trades.size(); ++i) {
          const auto &t = batch.trades[i];
          if (i > 0)
            sql += ", ";
          sql += "(" + quote(t.tx_hash) + ", " + std::to_string(t.log_index) + ", " +
                 std::to_string(t.block_number) + ", " + std::to_string(t.timestamp) + ", " +
                 quote(t.maker) + ", " + quote(t.taker) + ", " + quote(t.token_id) + ", " +
                 quote(t.condition_id) + ", " + std::to_string(t.outcome_index) + ", " +
                 std::to_string(static_cast<int>(t.side)) + ", " + std::to_string(t.price_e6) + ", " +
                 std::to_string(t.size) + ", " + std::to_string(t.usdc) + ", " + std::to_string(t.fee) + ")";
        }
        run(sql);
      }

      run("INSERT OR REPLACE INTO sync_state (key, value) VALUES ('last_block', '" +
          std::to_string(cursor.block_number) + "'), ('last_log_index', '" +
          std::to_string(cursor.log_index) + "')");
      run("COMMIT");
    } catch (const PersistenceError &) {
      auto rb = write_conn_->Query("ROLLBACK");
      if (rb->HasError())
        std::cerr << "[Store] rollback failed: " << rb->GetError() << std::endl;
      throw;
    }
  }

  std::vector<Market> load_markets() override {
    std::lock_guard<std::mutex> lock(read_mutex_);
    auto result = read_conn_->Query(
        "SELECT condition_id, exchange, slug, token0, token1, created_block, created_log_index, "
        "resolved, winning_outcome, payouts, resolved_block FROM market "
        "ORDER BY created_block, created_log_index");
    check(*result, "load_markets");

    std::vector<Market> markets;
    markets.reserve(result->RowCount());
    for (size_t row = 0; row < result->RowCount(); ++row) {
      Market m;
      m.condition_id = result->GetValue(0, row).ToString();
      m.exchange = result->GetValue(1, row).ToString();
      m.slug = result->GetValue(2, row).ToString();
      m.outcome_tokens = {result->GetValue(3, row).ToString(), result->GetValue(4, row).ToString()};
      m.created_block = result->GetValue(5, row).GetValue<int64_t>();
      m.created_log_index = result->GetValue(6, row).GetValue<int64_t>();
      m.resolved = result->GetValue(7, row).GetValue<bool>();
      m.winning_outcome = result->GetValue(8, row).GetValue<int32_t>();
      m.payouts = split_payouts(result->GetValue(9, row).ToString());
      m.resolved_block = result->GetValue(10, row).GetValue<int64_t>();
      markets.push_back(std::move(m));
    }
    return markets;
  }

  std::vector<Trade> load_trades() override {
    std::lock_guard<std::mutex> lock(read_mutex_);
    auto result = read_conn_->Query(
        "SELECT tx_hash, log_index, block_number, block_timestamp, maker, taker, token_id, "
        "condition_id, outcome_index, side, price_e6, size, usdc, fee FROM trade "
        "ORDER BY block_number, log_index");
    check(*result, "load_trades");

    std::vector<Trade> trades;
    trades.reserve(result->RowCount());
    for (size_t row = 0; row < result->RowCount(); ++row) {
      Trade t;
      t.tx_hash = result->GetValue(0, row).ToString();
      t.log_index = result->GetValue(1, row).GetValue<int64_t>();
      t.block_number = result->GetValue(2, row).GetValue<int64_t>();
      t.timestamp = result->GetValue(3, row).GetValue<int64_t>();
      t.maker = result->GetValue(4, row).ToString();
      t.taker = result->GetValue(5, row).ToString();
      t.token_id = result->GetValue(6, row).ToString();
      t.condition_id = result->GetValue(7, row).ToString();
      t.outcome_index = result->GetValue(8, row).GetValue<int32_t>();
      t.side = result->GetValue(9, row).GetValue<int32_t>() == 0 ? Side::Buy : Side::Sell;
      t.price_e6 = result->GetValue(10, row).GetValue<int64_t>();
      t.size = result->GetValue(11, row).GetValue<int64_t>();
      t.usdc = result->GetValue(12, row).GetValue<int64_t>();
      t.fee = result->GetValue(13, row).GetValue<int64_t>();
      trades.push_back(std::move(t));
    }
    return trades;
  }

  int64_t get_table_count(const std::string &table) {
    std::lock_guard<std::mutex> lock(read_mutex_);
    auto result = read_conn_->Query("SELECT COUNT(*) FROM " + table);
    check(*result, "count " + table);
    auto val = result->GetValue(0, 0);
    return val.IsNull() ? 0 : val.GetValue<int64_t>();
  }

private:
  // 调用方持有 write_mutex_
  void run(const std::string &sql) {
    auto result = write_conn_->Query(sql);
    check(*result, sql.substr(0, 80));
  }

  static void check(duckdb::MaterializedQueryResult &result, const std::string &what) {
    if (result.HasError())
      throw PersistenceError("DuckDB " + what + ": " + result.GetError());
  }

  static std::string quote(const std::string &s) {
    std::string out = "'";
    for (char c : s) {
      if (c == '\'')
        out += '\'';
      out += c;
    }
    return out + "'";
  }

  static std::string join_payouts(const std::vector<int64_t> &payouts) {
    std::string out;
    for (size_t i = 0; i < payouts.size(); ++i) {
      if (i > 0)
        out += ",";
      out += std::to_string(payouts[i]);
    }
    return out;
  }

  static std::vector<int64_t> split_payouts(const std::string &s) {
    std::vector<int64_t> out;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, ',')) {
      if (!item.empty())
        out.push_back(std::stoll(item));
    }
    return out;
  }

  // 路径
  std::string db_path_;
  std::string lock_path_;
  // 文件锁
  int lock_fd_ = -1;
  // DuckDB
  std::unique_ptr<duckdb::DuckDB> db_;
  std::unique_ptr<duckdb::Connection> read_conn_;
  std::unique_ptr<duckdb::Connection> write_conn_;
  std::mutex read_mutex_;
  std::mutex write_mutex_;
};
