#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include <boost/asio.hpp>

#include "../analytics/analytics_engine.hpp"
#include "../core/config.hpp"
#include "../core/errors.hpp"
#include "../core/types.hpp"
#include "batch_store.hpp"
#include "event_decoder.hpp"
#include "log_source.hpp"
#include "token_registry.hpp"

namespace asio = boost::asio;

enum class IndexerState : uint8_t { Idle, Fetching, Applying, Backoff, Stopped };

inline const char *indexer_state_name(IndexerState s) {
  switch (s) {
  case IndexerState::Idle:
    return "idle";
  case IndexerState::Fetching:
    return "fetching";
  case IndexerState::Applying:
    return "applying";
  case IndexerState::Backoff:
    return "backoff";
  case IndexerState::Stopped:
    return "stopped";
  }
  return "unknown";
}

struct IndexerOptions {
  int64_t initial_block = 0;
  int64_t batch_size = 1000;
  std::chrono::milliseconds poll_interval{2000};
  std::chrono::milliseconds max_poll_interval{30000};
  std::chrono::milliseconds backoff_initial{500};
  std::chrono::milliseconds backoff_max{60000};

  static IndexerOptions from_config(const Config &config) {
    IndexerOptions o;
    o.initial_block = config.initial_block;
    o.batch_size = config.sync_batch_size;
    o.poll_interval = std::chrono::seconds(config.poll_interval_seconds);
    o.max_poll_interval = std::chrono::seconds(config.max_poll_interval_seconds);
    o.backoff_initial = std::chrono::milliseconds(config.backoff_initial_ms);
    o.backoff_max = std::chrono::milliseconds(config.backoff_max_ms);
    return o;
  }
};

// ============================================================================
// Indexer - 单写者驱动循环: fetch -> decode -> commit -> apply -> 推进游标
// 游标只在 BatchStore::commit 成功后推进
// ============================================================================
class Indexer {
public:
  enum class Step : uint8_t { Applied, CaughtUp, Retry, Halted };

  Indexer(IndexerOptions options, LogSource &source, BatchStore &store, TokenRegistry &registry,
          AnalyticsEngine &engine, const EventDecoder::SlugMap *slugs = nullptr)
      : options_(options), source_(source), store_(store), registry_(registry), engine_(engine),
        decoder_(registry, slugs), poll_interval_(options.poll_interval) {}

  Indexer(const Indexer &) = delete;
  Indexer &operator=(const Indexer &) = delete;

  // 启动时从存储重放: 市场 -> 交易 -> 结算
  void restore() {
    if (auto c = store_.load_cursor())
      set_cursor(*c);

    std::vector<Market> markets = store_.load_markets();
    for (const auto &m : markets) {
      Market created = m;
      created.resolved = false;
      created.payouts.clear();
      created.winning_outcome = -1;
      registry_.register_market(created);
      engine_.apply_market_created(created);
    }

    std::vector<Trade> trades = store_.load_trades();
    for (const auto &t : trades)
      engine_.apply_trade(t);

    int64_t resolved = 0;
    for (const auto &m : markets) {
      if (!m.resolved)
        continue;
      registry_.mark_resolved(m.condition_id, m.payouts, m.winning_outcome, m.resolved_block);
      engine_.apply_market_resolved(m);
      ++resolved;
    }

    std::cout << "[Indexer] restored cursor=" << cursor().block_number << ":" << cursor().log_index
              << " markets=" << markets.size() << " trades=" << trades.size() << " resolved=" << resolved
              << std::endl;
  }

  void start(asio::io_context &ioc) {
    timer_ = std::make_unique<asio::steady_timer>(ioc);
    stopping_ = false;
    schedule(std::chrono::milliseconds(0));
  }

  void stop() {
    stopping_ = true;
    state_ = IndexerState::Stopped;
    if (timer_)
      timer_->cancel();
  }

  // 一个完整周期, 同步执行; 调度由 start() 驱动
  Step run_once() {
    if (halted_ || stopping_) {
      state_ = IndexerState::Stopped;
      return Step::Halted;
    }

    state_ = IndexerState::Fetching;
    int64_t from_block = 0;
    int64_t to_block = 0;
    std::vector<RawLog> logs;
    try {
      head_block_ = source_.head_block();
      IndexCursor c = cursor();
      from_block = c.block_number < 0 ? options_.initial_block : c.block_number + 1;
      if (from_block > head_block_) {
        state_ = IndexerState::Idle;
        failures_ = 0;
        // 追上链头后轮询间隔翻倍, 直到上限
        poll_interval_ = std::min(poll_interval_ * 2, options_.max_poll_interval);
        return Step::CaughtUp;
      }
      to_block = std::min(from_block + options_.batch_size - 1, head_block_.load());
      logs = source_.fetch_logs(from_block, to_block);
    } catch (const FetchError &e) {
      return on_fetch_error(e);
    } catch (const std::exception &e) {
      return on_unexpected_error("fetch", e);
    }

    state_ = IndexerState::Applying;
    try {
      apply_batch(logs, from_block, to_block);
    } catch (const PersistenceError &e) {
      ++failures_;
      state_ = IndexerState::Backoff;
      {
        std::lock_guard<std::mutex> lock(cursor_mutex_);
        last_error_ = e.what();
      }
      std::cerr << "[Indexer] commit " << from_block << "-" << to_block << " failed: " << e.what()
                << std::endl;
      return Step::Retry;
    } catch (const std::exception &e) {
      return on_unexpected_error("apply", e);
    }

    failures_ = 0;
    poll_interval_ = options_.poll_interval;
    state_ = IndexerState::Idle;
    return Step::Applied;
  }

  IndexerState state() const { return state_; }
  bool halted() const { return halted_; }
  int64_t head_block() const { return head_block_; }
  const DecodeStats &decode_stats() const { return stats_; }
  std::chrono::milliseconds poll_interval() const { return poll_interval_; }
  int failures() const { return failures_; }

  IndexCursor cursor() const {
    std::lock_guard<std::mutex> lock(cursor_mutex_);
    return cursor_;
  }

  std::string last_error() const {
    std::lock_guard<std::mutex> lock(cursor_mutex_);
    return last_error_;
  }

  // 第 n 次连续失败后的等待: initial * 2^(n-1), 不超过 max
  std::chrono::milliseconds backoff_delay() const {
    auto delay = options_.backoff_initial;
    for (int i = 1; i < failures_.load() && delay < options_.backoff_max; ++i)
      delay *= 2;
    return std::min(delay, options_.backoff_max);
  }

private:
  void schedule(std::chrono::milliseconds delay) {
    timer_->expires_after(delay);
    timer_->async_wait([this](boost::system::error_code ec) {
      if (!ec && !stopping_)
        tick();
    });
  }

  void tick() {
    switch (run_once()) {
    case Step::Applied:
      if (cursor().block_number < head_block_)
        schedule(std::chrono::milliseconds(0));
      else
        schedule(poll_interval_);
      break;
    case Step::CaughtUp:
      std::cout << "[Indexer] caught up at " << head_block_ << ", next poll in " << poll_interval_.count()
                << "ms" << std::endl;
      schedule(poll_interval_);
      break;
    case Step::Retry: {
      auto delay = backoff_delay();
      std::cerr << "[Indexer] backoff " << delay.count() << "ms (failures=" << failures_ << ")" << std::endl;
      schedule(delay);
      break;
    }
    case Step::Halted:
      break;
    }
  }

  Step on_fetch_error(const FetchError &e) {
    {
      std::lock_guard<std::mutex> lock(cursor_mutex_);
      last_error_ = std::string(fetch_error_name(e.kind())) + ": " + e.what();
    }
    if (!e.retryable()) {
      halted_ = true;
      state_ = IndexerState::Stopped;
      std::cerr << "[Indexer] halted on non-retryable fetch error: " << e.what() << std::endl;
      return Step::Halted;
    }
    ++failures_;
    state_ = IndexerState::Backoff;
    std::cerr << "[Indexer] fetch failed (" << fetch_error_name(e.kind()) << "): " << e.what() << std::endl;
    return Step::Retry;
  }

  // 未分类的异常按可重试处理, 不能让它逃出驱动循环
  Step on_unexpected_error(const char *phase, const std::exception &e) {
    {
      std::lock_guard<std::mutex> lock(cursor_mutex_);
      last_error_ = std::string(phase) + ": " + e.what();
    }
    ++failures_;
    state_ = IndexerState::Backoff;
    std::cerr << "[Indexer] unexpected " << phase << " error: " << e.what() << std::endl;
    return Step::Retry;
  }

  // 两遍: 先市场事件(按日志顺序), 再成交
  void apply_batch(const std::vector<RawLog> &logs, int64_t from_block, int64_t to_block) {
    DecodeStats batch_stats;
    AppliedBatch batch;
    batch.from_block = from_block;
    batch.to_block = to_block;
    std::set<std::string> created_in_batch;
    std::set<std::string> resolved_in_batch;

    for (const auto &log : logs) {
      LogKind kind = EventDecoder::classify(log);
      if (kind == LogKind::TradeFilled)
        continue;
      DecodeResult r = decoder_.decode(log);
      if (!r.ok()) {
        skip(batch_stats, log, r.error);
        continue;
      }
      if (std::holds_alternative<Unrecognized>(*r.event)) {
        ++batch_stats.unrecognized;
        continue;
      }
      ++batch_stats.decoded;

      if (auto *created = std::get_if<MarketCreated>(&*r.event)) {
        registry_.register_market(created->market);
        // 首次注册为准; 同一 condition 的反向 token 对只保留一份
        if (auto m = registry_.market(created->market.condition_id);
            m && created_in_batch.insert(m->condition_id).second) {
          m->resolved = false;
          m->payouts.clear();
          m->winning_outcome = -1;
          batch.markets.push_back(std::move(*m));
        }
      } else if (auto *resolved = std::get_if<MarketResolved>(&*r.event)) {
        registry_.mark_resolved(resolved->condition_id, resolved->payouts, resolved->winning_outcome,
                                resolved->block_number);
        auto m = registry_.market(resolved->condition_id);
        if (m && m->resolved && resolved_in_batch.insert(m->condition_id).second) {
          MarketResolved first{m->condition_id, m->payouts, m->winning_outcome, m->resolved_block,
                               resolved->log_index};
          batch.resolutions.push_back(std::move(first));
        }
      }
    }

    for (const auto &log : logs) {
      if (EventDecoder::classify(log) != LogKind::TradeFilled)
        continue;
      DecodeResult r = decoder_.decode(log);
      if (!r.ok()) {
        skip(batch_stats, log, r.error);
        continue;
      }
      ++batch_stats.decoded;
      batch.trades.push_back(std::get<TradeFilled>(*r.event).trade);
    }

    IndexCursor next{to_block, -1};
    if (!logs.empty() && logs.back().block_number == to_block)
      next.log_index = logs.back().log_index;

    store_.commit(batch, next);

    for (const auto &m : batch.markets)
      engine_.apply_market_created(m);
    for (const auto &r : batch.resolutions) {
      if (auto m = registry_.market(r.condition_id))
        engine_.apply_market_resolved(*m);
    }
    int64_t applied = 0;
    for (const auto &t : batch.trades) {
      if (engine_.apply_trade(t))
        ++applied;
    }

    stats_.merge(batch_stats);
    set_cursor(next);

    std::cout << "[Indexer] " << from_block << "-" << to_block << " logs=" << logs.size()
              << " markets=" << batch.markets.size() << " resolved=" << batch.resolutions.size()
              << " trades=" << applied << "/" << batch.trades.size() << " skipped=" << batch_stats.skipped()
              << " head=" << head_block_ << std::endl;
  }

  void skip(DecodeStats &batch_stats, const RawLog &log, const DecodeError &error) {
    batch_stats.count(error.kind);
    if (error.kind != DecodeErrorKind::UnknownToken) {
      std::cerr << "[Decoder] skip " << log.tx_hash << ":" << log.log_index << " "
                << decode_error_name(error.kind) << " " << error.detail << std::endl;
    }
  }

  void set_cursor(const IndexCursor &c) {
    std::lock_guard<std::mutex> lock(cursor_mutex_);
    cursor_ = c;
  }

  IndexerOptions options_;
  LogSource &source_;
  BatchStore &store_;
  TokenRegistry &registry_;
  AnalyticsEngine &engine_;
  EventDecoder decoder_;

  std::unique_ptr<asio::steady_timer> timer_;

  mutable std::mutex cursor_mutex_;
  IndexCursor cursor_;
  std::string last_error_;
  DecodeStats stats_;

  std::atomic<IndexerState> state_{IndexerState::Idle};
  std::atomic<int64_t> head_block_{0};
  std::atomic<bool> stopping_{false};
  std::atomic<bool> halted_{false};
  std::atomic<int> failures_{0};
  std::chrono::milliseconds poll_interval_;
};
