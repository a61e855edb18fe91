#pragma once

#include <algorithm>
#include <cctype>
#include <climits>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <iterator>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "../core/config.hpp"
#include "../core/contracts.hpp"
#include "../core/types.hpp"

struct EngineOptions {
  double arbitrage_threshold = 0.02;
  int smart_money_min_trades = 5;
  SmartMoneyWeights weights;
  WinRatePolicy policy = WinRatePolicy::MarkToLastPrice;

  static EngineOptions from_config(const Config &config) {
    EngineOptions o;
    o.arbitrage_threshold = config.arbitrage_threshold;
    o.smart_money_min_trades = config.smart_money_min_trades;
    o.weights = config.smart_money_weights;
    o.policy = config.win_rate_policy;
    return o;
  }
};

struct EngineStats {
  int64_t applied_trades = 0;
  int64_t duplicate_trades = 0;
  int64_t contract_violations = 0;
  int64_t markets = 0;
  int64_t resolved_markets = 0;
  int64_t traders = 0;
  int64_t latest_block = 0;
  int64_t latest_timestamp = 0;
};

// ============================================================================
// AnalyticsEngine - 交易者画像 / 聪明钱 / 套利 / 持仓盈亏
// 单写者(Indexer), 多读者(API): 写取独占锁, 读取共享锁
// ============================================================================
class AnalyticsEngine {
public:
  explicit AnalyticsEngine(EngineOptions options = {}) : options_(options) {
    threshold_e6_ = static_cast<int64_t>(std::llround(options_.arbitrage_threshold * FIXED_SCALE));
  }

  AnalyticsEngine(const AnalyticsEngine &) = delete;
  AnalyticsEngine &operator=(const AnalyticsEngine &) = delete;

  const EngineOptions &options() const { return options_; }

  // ==========================================================================
  // 写入
  // ==========================================================================

  // 按 condition_id 幂等
  bool apply_market_created(const Market &market) {
    std::unique_lock lock(mutex_);
    if (markets_.contains(market.condition_id))
      return false;
    MarketState state;
    state.market = market;
    state.market.resolved = false;
    state.market.payouts.clear();
    state.market.winning_outcome = -1;
    state.last_price.resize(market.outcome_tokens.size());
    if (!market.slug.empty())
      slug_index_.emplace(market.slug, market.condition_id);
    markets_.emplace(market.condition_id, std::move(state));
    return true;
  }

  // 重复 (tx_hash, log_index) 为空操作; 未知市场记为契约违规并跳过
  bool apply_trade(const Trade &trade) {
    std::unique_lock lock(mutex_);
    TradeKey key{trade.tx_hash, trade.log_index};
    if (seen_.contains(key)) {
      ++duplicate_trades_;
      return false;
    }

    auto mit = markets_.find(trade.condition_id);
    if (mit == markets_.end() || trade.outcome_index < 0 ||
        trade.outcome_index >= static_cast<int>(mit->second.last_price.size())) {
      ++contract_violations_;
      std::cerr << "[Analytics] trade for unknown market/outcome: " << trade.condition_id << " #"
                << trade.outcome_index << " tx=" << trade.tx_hash << ":" << trade.log_index
                << std::endl;
      return false;
    }

    MarketState &ms = mit->second;
    size_t id = trades_.size();
    trades_.push_back(trade);
    seen_.insert(std::move(key));
    ++applied_trades_;

    ms.trade_ids.push_back(id);
    ms.volume_e6 += trade.usdc;

    // 最新价按 (block, log_index) 取最大者
    auto &last = ms.last_price[trade.outcome_index];
    IndexCursor pos{trade.block_number, trade.log_index};
    if (!last || last->pos < pos)
      last = PricePoint{trade.price_e6, pos};

    latest_block_ = std::max(latest_block_, trade.block_number);
    latest_ts_ = std::max(latest_ts_, trade.timestamp);

    add_participation(trade.maker, id, trade.side);
    if (profiles_taker(trade))
      add_participation(trade.taker, id, opposite(trade.side));

    // 结算之后到达的交易立即归因
    if (ms.market.resolved)
      attribute_trade(ms, id);
    return true;
  }

  // 已结算市场不可变; 未知市场记为契约违规
  bool apply_market_resolved(const Market &market) {
    std::unique_lock lock(mutex_);
    auto it = markets_.find(market.condition_id);
    if (it == markets_.end()) {
      ++contract_violations_;
      std::cerr << "[Analytics] resolution for unknown market: " << market.condition_id << std::endl;
      return false;
    }
    MarketState &ms = it->second;
    if (ms.market.resolved)
      return false;

    ms.market.resolved = true;
    ms.market.payouts = market.payouts;
    ms.market.winning_outcome = market.winning_outcome;
    ms.market.resolved_block = market.resolved_block;
    ++resolved_markets_;

    for (size_t id : ms.trade_ids)
      attribute_trade(ms, id);
    return true;
  }

  // ==========================================================================
  // 读取
  // ==========================================================================

  std::optional<TraderProfile> get_trader_profile(const std::string &address) const {
    std::shared_lock lock(mutex_);
    auto it = traders_.find(address);
    if (it == traders_.end())
      return std::nullopt;
    return build_profile(it->first, it->second);
  }

  std::optional<ArbitrageOpportunity> find_arbitrage(const std::string &condition_id) const {
    std::shared_lock lock(mutex_);
    auto it = markets_.find(condition_id);
    if (it == markets_.end())
      return std::nullopt;
    return arbitrage_of(it->second);
  }

  std::vector<ArbitrageOpportunity> list_arbitrage(size_t limit, size_t offset = 0) const {
    std::vector<ArbitrageOpportunity> out;
    {
      std::shared_lock lock(mutex_);
      for (const auto &[id, ms] : markets_) {
        if (auto opp = arbitrage_of(ms))
          out.push_back(std::move(*opp));
      }
    }
    std::sort(out.begin(), out.end(), [](const ArbitrageOpportunity &a, const ArbitrageOpportunity &b) {
      if (a.magnitude != b.magnitude)
        return a.magnitude > b.magnitude;
      return a.condition_id < b.condition_id;
    });
    return page(std::move(out), limit, offset);
  }

  // 窗口锚定在最新已应用交易的时间戳, 与墙钟无关
  std::vector<SmartMoneyEntry> get_smart_money(int64_t window_seconds, size_t limit) const {
    if (window_seconds <= 0)
      throw std::invalid_argument("window must be > 0");

    std::vector<SmartMoneyEntry> out;
    std::shared_lock lock(mutex_);
    int64_t now = latest_ts_;
    int64_t start = now - window_seconds;

    double max_volume = 0.0;
    for (const auto &[address, ts] : traders_) {
      if (static_cast<int64_t>(ts.fills.size()) < options_.smart_money_min_trades)
        continue;
      if (ts.last_trade_ts < start)
        continue;

      int64_t window_e6 = 0;
      for (auto it = ts.fills.rbegin(); it != ts.fills.rend(); ++it) {
        const Trade &t = trades_[it->trade_id];
        if (t.timestamp >= start)
          window_e6 += t.usdc;
      }

      SmartMoneyEntry e;
      e.address = address;
      e.estimated_win_rate = estimated_win_rate(ts, start);
      e.window_volume = from_fixed(window_e6);
      e.trade_count = static_cast<int64_t>(ts.fills.size());
      e.last_trade_ts = ts.last_trade_ts;
      max_volume = std::max(max_volume, e.window_volume);
      out.push_back(std::move(e));
    }
    lock.unlock();

    for (auto &e : out) {
      double volume_score = max_volume > 0.0 ? e.window_volume / max_volume : 0.0;
      double age = static_cast<double>(now - e.last_trade_ts);
      double recency = std::clamp(1.0 - age / static_cast<double>(window_seconds), 0.0, 1.0);
      e.score = options_.weights.win_rate * e.estimated_win_rate + options_.weights.volume * volume_score +
                options_.weights.recency * recency;
    }

    std::sort(out.begin(), out.end(), [](const SmartMoneyEntry &a, const SmartMoneyEntry &b) {
      if (a.score != b.score)
        return a.score > b.score;
      if (a.window_volume != b.window_volume)
        return a.window_volume > b.window_volume;
      return a.address < b.address;
    });
    if (out.size() > limit)
      out.resize(limit);
    return out;
  }

  std::optional<MarketView> get_market(const std::string &condition_id) const {
    std::shared_lock lock(mutex_);
    auto it = markets_.find(condition_id);
    if (it == markets_.end())
      return std::nullopt;
    return market_view(it->second);
  }

  // slug 来自市场元数据; 同一 slug 以先注册者为准
  std::optional<MarketView> get_market_by_slug(const std::string &slug) const {
    std::shared_lock lock(mutex_);
    auto sit = slug_index_.find(slug);
    if (sit == slug_index_.end())
      return std::nullopt;
    return market_view(markets_.at(sit->second));
  }

  // slug 或 condition_id 子串匹配(不区分大小写), 按成交额降序
  std::vector<MarketView> search_markets(const std::string &query, size_t limit) const {
    std::string needle = lower(query);
    if (needle.empty())
      throw std::invalid_argument("query must not be empty");

    std::vector<MarketView> out;
    {
      std::shared_lock lock(mutex_);
      for (const auto &[id, ms] : markets_) {
        if (lower(ms.market.slug).find(needle) != std::string::npos || id.find(needle) != std::string::npos)
          out.push_back(market_view(ms));
      }
    }
    std::sort(out.begin(), out.end(), [](const MarketView &a, const MarketView &b) {
      if (a.volume != b.volume)
        return a.volume > b.volume;
      return a.market.condition_id < b.market.condition_id;
    });
    if (out.size() > limit)
      out.resize(limit);
    return out;
  }

  // 最新在前
  std::vector<Trade> get_trades_by_address(const std::string &address, size_t limit, size_t offset = 0) const {
    std::shared_lock lock(mutex_);
    std::vector<Trade> out;
    auto it = traders_.find(address);
    if (it == traders_.end())
      return out;
    const auto &fills = it->second.fills;
    for (size_t i = offset; i < fills.size() && out.size() < limit; ++i)
      out.push_back(trades_[fills[fills.size() - 1 - i].trade_id]);
    return out;
  }

  std::vector<Trade> get_market_trades(const std::string &condition_id, size_t limit, size_t offset = 0) const {
    std::shared_lock lock(mutex_);
    std::vector<Trade> out;
    auto it = markets_.find(condition_id);
    if (it == markets_.end())
      return out;
    const auto &ids = it->second.trade_ids;
    for (size_t i = offset; i < ids.size() && out.size() < limit; ++i)
      out.push_back(trades_[ids[ids.size() - 1 - i]]);
    return out;
  }

  std::vector<HotMarket> get_hot_markets(int64_t window_seconds, size_t limit) const {
    if (window_seconds <= 0)
      throw std::invalid_argument("window must be > 0");

    std::vector<HotMarket> out;
    {
      std::shared_lock lock(mutex_);
      int64_t start = latest_ts_ - window_seconds;
      for (const auto &[id, ms] : markets_) {
        int64_t volume_e6 = 0;
        int64_t count = 0;
        for (size_t tid : ms.trade_ids) {
          const Trade &t = trades_[tid];
          if (t.timestamp >= start) {
            volume_e6 += t.usdc;
            ++count;
          }
        }
        if (count == 0)
          continue;
        out.push_back({id, ms.market.slug, from_fixed(volume_e6), count});
      }
    }
    std::sort(out.begin(), out.end(), [](const HotMarket &a, const HotMarket &b) {
      if (a.window_volume != b.window_volume)
        return a.window_volume > b.window_volume;
      if (a.window_trades != b.window_trades)
        return a.window_trades > b.window_trades;
      return a.condition_id < b.condition_id;
    });
    if (out.size() > limit)
      out.resize(limit);
    return out;
  }

  // ==========================================================================
  // 持仓与盈亏
  // ==========================================================================

  // 默认不含已平仓(|净持仓| < 0.001 份)
  std::vector<Position> get_trader_positions(const std::string &address, bool include_closed = false) const {
    std::shared_lock lock(mutex_);
    std::vector<Position> out;
    auto it = traders_.find(address);
    if (it == traders_.end())
      return out;
    for (auto &p : positions_of(it->second, nullptr)) {
      if (include_closed || !p.closed)
        out.push_back(std::move(p));
    }
    return out;
  }

  // 汇总含已平仓的已实现盈亏; positions 列表只给未平仓
  std::optional<PortfolioSummary> get_portfolio(const std::string &address) const {
    std::shared_lock lock(mutex_);
    auto it = traders_.find(address);
    if (it == traders_.end())
      return std::nullopt;
    PortfolioSummary s = summarize(address, positions_of(it->second, nullptr));
    std::erase_if(s.positions, [](const Position &p) { return p.closed; });
    return s;
  }

  // condition_id 为空时统计全部市场, 否则只算该市场内的持仓
  std::vector<PnlLeaderboardEntry> get_pnl_leaderboard(const std::string &condition_id, size_t limit) const {
    std::vector<PnlLeaderboardEntry> out;
    {
      std::shared_lock lock(mutex_);
      std::set<std::string> candidates;
      const std::string *only = nullptr;
      if (condition_id.empty()) {
        for (const auto &[address, ts] : traders_)
          candidates.insert(address);
      } else {
        auto mit = markets_.find(condition_id);
        if (mit == markets_.end())
          return out;
        only = &mit->first;
        for (size_t id : mit->second.trade_ids) {
          const Trade &t = trades_[id];
          candidates.insert(t.maker);
          if (profiles_taker(t))
            candidates.insert(t.taker);
        }
      }

      for (const auto &address : candidates) {
        if (address == contracts::ZERO_ADDRESS)
          continue;
        PortfolioSummary s = summarize(address, positions_of(traders_.at(address), only));
        PnlLeaderboardEntry e;
        e.address = address;
        e.total_pnl = s.total_pnl;
        e.realized_pnl = s.realized_pnl;
        e.unrealized_pnl = s.unrealized_pnl;
        e.pnl_pct = s.pnl_pct;
        e.positions = s.total_positions;
        e.winning_positions = s.winning_positions;
        e.losing_positions = s.losing_positions;
        out.push_back(std::move(e));
      }
    }
    std::sort(out.begin(), out.end(), [](const PnlLeaderboardEntry &a, const PnlLeaderboardEntry &b) {
      if (a.total_pnl != b.total_pnl)
        return a.total_pnl > b.total_pnl;
      return a.address < b.address;
    });
    if (out.size() > limit)
      out.resize(limit);
    return out;
  }

  EngineStats stats() const {
    std::shared_lock lock(mutex_);
    EngineStats s;
    s.applied_trades = applied_trades_;
    s.duplicate_trades = duplicate_trades_;
    s.contract_violations = contract_violations_;
    s.markets = static_cast<int64_t>(markets_.size());
    s.resolved_markets = resolved_markets_;
    s.traders = static_cast<int64_t>(traders_.size());
    s.latest_block = latest_block_;
    s.latest_timestamp = latest_ts_;
    return s;
  }

private:
  struct PricePoint {
    int64_t price_e6 = 0;
    IndexCursor pos;
  };

  struct MarketState {
    Market market;
    std::vector<std::optional<PricePoint>> last_price; // 每个 outcome
    std::vector<size_t> trade_ids;                     // 应用顺序
    int64_t volume_e6 = 0;
    int64_t won_count = 0; // maker 视角
    int64_t lost_count = 0;
  };

  struct Fill {
    size_t trade_id;
    Side side;
  };

  struct TraderState {
    std::vector<Fill> fills;
    std::set<std::string> markets;
    int64_t buy_count = 0;
    int64_t sell_count = 0;
    int64_t buy_volume_e6 = 0;
    int64_t sell_volume_e6 = 0;
    int64_t price_sum_e6 = 0;
    int64_t won_count = 0;
    int64_t lost_count = 0;
    double resolved_pnl = 0.0;
    int64_t first_trade_ts = 0;
    int64_t last_trade_ts = 0;
    int64_t first_block = 0;
    int64_t last_block = 0;
  };

  // taker 为交易所合约时是撮合路由, 不计入画像
  static bool profiles_taker(const Trade &t) {
    return !t.taker.empty() && t.taker != t.maker && !contracts::is_exchange(t.taker);
  }

  static bool wins(Side side, double payout_fraction, double price) {
    return side == Side::Buy ? payout_fraction > price : payout_fraction < price;
  }

  void add_participation(const std::string &address, size_t id, Side side) {
    const Trade &t = trades_[id];
    TraderState &ts = traders_[address];
    if (ts.fills.empty()) {
      ts.first_trade_ts = t.timestamp;
      ts.first_block = t.block_number;
    }
    ts.fills.push_back({id, side});
    ts.markets.insert(t.condition_id);
    if (side == Side::Buy) {
      ++ts.buy_count;
      ts.buy_volume_e6 += t.usdc;
    } else {
      ++ts.sell_count;
      ts.sell_volume_e6 += t.usdc;
    }
    ts.price_sum_e6 += t.price_e6;
    ts.first_trade_ts = std::min(ts.first_trade_ts, t.timestamp);
    ts.last_trade_ts = std::max(ts.last_trade_ts, t.timestamp);
    ts.first_block = std::min(ts.first_block, t.block_number);
    ts.last_block = std::max(ts.last_block, t.block_number);
  }

  // 每个 (trade, participant) 仅调用一次
  void attribute_trade(MarketState &ms, size_t id) {
    const Trade &t = trades_[id];
    double fraction = ms.market.payout_fraction(t.outcome_index);

    if (wins(t.side, fraction, t.price()))
      ++ms.won_count;
    else
      ++ms.lost_count;

    attribute_participant(t.maker, t, t.side, fraction);
    if (profiles_taker(t))
      attribute_participant(t.taker, t, opposite(t.side), fraction);
  }

  void attribute_participant(const std::string &address, const Trade &t, Side side, double fraction) {
    TraderState &ts = traders_[address];
    if (wins(side, fraction, t.price()))
      ++ts.won_count;
    else
      ++ts.lost_count;
    double edge = side == Side::Buy ? fraction - t.price() : t.price() - fraction;
    ts.resolved_pnl += edge * t.shares();
  }

  // since 之前的成交不计; 已结算的按兑付判定, 未结算的按策略处理
  double estimated_win_rate(const TraderState &ts, int64_t since = INT64_MIN) const {
    int64_t won = 0;
    int64_t decided = 0;
    for (const auto &f : ts.fills) {
      const Trade &t = trades_[f.trade_id];
      if (t.timestamp < since)
        continue;
      const MarketState &ms = markets_.at(t.condition_id);
      if (ms.market.resolved) {
        if (wins(f.side, ms.market.payout_fraction(t.outcome_index), t.price()))
          ++won;
        ++decided;
        continue;
      }
      if (options_.policy != WinRatePolicy::MarkToLastPrice)
        continue;
      const auto &last = ms.last_price[t.outcome_index];
      if (!last || last->price_e6 == t.price_e6)
        continue;
      bool up = last->price_e6 > t.price_e6;
      if ((f.side == Side::Buy) == up)
        ++won;
      ++decided;
    }
    return decided > 0 ? static_cast<double>(won) / static_cast<double>(decided) : 0.0;
  }

  TraderProfile build_profile(const std::string &address, const TraderState &ts) const {
    TraderProfile p;
    p.address = address;
    p.trade_count = static_cast<int64_t>(ts.fills.size());
    p.buy_count = ts.buy_count;
    p.sell_count = ts.sell_count;
    p.buy_volume = from_fixed(ts.buy_volume_e6);
    p.sell_volume = from_fixed(ts.sell_volume_e6);
    p.distinct_markets = static_cast<int64_t>(ts.markets.size());
    p.won_count = ts.won_count;
    p.lost_count = ts.lost_count;
    for (const auto &f : ts.fills) {
      if (!markets_.at(trades_[f.trade_id].condition_id).market.resolved)
        ++p.open_count;
    }
    int64_t decided = ts.won_count + ts.lost_count;
    p.win_rate = decided > 0 ? static_cast<double>(ts.won_count) / static_cast<double>(decided) : 0.0;
    p.estimated_win_rate = estimated_win_rate(ts);
    p.resolved_pnl = ts.resolved_pnl;
    p.avg_price = p.trade_count > 0 ? from_fixed(ts.price_sum_e6) / static_cast<double>(p.trade_count) : 0.0;
    p.first_trade_ts = ts.first_trade_ts;
    p.last_trade_ts = ts.last_trade_ts;
    p.first_block = ts.first_block;
    p.last_block = ts.last_block;
    return p;
  }

  MarketView market_view(const MarketState &ms) const {
    MarketView view;
    view.market = ms.market;
    for (const auto &p : ms.last_price)
      view.last_prices.push_back(p ? std::optional<double>(from_fixed(p->price_e6)) : std::nullopt);
    view.volume = from_fixed(ms.volume_e6);
    view.trade_count = static_cast<int64_t>(ms.trade_ids.size());
    view.won_count = ms.won_count;
    view.lost_count = ms.lost_count;
    return view;
  }

  // 平均成本法: 卖出部分按买入均价结转; 结算后剩余持仓按兑付比例计入已实现
  std::vector<Position> positions_of(const TraderState &ts, const std::string *only_condition) const {
    struct Totals {
      int64_t trades = 0;
      int64_t bought_e6 = 0;
      int64_t sold_e6 = 0;
      int64_t cost_e6 = 0;
      int64_t proceeds_e6 = 0;
    };
    std::map<std::pair<std::string, int>, Totals> by_token;
    for (const auto &f : ts.fills) {
      const Trade &t = trades_[f.trade_id];
      if (only_condition && t.condition_id != *only_condition)
        continue;
      Totals &tot = by_token[{t.condition_id, t.outcome_index}];
      ++tot.trades;
      if (f.side == Side::Buy) {
        tot.bought_e6 += t.size;
        tot.cost_e6 += t.usdc;
      } else {
        tot.sold_e6 += t.size;
        tot.proceeds_e6 += t.usdc;
      }
    }

    std::vector<Position> out;
    out.reserve(by_token.size());
    for (const auto &[key, tot] : by_token) {
      const MarketState &ms = markets_.at(key.first);
      Position p;
      p.condition_id = key.first;
      p.slug = ms.market.slug;
      p.outcome_index = key.second;
      if (key.second < static_cast<int>(ms.market.outcome_tokens.size()))
        p.token_id = ms.market.outcome_tokens[key.second];
      p.trade_count = tot.trades;
      p.bought = from_fixed(tot.bought_e6);
      p.sold = from_fixed(tot.sold_e6);
      p.total_cost = from_fixed(tot.cost_e6);
      p.proceeds = from_fixed(tot.proceeds_e6);

      int64_t net_e6 = tot.bought_e6 - tot.sold_e6;
      p.net_size = from_fixed(net_e6);
      p.closed = (net_e6 < 0 ? -net_e6 : net_e6) < FIXED_SCALE / 1000;
      p.avg_cost = tot.bought_e6 > 0 ? p.total_cost / p.bought : 0.0;
      if (tot.sold_e6 > 0 && tot.bought_e6 > 0)
        p.realized_pnl = p.proceeds - p.sold * p.avg_cost;

      // 净空头来自链下拆分的 token, 无成本可循, 不计价值
      double held = net_e6 > 0 ? p.net_size : 0.0;
      if (ms.market.resolved) {
        p.resolved = true;
        p.current_price = ms.market.payout_fraction(p.outcome_index);
        p.current_value = held * p.current_price;
        p.realized_pnl += held * (p.current_price - p.avg_cost);
      } else {
        const auto &last = ms.last_price[p.outcome_index];
        p.current_price = last ? from_fixed(last->price_e6) : p.avg_cost;
        p.current_value = held * p.current_price;
        p.unrealized_pnl = held * (p.current_price - p.avg_cost);
      }
      out.push_back(std::move(p));
    }

    std::sort(out.begin(), out.end(), [](const Position &a, const Position &b) {
      if (a.pnl() != b.pnl())
        return a.pnl() > b.pnl();
      if (a.condition_id != b.condition_id)
        return a.condition_id < b.condition_id;
      return a.outcome_index < b.outcome_index;
    });
    return out;
  }

  static PortfolioSummary summarize(const std::string &address, std::vector<Position> positions) {
    PortfolioSummary s;
    s.address = address;
    for (const auto &p : positions) {
      ++s.total_positions;
      if (!p.closed)
        ++s.open_positions;
      if (p.pnl() >= 0.0)
        ++s.winning_positions;
      else
        ++s.losing_positions;
      s.total_cost += p.total_cost;
      s.current_value += p.current_value;
      s.realized_pnl += p.realized_pnl;
      s.unrealized_pnl += p.unrealized_pnl;
    }
    s.total_pnl = s.realized_pnl + s.unrealized_pnl;
    s.pnl_pct = s.total_cost > 0.0 ? s.total_pnl / s.total_cost * 100.0 : 0.0;
    s.positions = std::move(positions);
    return s;
  }

  static std::string lower(std::string s) {
    for (auto &c : s)
      c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
  }

  // 定点整数求和, 避免浮点误差影响阈值判断
  std::optional<ArbitrageOpportunity> arbitrage_of(const MarketState &ms) const {
    if (ms.market.resolved || ms.last_price.size() < 2)
      return std::nullopt;

    int64_t sum_e6 = 0;
    int64_t as_of = 0;
    ArbitrageOpportunity opp;
    for (const auto &p : ms.last_price) {
      if (!p)
        return std::nullopt;
      sum_e6 += p->price_e6;
      as_of = std::max(as_of, p->pos.block_number);
      opp.prices.push_back(from_fixed(p->price_e6));
    }

    int64_t deviation = sum_e6 > FIXED_SCALE ? sum_e6 - FIXED_SCALE : FIXED_SCALE - sum_e6;
    if (deviation <= threshold_e6_)
      return std::nullopt;

    opp.condition_id = ms.market.condition_id;
    opp.slug = ms.market.slug;
    opp.price_sum = from_fixed(sum_e6);
    opp.magnitude = from_fixed(deviation);
    opp.direction = sum_e6 > FIXED_SCALE ? ArbDirection::SellAll : ArbDirection::BuyAll;
    opp.as_of_block = as_of;
    return opp;
  }

  template <typename T> static std::vector<T> page(std::vector<T> items, size_t limit, size_t offset) {
    if (offset >= items.size())
      return {};
    size_t end = std::min(items.size(), offset + limit);
    return std::vector<T>(std::make_move_iterator(items.begin() + static_cast<std::ptrdiff_t>(offset)),
                          std::make_move_iterator(items.begin() + static_cast<std::ptrdiff_t>(end)));
  }

  EngineOptions options_;
  int64_t threshold_e6_ = 0;

  mutable std::shared_mutex mutex_;
  std::vector<Trade> trades_;
  std::unordered_set<TradeKey, TradeKeyHash> seen_;
  std::unordered_map<std::string, MarketState> markets_;
  std::unordered_map<std::string, TraderState> traders_;
  std::unordered_map<std::string, std::string> slug_index_; // slug -> condition_id

  int64_t applied_trades_ = 0;
  int64_t duplicate_trades_ = 0;
  int64_t contract_violations_ = 0;
  int64_t resolved_markets_ = 0;
  int64_t latest_block_ = 0;
  int64_t latest_ts_ = 0;
};
