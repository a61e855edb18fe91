#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// ============================================================================
// 领域类型
// 金额与价格均为 6 位定点整数 (1e6 = $1 / 1 share)
// ============================================================================

static constexpr int64_t FIXED_SCALE = 1000000;

inline double from_fixed(int64_t v) { return static_cast<double>(v) / FIXED_SCALE; }

enum class Side : uint8_t { Buy = 0, Sell = 1 };

inline const char *side_name(Side s) { return s == Side::Buy ? "BUY" : "SELL"; }

inline Side opposite(Side s) { return s == Side::Buy ? Side::Sell : Side::Buy; }

struct RawLog {
  std::string address;
  std::vector<std::string> topics;
  std::string data;
  std::string tx_hash;
  int64_t block_number = 0;
  int64_t log_index = 0;
  int64_t block_timestamp = 0;
};

// ----------------------------------------------------------------------------
// Market / Token
// ----------------------------------------------------------------------------

struct Market {
  std::string condition_id;
  std::string slug;
  std::string exchange;
  std::vector<std::string> outcome_tokens; // size >= 2, index = outcome index
  bool resolved = false;
  int winning_outcome = -1;
  std::vector<int64_t> payouts;
  int64_t created_block = 0;
  int64_t created_log_index = 0;
  int64_t resolved_block = 0;

  // 结算时该 outcome 每份的兑付比例
  double payout_fraction(int outcome_index) const {
    int64_t denom = 0;
    for (auto p : payouts)
      denom += p;
    if (denom <= 0 || outcome_index < 0 || outcome_index >= static_cast<int>(payouts.size()))
      return 0.0;
    return static_cast<double>(payouts[outcome_index]) / static_cast<double>(denom);
  }
};

struct Token {
  std::string token_id;
  std::string condition_id;
  int outcome_index = 0;
};

// ----------------------------------------------------------------------------
// Trade, keyed by (tx_hash, log_index)
// ----------------------------------------------------------------------------

struct Trade {
  int64_t block_number = 0;
  int64_t log_index = 0;
  std::string tx_hash;
  std::string maker;
  std::string taker;
  std::string token_id;
  std::string condition_id;
  int outcome_index = 0;
  Side side = Side::Buy;
  int64_t price_e6 = 0; // (0, 1e6)
  int64_t size = 0;     // outcome shares, 1e6 = 1 share
  int64_t usdc = 0;     // collateral leg, 1e6 = $1
  int64_t fee = 0;
  int64_t timestamp = 0;

  double price() const { return from_fixed(price_e6); }
  double shares() const { return from_fixed(size); }
  double notional() const { return from_fixed(usdc); }
};

struct TradeKey {
  std::string tx_hash;
  int64_t log_index = 0;

  bool operator==(const TradeKey &o) const {
    return log_index == o.log_index && tx_hash == o.tx_hash;
  }
};

struct TradeKeyHash {
  size_t operator()(const TradeKey &k) const {
    return std::hash<std::string>{}(k.tx_hash) ^ (std::hash<int64_t>{}(k.log_index) << 1);
  }
};

// ----------------------------------------------------------------------------
// Cursor
// ----------------------------------------------------------------------------

struct IndexCursor {
  int64_t block_number = -1;
  int64_t log_index = -1;

  bool operator<(const IndexCursor &o) const {
    if (block_number != o.block_number)
      return block_number < o.block_number;
    return log_index < o.log_index;
  }
  bool operator==(const IndexCursor &o) const {
    return block_number == o.block_number && log_index == o.log_index;
  }
};

// ----------------------------------------------------------------------------
// Decoded events
// ----------------------------------------------------------------------------

struct TradeFilled {
  Trade trade;
};

struct MarketCreated {
  Market market;
};

struct MarketResolved {
  std::string condition_id;
  std::vector<int64_t> payouts;
  int winning_outcome = -1;
  int64_t block_number = 0;
  int64_t log_index = 0;
};

struct Unrecognized {
  std::string topic0;
};

using DomainEvent = std::variant<TradeFilled, MarketCreated, MarketResolved, Unrecognized>;

// ----------------------------------------------------------------------------
// Derived views
// ----------------------------------------------------------------------------

struct TraderProfile {
  std::string address;
  int64_t trade_count = 0;
  int64_t buy_count = 0;
  int64_t sell_count = 0;
  double buy_volume = 0.0;  // USDC
  double sell_volume = 0.0; // USDC
  int64_t distinct_markets = 0;
  int64_t won_count = 0;
  int64_t lost_count = 0;
  int64_t open_count = 0; // 未结算市场中的交易
  double win_rate = 0.0;           // won / (won + lost)
  double estimated_win_rate = 0.0; // 按 win_rate_policy 估算
  double resolved_pnl = 0.0;
  double avg_price = 0.0;
  int64_t first_trade_ts = 0;
  int64_t last_trade_ts = 0;
  int64_t first_block = 0;
  int64_t last_block = 0;

  double total_volume() const { return buy_volume + sell_volume; }
};

enum class ArbDirection : uint8_t { BuyAll = 0, SellAll = 1 };

inline const char *direction_name(ArbDirection d) {
  return d == ArbDirection::BuyAll ? "buy_all_outcomes" : "sell_all_outcomes";
}

struct ArbitrageOpportunity {
  std::string condition_id;
  std::string slug;
  std::vector<double> prices; // 每个 outcome 的最新成交价
  double price_sum = 0.0;
  double magnitude = 0.0; // |1 - sum|
  ArbDirection direction = ArbDirection::BuyAll;
  int64_t as_of_block = 0;
};

struct SmartMoneyEntry {
  std::string address;
  double score = 0.0;
  double estimated_win_rate = 0.0;
  double window_volume = 0.0;
  int64_t trade_count = 0;
  int64_t last_trade_ts = 0;
};

struct MarketView {
  Market market;
  std::vector<std::optional<double>> last_prices;
  double volume = 0.0;
  int64_t trade_count = 0;
  int64_t won_count = 0;
  int64_t lost_count = 0;
};

struct HotMarket {
  std::string condition_id;
  std::string slug;
  double window_volume = 0.0;
  int64_t window_trades = 0;
};

// 单个 token 上的持仓, 平均成本法
struct Position {
  std::string condition_id;
  std::string slug;
  std::string token_id;
  int outcome_index = 0;
  int64_t trade_count = 0;
  double bought = 0.0; // shares
  double sold = 0.0;
  double net_size = 0.0;
  double avg_cost = 0.0;   // 买入均价
  double total_cost = 0.0; // 买入花费 USDC
  double proceeds = 0.0;   // 卖出所得 USDC
  double current_price = 0.0;
  double current_value = 0.0;
  double realized_pnl = 0.0;
  double unrealized_pnl = 0.0;
  bool resolved = false;
  bool closed = false; // |net_size| < 0.001

  double pnl() const { return realized_pnl + unrealized_pnl; }
};

struct PortfolioSummary {
  std::string address;
  int64_t total_positions = 0; // 含已平仓
  int64_t open_positions = 0;
  int64_t winning_positions = 0;
  int64_t losing_positions = 0;
  double total_cost = 0.0;
  double current_value = 0.0;
  double realized_pnl = 0.0;
  double unrealized_pnl = 0.0;
  double total_pnl = 0.0;
  double pnl_pct = 0.0;
  std::vector<Position> positions;
};

struct PnlLeaderboardEntry {
  std::string address;
  double total_pnl = 0.0;
  double realized_pnl = 0.0;
  double unrealized_pnl = 0.0;
  double pnl_pct = 0.0;
  int64_t positions = 0;
  int64_t winning_positions = 0;
  int64_t losing_positions = 0;
};
