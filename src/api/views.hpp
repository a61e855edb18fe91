#pragma once

#include <nlohmann/json.hpp>

#include "../analytics/analytics_engine.hpp"
#include "../analytics/trader_labels.hpp"
#include "../core/types.hpp"

using json = nlohmann::json;

// ============================================================================
// 领域类型 -> JSON (API 响应)
// ============================================================================

inline void to_json(json &j, const Trade &t) {
  j = {{"tx_hash", t.tx_hash},
       {"log_index", t.log_index},
       {"block_number", t.block_number},
       {"timestamp", t.timestamp},
       {"maker", t.maker},
       {"taker", t.taker},
       {"token_id", t.token_id},
       {"condition_id", t.condition_id},
       {"outcome_index", t.outcome_index},
       {"side", side_name(t.side)},
       {"price", t.price()},
       {"size", t.shares()},
       {"usdc", t.notional()},
       {"fee", from_fixed(t.fee)}};
}

inline void to_json(json &j, const Market &m) {
  j = {{"condition_id", m.condition_id},
       {"slug", m.slug},
       {"exchange", m.exchange},
       {"outcome_tokens", m.outcome_tokens},
       {"resolved", m.resolved},
       {"created_block", m.created_block}};
  if (m.resolved) {
    j["winning_outcome"] = m.winning_outcome;
    j["payouts"] = m.payouts;
    j["resolved_block"] = m.resolved_block;
  }
}

inline void to_json(json &j, const MarketView &v) {
  json prices = json::array();
  for (const auto &p : v.last_prices) {
    if (p)
      prices.push_back(*p);
    else
      prices.push_back(nullptr);
  }
  j = {{"market", v.market},
       {"last_prices", prices},
       {"volume", v.volume},
       {"trade_count", v.trade_count},
       {"won_count", v.won_count},
       {"lost_count", v.lost_count}};
}

inline void to_json(json &j, const TraderProfile &p) {
  json labels = json::array();
  for (auto l : trader_labels(p))
    labels.push_back(label_name(l));

  j = {{"address", p.address},
       {"trade_count", p.trade_count},
       {"buy_count", p.buy_count},
       {"sell_count", p.sell_count},
       {"buy_volume", p.buy_volume},
       {"sell_volume", p.sell_volume},
       {"total_volume", p.total_volume()},
       {"distinct_markets", p.distinct_markets},
       {"won_count", p.won_count},
       {"lost_count", p.lost_count},
       {"open_count", p.open_count},
       {"win_rate", p.win_rate},
       {"estimated_win_rate", p.estimated_win_rate},
       {"resolved_pnl", p.resolved_pnl},
       {"avg_price", p.avg_price},
       {"first_trade_ts", p.first_trade_ts},
       {"last_trade_ts", p.last_trade_ts},
       {"labels", labels}};
}

inline void to_json(json &j, const ArbitrageOpportunity &a) {
  j = {{"condition_id", a.condition_id},
       {"slug", a.slug},
       {"prices", a.prices},
       {"price_sum", a.price_sum},
       {"magnitude", a.magnitude},
       {"direction", direction_name(a.direction)},
       {"as_of_block", a.as_of_block}};
}

inline void to_json(json &j, const SmartMoneyEntry &e) {
  j = {{"address", e.address},
       {"score", e.score},
       {"estimated_win_rate", e.estimated_win_rate},
       {"window_volume", e.window_volume},
       {"trade_count", e.trade_count},
       {"last_trade_ts", e.last_trade_ts}};
}

inline void to_json(json &j, const HotMarket &h) {
  j = {{"condition_id", h.condition_id},
       {"slug", h.slug},
       {"window_volume", h.window_volume},
       {"window_trades", h.window_trades}};
}

inline void to_json(json &j, const EngineStats &s) {
  j = {{"applied_trades", s.applied_trades},
       {"duplicate_trades", s.duplicate_trades},
       {"contract_violations", s.contract_violations},
       {"markets", s.markets},
       {"resolved_markets", s.resolved_markets},
       {"traders", s.traders},
       {"latest_block", s.latest_block},
       {"latest_timestamp", s.latest_timestamp}};
}

inline void to_json(json &j, const Position &p) {
  j = {{"condition_id", p.condition_id},
       {"slug", p.slug},
       {"token_id", p.token_id},
       {"outcome_index", p.outcome_index},
       {"trade_count", p.trade_count},
       {"bought", p.bought},
       {"sold", p.sold},
       {"net_size", p.net_size},
       {"avg_cost", p.avg_cost},
       {"total_cost", p.total_cost},
       {"proceeds", p.proceeds},
       {"current_price", p.current_price},
       {"current_value", p.current_value},
       {"realized_pnl", p.realized_pnl},
       {"unrealized_pnl", p.unrealized_pnl},
       {"resolved", p.resolved},
       {"closed", p.closed}};
}

inline void to_json(json &j, const PortfolioSummary &s) {
  j = {{"address", s.address},
       {"total_positions", s.total_positions},
       {"open_positions", s.open_positions},
       {"winning_positions", s.winning_positions},
       {"losing_positions", s.losing_positions},
       {"total_cost", s.total_cost},
       {"current_value", s.current_value},
       {"total_realized_pnl", s.realized_pnl},
       {"total_unrealized_pnl", s.unrealized_pnl},
       {"total_pnl", s.total_pnl},
       {"pnl_pct", s.pnl_pct},
       {"positions", s.positions}};
}

inline void to_json(json &j, const PnlLeaderboardEntry &e) {
  j = {{"address", e.address},
       {"total_pnl", e.total_pnl},
       {"realized_pnl", e.realized_pnl},
       {"unrealized_pnl", e.unrealized_pnl},
       {"pnl_pct", e.pnl_pct},
       {"positions", e.positions},
       {"winning_positions", e.winning_positions},
       {"losing_positions", e.losing_positions}};
}
