#pragma once

#include <cstdint>
#include <vector>

#include "../core/types.hpp"

enum class TraderLabel : uint8_t {
  Whale,
  Active,
  Diversified,
  HighWinRate,
  Newcomer,
  BuyBiased,
  SellBiased,
  Sniper,
};

inline const char *label_name(TraderLabel l) {
  switch (l) {
  case TraderLabel::Whale:
    return "whale";
  case TraderLabel::Active:
    return "active";
  case TraderLabel::Diversified:
    return "diversified";
  case TraderLabel::HighWinRate:
    return "high_win_rate";
  case TraderLabel::Newcomer:
    return "newcomer";
  case TraderLabel::BuyBiased:
    return "buy_biased";
  case TraderLabel::SellBiased:
    return "sell_biased";
  case TraderLabel::Sniper:
    return "sniper";
  }
  return "unknown";
}

struct LabelThresholds {
  double whale_volume = 10000.0;
  int64_t active_trades = 50;
  int64_t diversified_markets = 5;
  double high_win_rate = 0.6;
  int64_t high_win_rate_min_resolved = 10;
  int64_t newcomer_max_trades = 5;
  double bias_ratio = 2.0;
  double sniper_low = 0.15;
  double sniper_high = 0.85;
};

// 纯函数: 画像 -> 标签, 顺序固定
inline std::vector<TraderLabel> trader_labels(const TraderProfile &p, const LabelThresholds &t = {}) {
  std::vector<TraderLabel> labels;
  if (p.trade_count == 0)
    return labels;

  if (p.total_volume() >= t.whale_volume)
    labels.push_back(TraderLabel::Whale);
  if (p.trade_count >= t.active_trades)
    labels.push_back(TraderLabel::Active);
  if (p.distinct_markets >= t.diversified_markets)
    labels.push_back(TraderLabel::Diversified);
  if (p.won_count + p.lost_count >= t.high_win_rate_min_resolved && p.win_rate > t.high_win_rate)
    labels.push_back(TraderLabel::HighWinRate);
  if (p.trade_count < t.newcomer_max_trades)
    labels.push_back(TraderLabel::Newcomer);

  if (p.buy_count > 0 && static_cast<double>(p.buy_count) >= t.bias_ratio * static_cast<double>(p.sell_count))
    labels.push_back(TraderLabel::BuyBiased);
  else if (p.sell_count > 0 &&
           static_cast<double>(p.sell_count) >= t.bias_ratio * static_cast<double>(p.buy_count))
    labels.push_back(TraderLabel::SellBiased);

  if (p.avg_price < t.sniper_low || p.avg_price > t.sniper_high)
    labels.push_back(TraderLabel::Sniper);
  return labels;
}
