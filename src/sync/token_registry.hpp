#pragma once

#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "../core/types.hpp"

// ============================================================================
// TokenRegistry - outcome token -> (market, outcome index)
// 只由 Indexer 写入; 读者(decoder, API)取共享锁
// ============================================================================
class TokenRegistry {
public:
  // 按 condition_id 幂等; 返回是否新建
  bool register_market(const Market &market) {
    std::unique_lock lock(mutex_);
    if (markets_.contains(market.condition_id))
      return false;

    for (const auto &token_id : market.outcome_tokens) {
      if (tokens_.contains(token_id))
        return false;
    }

    for (size_t i = 0; i < market.outcome_tokens.size(); ++i) {
      const auto &token_id = market.outcome_tokens[i];
      tokens_[token_id] = Token{token_id, market.condition_id, static_cast<int>(i)};
    }
    markets_[market.condition_id] = market;
    return true;
  }

  std::optional<Token> resolve(const std::string &token_id) const {
    std::shared_lock lock(mutex_);
    auto it = tokens_.find(token_id);
    if (it == tokens_.end())
      return std::nullopt;
    return it->second;
  }

  std::optional<Market> market(const std::string &condition_id) const {
    std::shared_lock lock(mutex_);
    auto it = markets_.find(condition_id);
    if (it == markets_.end())
      return std::nullopt;
    return it->second;
  }

  bool contains_market(const std::string &condition_id) const {
    std::shared_lock lock(mutex_);
    return markets_.contains(condition_id);
  }

  // 已结算的市场不可变: 重复结算返回 false
  bool mark_resolved(const std::string &condition_id, const std::vector<int64_t> &payouts,
                     int winning_outcome, int64_t block_number) {
    std::unique_lock lock(mutex_);
    auto it = markets_.find(condition_id);
    if (it == markets_.end() || it->second.resolved)
      return false;
    it->second.resolved = true;
    it->second.payouts = payouts;
    it->second.winning_outcome = winning_outcome;
    it->second.resolved_block = block_number;
    return true;
  }

  size_t market_count() const {
    std::shared_lock lock(mutex_);
    return markets_.size();
  }

  size_t token_count() const {
    std::shared_lock lock(mutex_);
    return tokens_.size();
  }

private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, Market> markets_;
  std::unordered_map<std::string, Token> tokens_;
};
