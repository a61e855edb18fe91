#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "../core/contracts.hpp"
#include "../core/errors.hpp"
#include "../core/types.hpp"
#include "token_registry.hpp"

namespace topics {
// CTFExchange: 订单
constexpr const char *ORDER_FILL = "0xd0a08e8c493f9c94f29311604c9de1b4e8c8d4c06bd0c789af57f2d65bfec0f6";
constexpr const char *TOKEN_REGISTER = "0xbc9a2432e8aeb48327246cddd6e872ef452812b4243c04e6bfb786a2cd8faf0d";
// ConditionalTokens: 结算
constexpr const char *CONDITION_RESOLVE = "0xb44d84d3289691f71497564b85d4233648d9dbae8cbdbb4329f301c3a0185894";
} // namespace topics

enum class LogKind : uint8_t { TradeFilled, MarketCreated, MarketResolved, Unrecognized };

struct DecodeResult {
  std::optional<DomainEvent> event;
  DecodeError error;

  bool ok() const { return event.has_value(); }

  static DecodeResult success(DomainEvent e) {
    DecodeResult r;
    r.event = std::move(e);
    return r;
  }

  static DecodeResult failure(DecodeErrorKind kind, std::string detail) {
    DecodeResult r;
    r.error = {kind, std::move(detail)};
    return r;
  }
};

// ============================================================================
// EventDecoder - RawLog -> DomainEvent
// 无 I/O; 仅读取 TokenRegistry
// ============================================================================
class EventDecoder {
public:
  using SlugMap = std::unordered_map<std::string, std::string>;

  explicit EventDecoder(const TokenRegistry &registry, const SlugMap *slugs = nullptr)
      : registry_(registry), slugs_(slugs) {}

  static LogKind classify(const RawLog &log) {
    if (log.topics.empty())
      return LogKind::Unrecognized;

    std::string address = to_lower(log.address);
    std::string topic0 = to_lower(log.topics[0]);

    if (contracts::is_exchange(address)) {
      if (topic0 == topics::ORDER_FILL)
        return LogKind::TradeFilled;
      if (topic0 == topics::TOKEN_REGISTER)
        return LogKind::MarketCreated;
    } else if (address == contracts::CONDITIONAL_TOKENS) {
      if (topic0 == topics::CONDITION_RESOLVE)
        return LogKind::MarketResolved;
    }
    return LogKind::Unrecognized;
  }

  DecodeResult decode(const RawLog &log) const {
    try {
      switch (classify(log)) {
      case LogKind::TradeFilled:
        return decode_order_filled(log);
      case LogKind::MarketCreated:
        return decode_token_registered(log);
      case LogKind::MarketResolved:
        return decode_condition_resolution(log);
      case LogKind::Unrecognized:
        return DecodeResult::success(
            Unrecognized{log.topics.empty() ? std::string() : to_lower(log.topics[0])});
      }
    } catch (const std::logic_error &e) {
      // stoull / substr 越界: 数据段长度或编码不符
      return DecodeResult::failure(DecodeErrorKind::MalformedLog, e.what());
    }
    return DecodeResult::failure(DecodeErrorKind::MalformedLog, "unreachable");
  }

  // floor(usdc * 1e6 / shares); 仅 (0, 1e6) 为有效成交价
  static std::optional<int64_t> price_from_amounts(int64_t usdc, int64_t shares) {
    if (usdc <= 0 || shares <= 0)
      return std::nullopt;
    __int128 p = static_cast<__int128>(usdc) * FIXED_SCALE / shares;
    if (p <= 0 || p >= FIXED_SCALE)
      return std::nullopt;
    return static_cast<int64_t>(p);
  }

  // 价格反算 collateral 数量
  static int64_t usdc_at_price(int64_t price_e6, int64_t shares) {
    return static_cast<int64_t>(static_cast<__int128>(price_e6) * shares / FIXED_SCALE);
  }

private:
  DecodeResult decode_order_filled(const RawLog &log) const {
    if (log.topics.size() < 4)
      return DecodeResult::failure(DecodeErrorKind::MalformedLog, "OrderFilled: topics < 4");
    if (word_count(log.data) < 5)
      return DecodeResult::failure(DecodeErrorKind::MalformedLog, "OrderFilled: data < 5 words");

    std::string maker = address_from_topic(log.topics[2]);
    std::string taker = address_from_topic(log.topics[3]);
    std::string maker_asset_id = extract_word(log.data, 0);
    std::string taker_asset_id = extract_word(log.data, 1);

    auto maker_amount = word_to_int64(log.data, 2);
    auto taker_amount = word_to_int64(log.data, 3);
    auto fee = word_to_int64(log.data, 4);
    if (!maker_amount || !taker_amount || !fee)
      return DecodeResult::failure(DecodeErrorKind::MalformedLog, "OrderFilled: amount overflow");

    Trade trade;
    trade.block_number = log.block_number;
    trade.log_index = log.log_index;
    trade.tx_hash = to_lower(log.tx_hash);
    trade.maker = maker;
    trade.taker = taker;
    trade.fee = *fee;
    trade.timestamp = log.block_timestamp;

    bool maker_pays_usdc = is_zero_word(maker_asset_id);
    bool taker_pays_usdc = is_zero_word(taker_asset_id);
    if (maker_pays_usdc == taker_pays_usdc) {
      return DecodeResult::failure(DecodeErrorKind::MalformedLog,
                                   "OrderFilled: no collateral leg " + trade.tx_hash);
    }

    if (maker_pays_usdc) {
      // maker 付 USDC -> BUY
      trade.side = Side::Buy;
      trade.token_id = taker_asset_id;
      trade.usdc = *maker_amount;
      trade.size = *taker_amount;
    } else {
      trade.side = Side::Sell;
      trade.token_id = maker_asset_id;
      trade.usdc = *taker_amount;
      trade.size = *maker_amount;
    }

    auto price = price_from_amounts(trade.usdc, trade.size);
    if (!price) {
      return DecodeResult::failure(DecodeErrorKind::InvalidPrice,
                                   "usdc=" + std::to_string(trade.usdc) +
                                       " shares=" + std::to_string(trade.size));
    }
    trade.price_e6 = *price;

    auto token = registry_.resolve(trade.token_id);
    if (!token)
      return DecodeResult::failure(DecodeErrorKind::UnknownToken, trade.token_id);
    trade.condition_id = token->condition_id;
    trade.outcome_index = token->outcome_index;

    return DecodeResult::success(TradeFilled{std::move(trade)});
  }

  DecodeResult decode_token_registered(const RawLog &log) const {
    if (log.topics.size() < 4)
      return DecodeResult::failure(DecodeErrorKind::MalformedLog, "TokenRegistered: topics < 4");

    Market market;
    market.condition_id = to_lower(log.topics[3]);
    market.exchange = to_lower(log.address) == contracts::CTF_EXCHANGE ? "CTF" : "NegRisk";
    market.outcome_tokens = {to_lower(log.topics[1]), to_lower(log.topics[2])};
    market.created_block = log.block_number;
    market.created_log_index = log.log_index;

    for (const auto &t : market.outcome_tokens) {
      if (!is_word(t))
        return DecodeResult::failure(DecodeErrorKind::MalformedLog, "TokenRegistered: bad token " + t);
    }
    if (!is_word(market.condition_id) || market.outcome_tokens[0] == market.outcome_tokens[1]) {
      return DecodeResult::failure(DecodeErrorKind::MalformedLog,
                                   "TokenRegistered: bad condition " + market.condition_id);
    }

    if (slugs_) {
      auto it = slugs_->find(market.condition_id);
      if (it != slugs_->end())
        market.slug = it->second;
    }
    return DecodeResult::success(MarketCreated{std::move(market)});
  }

  DecodeResult decode_condition_resolution(const RawLog &log) const {
    if (log.topics.size() < 4)
      return DecodeResult::failure(DecodeErrorKind::MalformedLog, "ConditionResolution: topics < 4");
    if (word_count(log.data) < 3)
      return DecodeResult::failure(DecodeErrorKind::MalformedLog, "ConditionResolution: data < 3 words");

    MarketResolved ev;
    ev.condition_id = to_lower(log.topics[1]);
    ev.block_number = log.block_number;
    ev.log_index = log.log_index;

    auto slot_count = word_to_int64(log.data, 0);
    auto payout_offset = word_to_int64(log.data, 1);
    if (!slot_count || !payout_offset || *payout_offset % 32 != 0)
      return DecodeResult::failure(DecodeErrorKind::MalformedLog, "ConditionResolution: bad header");

    size_t base = static_cast<size_t>(*payout_offset / 32);
    auto payout_len = word_to_int64(log.data, base);
    if (!payout_len || *payout_len != *slot_count || *payout_len < 2 ||
        base + 1 + static_cast<size_t>(*payout_len) > word_count(log.data)) {
      return DecodeResult::failure(DecodeErrorKind::MalformedLog, "ConditionResolution: bad payouts");
    }

    int64_t best = -1;
    for (int64_t i = 0; i < *payout_len; ++i) {
      auto p = word_to_int64(log.data, base + 1 + static_cast<size_t>(i));
      if (!p)
        return DecodeResult::failure(DecodeErrorKind::MalformedLog, "ConditionResolution: payout overflow");
      ev.payouts.push_back(*p);
      if (*p > best) {
        best = *p;
        ev.winning_outcome = static_cast<int>(i);
      }
    }
    if (best <= 0)
      ev.winning_outcome = -1;

    if (!registry_.contains_market(ev.condition_id))
      return DecodeResult::failure(DecodeErrorKind::UnknownMarket, ev.condition_id);

    return DecodeResult::success(std::move(ev));
  }

  static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
  }

  static bool is_hex_digit(char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
  }

  // 0x + 64 hex
  static bool is_word(const std::string &s) {
    if (s.size() != 66 || !s.starts_with("0x"))
      return false;
    return std::all_of(s.begin() + 2, s.end(), is_hex_digit);
  }

  static size_t word_count(const std::string &data) {
    if (data.size() < 2)
      return 0;
    return (data.size() - 2) / 64;
  }

  static std::string extract_word(const std::string &data, size_t index) {
    size_t start = 2 + index * 64;
    std::string w = data.substr(start, 64);
    if (w.size() != 64 || !std::all_of(w.begin(), w.end(), is_hex_digit))
      throw std::invalid_argument("bad data word " + std::to_string(index));
    return "0x" + to_lower(w);
  }

  static std::string address_from_topic(const std::string &topic) {
    if (topic.size() != 66)
      throw std::invalid_argument("bad address topic");
    return "0x" + to_lower(topic.substr(26));
  }

  static bool is_zero_word(const std::string &word) {
    return std::all_of(word.begin() + 2, word.end(), [](char c) { return c == '0'; });
  }

  // uint256 -> int64, 超过 63 位返回 nullopt
  static std::optional<int64_t> word_to_int64(const std::string &data, size_t index) {
    std::string w = extract_word(data, index);
    if (!std::all_of(w.begin() + 2, w.end() - 16, [](char c) { return c == '0'; }))
      return std::nullopt;
    uint64_t v = std::stoull(w.substr(w.size() - 16), nullptr, 16);
    if (v > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
      return std::nullopt;
    return static_cast<int64_t>(v);
  }

  const TokenRegistry &registry_;
  const SlugMap *slugs_;
};
