#pragma once

#include <atomic>
#include <cstdint>
#include <stdexcept>
#include <string>

// ============================================================================
// 错误分类
// DecodeError: 本地恢复, 跳过并计数
// FetchError: Timeout/RateLimited 退避重试, Invalid 停止索引
// PersistenceError: 本批次不提交, 下个 tick 重试
// ============================================================================

enum class DecodeErrorKind : uint8_t {
  InvalidPrice,
  UnknownToken,
  UnknownMarket,
  MalformedLog,
};

inline const char *decode_error_name(DecodeErrorKind k) {
  switch (k) {
  case DecodeErrorKind::InvalidPrice:
    return "InvalidPrice";
  case DecodeErrorKind::UnknownToken:
    return "UnknownToken";
  case DecodeErrorKind::UnknownMarket:
    return "UnknownMarket";
  case DecodeErrorKind::MalformedLog:
    return "MalformedLog";
  }
  return "Unknown";
}

struct DecodeError {
  DecodeErrorKind kind = DecodeErrorKind::MalformedLog;
  std::string detail;
};

struct DecodeStats {
  std::atomic<int64_t> decoded{0};
  std::atomic<int64_t> unrecognized{0};
  std::atomic<int64_t> invalid_price{0};
  std::atomic<int64_t> unknown_token{0};
  std::atomic<int64_t> unknown_market{0};
  std::atomic<int64_t> malformed{0};

  void count(DecodeErrorKind k) {
    switch (k) {
    case DecodeErrorKind::InvalidPrice:
      ++invalid_price;
      break;
    case DecodeErrorKind::UnknownToken:
      ++unknown_token;
      break;
    case DecodeErrorKind::UnknownMarket:
      ++unknown_market;
      break;
    case DecodeErrorKind::MalformedLog:
      ++malformed;
      break;
    }
  }

  void merge(const DecodeStats &o) {
    decoded += o.decoded.load();
    unrecognized += o.unrecognized.load();
    invalid_price += o.invalid_price.load();
    unknown_token += o.unknown_token.load();
    unknown_market += o.unknown_market.load();
    malformed += o.malformed.load();
  }

  int64_t skipped() const {
    return invalid_price + unknown_token + unknown_market + malformed;
  }
};

enum class FetchErrorKind : uint8_t { Timeout, RateLimited, Invalid };

inline const char *fetch_error_name(FetchErrorKind k) {
  switch (k) {
  case FetchErrorKind::Timeout:
    return "Timeout";
  case FetchErrorKind::RateLimited:
    return "RateLimited";
  case FetchErrorKind::Invalid:
    return "Invalid";
  }
  return "Unknown";
}

class FetchError : public std::runtime_error {
public:
  FetchError(FetchErrorKind kind, const std::string &what)
      : std::runtime_error(what), kind_(kind) {}

  FetchErrorKind kind() const { return kind_; }
  bool retryable() const { return kind_ != FetchErrorKind::Invalid; }

private:
  FetchErrorKind kind_;
};

class PersistenceError : public std::runtime_error {
public:
  explicit PersistenceError(const std::string &what) : std::runtime_error(what) {}
};
