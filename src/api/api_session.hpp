#pragma once

#include <cctype>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <nlohmann/json.hpp>

#include "../analytics/analytics_engine.hpp"
#include "views.hpp"

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;
using json = nlohmann::json;

struct SyncStatus {
  std::string state;
  bool halted = false;
  int64_t cursor_block = -1;
  int64_t cursor_log_index = -1;
  int64_t head_block = 0;
  std::string last_error;
  int64_t decoded = 0;
  int64_t unrecognized = 0;
  int64_t invalid_price = 0;
  int64_t unknown_token = 0;
  int64_t unknown_market = 0;
  int64_t malformed = 0;
};

// 404
class NotFound : public std::runtime_error {
public:
  explicit NotFound(const std::string &what) : std::runtime_error(what) {}
};

class ApiSession : public std::enable_shared_from_this<ApiSession> {
public:
  using SyncStatusGetter = std::function<SyncStatus()>;

  ApiSession(tcp::socket socket, const AnalyticsEngine &engine, SyncStatusGetter sync_getter = nullptr)
      : socket_(std::move(socket)), engine_(engine), sync_getter_(std::move(sync_getter)) {}

  void run() { do_read(); }

  // 路由 + 错误映射; 不依赖 socket
  static http::status route(const std::string &target, const AnalyticsEngine &engine,
                            const SyncStatusGetter &sync_getter, json &body) {
    try {
      std::string path = target.substr(0, target.find('?'));
      if (path == "/api/health") {
        body = {{"status", "ok"}};
      } else if (path == "/api/sync-state") {
        body = sync_state(engine, sync_getter);
      } else if (path == "/api/markets/hot") {
        body = engine.get_hot_markets(int_param(target, "window", 86400), limit_param(target));
      } else if (path == "/api/markets/search") {
        body = engine.search_markets(slug_param(get_param(target, "q")), limit_param(target));
      } else if (path.starts_with("/api/markets/by-slug/")) {
        std::string slug = slug_param(path.substr(21));
        auto view = engine.get_market_by_slug(slug);
        if (!view)
          throw NotFound("market not found: " + slug);
        body = *view;
      } else if (path.starts_with("/api/markets/")) {
        body = market_route(path.substr(13), target, engine);
      } else if (path.starts_with("/api/traders/")) {
        body = trader_route(path.substr(13), target, engine);
      } else if (path == "/api/arbitrage") {
        body = engine.list_arbitrage(limit_param(target), offset_param(target));
      } else if (path == "/api/smart-money") {
        body = engine.get_smart_money(int_param(target, "window", 7 * 86400), limit_param(target));
      } else if (path == "/api/leaderboard/pnl") {
        body = engine.get_pnl_leaderboard(market_param(target, engine), limit_param(target));
      } else {
        throw NotFound("Not found");
      }
      return http::status::ok;
    } catch (const NotFound &e) {
      body = {{"error", e.what()}};
      return http::status::not_found;
    } catch (const std::invalid_argument &e) {
      body = {{"error", e.what()}};
      return http::status::bad_request;
    } catch (const std::out_of_range &e) {
      body = {{"error", e.what()}};
      return http::status::bad_request;
    } catch (const std::exception &e) {
      body = {{"error", e.what()}};
      return http::status::internal_server_error;
    }
  }

  static std::string get_param(const std::string &target, const char *name) {
    auto q = target.find('?');
    if (q == std::string::npos)
      return "";
    std::string key = std::string(name) + "=";
    size_t pos = q + 1;
    while (pos < target.size()) {
      size_t end = target.find('&', pos);
      if (end == std::string::npos)
        end = target.size();
      if (target.compare(pos, key.size(), key) == 0)
        return url_decode(target.substr(pos + key.size(), end - pos - key.size()));
      pos = end + 1;
    }
    return "";
  }

  static std::string url_decode(const std::string &str) {
    std::string result;
    for (size_t i = 0; i < str.size(); ++i) {
      if (str[i] == '%' && i + 2 < str.size()) {
        int hex = std::stoi(str.substr(i + 1, 2), nullptr, 16);
        result += static_cast<char>(hex);
        i += 2;
      } else if (str[i] == '+') {
        result += ' ';
      } else {
        result += str[i];
      }
    }
    return result;
  }

private:
  void do_read() {
    req_ = {};
    http::async_read(socket_, buffer_, req_,
                     [self = shared_from_this()](beast::error_code ec, std::size_t) {
                       if (ec)
                         return;
                       self->handle_request();
                     });
  }

  void handle_request() {
    res_ = {};
    res_.version(req_.version());
    res_.keep_alive(req_.keep_alive());

    res_.set(http::field::access_control_allow_origin, "*");
    res_.set(http::field::access_control_allow_methods, "GET, OPTIONS");
    res_.set(http::field::access_control_allow_headers, "Content-Type");

    if (req_.method() == http::verb::options) {
      res_.result(http::status::ok);
      res_.prepare_payload();
      return do_write();
    }

    json body;
    if (req_.method() != http::verb::get) {
      res_.result(http::status::method_not_allowed);
      body = {{"error", "Only GET is supported"}};
    } else {
      res_.result(route(std::string(req_.target()), engine_, sync_getter_, body));
    }

    res_.set(http::field::content_type, "application/json");
    res_.body() = body.dump(-1, ' ', false, json::error_handler_t::replace);
    res_.prepare_payload();
    do_write();
  }

  static json sync_state(const AnalyticsEngine &engine, const SyncStatusGetter &sync_getter) {
    json result = {{"analytics", engine.stats()}};
    if (sync_getter) {
      SyncStatus s = sync_getter();
      result["state"] = s.state;
      result["halted"] = s.halted;
      result["last_block"] = s.cursor_block;
      result["last_log_index"] = s.cursor_log_index;
      result["head_block"] = s.head_block;
      result["lag"] = s.cursor_block < 0 ? s.head_block : s.head_block - s.cursor_block;
      result["last_error"] = s.last_error;
      result["decode"] = {{"decoded", s.decoded},
                          {"unrecognized", s.unrecognized},
                          {"invalid_price", s.invalid_price},
                          {"unknown_token", s.unknown_token},
                          {"unknown_market", s.unknown_market},
                          {"malformed", s.malformed}};
    }
    return result;
  }

  // <id> | <id>/trades
  static json market_route(const std::string &rest, const std::string &target, const AnalyticsEngine &engine) {
    auto slash = rest.find('/');
    std::string id = condition_param(rest.substr(0, slash));
    if (slash == std::string::npos) {
      auto view = engine.get_market(id);
      if (!view)
        throw NotFound("market not found: " + id);
      json j = *view;
      if (auto arb = engine.find_arbitrage(id))
        j["arbitrage"] = *arb;
      return j;
    }
    if (rest.substr(slash) == "/trades") {
      if (!engine.get_market(id))
        throw NotFound("market not found: " + id);
      return engine.get_market_trades(id, limit_param(target), offset_param(target));
    }
    throw NotFound("Not found");
  }

  // <addr> | <addr>/trades | <addr>/positions | <addr>/pnl
  static json trader_route(const std::string &rest, const std::string &target, const AnalyticsEngine &engine) {
    auto slash = rest.find('/');
    std::string address = address_param(rest.substr(0, slash));
    auto profile = engine.get_trader_profile(address);
    if (!profile)
      throw NotFound("trader not found: " + address);
    if (slash == std::string::npos)
      return *profile;
    std::string sub = rest.substr(slash);
    if (sub == "/trades")
      return engine.get_trades_by_address(address, limit_param(target), offset_param(target));
    if (sub == "/positions")
      return engine.get_trader_positions(address, get_param(target, "include_closed") == "1");
    if (sub == "/pnl")
      return *engine.get_portfolio(address);
    throw NotFound("Not found");
  }

  // 空 = 全部市场; 0x 开头按 condition_id, 否则按 slug
  static std::string market_param(const std::string &target, const AnalyticsEngine &engine) {
    std::string market = get_param(target, "market");
    if (market.empty())
      return "";
    if (market.starts_with("0x") || market.starts_with("0X")) {
      std::string id = condition_param(market);
      if (!engine.get_market(id))
        throw NotFound("market not found: " + id);
      return id;
    }
    std::string slug = slug_param(market);
    auto view = engine.get_market_by_slug(slug);
    if (!view)
      throw NotFound("market not found: " + slug);
    return view->market.condition_id;
  }

  // 0x + digits 个十六进制字符, 统一小写
  static std::string hex_id(const std::string &raw, size_t digits, const char *what) {
    std::string v = lower(raw);
    bool ok = v.size() == digits + 2 && v.starts_with("0x");
    for (size_t i = 2; ok && i < v.size(); ++i)
      ok = std::isxdigit(static_cast<unsigned char>(v[i])) != 0;
    if (!ok)
      throw std::invalid_argument(std::string("invalid ") + what);
    return v;
  }

  static std::string condition_param(const std::string &raw) { return hex_id(raw, 64, "condition id"); }
  static std::string address_param(const std::string &raw) { return hex_id(raw, 40, "address"); }

  // slug / 搜索词: 可打印 ASCII
  static std::string slug_param(const std::string &raw) {
    if (raw.empty() || raw.size() > 256)
      throw std::invalid_argument("invalid slug");
    for (unsigned char c : raw) {
      if (c < 0x20 || c > 0x7e)
        throw std::invalid_argument("invalid slug");
    }
    return raw;
  }

  static int64_t int_param(const std::string &target, const char *name, int64_t fallback) {
    std::string v = get_param(target, name);
    if (v.empty())
      return fallback;
    size_t used = 0;
    int64_t n = std::stoll(v, &used);
    if (used != v.size() || n < 0)
      throw std::invalid_argument(std::string("bad parameter: ") + name);
    return n;
  }

  static size_t limit_param(const std::string &target) {
    int64_t n = int_param(target, "limit", 50);
    if (n < 1 || n > 500)
      throw std::invalid_argument("limit must be in [1, 500]");
    return static_cast<size_t>(n);
  }

  static size_t offset_param(const std::string &target) {
    return static_cast<size_t>(int_param(target, "offset", 0));
  }

  static std::string lower(std::string s) {
    for (auto &c : s)
      c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
  }

  void do_write() {
    http::async_write(socket_, res_,
                      [self = shared_from_this()](beast::error_code ec, std::size_t) {
                        if (!ec && self->res_.keep_alive()) {
                          self->do_read();
                        } else {
                          beast::error_code shutdown_ec;
                          [[maybe_unused]] auto ret = self->socket_.shutdown(tcp::socket::shutdown_send, shutdown_ec);
                        }
                      });
  }

  tcp::socket socket_;
  const AnalyticsEngine &engine_;
  SyncStatusGetter sync_getter_;
  beast::flat_buffer buffer_;
  http::request<http::string_body> req_;
  http::response<http::string_body> res_;
};
