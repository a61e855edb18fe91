#pragma once

#include <cctype>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>

#include "../core/errors.hpp"

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;
using json = nlohmann::json;

// ============================================================================
// RpcClient - Polygon JSON-RPC (HTTP/HTTPS), 每次请求带超时
// 所有失败统一抛 FetchError
// ============================================================================
class RpcClient {
public:
  struct LogQuery {
    std::string address;
    int64_t from_block;
    int64_t to_block;
    std::vector<std::string> topic0_list;
  };

  RpcClient(const std::string &url, const std::string &api_key = "",
            std::chrono::seconds timeout = std::chrono::seconds(30))
      : api_key_(api_key), timeout_(timeout) {
    parse_url(url);
  }

  int64_t eth_blockNumber() {
    json request = {
        {"jsonrpc", "2.0"},
        {"id", ++request_id_},
        {"method", "eth_blockNumber"},
        {"params", json::array()}};

    return parse_block_number(http_post(request.dump()));
  }

  std::vector<json> eth_getLogs_batch(const std::vector<LogQuery> &queries) {
    json batch = json::array();

    for (const auto &q : queries) {
      json filter = {
          {"address", q.address},
          {"fromBlock", to_hex(q.from_block)},
          {"toBlock", to_hex(q.to_block)}};

      if (!q.topic0_list.empty()) {
        filter["topics"] = json::array({q.topic0_list});
      }

      batch.push_back({{"jsonrpc", "2.0"},
                       {"id", batch.size()},
                       {"method", "eth_getLogs"},
                       {"params", json::array({filter})}});
    }

    return post_batch(batch);
  }

  // block_number -> timestamp(秒)
  std::vector<int64_t> eth_getBlockTimestamps(const std::vector<int64_t> &blocks) {
    if (blocks.empty())
      return {};

    json batch = json::array();
    for (auto b : blocks) {
      batch.push_back({{"jsonrpc", "2.0"},
                       {"id", batch.size()},
                       {"method", "eth_getBlockByNumber"},
                       {"params", json::array({to_hex(b), false})}});
    }

    std::vector<json> results = post_batch(batch);
    std::vector<int64_t> timestamps;
    timestamps.reserve(results.size());
    for (size_t i = 0; i < results.size(); ++i)
      timestamps.push_back(parse_block_timestamp(results[i], blocks[i]));
    return timestamps;
  }

  // ---- 响应解析 ----
  // 响应本身损坏(非 JSON, 缺字段, 类型不对)按暂时性故障处理: Timeout
  // Invalid 只留给节点明确拒绝的请求

  static int64_t parse_block_number(const std::string &body) {
    json response = parse_body(body);
    check_rpc_error(response);
    if (!response.is_object() || !response.contains("result") || !response["result"].is_string())
      throw FetchError(FetchErrorKind::Timeout, "eth_blockNumber returned no result");
    return from_hex(response["result"].get<std::string>());
  }

  // batch 响应按 id 还原为请求顺序
  static std::vector<json> parse_batch(const std::string &body, size_t expected) {
    json responses = parse_body(body);
    if (!responses.is_array()) {
      // 有的节点对整个 batch 返回单个 error 对象
      check_rpc_error(responses);
      throw FetchError(FetchErrorKind::Timeout, "RPC batch response is not an array");
    }

    std::vector<json> results(expected);
    std::vector<bool> seen(expected, false);
    for (const auto &resp : responses) {
      check_rpc_error(resp);
      if (!resp.is_object() || !resp.contains("id") || !resp["id"].is_number_unsigned())
        throw FetchError(FetchErrorKind::Timeout, "RPC response without a usable id");
      size_t id = resp["id"].get<size_t>();
      if (id >= expected)
        throw FetchError(FetchErrorKind::Timeout, "RPC response id out of range");
      if (!resp.contains("result") || resp["result"].is_null())
        throw FetchError(FetchErrorKind::Timeout, "RPC response " + std::to_string(id) + " has no result");
      results[id] = resp["result"];
      seen[id] = true;
    }
    for (size_t i = 0; i < expected; ++i) {
      if (!seen[i])
        throw FetchError(FetchErrorKind::Timeout, "RPC batch response missing id " + std::to_string(i));
    }
    return results;
  }

  static int64_t parse_block_timestamp(const json &block, int64_t number) {
    if (!block.is_object() || !block.contains("timestamp") || !block["timestamp"].is_string()) {
      throw FetchError(FetchErrorKind::Timeout,
                       "block " + std::to_string(number) + " not available yet");
    }
    return from_hex(block["timestamp"].get<std::string>());
  }

  static std::string to_hex(int64_t value) {
    std::stringstream ss;
    ss << "0x" << std::hex << value;
    return ss.str();
  }

  static int64_t from_hex(const std::string &hex) {
    try {
      return static_cast<int64_t>(std::stoull(hex, nullptr, 16));
    } catch (const std::logic_error &) {
      throw FetchError(FetchErrorKind::Timeout, "bad hex quantity: " + hex);
    }
  }

  // JSON-RPC error -> FetchError 分类
  static FetchErrorKind classify_rpc_error(const json &error) {
    int64_t code = 0;
    std::string message;
    if (error.contains("code") && error["code"].is_number_integer())
      code = error["code"].get<int64_t>();
    if (error.contains("message") && error["message"].is_string())
      message = error["message"].get<std::string>();
    for (auto &c : message)
      c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (code == -32005 || code == -32090 || message.find("rate limit") != std::string::npos ||
        message.find("too many requests") != std::string::npos) {
      return FetchErrorKind::RateLimited;
    }
    if (code == -32600 || code == -32601 || code == -32602 || code == -32700) {
      return FetchErrorKind::Invalid;
    }
    return FetchErrorKind::Timeout;
  }

  static FetchErrorKind classify_http_status(unsigned status) {
    if (status == 429)
      return FetchErrorKind::RateLimited;
    if (status >= 500 || status == 408)
      return FetchErrorKind::Timeout;
    return FetchErrorKind::Invalid;
  }

private:
  std::vector<json> post_batch(const json &batch) { return parse_batch(http_post(batch.dump()), batch.size()); }

  static void check_rpc_error(const json &response) {
    if (response.is_object() && response.contains("error")) {
      const auto &error = response["error"];
      FetchErrorKind kind = error.is_object() ? classify_rpc_error(error) : FetchErrorKind::Timeout;
      std::string text = error.dump(-1, ' ', false, json::error_handler_t::replace);
      std::cerr << "[Rpc] " << fetch_error_name(kind) << " " << text.substr(0, 200) << std::endl;
      throw FetchError(kind, "RPC error: " + text);
    }
  }

  static json parse_body(const std::string &body) {
    try {
      return json::parse(body);
    } catch (const json::parse_error &e) {
      throw FetchError(FetchErrorKind::Timeout, "RPC response is not JSON: " + std::string(e.what()));
    }
  }

  void parse_url(const std::string &url) {
    std::string u = url;

    if (u.starts_with("https://")) {
      use_ssl_ = true;
      u = u.substr(8);
    } else if (u.starts_with("http://")) {
      use_ssl_ = false;
      u = u.substr(7);
    } else {
      throw std::invalid_argument("RPC URL 必须以 http:// 或 https:// 开头: " + url);
    }

    auto slash_pos = u.find('/');
    if (slash_pos != std::string::npos) {
      target_ = u.substr(slash_pos);
      u = u.substr(0, slash_pos);
    } else {
      target_ = "/";
    }

    auto colon_pos = u.find(':');
    if (colon_pos != std::string::npos) {
      host_ = u.substr(0, colon_pos);
      port_ = u.substr(colon_pos + 1);
    } else {
      host_ = u;
      port_ = use_ssl_ ? "443" : "80";
    }
  }

  // 异步操作 + expires_after 实现整体超时, 在本地 io_context 上同步等待
  std::string http_post(const std::string &body) {
    asio::io_context ioc;
    tcp::resolver resolver(ioc);

    http::request<http::string_body> req{http::verb::post, target_, 11};
    req.set(http::field::host, host_);
    req.set(http::field::content_type, "application/json");
    req.set(http::field::user_agent, "polyscope/1.0");

    if (!api_key_.empty()) {
      req.set(http::field::authorization, "Bearer " + api_key_);
    }

    req.body() = body;
    req.prepare_payload();

    beast::error_code ec;
    auto wait = [&ioc, &ec](const char *step) {
      ioc.run();
      ioc.restart();
      if (ec == beast::error::timeout)
        throw FetchError(FetchErrorKind::Timeout, std::string("RPC ") + step + " timed out");
      if (ec)
        throw FetchError(FetchErrorKind::Timeout, std::string("RPC ") + step + ": " + ec.message());
    };

    tcp::resolver::results_type endpoints;
    resolver.async_resolve(host_, port_,
                           [&](beast::error_code e, tcp::resolver::results_type r) {
                             ec = e;
                             endpoints = std::move(r);
                           });
    wait("resolve");

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(256 * 1024 * 1024);

    if (use_ssl_) {
      asio::ssl::context ssl_ctx(asio::ssl::context::tls_client);
      ssl_ctx.set_default_verify_paths();
      ssl_ctx.set_verify_mode(asio::ssl::verify_peer);
      beast::ssl_stream<beast::tcp_stream> stream(ioc, ssl_ctx);
      SSL_set_tlsext_host_name(stream.native_handle(), host_.c_str());

      beast::get_lowest_layer(stream).expires_after(timeout_);
      beast::get_lowest_layer(stream).async_connect(
          endpoints, [&](beast::error_code e, tcp::endpoint) { ec = e; });
      wait("connect");
      stream.async_handshake(asio::ssl::stream_base::client, [&](beast::error_code e) { ec = e; });
      wait("handshake");
      http::async_write(stream, req, [&](beast::error_code e, std::size_t) { ec = e; });
      wait("write");
      http::async_read(stream, buffer, parser, [&](beast::error_code e, std::size_t) { ec = e; });
      wait("read");

      // 忽略 shutdown 错误(服务器可能已关闭)
      beast::get_lowest_layer(stream).expires_after(std::chrono::seconds(2));
      stream.async_shutdown([](beast::error_code) {});
      ioc.run();
    } else {
      beast::tcp_stream stream(ioc);
      stream.expires_after(timeout_);
      stream.async_connect(endpoints, [&](beast::error_code e, tcp::endpoint) { ec = e; });
      wait("connect");
      http::async_write(stream, req, [&](beast::error_code e, std::size_t) { ec = e; });
      wait("write");
      http::async_read(stream, buffer, parser, [&](beast::error_code e, std::size_t) { ec = e; });
      wait("read");
      beast::error_code shutdown_ec;
      [[maybe_unused]] auto _ = stream.socket().shutdown(tcp::socket::shutdown_both, shutdown_ec);
    }

    const auto &res = parser.get();
    unsigned status = res.result_int();
    if (status != 200) {
      throw FetchError(classify_http_status(status),
                       "RPC HTTP " + std::to_string(status) + ": " + res.body().substr(0, 200));
    }

    return res.body();
  }

  std::string host_;
  std::string port_;
  std::string target_;
  std::string api_key_;
  std::chrono::seconds timeout_;
  bool use_ssl_ = false;
  int request_id_ = 0;
};
