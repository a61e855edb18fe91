#pragma once

#include <iostream>
#include <memory>

#include <boost/asio.hpp>
#include <boost/beast.hpp>

#include "../analytics/analytics_engine.hpp"
#include "api_session.hpp"

namespace asio = boost::asio;
namespace beast = boost::beast;
using tcp = asio::ip::tcp;

// ============================================================================
// ApiServer - 只读 HTTP 接口
// ============================================================================
class ApiServer {
public:
  ApiServer(asio::io_context &ioc, const AnalyticsEngine &engine, unsigned short port,
            ApiSession::SyncStatusGetter sync_getter = nullptr)
      : acceptor_(ioc, tcp::endpoint(tcp::v4(), port)), engine_(engine),
        sync_getter_(std::move(sync_getter)) {
    std::cout << "[HTTP] 监听端口 " << port << std::endl;
    do_accept();
  }

private:
  void do_accept() {
    acceptor_.async_accept([this](beast::error_code ec, tcp::socket socket) {
      if (ec == asio::error::operation_aborted)
        return;
      if (!ec) {
        std::make_shared<ApiSession>(std::move(socket), engine_, sync_getter_)->run();
      } else {
        std::cerr << "[HTTP] accept: " << ec.message() << std::endl;
      }
      do_accept();
    });
  }

  tcp::acceptor acceptor_;
  const AnalyticsEngine &engine_;
  ApiSession::SyncStatusGetter sync_getter_;
};
