#include <csignal>
#include <cstring>
#include <exception>
#include <iostream>
#include <string>
#include <thread>

#include "analytics/analytics_engine.hpp"
#include "api/api_server.hpp"
#include "core/config.hpp"
#include "core/database.hpp"
#include "infra/rpc_client.hpp"
#include "sync/indexer.hpp"
#include "sync/log_source.hpp"
#include "sync/token_registry.hpp"

void print_usage(const char *prog) {
  std::cout << "用法: " << prog << " --config <config.json>" << std::endl;
}

int run(const std::string &config_path) {
  Config config = Config::load(config_path);
  auto slugs = load_market_slugs(config.market_metadata_path);

  std::cout << "[Main] DB Path: " << config.db_path << std::endl;
  std::cout << "[Main] RPC Node: " << config.rpc_url << std::endl;
  std::cout << "[Main] Batch Size: " << config.sync_batch_size << " blocks" << std::endl;
  std::cout << "[Main] API Port: " << config.api_port << std::endl;
  std::cout << "[Main] Market slugs: " << slugs.size() << std::endl;

  Database db(config.db_path);
  db.init_schema();

  RpcClient rpc(config.rpc_url, config.rpc_api_key, std::chrono::seconds(config.rpc_timeout_seconds));
  RpcLogSource source(rpc);
  TokenRegistry registry;
  AnalyticsEngine engine(EngineOptions::from_config(config));

  Indexer indexer(IndexerOptions::from_config(config), source, db, registry, engine, &slugs);
  indexer.restore();

  auto sync_getter = [&indexer]() -> SyncStatus {
    SyncStatus s;
    IndexCursor c = indexer.cursor();
    const DecodeStats &d = indexer.decode_stats();
    s.state = indexer_state_name(indexer.state());
    s.halted = indexer.halted();
    s.cursor_block = c.block_number;
    s.cursor_log_index = c.log_index;
    s.head_block = indexer.head_block();
    s.last_error = indexer.last_error();
    s.decoded = d.decoded;
    s.unrecognized = d.unrecognized;
    s.invalid_price = d.invalid_price;
    s.unknown_token = d.unknown_token;
    s.unknown_market = d.unknown_market;
    s.malformed = d.malformed;
    return s;
  };

  // Indexer 使用单独的 io_context 和线程, 避免阻塞 API
  boost::asio::io_context sync_ioc;
  indexer.start(sync_ioc);
  std::thread sync_thread([&sync_ioc]() { sync_ioc.run(); });

  boost::asio::io_context api_ioc;
  ApiServer api_server(api_ioc, engine, static_cast<unsigned short>(config.api_port), sync_getter);

  boost::asio::signal_set signals(api_ioc, SIGINT, SIGTERM);
  signals.async_wait([&](const boost::system::error_code &, int) {
    std::cout << "\n[Main] 正在关闭..." << std::endl;
    api_ioc.stop();
  });

  std::cout << "[Main] 服务已启动" << std::endl;
  api_ioc.run();

  std::cout << "[Main] 正在停止索引..." << std::endl;
  sync_ioc.stop();
  sync_thread.join();
  indexer.stop();

  IndexCursor c = indexer.cursor();
  std::cout << "[Main] 已退出, cursor=" << c.block_number << ":" << c.log_index << std::endl;
  return 0;
}

int main(int argc, char *argv[]) {
  std::string config_path = "config.json";

  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
      config_path = argv[++i];
    } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
      print_usage(argv[0]);
      return 0;
    } else {
      print_usage(argv[0]);
      return 2;
    }
  }

  std::cout << "========================================" << std::endl;
  std::cout << "    Polyscope Indexer" << std::endl;
  std::cout << "========================================" << std::endl;

  try {
    return run(config_path);
  } catch (const std::exception &e) {
    std::cerr << "[Main] 启动失败: " << e.what() << std::endl;
    return 1;
  }
}
