// Indexer 状态机, 两遍应用, 恢复与重放, 配置

#include <sstream>

#include "analytics/analytics_engine.hpp"
#include "core/config.hpp"
#include "sync/indexer.hpp"
#include "sync/token_registry.hpp"
#include "test_support.hpp"

using namespace fixture;

static IndexerOptions small_batches() {
  IndexerOptions o;
  o.initial_block = 100;
  o.batch_size = 10;
  o.poll_interval = std::chrono::milliseconds(1000);
  o.max_poll_interval = std::chrono::milliseconds(8000);
  o.backoff_initial = std::chrono::milliseconds(500);
  o.backoff_max = std::chrono::milliseconds(1600);
  return o;
}

// 三个批次: 市场创建, 成交, 结算, 以及第二个市场的持续成交
static void script_chain(ScriptedLogSource &chain) {
  chain.add(token_registered(100, 0, token(0), token(1), condition(1)));
  chain.add(token_registered(100, 1, token(1), token(0), condition(1)));
  chain.add(buy(101, 0, address(1), token(0), 40000000, 100000000, address(9)));
  chain.add(sell(103, 2, address(2), token(0), 7000000, 10000000));
  chain.add(token_registered(105, 0, token(2), token(3), condition(2), contracts::NEG_RISK_CTF_EXCHANGE));
  chain.add(buy(112, 1, address(1), token(2), 3100000, 5000000));
  chain.add(buy(114, 0, address(3), token(3), 2250000, 5000000));
  chain.add(buy(115, 3, address(3), token(1), 3000000, 10000000));
  chain.add(condition_resolution(118, 0, condition(1), {1, 0}));
  chain.add(buy(121, 0, address(4), token(0), 5000000, 10000000));
  chain.add(sell(125, 1, address(1), token(2), 3000000, 5000000, address(3)));
  chain.set_head(129);
}

struct Pipeline {
  TokenRegistry registry;
  AnalyticsEngine engine;
  Indexer indexer;

  Pipeline(LogSource &source, BatchStore &store, IndexerOptions options = small_batches())
      : indexer(options, source, store, registry, engine) {}

  int drain(int max_steps = 50) {
    int steps = 0;
    while (steps < max_steps) {
      ++steps;
      auto step = indexer.run_once();
      if (step == Indexer::Step::CaughtUp || step == Indexer::Step::Halted)
        break;
    }
    return steps;
  }
};

static void assert_same_state(const AnalyticsEngine &a, const AnalyticsEngine &b) {
  auto sa = a.stats();
  auto sb = b.stats();
  ASSERT_EQ(sa.applied_trades, sb.applied_trades);
  ASSERT_EQ(sa.markets, sb.markets);
  ASSERT_EQ(sa.resolved_markets, sb.resolved_markets);
  ASSERT_EQ(sa.traders, sb.traders);
  ASSERT_EQ(sa.latest_block, sb.latest_block);

  for (uint64_t n : {1, 2, 3, 4, 9}) {
    auto pa = a.get_trader_profile(address(n));
    auto pb = b.get_trader_profile(address(n));
    ASSERT_EQ(pa.has_value(), pb.has_value());
    if (!pa)
      continue;
    ASSERT_EQ(pa->trade_count, pb->trade_count);
    ASSERT_EQ(pa->won_count, pb->won_count);
    ASSERT_EQ(pa->lost_count, pb->lost_count);
    ASSERT_EQ(pa->open_count, pb->open_count);
    ASSERT_EQ(pa->buy_volume, pb->buy_volume);
    ASSERT_EQ(pa->sell_volume, pb->sell_volume);
    ASSERT_EQ(pa->estimated_win_rate, pb->estimated_win_rate);
    ASSERT_EQ(pa->resolved_pnl, pb->resolved_pnl);
  }

  for (const auto &cid : {condition(1), condition(2)}) {
    auto ma = a.get_market(cid);
    auto mb = b.get_market(cid);
    ASSERT_EQ(ma.has_value(), mb.has_value());
    ASSERT_EQ(ma->trade_count, mb->trade_count);
    ASSERT_EQ(ma->won_count, mb->won_count);
    ASSERT_EQ(ma->lost_count, mb->lost_count);
    ASSERT_TRUE(ma->last_prices == mb->last_prices);
    ASSERT_EQ(ma->market.resolved, mb->market.resolved);
  }

  auto arb_a = a.list_arbitrage(10);
  auto arb_b = b.list_arbitrage(10);
  ASSERT_EQ(arb_a.size(), arb_b.size());
  for (size_t i = 0; i < arb_a.size(); ++i) {
    ASSERT_EQ(arb_a[i].condition_id, arb_b[i].condition_id);
    ASSERT_EQ(arb_a[i].magnitude, arb_b[i].magnitude);
  }

  auto sm_a = a.get_smart_money(86400, 10);
  auto sm_b = b.get_smart_money(86400, 10);
  ASSERT_EQ(sm_a.size(), sm_b.size());
  for (size_t i = 0; i < sm_a.size(); ++i) {
    ASSERT_EQ(sm_a[i].address, sm_b[i].address);
    ASSERT_EQ(sm_a[i].score, sm_b[i].score);
  }
}

int main() {
  std::cout << "\n== indexer.hpp\n";

  runTest("batches_advance_cursor_to_head", [] {
    ScriptedLogSource chain;
    script_chain(chain);
    MemoryStore store;
    Pipeline p(chain, store);

    ASSERT_EQ(p.indexer.run_once(), Indexer::Step::Applied);
    ASSERT_EQ(p.indexer.cursor().block_number, 109);
    ASSERT_EQ(p.indexer.cursor().log_index, -1);
    ASSERT_EQ(p.indexer.run_once(), Indexer::Step::Applied);
    ASSERT_EQ(p.indexer.run_once(), Indexer::Step::Applied);
    ASSERT_EQ(p.indexer.cursor().block_number, 129);
    ASSERT_EQ(p.indexer.run_once(), Indexer::Step::CaughtUp);
    ASSERT_EQ(p.indexer.state(), IndexerState::Idle);
    ASSERT_EQ(store.commits(), 3);
    ASSERT_EQ(store.load_cursor()->block_number, 129);

    ASSERT_EQ(p.engine.stats().applied_trades, 7);
    ASSERT_EQ(p.engine.stats().markets, 2);
    ASSERT_EQ(p.engine.stats().resolved_markets, 1);
    ASSERT_EQ(p.indexer.decode_stats().skipped(), 0);
    ASSERT_EQ(p.indexer.decode_stats().decoded, 11);
  });

  runTest("reversed_registration_keeps_first_token_order", [] {
    ScriptedLogSource chain;
    script_chain(chain);
    MemoryStore store;
    Pipeline p(chain, store);
    p.drain();
    auto m = p.engine.get_market(condition(1));
    ASSERT_EQ(m->market.outcome_tokens[0], token(0));
    ASSERT_EQ(store.load_markets().size(), 2u);
    ASSERT_EQ(store.load_markets()[1].exchange, "NegRisk");
  });

  runTest("resolution_attributes_all_market_trades", [] {
    ScriptedLogSource chain;
    script_chain(chain);
    MemoryStore store;
    Pipeline p(chain, store);
    p.drain();
    auto m = *p.engine.get_market(condition(1));
    ASSERT_TRUE(m.market.resolved);
    ASSERT_EQ(m.market.winning_outcome, 0);
    ASSERT_EQ(m.trade_count, 4);
    ASSERT_EQ(m.won_count + m.lost_count, 4);
    // address(1) 在 101 块以 0.40 买入赢家
    ASSERT_EQ(p.engine.get_trader_profile(address(1))->won_count, 1);
    // address(9) 是对手方
    ASSERT_EQ(p.engine.get_trader_profile(address(9))->lost_count, 1);
  });

  runTest("trade_before_registration_in_same_batch_is_applied", [] {
    ScriptedLogSource chain;
    chain.add(buy(100, 0, address(1), token(0), 400000, 1000000));
    chain.add(token_registered(100, 5, token(0), token(1), condition(1)));
    MemoryStore store;
    Pipeline p(chain, store);
    ASSERT_EQ(p.indexer.run_once(), Indexer::Step::Applied);
    ASSERT_EQ(p.engine.stats().applied_trades, 1);
    ASSERT_EQ(p.indexer.decode_stats().unknown_token, 0);
    ASSERT_EQ(p.indexer.cursor().log_index, 5);
  });

  runTest("trade_before_registration_in_earlier_batch_is_skipped", [] {
    ScriptedLogSource chain;
    chain.add(buy(102, 0, address(1), token(0), 400000, 1000000));
    chain.add(token_registered(115, 0, token(0), token(1), condition(1)));
    chain.add(buy(116, 0, address(1), token(0), 500000, 1000000));
    chain.add(condition_resolution(117, 0, condition(5), {1, 0}));
    MemoryStore store;
    Pipeline p(chain, store);
    p.drain();
    ASSERT_EQ(p.indexer.decode_stats().unknown_token, 1);
    ASSERT_EQ(p.indexer.decode_stats().unknown_market, 1);
    ASSERT_EQ(p.engine.stats().applied_trades, 1);
    ASSERT_EQ(p.indexer.cursor().block_number, 117);
    ASSERT_FALSE(p.indexer.halted());
  });

  runTest("transient_fetch_errors_back_off_with_cap", [] {
    ScriptedLogSource chain;
    script_chain(chain);
    chain.fail_next(FetchErrorKind::Timeout);
    chain.fail_next(FetchErrorKind::RateLimited);
    chain.fail_next(FetchErrorKind::Timeout);
    chain.fail_next(FetchErrorKind::Timeout);
    MemoryStore store;
    Pipeline p(chain, store);

    ASSERT_EQ(p.indexer.run_once(), Indexer::Step::Retry);
    ASSERT_EQ(p.indexer.state(), IndexerState::Backoff);
    ASSERT_EQ(p.indexer.backoff_delay().count(), 500);
    ASSERT_EQ(p.indexer.run_once(), Indexer::Step::Retry);
    ASSERT_EQ(p.indexer.backoff_delay().count(), 1000);
    ASSERT_EQ(p.indexer.run_once(), Indexer::Step::Retry);
    ASSERT_EQ(p.indexer.backoff_delay().count(), 1600);
    ASSERT_EQ(p.indexer.run_once(), Indexer::Step::Retry);
    ASSERT_EQ(p.indexer.backoff_delay().count(), 1600);
    ASSERT_EQ(p.indexer.cursor().block_number, -1);

    ASSERT_EQ(p.indexer.run_once(), Indexer::Step::Applied);
    ASSERT_EQ(p.indexer.failures(), 0);
    ASSERT_EQ(p.indexer.cursor().block_number, 109);
  });

  runTest("invalid_fetch_halts_without_advancing", [] {
    ScriptedLogSource chain;
    script_chain(chain);
    MemoryStore store;
    Pipeline p(chain, store);
    ASSERT_EQ(p.indexer.run_once(), Indexer::Step::Applied);
    chain.fail_next(FetchErrorKind::Invalid);
    ASSERT_EQ(p.indexer.run_once(), Indexer::Step::Halted);
    ASSERT_TRUE(p.indexer.halted());
    ASSERT_EQ(p.indexer.state(), IndexerState::Stopped);
    ASSERT_EQ(p.indexer.cursor().block_number, 109);
    ASSERT_TRUE(p.indexer.last_error().starts_with("Invalid"));

    int calls = chain.fetch_calls();
    ASSERT_EQ(p.indexer.run_once(), Indexer::Step::Halted);
    ASSERT_EQ(chain.fetch_calls(), calls);
  });

  runTest("garbled_source_response_retries_instead_of_escaping", [] {
    ScriptedLogSource chain;
    script_chain(chain);
    MemoryStore store;
    Pipeline p(chain, store);
    ASSERT_EQ(p.indexer.run_once(), Indexer::Step::Applied);
    chain.garble_next();
    ASSERT_EQ(p.indexer.run_once(), Indexer::Step::Retry);
    ASSERT_FALSE(p.indexer.halted());
    ASSERT_EQ(p.indexer.state(), IndexerState::Backoff);
    ASSERT_EQ(p.indexer.failures(), 1);
    ASSERT_EQ(p.indexer.cursor().block_number, 109);
    ASSERT_TRUE(p.indexer.last_error().starts_with("fetch"));

    ASSERT_EQ(p.indexer.run_once(), Indexer::Step::Applied);
    ASSERT_EQ(p.indexer.failures(), 0);
    ASSERT_EQ(p.indexer.cursor().block_number, 119);
  });

  runTest("poll_interval_widens_while_caught_up_and_resets_on_new_blocks", [] {
    ScriptedLogSource chain;
    script_chain(chain);
    MemoryStore store;
    Pipeline p(chain, store);
    p.drain();
    ASSERT_EQ(p.indexer.cursor().block_number, 129);
    // drain() 的最后一步已经是一次 CaughtUp
    ASSERT_EQ(p.indexer.poll_interval().count(), 2000);
    ASSERT_EQ(p.indexer.run_once(), Indexer::Step::CaughtUp);
    ASSERT_EQ(p.indexer.poll_interval().count(), 4000);
    ASSERT_EQ(p.indexer.run_once(), Indexer::Step::CaughtUp);
    ASSERT_EQ(p.indexer.poll_interval().count(), 8000);
    ASSERT_EQ(p.indexer.run_once(), Indexer::Step::CaughtUp);
    ASSERT_EQ(p.indexer.poll_interval().count(), 8000);

    chain.add(buy(131, 0, address(5), token(2), 1000000, 2000000));
    ASSERT_EQ(p.indexer.run_once(), Indexer::Step::Applied);
    ASSERT_EQ(p.indexer.poll_interval().count(), 1000);
    ASSERT_EQ(p.indexer.cursor().block_number, 131);
  });

  runTest("failed_commit_does_not_advance_or_apply", [] {
    ScriptedLogSource chain;
    script_chain(chain);
    MemoryStore store;
    Pipeline p(chain, store);
    store.fail_next_commit();
    ASSERT_EQ(p.indexer.run_once(), Indexer::Step::Retry);
    ASSERT_EQ(p.indexer.cursor().block_number, -1);
    ASSERT_FALSE(store.load_cursor().has_value());
    ASSERT_EQ(p.engine.stats().applied_trades, 0);
    ASSERT_EQ(p.indexer.decode_stats().decoded, 0);

    ASSERT_EQ(p.indexer.run_once(), Indexer::Step::Applied);
    ASSERT_EQ(p.indexer.cursor().block_number, 109);
    ASSERT_EQ(p.engine.stats().applied_trades, 2);
    ASSERT_EQ(p.engine.stats().markets, 2);
  });

  runTest("caught_up_when_head_is_behind_start", [] {
    ScriptedLogSource chain;
    chain.set_head(99);
    MemoryStore store;
    Pipeline p(chain, store);
    ASSERT_EQ(p.indexer.run_once(), Indexer::Step::CaughtUp);
    ASSERT_EQ(chain.fetch_calls(), 0);
    ASSERT_FALSE(store.load_cursor().has_value());
  });

  runTest("restart_after_crash_matches_uninterrupted_run", [] {
    ScriptedLogSource chain;
    script_chain(chain);

    MemoryStore reference_store;
    Pipeline reference(chain, reference_store);
    reference.drain();

    // 第二批提交前崩溃
    MemoryStore store;
    {
      Pipeline crashed(chain, store);
      ASSERT_EQ(crashed.indexer.run_once(), Indexer::Step::Applied);
      store.fail_next_commit();
      ASSERT_EQ(crashed.indexer.run_once(), Indexer::Step::Retry);
    }
    ASSERT_EQ(store.load_cursor()->block_number, 109);

    Pipeline resumed(chain, store);
    resumed.indexer.restore();
    ASSERT_EQ(resumed.indexer.cursor().block_number, 109);
    ASSERT_EQ(resumed.engine.stats().applied_trades, 2);
    resumed.drain();

    assert_same_state(reference.engine, resumed.engine);
  });

  runTest("restore_replays_resolved_markets", [] {
    ScriptedLogSource chain;
    script_chain(chain);
    MemoryStore store;
    Pipeline first(chain, store);
    first.drain();

    Pipeline replayed(chain, store);
    replayed.indexer.restore();
    ASSERT_EQ(replayed.indexer.run_once(), Indexer::Step::CaughtUp);
    ASSERT_TRUE(replayed.registry.market(condition(1))->resolved);
    assert_same_state(first.engine, replayed.engine);
  });

  runTest("async_driver_runs_until_caught_up_and_stops", [] {
    ScriptedLogSource chain;
    script_chain(chain);
    MemoryStore store;
    IndexerOptions options = small_batches();
    options.poll_interval = std::chrono::milliseconds(1);
    options.max_poll_interval = std::chrono::milliseconds(2);
    Pipeline p(chain, store, options);

    boost::asio::io_context ioc;
    p.indexer.start(ioc);
    boost::asio::steady_timer stop_timer(ioc);
    stop_timer.expires_after(std::chrono::milliseconds(200));
    stop_timer.async_wait([&](boost::system::error_code) { p.indexer.stop(); });
    ioc.run();

    ASSERT_EQ(p.indexer.cursor().block_number, 129);
    ASSERT_EQ(p.indexer.state(), IndexerState::Stopped);
    ASSERT_EQ(p.engine.stats().applied_trades, 7);
  });

  std::cout << "\n== rpc_client.hpp / log_source.hpp\n";

  runTest("rpc_errors_map_to_fetch_kinds", [] {
    ASSERT_EQ(RpcClient::classify_rpc_error({{"code", -32005}, {"message", "limit exceeded"}}),
              FetchErrorKind::RateLimited);
    ASSERT_EQ(RpcClient::classify_rpc_error({{"code", -32000}, {"message", "Too Many Requests"}}),
              FetchErrorKind::RateLimited);
    ASSERT_EQ(RpcClient::classify_rpc_error({{"code", -32602}, {"message", "invalid params"}}),
              FetchErrorKind::Invalid);
    ASSERT_EQ(RpcClient::classify_rpc_error({{"code", -32000}, {"message", "header not found"}}),
              FetchErrorKind::Timeout);
    ASSERT_EQ(RpcClient::classify_http_status(429), FetchErrorKind::RateLimited);
    ASSERT_EQ(RpcClient::classify_http_status(503), FetchErrorKind::Timeout);
    ASSERT_EQ(RpcClient::classify_http_status(403), FetchErrorKind::Invalid);
    ASSERT_EQ(RpcClient::from_hex("0x1f"), 31);
    ASSERT_EQ(RpcClient::to_hex(31), "0x1f");
    ASSERT_THROWS(RpcClient::from_hex("0xzz"), FetchError);
    ASSERT_EQ(RpcClient::classify_rpc_error(json::object()), FetchErrorKind::Timeout);
    ASSERT_THROWS(RpcClient("ftp://node"), std::invalid_argument);
  });

  runTest("malformed_rpc_responses_are_retryable", [] {
    auto kind_of = [](const std::function<void()> &fn) {
      try {
        fn();
      } catch (const FetchError &e) {
        return std::optional<FetchErrorKind>(e.kind());
      }
      return std::optional<FetchErrorKind>();
    };

    ASSERT_EQ(RpcClient::parse_block_number(R"({"jsonrpc":"2.0","id":1,"result":"0x81"})"), 129);
    ASSERT_EQ(kind_of([] { RpcClient::parse_block_number(R"({"jsonrpc":"2.0","id":1,"result":null})"); }),
              FetchErrorKind::Timeout);
    ASSERT_EQ(kind_of([] { RpcClient::parse_block_number(R"({"jsonrpc":"2.0","id":1})"); }),
              FetchErrorKind::Timeout);
    ASSERT_EQ(kind_of([] { RpcClient::parse_block_number("<html>502 Bad Gateway</html>"); }),
              FetchErrorKind::Timeout);
    ASSERT_EQ(kind_of([] { RpcClient::parse_block_number(R"({"jsonrpc":"2.0","id":1,"result":"0x)"); }),
              FetchErrorKind::Timeout);

    auto ordered = RpcClient::parse_batch(R"([{"id":1,"result":[]},{"id":0,"result":"0x1"}])", 2);
    ASSERT_EQ(ordered[0], json("0x1"));
    ASSERT_TRUE(ordered[1].is_array());
    ASSERT_EQ(kind_of([] { RpcClient::parse_batch(R"([{"result":[]}])", 1); }), FetchErrorKind::Timeout);
    ASSERT_EQ(kind_of([] { RpcClient::parse_batch(R"([{"id":0}])", 1); }), FetchErrorKind::Timeout);
    ASSERT_EQ(kind_of([] { RpcClient::parse_batch(R"([{"id":0,"result":null}])", 1); }),
              FetchErrorKind::Timeout);
    ASSERT_EQ(kind_of([] { RpcClient::parse_batch(R"([{"id":0,"result":[]}])", 2); }),
              FetchErrorKind::Timeout);
    ASSERT_EQ(kind_of([] { RpcClient::parse_batch(R"({"jsonrpc":"2.0"})", 1); }), FetchErrorKind::Timeout);
    ASSERT_EQ(kind_of([] { RpcClient::parse_batch(R"({"error":{"code":-32602,"message":"bad range"}})", 1); }),
              FetchErrorKind::Invalid);
    ASSERT_EQ(kind_of([] { RpcClient::parse_batch(R"([{"id":0,"error":"busy"}])", 1); }),
              FetchErrorKind::Timeout);

    // 节点返回的错误以 [Rpc] 记入 stderr
    std::ostringstream captured;
    auto *saved = std::cerr.rdbuf(captured.rdbuf());
    auto kind = kind_of([] { RpcClient::parse_block_number(R"({"error":{"code":-32005,"message":"limit"}})"); });
    std::cerr.rdbuf(saved);
    ASSERT_EQ(kind, FetchErrorKind::RateLimited);
    ASSERT_TRUE(captured.str().starts_with("[Rpc] RateLimited"));

    ASSERT_EQ(RpcClient::parse_block_timestamp(json{{"timestamp", "0x6553f100"}}, 100), 1700000000);
    ASSERT_EQ(kind_of([] { RpcClient::parse_block_timestamp(json{{"timestamp", nullptr}}, 100); }),
              FetchErrorKind::Timeout);
  });

  runTest("rpc_log_entries_parse_into_raw_logs", [] {
    json entry = {{"address", contracts::CTF_EXCHANGE},
                  {"topics", {topics::TOKEN_REGISTER, token(0), token(1), condition(1)}},
                  {"data", "0x"},
                  {"transactionHash", tx(1)},
                  {"blockNumber", "0x64"},
                  {"logIndex", "0x2"},
                  {"blockTimestamp", "0x6553f100"}};
    RawLog log = RpcLogSource::parse_log(entry);
    ASSERT_EQ(log.block_number, 100);
    ASSERT_EQ(log.log_index, 2);
    ASSERT_EQ(log.block_timestamp, 1700000000);
    ASSERT_EQ(log.topics.size(), 4u);
    ASSERT_EQ(EventDecoder::classify(log), LogKind::MarketCreated);

    entry.erase("blockNumber");
    ASSERT_THROWS(RpcLogSource::parse_log(entry), FetchError);

    std::vector<RawLog> logs = {buy(5, 3, address(1), token(0), 1, 2), buy(4, 9, address(1), token(0), 1, 2),
                                buy(5, 1, address(1), token(0), 1, 2)};
    sort_logs(logs);
    ASSERT_EQ(logs[0].block_number, 4);
    ASSERT_EQ(logs[1].log_index, 1);
    ASSERT_EQ(logs[2].log_index, 3);
  });

  std::cout << "\n== config.hpp\n";

  runTest("config_defaults_and_overrides", [] {
    json j = {{"db_path", "x.duckdb"},
              {"rpc_url", "https://rpc.example"},
              {"api_port", 8080},
              {"sync_batch_size", 200},
              {"initial_block", 5},
              {"arbitrage_threshold", 0.05},
              {"win_rate_policy", "resolved_only"},
              {"smart_money_weights", {{"win_rate", 0.6}}}};
    Config c = Config::from_json(j);
    ASSERT_EQ(c.sync_batch_size, 200);
    ASSERT_EQ(c.poll_interval_seconds, 2);
    ASSERT_EQ(c.max_poll_interval_seconds, 30);
    ASSERT_NEAR(c.arbitrage_threshold, 0.05, 1e-12);
    ASSERT_EQ(c.win_rate_policy, WinRatePolicy::ResolvedOnly);
    ASSERT_NEAR(c.smart_money_weights.win_rate, 0.6, 1e-12);
    ASSERT_NEAR(c.smart_money_weights.volume, 0.3, 1e-12);

    auto o = IndexerOptions::from_config(c);
    ASSERT_EQ(o.batch_size, 200);
    ASSERT_EQ(o.poll_interval.count(), 2000);
  });

  runTest("config_rejects_bad_input", [] {
    json base = {{"db_path", "x.duckdb"},
                 {"rpc_url", "https://rpc.example"},
                 {"api_port", 8080},
                 {"sync_batch_size", 200},
                 {"initial_block", 5}};

    json missing = base;
    missing.erase("rpc_url");
    ASSERT_THROWS(Config::from_json(missing), std::runtime_error);

    json wrong_type = base;
    wrong_type["sync_batch_size"] = "many";
    ASSERT_THROWS(Config::from_json(wrong_type), std::runtime_error);

    json zero_batch = base;
    zero_batch["sync_batch_size"] = 0;
    ASSERT_THROWS(Config::from_json(zero_batch), std::runtime_error);

    json bad_policy = base;
    bad_policy["win_rate_policy"] = "vibes";
    ASSERT_THROWS(Config::from_json(bad_policy), std::runtime_error);

    json bad_interval = base;
    bad_interval["max_poll_interval_seconds"] = 1;
    bad_interval["poll_interval_seconds"] = 5;
    ASSERT_THROWS(Config::from_json(bad_interval), std::runtime_error);

    ASSERT_THROWS(Config::load("/nonexistent/polyscope.json"), std::runtime_error);
  });

  return report();
}
