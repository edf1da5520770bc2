#include <catch2/catch.hpp>

#include <algorithm>

#include "../test_util/harness.hpp"
#include "sync_coordinator.hpp"

namespace indexer {

using test::address_of;
using test::hash_of;
using test::wait_until;

namespace {

Config fast_config() {
  Config config;
  config.rpc_url = "http://localhost:8545";
  config.db_path = ":memory:";
  config.min_batch_size = 2;
  config.max_batch_size = 6;
  config.batch_size_step = 2;
  config.parallel_blocks = 2;
  config.reorg_depth = 12;
  config.start_lookback = 100;
  config.poll_interval_ms = 10;
  config.error_retry_delay_ms = 5;
  config.max_retry_delay_ms = 20;
  config.failures_before_health_probe = 3;
  config.enable_tracing = false;
  config.enable_nft_metadata = false;
  return config;
}

void build_chain(test::FakeChain &chain, int64_t from, int64_t to, const std::string &tag = "a") {
  for (int64_t n = from; n <= to; ++n)
    chain.add_block(n, tag);
}

} // namespace

TEST_CASE("catches up to the chain head and persists the cursor") {
  test::MemoryStorage storage;
  test::FakeChain chain;
  test::FakeHttp http;
  build_chain(chain, 0, 20);
  chain.add_transaction(7, address_of(1), address_of(2));

  SyncCoordinator sync(fast_config(), storage, chain, http);
  sync.start();
  REQUIRE(wait_until([&]() { return sync.current_block() == 20; }));
  CHECK(sync.target_block() == 20);
  CHECK(sync.is_running());
  sync.stop();

  CHECK_FALSE(sync.is_running());
  CHECK(storage.block_count() == 20);
  CHECK_FALSE(storage.get_block(0));
  CHECK(storage.count_transactions() == 1);

  auto state = storage.get_indexer_state();
  REQUIRE(state);
  CHECK(state->last_indexed_block == 20);
  CHECK_FALSE(state->is_running);
  CHECK(state->last_error == std::nullopt);

  auto history = storage.cursor_history();
  CHECK(std::is_sorted(history.begin(), history.end()));

  REQUIRE(wait_until([&]() { return storage.get_network_stats().has_value(); }));
  auto stats = storage.get_network_stats();
  CHECK(stats->latest_block == 20);
  CHECK(stats->avg_block_time == "12.00");
  CHECK(stats->avg_gas_price == "1000000000");
  CHECK(storage.get_daily_stats(chain.get_block(1, false)->timestamp / 86400 * 86400));
}

TEST_CASE("recovers from an unreachable rpc and resumes from the persisted cursor") {
  test::MemoryStorage storage;
  test::FakeChain chain;
  test::FakeHttp http;
  build_chain(chain, 0, 20);
  storage.update_indexer_state(15, false, std::nullopt);
  chain.fail_next(4);

  SyncCoordinator sync(fast_config(), storage, chain, http);
  sync.start();
  REQUIRE(wait_until([&]() { return sync.current_block() == 20; }));

  CHECK(chain.reconnects() > 0);
  auto history = storage.cursor_history();
  CHECK(std::all_of(history.begin(), history.end(), [](int64_t c) { return c >= 15; }));
  CHECK_FALSE(storage.get_block(15));
  for (int64_t n = 16; n <= 20; ++n)
    CHECK(storage.get_block(n));

  SECTION("mid-run outage") {
    chain.fail_next(6);
    build_chain(chain, 21, 25);
    REQUIRE(wait_until([&]() { return sync.current_block() == 25; }));
    for (int64_t n = 21; n <= 25; ++n)
      CHECK(storage.get_block(n));
    CHECK(storage.get_indexer_state()->last_error == std::nullopt);
  }
  sync.stop();
}

TEST_CASE("reorg while stopped is repaired on the next start") {
  test::MemoryStorage storage;
  test::FakeChain chain;
  test::FakeHttp http;
  build_chain(chain, 0, 10);
  auto stale_tx = chain.add_transaction(9, address_of(1), address_of(2));

  SyncCoordinator sync(fast_config(), storage, chain, http);
  sync.start();
  REQUIRE(wait_until([&]() { return sync.current_block() == 10; }));
  sync.stop();
  REQUIRE(storage.get_transaction(stale_tx));

  chain.fork_from(7, 10, "b");
  sync.start();
  REQUIRE(wait_until([&]() {
    for (int64_t n = 7; n <= 10; ++n) {
      auto b = storage.get_block(n);
      if (!b || b->hash != hash_of(n, "b"))
        return false;
    }
    return sync.current_block() == 10;
  }));
  sync.stop();

  for (int64_t n = 1; n <= 6; ++n)
    CHECK(storage.get_block(n)->hash == hash_of(n, "a"));
  CHECK_FALSE(storage.get_transaction(stale_tx));
  CHECK(storage.block_count() == 10);
}

TEST_CASE("transient errors shrink the batch and are retried") {
  test::MemoryStorage storage;
  test::FakeChain chain;
  test::FakeHttp http;
  build_chain(chain, 0, 12);
  chain.fail_blocks(4);

  SyncCoordinator sync(fast_config(), storage, chain, http);
  sync.start();
  REQUIRE(wait_until([&]() { return sync.current_block() == 12; }));
  sync.stop();

  CHECK(storage.block_count() == 12);
  CHECK(storage.get_indexer_state()->last_error == std::nullopt);
  CHECK(chain.reconnects() == 0);
}

TEST_CASE("start and stop are idempotent") {
  test::MemoryStorage storage;
  test::FakeChain chain;
  test::FakeHttp http;
  build_chain(chain, 0, 3);

  SyncCoordinator sync(fast_config(), storage, chain, http);
  sync.stop();
  CHECK_FALSE(sync.is_running());

  sync.start();
  sync.start();
  CHECK(sync.is_running());
  REQUIRE(wait_until([&]() { return sync.current_block() == 3; }));

  sync.stop();
  sync.stop();
  CHECK_FALSE(sync.is_running());
  CHECK(storage.block_count() == 3);
}

} // namespace indexer
