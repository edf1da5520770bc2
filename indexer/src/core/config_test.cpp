#include <catch2/catch.hpp>

#include "config.hpp"

namespace indexer {

TEST_CASE("defaults apply to missing keys") {
  auto config = Config::from_json(json{{"rpc_url", "https://rpc.example"}, {"db_path", "chain.duckdb"}});
  CHECK(config.min_batch_size == 5);
  CHECK(config.max_batch_size == 30);
  CHECK(config.batch_size_step == 5);
  CHECK(config.parallel_blocks == 5);
  CHECK(config.reorg_depth == 12);
  CHECK(config.start_lookback == 100);
  CHECK(config.poll_interval_ms == 3000);
  CHECK(config.failures_before_health_probe == 5);
  CHECK(config.http_timeout_seconds == 10);
  CHECK(config.ipfs_gateways.front() == "https://ipfs.io/ipfs/");
  CHECK(config.enable_tracing);
}

TEST_CASE("overrides are read") {
  auto config = Config::from_json(json{{"rpc_url", "http://localhost:8545"},
                                       {"db_path", ":memory:"},
                                       {"rpc_api_key", "secret"},
                                       {"max_batch_size", 50},
                                       {"enable_nft_metadata", false},
                                       {"ipfs_gateways", {"https://gw.example/ipfs/"}}});
  CHECK(config.rpc_api_key == "secret");
  CHECK(config.max_batch_size == 50);
  CHECK_FALSE(config.enable_nft_metadata);
  CHECK(config.ipfs_gateways == std::vector<std::string>{"https://gw.example/ipfs/"});
}

TEST_CASE("invalid configs are rejected") {
  CHECK_THROWS_WITH(Config::from_json(json{{"db_path", "x"}}), Catch::Contains("rpc_url"));
  CHECK_THROWS_WITH(Config::from_json(json{{"rpc_url", "http://x"}}), Catch::Contains("db_path"));
  CHECK_THROWS(Config::from_json(json{{"rpc_url", "ws://x"}, {"db_path", "x"}}));
  CHECK_THROWS(Config::from_json(json{{"rpc_url", "http://x"}, {"db_path", "x"}, {"min_batch_size", 40}}));
  CHECK_THROWS(Config::from_json(json{{"rpc_url", "http://x"}, {"db_path", "x"}, {"ipfs_gateways", json::array()}}));
  CHECK_THROWS(Config::load("/nonexistent/config.json"));
}

} // namespace indexer
