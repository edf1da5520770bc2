#include <catch2/catch.hpp>

#include "database.hpp"

namespace indexer {

namespace {

Block make_block(int64_t number, const std::string &hash, int64_t timestamp) {
  Block b;
  b.number = number;
  b.hash = hash;
  b.parent_hash = "0xparent";
  b.timestamp = timestamp;
  b.miner = "0xminer";
  b.gas_used = 100;
  b.gas_limit = 1000;
  b.transaction_count = 1;
  return b;
}

Transaction make_tx(const std::string &hash, int64_t block, const std::string &from, const std::string &to) {
  Transaction tx;
  tx.hash = hash;
  tx.block_number = block;
  tx.block_hash = "0xb" + std::to_string(block);
  tx.from = from;
  tx.to = to;
  tx.value = "1";
  tx.status = true;
  tx.method_id = "0xa9059cbb";
  return tx;
}

TokenTransfer make_transfer(const std::string &tx, int32_t log_index, int64_t block) {
  TokenTransfer t;
  t.transaction_hash = tx;
  t.log_index = log_index;
  t.block_number = block;
  t.token_address = "0xtoken";
  t.from = "0xa";
  t.to = "0xb";
  t.value = "5";
  return t;
}

} // namespace

TEST_CASE("blocks round trip and upsert") {
  Database db(":memory:");
  db.init_schema();
  db.init_schema();

  auto b = make_block(1, "0x01", 1000);
  b.base_fee_per_gas = "7";
  db.upsert_block(b);
  CHECK(db.get_block(1) == b);

  b.hash = "0x02";
  db.upsert_block(b);
  CHECK(db.get_block(1)->hash == "0x02");
  CHECK(db.get_max_block_number() == 1);
  CHECK_FALSE(db.get_block(2));
}

TEST_CASE("transactions upsert without touching indexed columns") {
  Database db(":memory:");
  db.init_schema();
  auto tx = make_tx("0xt1", 5, "0xa", "0xb");
  db.upsert_transaction(tx);
  tx.status = false;
  tx.method_name = "transfer";
  db.upsert_transaction(tx);

  auto stored = db.get_transaction("0xt1");
  REQUIRE(stored);
  CHECK(stored->status == false);
  CHECK(stored->method_name == "transfer");
  CHECK(db.count_transactions() == 1);

  db.upsert_transaction(make_tx("0xt2", 5, "0xb", "0xa"));
  auto counts = db.get_address_tx_counts("0xa");
  CHECK(counts.total == 2);
  CHECK(counts.sent == 1);
  CHECK(counts.received == 1);
}

TEST_CASE("logs keep their topic order") {
  Database db(":memory:");
  db.init_schema();
  TransactionLog log;
  log.transaction_hash = "0xt1";
  log.log_index = 2;
  log.address = "0xtoken";
  log.topics = {"0xddf2", "0x01", "0x02"};
  log.topic0 = "0xddf2";
  log.data = "0x";
  log.block_number = 5;
  log.block_hash = "0xb5";
  db.upsert_log(log);
  db.upsert_log(log);

  auto logs = db.get_logs("0xt1");
  REQUIRE(logs.size() == 1);
  CHECK(logs[0] == log);
}

TEST_CASE("token transfers insert once") {
  Database db(":memory:");
  db.init_schema();
  CHECK(db.insert_token_transfer(make_transfer("0xt1", 0, 5)));
  CHECK_FALSE(db.insert_token_transfer(make_transfer("0xt1", 0, 5)));
  auto batch = make_transfer("0xt1", 0, 5);
  batch.batch_index = 1;
  CHECK(db.insert_token_transfer(batch));
  CHECK(db.count_token_transfers() == 2);
  CHECK(db.count_token_transfers_for("0xtoken") == 2);
  auto unique = db.get_unique_token_addresses();
  REQUIRE(unique.size() == 1);
  CHECK(unique[0].first == "0xtoken");
}

TEST_CASE("token upsert only refreshes metadata") {
  Database db(":memory:");
  db.init_schema();
  Token t;
  t.address = "0xtoken";
  db.upsert_token(t);
  db.set_token_transfer_count("0xtoken", 4);
  db.increment_token_transfer_count("0xtoken");
  for (const auto *holder : {"0xa", "0xb"}) {
    TokenHolder h;
    h.token_address = "0xtoken";
    h.holder_address = holder;
    h.balance = "1";
    db.upsert_token_holder(h);
  }
  CHECK(db.refresh_token_holder_count("0xtoken") == 2);

  t.name = "Name";
  t.decimals = 6;
  db.upsert_token(t);

  auto stored = db.get_token("0xtoken");
  REQUIRE(stored);
  CHECK(stored->name == "Name");
  CHECK(stored->decimals == 6);
  CHECK(stored->transfer_count == 5);
  CHECK(stored->holder_count == 2);
  CHECK(db.get_tokens(10).size() == 1);
}

TEST_CASE("holder count ignores zero balances") {
  Database db(":memory:");
  db.init_schema();
  Token t;
  t.address = "0xtoken";
  db.upsert_token(t);

  TokenHolder h;
  h.token_address = "0xtoken";
  h.holder_address = "0xa";
  h.balance = "10";
  db.upsert_token_holder(h);
  h.holder_address = "0xb";
  h.balance = "0";
  db.upsert_token_holder(h);
  CHECK(db.refresh_token_holder_count("0xtoken") == 1);
  CHECK(db.get_token("0xtoken")->holder_count == 1);

  h.balance = "3";
  db.upsert_token_holder(h);
  CHECK(db.refresh_token_holder_count("0xtoken") == 2);
  CHECK(db.get_token("0xtoken")->holder_count == 2);
  CHECK(db.get_token_holder("0xtoken", "0xb", std::nullopt)->balance == "3");
}

TEST_CASE("address upsert preserves first seen") {
  Database db(":memory:");
  db.init_schema();
  Address a;
  a.address = "0xa";
  a.first_seen = 100;
  a.last_seen = 100;
  db.upsert_address(a);
  a.first_seen = 500;
  a.last_seen = 500;
  a.balance = "9";
  db.upsert_address(a);

  auto stored = db.get_address("0xa");
  REQUIRE(stored);
  CHECK(stored->first_seen == 100);
  CHECK(stored->last_seen == 500);
  CHECK(stored->balance == "9");
  CHECK(db.count_addresses() == 1);
}

TEST_CASE("nft and internal transaction rows") {
  Database db(":memory:");
  db.init_schema();
  NftToken n;
  n.contract_address = "0xnft";
  n.token_id = "1";
  n.attributes = R"([{"a":1}])";
  db.upsert_nft_token(n);
  CHECK(db.get_nft_token("0xnft", "1")->attributes == R"([{"a":1}])");
  CHECK_FALSE(db.get_nft_token("0xnft", "2"));

  InternalTransaction itx;
  itx.transaction_hash = "0xt1";
  itx.block_number = 5;
  itx.trace_address = {0, 2};
  itx.value = "5";
  db.upsert_internal_transaction(itx);
  db.upsert_internal_transaction(itx);
  auto rows = db.get_internal_transactions("0xt1");
  REQUIRE(rows.size() == 1);
  CHECK(rows[0].trace_address == std::vector<int32_t>{0, 2});
}

TEST_CASE("indexer state and stats") {
  Database db(":memory:");
  db.init_schema();
  CHECK_FALSE(db.get_indexer_state());
  db.update_indexer_state(10, true, std::string("boom"));
  CHECK(db.get_indexer_state()->last_error == "boom");
  db.update_indexer_state(11, false, std::nullopt);
  auto state = db.get_indexer_state();
  CHECK(state->last_indexed_block == 11);
  CHECK_FALSE(state->is_running);
  CHECK(state->last_error == std::nullopt);

  db.upsert_block(make_block(1, "0x01", 86400 + 10));
  db.upsert_block(make_block(2, "0x02", 86400 + 20));
  db.upsert_block(make_block(3, "0x03", 2 * 86400 + 5));
  db.refresh_daily_stats(1, 2);
  db.refresh_daily_stats(1, 2);
  auto day = db.get_daily_stats(86400);
  REQUIRE(day);
  CHECK(day->block_count == 2);
  CHECK(day->transaction_count == 2);
  CHECK(day->gas_used == "200");
  CHECK_FALSE(db.get_daily_stats(2 * 86400));

  NetworkStats s;
  s.latest_block = 3;
  s.avg_block_time = "12.00";
  db.update_network_stats(s);
  CHECK(db.get_network_stats()->avg_block_time == "12.00");
}

TEST_CASE("delete from height removes every dependent row") {
  Database db(":memory:");
  db.init_schema();
  for (int64_t n = 1; n <= 4; ++n) {
    db.upsert_block(make_block(n, "0x0" + std::to_string(n), 1000 + n));
    db.upsert_transaction(make_tx("0xt" + std::to_string(n), n, "0xa", "0xb"));
    db.insert_token_transfer(make_transfer("0xt" + std::to_string(n), 0, n));
  }
  InternalTransaction itx;
  itx.transaction_hash = "0xt4";
  itx.block_number = 4;
  itx.trace_address = {0};
  db.upsert_internal_transaction(itx);

  auto counts = db.delete_from_height(3);
  CHECK(counts.blocks == 2);
  CHECK(counts.transactions == 2);
  CHECK(counts.transfers == 2);
  CHECK(counts.internal_transactions == 1);
  CHECK(db.get_max_block_number() == 2);
  CHECK(db.count_transactions() == 2);
  CHECK(db.count_token_transfers() == 2);

  // 回滚后同一高度可以重新写入
  db.upsert_transaction(make_tx("0xt3", 3, "0xa", "0xb"));
  CHECK(db.insert_token_transfer(make_transfer("0xt3", 0, 3)));
}

} // namespace indexer
