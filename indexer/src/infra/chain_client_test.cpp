#include <catch2/catch.hpp>

#include "chain_client.hpp"

namespace indexer {

TEST_CASE("decode block with transaction objects") {
  auto j = json::parse(R"({
    "number": "0x10", "hash": "0xAB", "parentHash": "0xaa", "timestamp": "0x6553f100",
    "miner": "0xMINER", "gasUsed": "0x5208", "gasLimit": "0x1c9c380", "baseFeePerGas": "0x3b9aca00",
    "size": "0x220", "extraData": "0x", "nonce": "0x0000000000000000",
    "transactions": [
      {"hash": "0xT1", "blockNumber": "0x10", "from": "0xA", "to": null, "value": "0xde0b6b3a7640000",
       "gas": "0x5208", "input": "0xa9059cbb", "nonce": "0x1", "type": "0x2"}
    ]
  })");
  auto b = rpc_decode::block(j);
  CHECK(b.number == 16);
  CHECK(b.hash == "0xab");
  CHECK(b.miner == "0xminer");
  CHECK(b.base_fee_per_gas == "1000000000");
  CHECK(b.size == 544);
  REQUIRE(b.transactions.size() == 1);
  CHECK(b.transaction_hashes == std::vector<std::string>{"0xt1"});
  CHECK(b.transactions[0].to == std::nullopt);
  CHECK(b.transactions[0].value == "1000000000000000000");
  CHECK(b.transactions[0].type == 2);
}

TEST_CASE("decode receipt tolerates missing optional fields") {
  auto j = json::parse(R"({"transactionHash": "0x1", "gasUsed": "0x5208",
                           "logs": [{"address": "0xT", "topics": ["0xDD"], "logIndex": "0x3"}]})");
  auto r = rpc_decode::receipt(j);
  CHECK(r.status == std::nullopt);
  CHECK(r.contract_address == std::nullopt);
  CHECK(r.cumulative_gas_used == 0);
  REQUIRE(r.logs.size() == 1);
  CHECK(r.logs[0].topics == std::vector<std::string>{"0xdd"});
  CHECK(r.logs[0].log_index == 3);
  CHECK(r.logs[0].data == "0x");
}

TEST_CASE("oversized quantities fall back instead of throwing") {
  auto j = json::parse(R"({"gasUsed": "0xffffffffffffffffffff"})");
  CHECK(rpc_decode::quantity(j, "gasUsed", -1) == -1);
  CHECK(rpc_decode::opt_quantity(j, "gasUsed") == std::nullopt);
}

TEST_CASE("network error classification is by type") {
  CHECK(is_network_error(std::make_exception_ptr(RpcTransportError("timeout"))));
  CHECK_FALSE(is_network_error(std::make_exception_ptr(RpcResponseError(-32000, "connection refused"))));
  CHECK_FALSE(is_network_error(std::make_exception_ptr(std::runtime_error("ECONNRESET"))));
  CHECK_FALSE(is_network_error(nullptr));
}

} // namespace indexer
