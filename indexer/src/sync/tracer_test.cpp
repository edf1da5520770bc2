#include <catch2/catch.hpp>

#include "../test_util/fakes.hpp"
#include "tracer.hpp"

namespace indexer {

using test::address_of;

namespace {

json sample_trace() {
  return json::parse(R"({
    "type": "CALL", "from": "0x01", "to": "0x02", "value": "0x10", "gas": "0x5208", "gasUsed": "0x5208",
    "calls": [
      {"type": "CALL", "from": "0x02", "to": "0x03", "value": "0x0",
       "calls": [{"type": "CALL", "from": "0x03", "to": "0x04", "value": "0x5", "gas": "0x100"}]},
      {"type": "CREATE2", "from": "0x02", "to": "0x05", "value": "0x0", "output": "0x6080"},
      {"type": "STATICCALL", "from": "0x02", "to": "0x06"},
      {"type": "DELEGATECALL", "from": "0x02", "to": "0x07", "error": "out of gas"}
    ]
  })");
}

} // namespace

TEST_CASE("flatten keeps value transfers and creations with their paths") {
  auto rows = InternalTxTracer::flatten(rpc_decode::call_frame(sample_trace()), "0xaa", 9, 1000);
  REQUIRE(rows.size() == 2);

  CHECK(rows[0].trace_address == std::vector<int32_t>{0, 0});
  CHECK(rows[0].value == "5");
  CHECK(rows[0].gas == 256);
  CHECK(rows[0].call_type == "call");
  CHECK(rows[0].block_number == 9);

  CHECK(rows[1].trace_address == std::vector<int32_t>{1});
  CHECK(rows[1].type == "CREATE2");
  CHECK(rows[1].call_type == "create2");
  CHECK(rows[1].output == "0x6080");
}

TEST_CASE("supported node persists internal transactions") {
  test::MemoryStorage storage;
  test::FakeChain chain;
  chain.set_trace("0xaa", sample_trace());
  InternalTxTracer tracer(storage, chain, true);

  CHECK(tracer.supported());
  CHECK(tracer.trace("0xaa", 9, 1000) == 2);
  CHECK(storage.get_internal_transactions("0xaa").size() == 2);

  SECTION("retracing is idempotent") {
    tracer.trace("0xaa", 9, 1000);
    CHECK(storage.get_internal_transactions("0xaa").size() == 2);
  }

  SECTION("untraceable transactions are skipped silently") { CHECK(tracer.trace("0xbb", 9, 1000) == 0); }
}

TEST_CASE("unsupported node disables tracing until reset") {
  test::MemoryStorage storage;
  test::FakeChain chain;
  chain.set_trace("0xaa", sample_trace());
  chain.set_trace_supported(false);
  InternalTxTracer tracer(storage, chain, true);

  CHECK_FALSE(tracer.supported());
  CHECK(tracer.trace("0xaa", 9, 1000) == 0);

  chain.set_trace_supported(true);
  CHECK_FALSE(tracer.supported());
  tracer.reset_support();
  CHECK(tracer.supported());
  CHECK(tracer.trace("0xaa", 9, 1000) == 2);
}

TEST_CASE("disabled tracer makes no calls") {
  test::MemoryStorage storage;
  test::FakeChain chain;
  InternalTxTracer tracer(storage, chain, false);
  CHECK(tracer.trace("0xaa", 1, 1) == 0);
  CHECK(chain.calls_made() == 0);
}

TEST_CASE("network errors during tracing propagate") {
  test::MemoryStorage storage;
  test::FakeChain chain;
  InternalTxTracer tracer(storage, chain, true);
  REQUIRE(tracer.supported());
  chain.fail_next(1);
  CHECK_THROWS_AS(tracer.trace("0xaa", 1, 1), RpcTransportError);
}

} // namespace indexer
