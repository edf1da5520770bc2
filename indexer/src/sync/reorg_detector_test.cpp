#include <catch2/catch.hpp>

#include "../test_util/harness.hpp"
#include "reorg_detector.hpp"

namespace indexer {

using test::address_of;
using test::hash_of;

TEST_CASE("reorg at height 7 rolls back and re-sync yields the new canonical blocks") {
  test::IngestHarness h;
  for (int64_t n = 0; n <= 10; ++n)
    h.chain.add_block(n, "a");
  std::string stale_tx = h.chain.add_transaction(8, address_of(1), address_of(2));
  for (int64_t n = 0; n <= 10; ++n)
    h.processor.index_block(n);
  REQUIRE(h.storage.get_transaction(stale_tx));

  h.chain.fork_from(7, 10, "b");

  ReorgDetector reorg(h.storage, h.chain, 12);
  CHECK(reorg.find_divergence(10) == 7);

  auto cursor = reorg.check_and_rollback(10);
  REQUIRE(cursor == 6);
  CHECK(h.storage.get_max_block_number() == 6);
  CHECK_FALSE(h.storage.get_transaction(stale_tx));

  for (int64_t n = *cursor + 1; n <= 10; ++n)
    h.processor.index_block(n);

  for (int64_t n = 0; n <= 6; ++n)
    CHECK(h.storage.get_block(n)->hash == hash_of(n, "a"));
  for (int64_t n = 7; n <= 10; ++n)
    CHECK(h.storage.get_block(n)->hash == hash_of(n, "b"));
  CHECK(h.storage.block_count() == 11);
  CHECK_FALSE(reorg.find_divergence(10));
}

TEST_CASE("matching chain has no divergence") {
  test::IngestHarness h;
  for (int64_t n = 0; n <= 5; ++n) {
    h.chain.add_block(n);
    h.processor.index_block(n);
  }
  ReorgDetector reorg(h.storage, h.chain, 12);
  CHECK_FALSE(reorg.find_divergence(5));
  CHECK_FALSE(reorg.check_and_rollback(5));
  CHECK(h.storage.block_count() == 6);
}

TEST_CASE("scan is bounded by depth") {
  test::IngestHarness h;
  for (int64_t n = 0; n <= 20; ++n) {
    h.chain.add_block(n, "a");
    h.processor.index_block(n);
  }
  h.chain.fork_from(5, 20, "b");

  ReorgDetector reorg(h.storage, h.chain, 3);
  CHECK(reorg.find_divergence(20) == 18);
}

TEST_CASE("heights missing locally are skipped") {
  test::IngestHarness h;
  for (int64_t n = 0; n <= 6; ++n)
    h.chain.add_block(n, "a");
  for (int64_t n : {0, 1, 2, 3, 6})
    h.processor.index_block(n);
  h.chain.fork_from(3, 6, "b");

  ReorgDetector reorg(h.storage, h.chain, 12);
  CHECK(reorg.find_divergence(6) == 3);
}

} // namespace indexer
