#include <catch2/catch.hpp>

#include "../test_util/fakes.hpp"
#include "event_parser.hpp"

namespace indexer {

using test::address_of;
using test::topic_of_address;
using test::word_of;

TEST_CASE("Transfer with three topics is ERC20") {
  auto log = test::erc20_transfer(address_of(1), address_of(2), address_of(3), 500);
  auto out = EventParser::parse_transfers(log);
  REQUIRE(out.size() == 1);
  CHECK(out[0].token_type == TokenType::ERC20);
  CHECK(out[0].from == address_of(2));
  CHECK(out[0].to == address_of(3));
  CHECK(out[0].value == "500");
  CHECK(out[0].token_id == std::nullopt);
}

TEST_CASE("ERC20 Transfer with empty data has zero value") {
  auto log = test::erc20_transfer(address_of(1), address_of(2), address_of(3), 0);
  log.data = "0x";
  auto out = EventParser::parse_transfers(log);
  REQUIRE(out.size() == 1);
  CHECK(out[0].value == "0");
}

TEST_CASE("Transfer with four topics is ERC721") {
  auto log = test::erc721_transfer(address_of(1), abi::ZERO_ADDRESS, address_of(3), 77);
  auto out = EventParser::parse_transfers(log);
  REQUIRE(out.size() == 1);
  CHECK(out[0].token_type == TokenType::ERC721);
  CHECK(out[0].token_id == "77");
  CHECK(out[0].from == abi::ZERO_ADDRESS);
  CHECK(out[0].value == std::nullopt);
}

TEST_CASE("TransferSingle carries id and value in data") {
  ChainLog log;
  log.address = address_of(9);
  log.topics = {topics::TRANSFER_SINGLE, topic_of_address(address_of(4)), topic_of_address(address_of(5)),
                topic_of_address(address_of(6))};
  log.data = "0x" + word_of(3) + word_of(12);
  auto out = EventParser::parse_transfers(log);
  REQUIRE(out.size() == 1);
  CHECK(out[0].token_type == TokenType::ERC1155);
  CHECK(out[0].from == address_of(5));
  CHECK(out[0].to == address_of(6));
  CHECK(out[0].token_id == "3");
  CHECK(out[0].value == "12");
}

TEST_CASE("TransferBatch expands into one transfer per id") {
  ChainLog log;
  log.address = address_of(9);
  log.topics = {topics::TRANSFER_BATCH, topic_of_address(address_of(4)), topic_of_address(address_of(5)),
                topic_of_address(address_of(6))};
  // ids 在 0x40, values 在 0xa0
  log.data = "0x" + word_of(0x40) + word_of(0xa0) + word_of(2) + word_of(1) + word_of(2) + word_of(2) +
             word_of(10) + word_of(20);
  auto out = EventParser::parse_transfers(log);
  REQUIRE(out.size() == 2);
  CHECK(out[0].batch_index == 0);
  CHECK(out[0].token_id == "1");
  CHECK(out[0].value == "10");
  CHECK(out[1].batch_index == 1);
  CHECK(out[1].token_id == "2");
  CHECK(out[1].value == "20");
}

TEST_CASE("malformed and unrelated logs yield nothing") {
  ChainLog log;
  log.address = address_of(1);
  CHECK(EventParser::parse_transfers(log).empty());

  log.topics = {topics::TRANSFER, topic_of_address(address_of(2))};
  CHECK(EventParser::parse_transfers(log).empty());

  log.topics = {"0x8c5be1e5ebec7d5bd14f71427d1e84f3dd0314c0f7b2291e5b200ac8c7c3b925", topic_of_address(address_of(2)),
                topic_of_address(address_of(3))};
  CHECK(EventParser::parse_transfers(log).empty());

  log.topics = {topics::TRANSFER_SINGLE, topic_of_address(address_of(4)), topic_of_address(address_of(5)),
                topic_of_address(address_of(6))};
  log.data = "0x" + word_of(3);
  CHECK(EventParser::parse_transfers(log).empty());
}

} // namespace indexer
