#include <catch2/catch.hpp>

#include <chrono>

#include "../test_util/harness.hpp"
#include "nft_pipeline.hpp"

namespace indexer {

using test::address_of;

namespace {

const std::vector<std::string> GATEWAYS = {"https://gw1.example/ipfs/", "https://gw2.example/ipfs/"};

std::string token_uri_call(uint64_t id) { return abi::encode_call_uint(abi::selectors::TOKEN_URI, abi::uint256(id)); }
std::string owner_of_call(uint64_t id) { return abi::encode_call_uint(abi::selectors::OWNER_OF, abi::uint256(id)); }

} // namespace

TEST_CASE("erc721 metadata over ipfs falls back through gateways") {
  test::MemoryStorage storage;
  test::FakeChain chain;
  test::FakeHttp http;
  const auto nft = address_of(0x71);
  chain.set_call(nft, token_uri_call(1), test::abi_string("ipfs://QmMeta/1.json"));
  chain.set_call(nft, owner_of_call(1), "0x" + abi::encode_address(address_of(5)));
  http.set("https://gw2.example/ipfs/QmMeta/1.json",
           R"({"name":"Punk #1","description":"d","image":"ipfs://QmImg","attributes":[{"trait_type":"hat"}]})");

  NftMetadataPipeline pipeline(storage, chain, http, GATEWAYS, 0);
  pipeline.process({nft, "1", TokenType::ERC721});

  auto stored = storage.get_nft_token(nft, "1");
  REQUIRE(stored);
  CHECK(stored->name == "Punk #1");
  CHECK(stored->description == "d");
  CHECK(stored->image == "ipfs://QmImg");
  CHECK(stored->image_gateway == "https://gw1.example/ipfs/QmImg");
  CHECK(stored->metadata_uri == "ipfs://QmMeta/1.json");
  CHECK(stored->owner == address_of(5));
  CHECK(stored->attributes == R"([{"trait_type":"hat"}])");
  CHECK(http.requested().size() == 2);
}

TEST_CASE("data uri metadata is decoded inline") {
  test::MemoryStorage storage;
  test::FakeChain chain;
  test::FakeHttp http;
  const auto nft = address_of(0x71);
  chain.set_call(nft, token_uri_call(2), test::abi_string("data:application/json;base64,eyJuYW1lIjoiQSJ9"));

  NftMetadataPipeline pipeline(storage, chain, http, GATEWAYS, 0);
  pipeline.process({nft, "2", TokenType::ERC721});

  CHECK(storage.get_nft_token(nft, "2")->name == "A");
  CHECK(http.requested().empty());
}

TEST_CASE("erc1155 uri substitutes the hex id") {
  test::MemoryStorage storage;
  test::FakeChain chain;
  test::FakeHttp http;
  const auto token = address_of(0x72);
  chain.set_call(token, abi::encode_call_uint(abi::selectors::URI, abi::uint256(26)),
                 test::abi_string("https://meta.example/{id}.json"));
  http.set("https://meta.example/" + std::string(62, '0') + "1a.json", R"({"name":"Sword"})");

  NftMetadataPipeline pipeline(storage, chain, http, GATEWAYS, 0);
  pipeline.process({token, "26", TokenType::ERC1155});

  auto stored = storage.get_nft_token(token, "26");
  REQUIRE(stored);
  CHECK(stored->name == "Sword");
  CHECK(stored->owner == std::nullopt);
}

TEST_CASE("unresolvable metadata still writes a placeholder") {
  test::MemoryStorage storage;
  test::FakeChain chain;
  test::FakeHttp http;
  const auto nft = address_of(0x71);
  NftMetadataPipeline pipeline(storage, chain, http, GATEWAYS, 0);

  SECTION("tokenURI reverts") {
    pipeline.process({nft, "3", TokenType::ERC721});
    auto stored = storage.get_nft_token(nft, "3");
    REQUIRE(stored);
    CHECK(stored->name == std::nullopt);
    CHECK(stored->metadata_uri == std::nullopt);
  }

  SECTION("gateway returns garbage") {
    chain.set_call(nft, token_uri_call(3), test::abi_string("https://meta.example/3"));
    http.set("https://meta.example/3", "<html>");
    pipeline.process({nft, "3", TokenType::ERC721});
    auto stored = storage.get_nft_token(nft, "3");
    REQUIRE(stored);
    CHECK(stored->name == std::nullopt);
    CHECK(stored->metadata_uri == "https://meta.example/3");
  }

  SECTION("rpc unreachable") {
    chain.fail_next(1);
    pipeline.process({nft, "3", TokenType::ERC721});
    auto stored = storage.get_nft_token(nft, "3");
    REQUIRE(stored);
    CHECK(stored->name == std::nullopt);
    CHECK(stored->token_type == TokenType::ERC721);
  }
}

TEST_CASE("already named tokens are skipped") {
  test::MemoryStorage storage;
  test::FakeChain chain;
  test::FakeHttp http;
  const auto nft = address_of(0x71);
  NftToken existing;
  existing.contract_address = nft;
  existing.token_id = "4";
  existing.name = "Known";
  storage.upsert_nft_token(existing);

  NftMetadataPipeline pipeline(storage, chain, http, GATEWAYS, 0);
  pipeline.process({nft, "4", TokenType::ERC721});
  CHECK(storage.get_nft_token(nft, "4")->name == "Known");
  CHECK(chain.calls_made() == 0);
}

TEST_CASE("background consumer drains the queue") {
  test::MemoryStorage storage;
  test::FakeChain chain;
  test::FakeHttp http;
  const auto nft = address_of(0x71);
  NftMetadataPipeline pipeline(storage, chain, http, GATEWAYS, 1);
  pipeline.start();
  pipeline.start();
  for (int i = 0; i < 3; ++i)
    pipeline.enqueue({nft, std::to_string(i), TokenType::ERC721});

  REQUIRE(pipeline.wait_idle(std::chrono::seconds(5)));
  pipeline.stop();
  for (int i = 0; i < 3; ++i)
    CHECK(storage.get_nft_token(nft, std::to_string(i)));
}

TEST_CASE("disabled pipeline ignores work") {
  test::MemoryStorage storage;
  test::FakeChain chain;
  test::FakeHttp http;
  NftMetadataPipeline pipeline(storage, chain, http, GATEWAYS, 0, false);
  pipeline.start();
  pipeline.enqueue({address_of(0x71), "1", TokenType::ERC721});
  CHECK(pipeline.pending() == 0);
  pipeline.stop();
}

TEST_CASE("slow metadata fetches do not delay block ingestion") {
  test::MemoryStorage storage;
  test::FakeChain chain;
  test::FakeHttp http(500);
  const auto nft = address_of(0x71);
  for (int id = 0; id < 5; ++id)
    chain.set_call(nft, token_uri_call(id), test::abi_string("https://slow.example/" + std::to_string(id)));

  TokenTracker tokens(storage, chain);
  NftMetadataPipeline pipeline(storage, chain, http, GATEWAYS, 0);
  InternalTxTracer tracer(storage, chain, false);
  TransferExtractor extractor(tokens, &pipeline);
  BlockProcessor processor(storage, chain, extractor, tracer);
  pipeline.start();

  chain.add_block(1);
  std::vector<ChainLog> logs;
  for (int id = 0; id < 5; ++id)
    logs.push_back(test::erc721_transfer(nft, abi::ZERO_ADDRESS, address_of(2), id));
  chain.add_transaction(1, address_of(2), nft, logs);

  auto begin = std::chrono::steady_clock::now();
  processor.index_block(1);
  auto elapsed = std::chrono::steady_clock::now() - begin;

  CHECK(elapsed < std::chrono::milliseconds(500));
  CHECK(storage.count_token_transfers() == 5);
  pipeline.stop();
}

} // namespace indexer
