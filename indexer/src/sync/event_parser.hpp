#pragma once

#include <optional>
#include <string>
#include <vector>

#include "../core/types.hpp"
#include "../infra/abi.hpp"
#include "../infra/chain_client.hpp"

namespace indexer {

namespace topics {
// ERC20 / ERC721 共用, 按 topic 数量区分
constexpr const char *TRANSFER = "0xddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef";
// ERC1155
constexpr const char *TRANSFER_SINGLE = "0xc3d58168c5ae7397731d063d5bbf3d657854427343f4c083240f7aacaa2d0f62";
constexpr const char *TRANSFER_BATCH = "0x4a39dc06d4c0dbc64b70af90fd698a233a518aa5d07e595d983b8c0526c8f7fb";
} // namespace topics

struct ParsedTransfer {
  int32_t batch_index = 0;
  std::string token_address;
  std::string from;
  std::string to;
  std::optional<std::string> value;
  std::optional<std::string> token_id;
  TokenType token_type = TokenType::ERC20;
};

class EventParser {
public:
  // 非转账事件或格式错误返回空
  static std::vector<ParsedTransfer> parse_transfers(const ChainLog &log) {
    if (log.topics.empty())
      return {};

    const auto &topic0 = log.topics[0];
    if (topic0 == topics::TRANSFER) {
      if (log.topics.size() == 3)
        return wrap(parse_erc20(log));
      if (log.topics.size() == 4)
        return wrap(parse_erc721(log));
      return {};
    }
    if (topic0 == topics::TRANSFER_SINGLE && log.topics.size() == 4)
      return wrap(parse_single(log));
    if (topic0 == topics::TRANSFER_BATCH && log.topics.size() == 4)
      return parse_batch(log);
    return {};
  }

  static bool is_nft(TokenType type) { return type == TokenType::ERC721 || type == TokenType::ERC1155; }

private:
  static std::vector<ParsedTransfer> wrap(std::optional<ParsedTransfer> t) {
    if (!t)
      return {};
    return {std::move(*t)};
  }

  static bool valid_topic(const std::string &topic) {
    auto digits = abi::strip_0x(topic);
    return digits.size() == 64 && abi::is_hex(digits);
  }

  // Transfer(address indexed from, address indexed to, uint256 value)
  static std::optional<ParsedTransfer> parse_erc20(const ChainLog &log) {
    if (!valid_topic(log.topics[1]) || !valid_topic(log.topics[2]))
      return std::nullopt;

    ParsedTransfer t;
    t.token_address = log.address;
    t.from = abi::address_from_topic(log.topics[1]);
    t.to = abi::address_from_topic(log.topics[2]);
    t.token_type = TokenType::ERC20;

    auto digits = abi::strip_0x(log.data);
    if (digits.empty()) {
      t.value = "0";
    } else {
      auto v = abi::parse_uint256_hex(digits.substr(0, std::min<size_t>(digits.size(), 64)));
      if (!v)
        return std::nullopt;
      t.value = v->str();
    }
    return t;
  }

  // Transfer(address indexed from, address indexed to, uint256 indexed tokenId)
  static std::optional<ParsedTransfer> parse_erc721(const ChainLog &log) {
    if (!valid_topic(log.topics[1]) || !valid_topic(log.topics[2]) || !valid_topic(log.topics[3]))
      return std::nullopt;

    ParsedTransfer t;
    t.token_address = log.address;
    t.from = abi::address_from_topic(log.topics[1]);
    t.to = abi::address_from_topic(log.topics[2]);
    t.token_id = abi::parse_uint256_hex(log.topics[3])->str();
    t.token_type = TokenType::ERC721;
    return t;
  }

  // TransferSingle(operator indexed, from indexed, to indexed, uint256 id, uint256 value)
  static std::optional<ParsedTransfer> parse_single(const ChainLog &log) {
    if (!valid_topic(log.topics[2]) || !valid_topic(log.topics[3]))
      return std::nullopt;
    auto id = abi::word_uint(log.data, 0);
    auto value = abi::word_uint(log.data, 1);
    if (!id || !value)
      return std::nullopt;

    ParsedTransfer t;
    t.token_address = log.address;
    t.from = abi::address_from_topic(log.topics[2]);
    t.to = abi::address_from_topic(log.topics[3]);
    t.token_id = id->str();
    t.value = value->str();
    t.token_type = TokenType::ERC1155;
    return t;
  }

  // TransferBatch(operator indexed, from indexed, to indexed, uint256[] ids, uint256[] values)
  static std::vector<ParsedTransfer> parse_batch(const ChainLog &log) {
    if (!valid_topic(log.topics[2]) || !valid_topic(log.topics[3]))
      return {};
    auto ids_offset = abi::word_uint(log.data, 0);
    auto values_offset = abi::word_uint(log.data, 1);
    if (!ids_offset || !values_offset)
      return {};
    auto ids = abi::decode_uint_array(log.data, *ids_offset);
    auto values = abi::decode_uint_array(log.data, *values_offset);
    if (!ids || !values || ids->size() != values->size())
      return {};

    std::string from = abi::address_from_topic(log.topics[2]);
    std::string to = abi::address_from_topic(log.topics[3]);

    std::vector<ParsedTransfer> out;
    out.reserve(ids->size());
    for (size_t i = 0; i < ids->size(); ++i) {
      ParsedTransfer t;
      t.batch_index = static_cast<int32_t>(i);
      t.token_address = log.address;
      t.from = from;
      t.to = to;
      t.token_id = (*ids)[i].str();
      t.value = (*values)[i].str();
      t.token_type = TokenType::ERC1155;
      out.push_back(std::move(t));
    }
    return out;
  }
};

} // namespace indexer
