#pragma once

// ============================================================================
// 实体定义 (与 Storage 表结构一一对应)
// 地址/哈希一律小写 0x 前缀; uint256 数量一律十进制字符串; 时间为 unix 秒
// ============================================================================

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace indexer {

enum class TokenType : uint8_t {
  ERC20 = 0,
  ERC721 = 1,
  ERC1155 = 2,
};

inline const char *token_type_name(TokenType type) {
  switch (type) {
  case TokenType::ERC20:
    return "ERC20";
  case TokenType::ERC721:
    return "ERC721";
  case TokenType::ERC1155:
    return "ERC1155";
  }
  return "ERC20";
}

inline std::optional<TokenType> parse_token_type(std::string_view name) {
  if (name == "ERC20")
    return TokenType::ERC20;
  if (name == "ERC721")
    return TokenType::ERC721;
  if (name == "ERC1155")
    return TokenType::ERC1155;
  return std::nullopt;
}

struct Block {
  int64_t number = 0;
  std::string hash;
  std::string parent_hash;
  int64_t timestamp = 0;
  std::string miner;
  int64_t gas_used = 0;
  int64_t gas_limit = 0;
  std::optional<std::string> base_fee_per_gas;
  int32_t transaction_count = 0;
  std::optional<int64_t> size;
  std::optional<std::string> extra_data;
  std::optional<std::string> nonce;

  bool operator==(const Block &) const = default;
};

struct Transaction {
  std::string hash;
  int64_t block_number = 0;
  std::string block_hash;
  int32_t transaction_index = 0;
  std::string from;
  std::optional<std::string> to;
  std::string value = "0";
  int64_t gas = 0;
  std::optional<std::string> gas_price;
  std::optional<std::string> max_fee_per_gas;
  std::optional<std::string> max_priority_fee_per_gas;
  std::optional<std::string> input;
  int64_t nonce = 0;
  int32_t type = 0;
  std::optional<bool> status;  // nullopt = pending
  std::optional<int64_t> gas_used;
  std::optional<std::string> effective_gas_price;
  std::optional<int64_t> cumulative_gas_used;
  std::optional<std::string> contract_address;
  int64_t timestamp = 0;
  std::optional<std::string> method_id;
  std::optional<std::string> method_name;

  bool operator==(const Transaction &) const = default;
};

struct TransactionLog {
  std::string transaction_hash;
  int32_t log_index = 0;
  std::string address;
  std::vector<std::string> topics;
  std::string data;
  int64_t block_number = 0;
  std::string block_hash;
  bool removed = false;
  std::optional<std::string> topic0;

  bool operator==(const TransactionLog &) const = default;
};

struct TokenTransfer {
  std::string transaction_hash;
  int32_t log_index = 0;
  int32_t batch_index = 0;  // TransferBatch 展开后的序号, 其余为 0
  int64_t block_number = 0;
  int64_t timestamp = 0;
  std::string token_address;
  std::string from;
  std::string to;
  std::optional<std::string> value;
  std::optional<std::string> token_id;
  TokenType token_type = TokenType::ERC20;

  bool operator==(const TokenTransfer &) const = default;
};

struct Token {
  std::string address;
  std::optional<std::string> name;
  std::optional<std::string> symbol;
  std::optional<int32_t> decimals;
  std::optional<std::string> total_supply;
  TokenType token_type = TokenType::ERC20;
  int64_t holder_count = 0;
  int64_t transfer_count = 0;

  bool operator==(const Token &) const = default;
};

struct TokenHolder {
  std::string token_address;
  std::string holder_address;
  std::optional<std::string> token_id;  // ERC20 为 nullopt
  std::string balance = "0";
  TokenType token_type = TokenType::ERC20;
  int64_t last_updated = 0;
};

struct NftToken {
  std::string contract_address;
  std::string token_id;
  std::optional<std::string> owner;
  std::optional<std::string> name;
  std::optional<std::string> description;
  std::optional<std::string> image;
  std::optional<std::string> image_gateway;
  std::optional<std::string> metadata_uri;
  std::optional<std::string> attributes;  // JSON 文本
  TokenType token_type = TokenType::ERC721;
  int64_t last_updated = 0;
};

struct InternalTransaction {
  std::string transaction_hash;
  int64_t block_number = 0;
  std::vector<int32_t> trace_address;
  std::string type = "CALL";
  std::optional<std::string> from;
  std::optional<std::string> to;
  std::optional<std::string> value;
  std::optional<int64_t> gas;
  std::optional<int64_t> gas_used;
  std::optional<std::string> input;
  std::optional<std::string> output;
  std::optional<std::string> error;
  std::optional<std::string> call_type;
  int64_t timestamp = 0;

  bool operator==(const InternalTransaction &) const = default;
};

inline std::string join_trace_address(const std::vector<int32_t> &path) {
  std::string out;
  for (size_t i = 0; i < path.size(); ++i) {
    if (i > 0)
      out += ",";
    out += std::to_string(path[i]);
  }
  return out;
}

struct Address {
  std::string address;
  std::string balance = "0";
  int64_t transaction_count = 0;
  int64_t sent_count = 0;
  int64_t received_count = 0;
  bool is_contract = false;
  std::optional<std::string> contract_code;
  int64_t first_seen = 0;
  int64_t last_seen = 0;
};

struct AddressTxCounts {
  int64_t total = 0;
  int64_t sent = 0;
  int64_t received = 0;
};

struct NetworkStats {
  int64_t latest_block = 0;
  int64_t total_transactions = 0;
  int64_t total_addresses = 0;
  int64_t total_token_transfers = 0;
  std::string avg_block_time = "0.00";
  std::string avg_gas_price = "0";
  int64_t last_updated = 0;
};

struct DailyStats {
  int64_t day_start = 0;  // UTC 当天 00:00 的 unix 秒
  int64_t block_count = 0;
  int64_t transaction_count = 0;
  std::string gas_used = "0";
};

struct IndexerState {
  int64_t last_indexed_block = 0;
  bool is_running = false;
  std::optional<std::string> last_error;
  int64_t last_updated = 0;
};

struct RollbackCounts {
  int64_t blocks = 0;
  int64_t transactions = 0;
  int64_t logs = 0;
  int64_t transfers = 0;
  int64_t internal_transactions = 0;
};

} // namespace indexer
