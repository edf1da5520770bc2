#pragma once

// ============================================================================
// TokenTracker - 代币建档 / 转账计数 / 持有者余额
// 余额一律从链上重新读取, 不做增量累加
// ============================================================================

#include <ctime>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "../core/storage.hpp"
#include "../infra/abi.hpp"
#include "../infra/chain_client.hpp"

namespace indexer {

struct TokenMetadata {
  std::optional<std::string> name;
  std::optional<std::string> symbol;
  std::optional<int32_t> decimals;
  std::optional<std::string> total_supply;
};

struct BackfillResult {
  bool success = true;
  int tokens_indexed = 0;
  int errors = 0;
};

struct TokenBalance {
  std::string address;
  std::string token_address;
  std::optional<std::string> name;
  std::optional<std::string> symbol;
  std::optional<int32_t> decimals;
  std::string balance;
  std::string formatted_balance;
};

class TokenTracker {
public:
  static constexpr int BALANCE_TOKEN_LIMIT = 100;
  static constexpr int DEFAULT_DECIMALS = 18;

  TokenTracker(Storage &storage, ChainClient &chain) : storage_(storage), chain_(chain) {}

  // 写入转账并维护代币记录, 返回 false 表示转账已存在
  // 首次出现的代币读取元数据建档, 计数按库内转账数重算
  bool record_transfer(const TokenTransfer &transfer) {
    const auto &address = transfer.token_address;

    std::optional<TokenMetadata> metadata;
    if (!is_known(address) && !storage_.get_token(address)) {
      metadata = read_metadata(address);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    bool inserted = storage_.insert_token_transfer(transfer);

    if (known_tokens_.count(address) == 0) {
      if (!storage_.get_token(address)) {
        Token token;
        token.address = address;
        token.token_type = transfer.token_type;
        if (metadata) {
          token.name = metadata->name;
          token.symbol = metadata->symbol;
          token.decimals = metadata->decimals;
          token.total_supply = metadata->total_supply;
        }
        storage_.upsert_token(token);
        std::cout << "[Token] 新代币 " << token.symbol.value_or(token.name.value_or(address)) << " ("
                  << token_type_name(token.token_type) << ")" << std::endl;
      }
      storage_.set_token_transfer_count(address, storage_.count_token_transfers_for(address));
      known_tokens_.insert(address);
    } else if (inserted) {
      storage_.increment_token_transfer_count(address);
    }
    return inserted;
  }

  // 重新读取 holder 的链上余额; 读取失败保留旧值并返回 false
  bool refresh_holder(const std::string &token_address, const std::string &holder_address, TokenType type,
                      const std::optional<std::string> &token_id) {
    if (holder_address.empty() || holder_address == abi::ZERO_ADDRESS)
      return false;

    auto balance = read_balance(token_address, holder_address, type, token_id);
    if (!balance) {
      std::cerr << "[Token] 读取 " << token_address << " 余额失败 (holder=" << holder_address
                << "), 保留旧值" << std::endl;
      return false;
    }

    TokenHolder holder;
    holder.token_address = token_address;
    holder.holder_address = holder_address;
    holder.token_id = type == TokenType::ERC20 ? std::nullopt : token_id;
    holder.balance = *balance;
    holder.token_type = type;
    holder.last_updated = std::time(nullptr);
    storage_.upsert_token_holder(holder);

    storage_.refresh_token_holder_count(token_address);
    return true;
  }

  // name / symbol / decimals / totalSupply, 每项独立, 读不到为 null
  TokenMetadata read_metadata(const std::string &address) {
    TokenMetadata md;
    if (auto ret = try_call(address, abi::encode_call(abi::selectors::NAME)))
      md.name = abi::decode_string(*ret);
    if (auto ret = try_call(address, abi::encode_call(abi::selectors::SYMBOL)))
      md.symbol = abi::decode_string(*ret);
    if (auto ret = try_call(address, abi::encode_call(abi::selectors::DECIMALS))) {
      auto v = abi::word_uint(*ret, 0);
      if (v && *v <= 255)
        md.decimals = static_cast<int32_t>(*v);
    }
    if (auto ret = try_call(address, abi::encode_call(abi::selectors::TOTAL_SUPPLY)))
      md.total_supply = abi::decode_uint256(*ret);
    return md;
  }

  // 给所有没有 name 的代币补元数据
  BackfillResult backfill_metadata() {
    BackfillResult result;
    std::cout << "[Token] 开始补全代币元数据..." << std::endl;

    std::vector<std::pair<std::string, TokenType>> tokens;
    try {
      tokens = storage_.get_unique_token_addresses();
    } catch (const std::exception &e) {
      std::cerr << "[Token] 补全失败: " << e.what() << std::endl;
      result.success = false;
      return result;
    }
    std::cout << "[Token] 共 " << tokens.size() << " 个代币地址" << std::endl;

    for (const auto &[address, type] : tokens) {
      try {
        auto existing = storage_.get_token(address);
        if (existing && existing->name) {
          remember(address);
          continue;
        }

        auto md = read_metadata(address);
        int64_t transfer_count = storage_.count_token_transfers_for(address);

        Token token;
        token.address = address;
        token.name = md.name;
        token.symbol = md.symbol;
        token.decimals = md.decimals;
        token.total_supply = md.total_supply;
        token.token_type = type;
        token.holder_count = existing ? existing->holder_count : 0;
        token.transfer_count = transfer_count;
        storage_.upsert_token(token);
        storage_.set_token_transfer_count(address, transfer_count);

        remember(address);
        ++result.tokens_indexed;
        std::cout << "[Token] 已补全 " << md.symbol.value_or(md.name.value_or(address)) << std::endl;
      } catch (const std::exception &e) {
        ++result.errors;
        std::cerr << "[Token] 补全 " << address << " 失败: " << e.what() << std::endl;
      }
    }

    std::cout << "[Token] 补全完成: " << result.tokens_indexed << " 个成功, " << result.errors << " 个失败"
              << std::endl;
    return result;
  }

  // 已知代币中 balanceOf(address) > 0 的, 按转账数取前 100 个代币
  std::vector<TokenBalance> get_token_balances(const std::string &wallet) {
    std::vector<TokenBalance> out;
    std::string address = abi::to_lower(wallet);

    std::vector<Token> tokens;
    try {
      tokens = storage_.get_tokens(BALANCE_TOKEN_LIMIT);
    } catch (const std::exception &e) {
      std::cerr << "[Token] 查询 " << address << " 余额失败: " << e.what() << std::endl;
      return out;
    }

    for (const auto &token : tokens) {
      std::optional<std::string> balance;
      try {
        if (auto ret = try_call(token.address, abi::encode_call_address(abi::selectors::BALANCE_OF, address)))
          balance = abi::decode_uint256(*ret);
      } catch (const std::exception &e) {
        std::cerr << "[Token] balanceOf " << token.address << " 失败: " << e.what() << std::endl;
        continue;
      }
      if (!balance || *balance == "0")
        continue;

      TokenBalance b;
      b.address = address;
      b.token_address = token.address;
      b.name = token.name;
      b.symbol = token.symbol;
      b.decimals = token.decimals;
      b.balance = *balance;
      b.formatted_balance = abi::format_units(*balance, token.decimals.value_or(DEFAULT_DECIMALS));
      out.push_back(std::move(b));
    }
    return out;
  }

  bool is_known(const std::string &address) {
    std::lock_guard<std::mutex> lock(mutex_);
    return known_tokens_.count(address) > 0;
  }

private:
  std::optional<std::string> read_balance(const std::string &token, const std::string &holder, TokenType type,
                                          const std::optional<std::string> &token_id) {
    if (type == TokenType::ERC20) {
      auto ret = try_call(token, abi::encode_call_address(abi::selectors::BALANCE_OF, holder));
      return ret ? abi::decode_uint256(*ret) : std::nullopt;
    }

    if (!token_id)
      return std::nullopt;
    auto id = abi::parse_uint256_dec(*token_id);
    if (!id)
      return std::nullopt;

    if (type == TokenType::ERC721) {
      auto ret = try_call(token, abi::encode_call_uint(abi::selectors::OWNER_OF, *id));
      if (!ret)
        return std::nullopt;
      auto owner = abi::decode_address(*ret);
      if (!owner)
        return std::nullopt;
      return std::string(*owner == holder ? "1" : "0");
    }

    auto ret = try_call(token, abi::encode_call_address_uint(abi::selectors::BALANCE_OF_ID, holder, *id));
    return ret ? abi::decode_uint256(*ret) : std::nullopt;
  }

  // revert / RPC error 返回 nullopt; 网络错误继续抛出
  std::optional<std::string> try_call(const std::string &to, const std::string &data) {
    try {
      return chain_.call(to, data);
    } catch (const RpcResponseError &) {
      return std::nullopt;
    }
  }

  void remember(const std::string &address) {
    std::lock_guard<std::mutex> lock(mutex_);
    known_tokens_.insert(address);
  }

  Storage &storage_;
  ChainClient &chain_;

  std::mutex mutex_;
  std::unordered_set<std::string> known_tokens_;
};

} // namespace indexer
