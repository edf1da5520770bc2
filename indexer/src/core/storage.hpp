#pragma once

// ============================================================================
// Storage - indexer 依赖的持久化接口
// 实现必须支持多线程并发调用; delete_from_height 必须在单个事务内完成
// ============================================================================

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "types.hpp"

namespace indexer {

class DatabaseError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class Storage {
public:
  virtual ~Storage() = default;

  // 区块
  virtual void upsert_block(const Block &block) = 0;
  virtual std::optional<Block> get_block(int64_t number) = 0;
  virtual std::optional<int64_t> get_max_block_number() = 0;
  virtual std::vector<Block> get_latest_blocks(int limit) = 0;

  // 交易 / 日志
  virtual void upsert_transaction(const Transaction &tx) = 0;
  virtual std::optional<Transaction> get_transaction(const std::string &hash) = 0;
  virtual int64_t count_transactions() = 0;
  virtual void upsert_log(const TransactionLog &log) = 0;
  virtual std::vector<TransactionLog> get_logs(const std::string &tx_hash) = 0;

  // 代币转账, 返回 false 表示已存在
  virtual bool insert_token_transfer(const TokenTransfer &transfer) = 0;
  virtual int64_t count_token_transfers() = 0;
  virtual int64_t count_token_transfers_for(const std::string &token_address) = 0;
  virtual std::vector<std::pair<std::string, TokenType>> get_unique_token_addresses() = 0;

  // 代币
  virtual std::optional<Token> get_token(const std::string &address) = 0;
  // 新建时写入全部字段; 已存在时只更新元数据 (name/symbol/decimals/total_supply/token_type)
  virtual void upsert_token(const Token &token) = 0;
  virtual void increment_token_transfer_count(const std::string &address) = 0;
  virtual void set_token_transfer_count(const std::string &address, int64_t count) = 0;
  virtual std::vector<Token> get_tokens(int limit) = 0;

  // 持有者
  virtual void upsert_token_holder(const TokenHolder &holder) = 0;
  virtual std::optional<TokenHolder> get_token_holder(const std::string &token_address,
                                                      const std::string &holder_address,
                                                      const std::optional<std::string> &token_id) = 0;
  // 按当前持有者表重算 holder_count, 单条语句完成, 返回新值
  virtual int64_t refresh_token_holder_count(const std::string &token_address) = 0;

  // NFT
  virtual std::optional<NftToken> get_nft_token(const std::string &contract, const std::string &token_id) = 0;
  virtual void upsert_nft_token(const NftToken &nft) = 0;

  // 内部交易
  virtual void upsert_internal_transaction(const InternalTransaction &itx) = 0;
  virtual std::vector<InternalTransaction> get_internal_transactions(const std::string &tx_hash) = 0;

  // 地址
  virtual std::optional<Address> get_address(const std::string &address) = 0;
  virtual void upsert_address(const Address &address) = 0;
  virtual AddressTxCounts get_address_tx_counts(const std::string &address) = 0;
  virtual int64_t count_addresses() = 0;

  // 统计
  virtual void update_network_stats(const NetworkStats &stats) = 0;
  virtual std::optional<NetworkStats> get_network_stats() = 0;
  // 按区块时间戳重算 [from_block, to_block] 涉及到的每一天
  virtual void refresh_daily_stats(int64_t from_block, int64_t to_block) = 0;
  virtual std::optional<DailyStats> get_daily_stats(int64_t day_start) = 0;

  // 同步状态
  virtual std::optional<IndexerState> get_indexer_state() = 0;
  virtual void update_indexer_state(int64_t last_indexed_block, bool is_running,
                                    const std::optional<std::string> &error) = 0;

  // reorg 回滚: 删除 height 及以上的区块/交易/日志/转账/内部交易 (单事务)
  virtual RollbackCounts delete_from_height(int64_t height) = 0;
};

} // namespace indexer
