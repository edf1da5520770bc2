#pragma once

// ============================================================================
// BlockProcessor - 单个区块: 区块 -> 交易 (+收据) -> 日志 -> 转账, 最后刷新涉及的地址
// 单笔交易的普通错误只记录日志; 网络错误和资源耗尽向上抛出, 整个 chunk 重试
// ============================================================================

#include <algorithm>
#include <future>
#include <iostream>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "../core/storage.hpp"
#include "../infra/chain_client.hpp"
#include "method_decoder.hpp"
#include "parallel.hpp"
#include "tracer.hpp"
#include "transfer_extractor.hpp"

namespace indexer {

class TouchedAddresses {
public:
  void add(const std::string &address) {
    if (address.empty())
      return;
    std::lock_guard<std::mutex> lock(mutex_);
    addresses_.insert(abi::to_lower(address));
  }

  std::vector<std::string> snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {addresses_.begin(), addresses_.end()};
  }

private:
  mutable std::mutex mutex_;
  std::set<std::string> addresses_;
};

class BlockProcessor {
public:
  static constexpr size_t MAX_PARALLEL_TXS = 16;
  static constexpr size_t MAX_PARALLEL_LOGS = 16;

  BlockProcessor(Storage &storage, ChainClient &chain, TransferExtractor &extractor, InternalTxTracer &tracer)
      : storage_(storage), chain_(chain), extractor_(extractor), tracer_(tracer) {}

  void index_block(int64_t number) {
    auto chain_block = chain_.get_block(number, true);
    if (!chain_block) {
      throw RpcResponseError("block " + std::to_string(number) + " not found");
    }

    Block block = to_block(*chain_block);
    storage_.upsert_block(block);

    TouchedAddresses touched;
    touched.add(block.miner);

    parallel_for_each(
        chain_block->transaction_hashes,
        [&](const std::string &hash) {
          try {
            index_transaction(hash, block, touched);
          } catch (const std::exception &e) {
            if (aborts_block(std::current_exception()))
              throw;
            std::cerr << "[Block] 区块 " << number << " 交易 " << hash << " 索引失败: " << e.what() << std::endl;
          }
        },
        MAX_PARALLEL_TXS);

    parallel_for_each(
        touched.snapshot(), [&](const std::string &address) { refresh_address(address, block.timestamp); },
        MAX_PARALLEL_TXS);
  }

  void index_transaction(const std::string &hash, const Block &block, TouchedAddresses &touched) {
    auto tx_future = std::async(std::launch::async, [this, &hash]() { return chain_.get_transaction(hash); });
    auto receipt = chain_.get_transaction_receipt(hash);
    auto tx = tx_future.get();

    if (!tx || !receipt) {
      std::cerr << "[Block] 交易 " << hash << " 或其收据不存在, 跳过" << std::endl;
      return;
    }

    Transaction row = to_transaction(*tx, *receipt, block);
    storage_.upsert_transaction(row);

    touched.add(row.from);
    if (row.to)
      touched.add(*row.to);
    if (row.contract_address)
      touched.add(*row.contract_address);

    parallel_for_each(
        receipt->logs, [&](const ChainLog &log) { index_log(log, row, touched); }, MAX_PARALLEL_LOGS);

    tracer_.trace(row.hash, row.block_number, row.timestamp);
  }

  // 余额 / 代码 / 交易计数; 非网络错误只记录
  void refresh_address(const std::string &address, int64_t seen_at) {
    try {
      auto balance = chain_.get_balance(address);
      auto code = chain_.get_code(address);
      auto counts = storage_.get_address_tx_counts(address);
      auto existing = storage_.get_address(address);

      Address a;
      a.address = address;
      a.balance = balance;
      a.transaction_count = counts.total;
      a.sent_count = counts.sent;
      a.received_count = counts.received;
      a.is_contract = !code.empty() && code != "0x";
      if (a.is_contract)
        a.contract_code = code;
      a.first_seen = existing ? std::min(existing->first_seen, seen_at) : seen_at;
      a.last_seen = existing ? std::max(existing->last_seen, seen_at) : seen_at;
      storage_.upsert_address(a);
    } catch (const std::exception &e) {
      if (aborts_block(std::current_exception()))
        throw;
      std::cerr << "[Block] 更新地址 " << address << " 失败: " << e.what() << std::endl;
    }
  }

  static Block to_block(const ChainBlock &b) {
    Block block;
    block.number = b.number;
    block.hash = b.hash;
    block.parent_hash = b.parent_hash;
    block.timestamp = b.timestamp;
    block.miner = b.miner;
    block.gas_used = b.gas_used;
    block.gas_limit = b.gas_limit;
    block.base_fee_per_gas = b.base_fee_per_gas;
    block.transaction_count = static_cast<int32_t>(b.transaction_hashes.size());
    block.size = b.size;
    block.extra_data = b.extra_data;
    block.nonce = b.nonce;
    return block;
  }

  static Transaction to_transaction(const ChainTransaction &tx, const ChainReceipt &receipt, const Block &block) {
    Transaction row;
    row.hash = tx.hash;
    row.block_number = tx.block_number != 0 ? tx.block_number : block.number;
    row.block_hash = !tx.block_hash.empty() ? tx.block_hash : block.hash;
    row.transaction_index = tx.transaction_index;
    row.from = tx.from;
    row.to = tx.to;
    row.value = tx.value;
    row.gas = tx.gas;
    row.gas_price = tx.gas_price;
    row.max_fee_per_gas = tx.max_fee_per_gas;
    row.max_priority_fee_per_gas = tx.max_priority_fee_per_gas;
    row.input = tx.input;
    row.nonce = tx.nonce;
    row.type = tx.type;
    row.status = receipt.status;
    row.gas_used = receipt.gas_used;
    row.effective_gas_price = receipt.effective_gas_price;
    row.cumulative_gas_used = receipt.cumulative_gas_used;
    row.contract_address = receipt.contract_address;
    row.timestamp = block.timestamp;

    auto method = MethodDecoder::decode(tx.input);
    row.method_id = method.method_id;
    row.method_name = method.method_name;
    return row;
  }

private:
  void index_log(const ChainLog &log, const Transaction &tx, TouchedAddresses &touched) {
    TransactionLog row;
    row.transaction_hash = tx.hash;
    row.log_index = log.log_index;
    row.address = log.address;
    row.topics = log.topics;
    row.data = log.data;
    row.block_number = tx.block_number;
    row.block_hash = tx.block_hash;
    row.removed = log.removed;
    if (!log.topics.empty())
      row.topic0 = log.topics[0];
    storage_.upsert_log(row);
    touched.add(log.address);

    try {
      extractor_.extract(log, tx.hash, tx.block_number, tx.timestamp);
    } catch (const std::exception &e) {
      if (aborts_block(std::current_exception()))
        throw;
      std::cerr << "[Block] 交易 " << tx.hash << " 日志 " << log.log_index << " 转账解析失败: " << e.what()
                << std::endl;
    }
  }

  Storage &storage_;
  ChainClient &chain_;
  TransferExtractor &extractor_;
  InternalTxTracer &tracer_;
};

} // namespace indexer
