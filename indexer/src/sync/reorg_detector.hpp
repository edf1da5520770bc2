#pragma once

#include <algorithm>
#include <iostream>
#include <optional>

#include "../core/storage.hpp"
#include "../infra/chain_client.hpp"

namespace indexer {

// ============================================================================
// ReorgDetector - 本地 hash 与链上 hash 比对, 分叉时整体回滚
// ============================================================================
class ReorgDetector {
public:
  ReorgDetector(Storage &storage, ChainClient &chain, int depth)
      : storage_(storage), chain_(chain), depth_(depth) {}

  // 从 cursor 往回走, 遇到第一个 hash 一致的区块停止
  // 返回最低的不一致高度 (分叉点, 含), 无分叉返回 nullopt
  // 链上已不存在的高度视为不一致, 本地缺失的高度跳过
  std::optional<int64_t> find_divergence(int64_t cursor) {
    int64_t depth = std::min<int64_t>(depth_, cursor);
    std::optional<int64_t> divergence;

    for (int64_t i = 0; i < depth; ++i) {
      int64_t height = cursor - i;
      auto stored = storage_.get_block(height);
      if (!stored)
        continue;

      auto live = chain_.get_block(height, false);
      if (live && live->hash == stored->hash)
        break;

      std::cout << "[Reorg] 区块 " << height << " hash 不一致: db=" << stored->hash
                << " chain=" << (live ? live->hash : std::string("<missing>")) << std::endl;
      divergence = height;
    }
    return divergence;
  }

  // 有分叉时回滚并返回新 cursor (分叉点 - 1)
  std::optional<int64_t> check_and_rollback(int64_t cursor) {
    auto divergence = find_divergence(cursor);
    if (!divergence)
      return std::nullopt;

    std::cout << "[Reorg] 分叉点 " << *divergence << ", 删除 >= " << *divergence << " 的数据" << std::endl;
    auto counts = storage_.delete_from_height(*divergence);
    std::cout << "[Reorg] 回滚完成: " << counts.blocks << " blocks, " << counts.transactions << " txs, "
              << counts.logs << " logs, " << counts.transfers << " transfers, " << counts.internal_transactions
              << " internal txs" << std::endl;
    return *divergence - 1;
  }

private:
  Storage &storage_;
  ChainClient &chain_;
  int depth_;
};

} // namespace indexer
