#pragma once

#include <string>

#include "event_parser.hpp"
#include "nft_pipeline.hpp"
#include "token_tracker.hpp"

namespace indexer {

// 日志 -> 代币转账 -> 代币计数 / 两端余额 / NFT 元数据入队
class TransferExtractor {
public:
  TransferExtractor(TokenTracker &tokens, NftMetadataPipeline *nft) : tokens_(tokens), nft_(nft) {}

  // 返回识别出的转账条数
  size_t extract(const ChainLog &log, const std::string &tx_hash, int64_t block_number, int64_t timestamp) {
    auto parsed = EventParser::parse_transfers(log);

    for (const auto &p : parsed) {
      TokenTransfer transfer;
      transfer.transaction_hash = tx_hash;
      transfer.log_index = log.log_index;
      transfer.batch_index = p.batch_index;
      transfer.block_number = block_number;
      transfer.timestamp = timestamp;
      transfer.token_address = p.token_address;
      transfer.from = p.from;
      transfer.to = p.to;
      transfer.value = p.value;
      transfer.token_id = p.token_id;
      transfer.token_type = p.token_type;
      tokens_.record_transfer(transfer);

      // 零地址表示 mint / burn, refresh_holder 内部跳过
      tokens_.refresh_holder(p.token_address, p.from, p.token_type, p.token_id);
      tokens_.refresh_holder(p.token_address, p.to, p.token_type, p.token_id);

      if (nft_ && EventParser::is_nft(p.token_type) && p.token_id) {
        nft_->enqueue({p.token_address, *p.token_id, p.token_type});
      }
    }
    return parsed.size();
  }

private:
  TokenTracker &tokens_;
  NftMetadataPipeline *nft_;
};

} // namespace indexer
