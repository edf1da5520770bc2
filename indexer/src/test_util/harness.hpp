#pragma once

#include <chrono>
#include <functional>
#include <thread>

#include "../sync/block_processor.hpp"
#include "../sync/nft_pipeline.hpp"
#include "../sync/token_tracker.hpp"
#include "../sync/tracer.hpp"
#include "../sync/transfer_extractor.hpp"
#include "fakes.hpp"

namespace indexer::test {

// 不带同步循环的单块入库组件
struct IngestHarness {
  MemoryStorage storage;
  FakeChain chain;
  FakeHttp http;
  TokenTracker tokens{storage, chain};
  NftMetadataPipeline nft{storage, chain, http, {"https://ipfs.io/ipfs/"}, 0, false};
  InternalTxTracer tracer{storage, chain, false};
  TransferExtractor extractor{tokens, &nft};
  BlockProcessor processor{storage, chain, extractor, tracer};
};

inline bool wait_until(const std::function<bool()> &pred, int timeout_ms = 10000) {
  auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred())
      return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return pred();
}

} // namespace indexer::test
