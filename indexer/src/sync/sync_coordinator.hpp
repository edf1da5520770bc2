#pragma once

// ============================================================================
// SyncCoordinator - 主同步循环
//   启动: 探测 RPC, 不可达则等待恢复; cursor = max(持久化 cursor, head - lookback)
//   追块: [cursor+1, min(cursor+batch, head)] 按 parallel_blocks 分块, 块内并行, 块间串行
//         每块完成后推进并持久化 cursor
//   轮询: 已追上时做 reorg 检查, 更新统计, 等待 poll_interval
//   出错: 网络错误 -> 等待恢复 + reorg 检查; 其他错误 -> 缩小 batch, 连续失败后做健康探测
// ============================================================================

#include <algorithm>
#include <atomic>
#include <ctime>
#include <exception>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "../core/config.hpp"
#include "../core/storage.hpp"
#include "../infra/chain_client.hpp"
#include "../infra/http_client.hpp"
#include "batch_controller.hpp"
#include "block_processor.hpp"
#include "nft_pipeline.hpp"
#include "parallel.hpp"
#include "reorg_detector.hpp"
#include "rpc_health.hpp"
#include "stop_signal.hpp"
#include "token_tracker.hpp"
#include "tracer.hpp"
#include "transfer_extractor.hpp"

namespace indexer {

class SyncCoordinator {
public:
  static constexpr int STATS_BLOCK_WINDOW = 10;

  SyncCoordinator(const Config &config, Storage &storage, ChainClient &chain, HttpFetcher &http)
      : config_(config), storage_(storage), chain_(chain),
        batch_(config.min_batch_size, config.max_batch_size, config.batch_size_step),
        health_(chain, stop_, config.error_retry_delay_ms, config.max_retry_delay_ms),
        reorg_(storage, chain, config.reorg_depth), tokens_(storage, chain),
        nft_(storage, chain, http, config.ipfs_gateways, config.nft_metadata_delay_ms, config.enable_nft_metadata),
        tracer_(storage, chain, config.enable_tracing), extractor_(tokens_, &nft_),
        blocks_(storage, chain, extractor_, tracer_) {}

  ~SyncCoordinator() { stop(); }

  SyncCoordinator(const SyncCoordinator &) = delete;
  SyncCoordinator &operator=(const SyncCoordinator &) = delete;

  void start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
      std::cout << "[Sync] 已在运行" << std::endl;
      return;
    }
    if (worker_.joinable())
      worker_.join();

    stop_.reset();
    nft_.start();
    worker_ = std::thread([this]() { run(); });
    std::cout << "[Sync] 已启动" << std::endl;
  }

  // 当前块处理完成后退出, 不强行打断
  void stop() {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false))
      return;

    std::cout << "[Sync] 正在停止..." << std::endl;
    stop_.request_stop();
    if (worker_.joinable())
      worker_.join();
    nft_.stop();
    write_state_logged(current_block_, std::nullopt);
    std::cout << "[Sync] 已停止, cursor=" << current_block_.load() << std::endl;
  }

  bool is_running() const { return running_; }
  int64_t current_block() const { return current_block_; }
  int64_t target_block() const { return target_block_; }
  int batch_size() const { return batch_.size(); }

  BackfillResult backfill_token_metadata() { return tokens_.backfill_metadata(); }
  std::vector<TokenBalance> get_token_balances(const std::string &address) {
    return tokens_.get_token_balances(address);
  }

  NftMetadataPipeline &nft_pipeline() { return nft_; }

private:
  void run() {
    std::cout << "[Sync] 同步线程启动" << std::endl;
    if (!bootstrap()) {
      std::cout << "[Sync] 启动阶段收到停止信号" << std::endl;
      return;
    }

    while (!stop_.stop_requested()) {
      try {
        sync_once();
      } catch (const std::exception &e) {
        handle_sync_error(std::current_exception(), e.what());
      }
    }
    std::cout << "[Sync] 同步线程退出" << std::endl;
  }

  bool bootstrap() {
    while (!stop_.stop_requested()) {
      try {
        int64_t persisted = persisted_cursor();
        current_block_ = persisted;

        if (!health_.probe()) {
          std::cout << "[Sync] RPC 不可达, 等待连接..." << std::endl;
          write_state(persisted, "Waiting for RPC connection");
          if (!recover())
            return false;
        }

        int64_t head = chain_.get_block_number();
        target_block_ = head;
        int64_t resume = std::max(persisted, std::max<int64_t>(head - config_.start_lookback, 0));
        current_block_ = resume;
        write_state(resume, std::nullopt);
        std::cout << "[Sync] 从区块 " << resume << " 之后继续 (持久化=" << persisted << ", head=" << head << ")"
                  << std::endl;
        return true;
      } catch (const std::exception &e) {
        handle_sync_error(std::current_exception(), e.what());
      }
    }
    return false;
  }

  int64_t persisted_cursor() {
    if (auto state = storage_.get_indexer_state())
      return state->last_indexed_block;
    return storage_.get_max_block_number().value_or(0);
  }

  void sync_once() {
    int64_t head = chain_.get_block_number();
    target_block_ = head;

    if (current_block_ >= head) {
      if (auto rolled = reorg_.check_and_rollback(current_block_)) {
        current_block_ = *rolled;
        write_state(*rolled, std::nullopt);
        return;
      }
      update_network_stats();
      stop_.wait_for(config_.poll_interval_ms);
      return;
    }

    int64_t from = current_block_ + 1;
    int64_t to = std::min<int64_t>(current_block_ + batch_.size(), head);
    std::cout << "[Sync] 同步区块 " << from << ".." << to << " (batch=" << batch_.size()
              << ", parallel=" << config_.parallel_blocks << ", head=" << head << ")" << std::endl;

    for (int64_t start = from; start <= to; start += config_.parallel_blocks) {
      if (stop_.stop_requested())
        return;
      int64_t end = std::min<int64_t>(start + config_.parallel_blocks - 1, to);
      process_chunk(start, end);
    }
    update_network_stats();
  }

  // 块内所有区块都成功后才推进 cursor
  void process_chunk(int64_t start, int64_t end) {
    std::vector<int64_t> numbers;
    for (int64_t n = start; n <= end; ++n)
      numbers.push_back(n);

    parallel_for_each(numbers, [this](int64_t n) { blocks_.index_block(n); });

    write_state(end, std::nullopt);
    current_block_ = end;
    consecutive_errors_ = 0;
    if (batch_.on_success())
      std::cout << "[Sync] batch 增大到 " << batch_.size() << std::endl;

    try {
      storage_.refresh_daily_stats(start, end);
    } catch (const std::exception &e) {
      std::cerr << "[Sync] 更新每日统计失败: " << e.what() << std::endl;
    }
    std::cout << "[Sync] 区块 " << start << ".." << end << " 完成" << std::endl;
  }

  void handle_sync_error(std::exception_ptr error, const std::string &message) {
    std::cerr << "[Sync] 同步出错: " << message << std::endl;

    if (is_network_error(error)) {
      write_state_logged(current_block_, "RPC endpoint unreachable - waiting for recovery");
      recover();
      return;
    }

    write_state_logged(current_block_, message);
    if (batch_.on_failure())
      std::cout << "[Sync] batch 缩小到 " << batch_.size() << std::endl;

    if (++consecutive_errors_ >= config_.failures_before_health_probe) {
      std::cout << "[Sync] 连续 " << consecutive_errors_ << " 次失败, 检查 RPC 状态" << std::endl;
      consecutive_errors_ = 0;
      if (!health_.probe()) {
        recover();
        return;
      }
    }
    stop_.wait_for(config_.error_retry_delay_ms);
  }

  // 等待 RPC 恢复, 恢复后立即检查 reorg
  bool recover() {
    if (!health_.wait_for_recovery([this]() { tracer_.reset_support(); }))
      return false;

    batch_.reset();
    consecutive_errors_ = 0;
    try {
      if (auto rolled = reorg_.check_and_rollback(current_block_))
        current_block_ = *rolled;
      write_state(current_block_, std::nullopt);
    } catch (const std::exception &e) {
      std::cerr << "[Sync] 恢复后 reorg 检查失败: " << e.what() << std::endl;
    }
    return true;
  }

  void update_network_stats() {
    try {
      NetworkStats stats;
      stats.latest_block = storage_.get_max_block_number().value_or(0);
      stats.total_transactions = storage_.count_transactions();
      stats.total_addresses = storage_.count_addresses();
      stats.total_token_transfers = storage_.count_token_transfers();

      try {
        stats.avg_gas_price = chain_.get_fee_data().gas_price.value_or("0");
      } catch (const std::exception &e) {
        std::cerr << "[Sync] 获取 gas price 失败: " << e.what() << std::endl;
        stats.avg_gas_price = "0";
      }

      auto latest = storage_.get_latest_blocks(STATS_BLOCK_WINDOW);
      if (latest.size() >= 2) {
        double span = static_cast<double>(latest.front().timestamp - latest.back().timestamp);
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(2) << span / static_cast<double>(latest.size() - 1);
        stats.avg_block_time = ss.str();
      }
      stats.last_updated = std::time(nullptr);
      storage_.update_network_stats(stats);
    } catch (const std::exception &e) {
      std::cerr << "[Sync] 更新网络统计失败: " << e.what() << std::endl;
    }
  }

  void write_state(int64_t cursor, const std::optional<std::string> &error) {
    storage_.update_indexer_state(cursor, running_, error);
  }

  void write_state_logged(int64_t cursor, const std::optional<std::string> &error) {
    try {
      write_state(cursor, error);
    } catch (const std::exception &e) {
      std::cerr << "[Sync] 写入同步状态失败: " << e.what() << std::endl;
    }
  }

  Config config_;
  Storage &storage_;
  ChainClient &chain_;

  StopSignal stop_;
  BatchController batch_;
  RpcHealthMonitor health_;
  ReorgDetector reorg_;
  TokenTracker tokens_;
  NftMetadataPipeline nft_;
  InternalTxTracer tracer_;
  TransferExtractor extractor_;
  BlockProcessor blocks_;

  std::atomic<bool> running_{false};
  std::atomic<int64_t> current_block_{0};
  std::atomic<int64_t> target_block_{0};
  int consecutive_errors_ = 0;
  std::thread worker_;
};

} // namespace indexer
