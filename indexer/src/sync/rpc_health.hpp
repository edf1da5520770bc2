#pragma once

#include <algorithm>
#include <chrono>
#include <functional>
#include <iostream>

#include "../infra/chain_client.hpp"
#include "stop_signal.hpp"

namespace indexer {

// ============================================================================
// RpcHealthMonitor - 存活探测 + 指数退避重连
// ============================================================================
class RpcHealthMonitor {
public:
  RpcHealthMonitor(ChainClient &chain, StopSignal &stop, int initial_delay_ms, int max_delay_ms)
      : chain_(chain), stop_(stop), initial_delay_ms_(initial_delay_ms), max_delay_ms_(max_delay_ms) {}

  bool probe() {
    try {
      chain_.get_block_number();
      return true;
    } catch (const std::exception &e) {
      std::cerr << "[Health] 探测失败: " << e.what() << std::endl;
      return false;
    }
  }

  // 阻塞直到探测成功 (true) 或收到 stop (false)
  // on_reconnect 在每次重建传输后调用
  bool wait_for_recovery(const std::function<void()> &on_reconnect = {}) {
    auto down_since = std::chrono::steady_clock::now();
    std::cout << "[Health] RPC 不可用, 等待恢复..." << std::endl;

    int64_t delay = initial_delay_ms_;
    int attempts = 0;
    while (!stop_.stop_requested()) {
      ++attempts;
      auto downtime = std::chrono::duration_cast<std::chrono::seconds>(
                          std::chrono::steady_clock::now() - down_since)
                          .count();
      std::cout << "[Health] 第 " << attempts << " 次探测 (已中断 " << downtime << "s)" << std::endl;

      try {
        chain_.reconnect();
      } catch (const std::exception &e) {
        std::cerr << "[Health] 重建连接失败: " << e.what() << std::endl;
      }
      if (on_reconnect)
        on_reconnect();

      if (probe()) {
        std::cout << "[Health] RPC 已恢复, 中断 " << downtime << "s, 探测 " << attempts << " 次" << std::endl;
        last_attempts_ = attempts;
        return true;
      }

      if (!stop_.wait_for(delay))
        break;
      delay = std::min<int64_t>(delay * 3 / 2, max_delay_ms_);
    }

    std::cout << "[Health] 收到停止信号, 放弃等待" << std::endl;
    last_attempts_ = attempts;
    return false;
  }

  int last_attempts() const { return last_attempts_; }

private:
  ChainClient &chain_;
  StopSignal &stop_;
  int64_t initial_delay_ms_;
  int64_t max_delay_ms_;
  int last_attempts_ = 0;
};

} // namespace indexer
