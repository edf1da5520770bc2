#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace indexer {

// 可被 stop 打断的等待
class StopSignal {
public:
  void request_stop() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      stopped_ = true;
    }
    cv_.notify_all();
  }

  bool stop_requested() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stopped_;
  }

  // 等满 ms 返回 true, 被打断返回 false
  bool wait_for(int64_t ms) {
    std::unique_lock<std::mutex> lock(mutex_);
    return !cv_.wait_for(lock, std::chrono::milliseconds(ms), [this] { return stopped_; });
  }

  void reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    stopped_ = false;
  }

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool stopped_ = false;
};

} // namespace indexer
