#pragma once

#include <algorithm>
#include <atomic>

namespace indexer {

// 加性增 / 乘性减: 连续 3 次成功 +step, 连续 2 次失败减半, 始终在 [min, max]
class BatchController {
public:
  static constexpr int SUCCESSES_TO_GROW = 3;
  static constexpr int FAILURES_TO_SHRINK = 2;

  BatchController(int min_size, int max_size, int step)
      : min_(min_size), max_(std::max(min_size, max_size)), step_(step), size_(min_size) {}

  int size() const { return size_; }

  // 返回 true 表示 size 发生变化
  bool on_success() {
    ++successes_;
    failures_ = 0;
    if (successes_ >= SUCCESSES_TO_GROW && size_ < max_) {
      size_ = std::min(size_.load() + step_, max_);
      successes_ = 0;
      return true;
    }
    return false;
  }

  bool on_failure() {
    ++failures_;
    successes_ = 0;
    if (failures_ >= FAILURES_TO_SHRINK) {
      failures_ = 0;
      int shrunk = std::max(size_.load() / 2, min_);
      if (shrunk != size_) {
        size_ = shrunk;
        return true;
      }
    }
    return false;
  }

  void reset() {
    size_ = min_;
    successes_ = 0;
    failures_ = 0;
  }

private:
  int min_;
  int max_;
  int step_;
  std::atomic<int> size_;
  int successes_ = 0;
  int failures_ = 0;
};

} // namespace indexer
