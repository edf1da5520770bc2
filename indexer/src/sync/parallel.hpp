#pragma once

#include <algorithm>
#include <exception>
#include <future>
#include <new>
#include <system_error>
#include <vector>

#include "../infra/chain_client.hpp"

namespace indexer {

// 线程 / 内存耗尽 (std::async 启动失败等), 与网络错误一样不能按单条记录跳过
inline bool is_resource_error(const std::exception_ptr &eptr) {
  if (!eptr)
    return false;
  try {
    std::rethrow_exception(eptr);
  } catch (const std::system_error &) {
    return true;
  } catch (const std::bad_alloc &) {
    return true;
  } catch (const std::exception &) {
    return false;
  }
}

// 整块必须放弃重试的错误
inline bool aborts_block(const std::exception_ptr &eptr) { return is_network_error(eptr) || is_resource_error(eptr); }

// 每个元素一个 std::async 任务, 全部完成后再抛异常
// 抛出优先级: 网络错误 > 资源错误 > 第一个错误
// max_parallel > 0 时分波执行, 出错的波次之后不再启动; 启动失败时等已启动的任务结束后抛出
template <typename Item, typename Fn>
void parallel_for_each(const std::vector<Item> &items, Fn fn, size_t max_parallel = 0) {
  size_t wave = max_parallel == 0 ? items.size() : max_parallel;
  std::exception_ptr first_error;
  std::exception_ptr network_error;
  std::exception_ptr resource_error;

  auto record = [&](std::exception_ptr e) {
    if (!first_error)
      first_error = e;
    if (!network_error && is_network_error(e))
      network_error = e;
    if (!resource_error && is_resource_error(e))
      resource_error = e;
  };

  for (size_t start = 0; start < items.size(); start += wave) {
    size_t end = std::min(start + wave, items.size());

    std::vector<std::future<void>> futures;
    futures.reserve(end - start);
    for (size_t i = start; i < end; ++i) {
      const Item &item = items[i];
      try {
        futures.push_back(std::async(std::launch::async, [&fn, &item]() { fn(item); }));
      } catch (const std::exception &) {
        record(std::current_exception());
        break;
      }
    }

    for (auto &f : futures) {
      try {
        f.get();
      } catch (const std::exception &) {
        record(std::current_exception());
      }
    }
    if (first_error)
      break;
  }

  if (network_error)
    std::rethrow_exception(network_error);
  if (resource_error)
    std::rethrow_exception(resource_error);
  if (first_error)
    std::rethrow_exception(first_error);
}

} // namespace indexer
