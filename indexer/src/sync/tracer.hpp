#pragma once

#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "../core/storage.hpp"
#include "../infra/abi.hpp"
#include "../infra/chain_client.hpp"

namespace indexer {

// ============================================================================
// InternalTxTracer - debug_traceTransaction(callTracer) 展开为内部交易
// 首次使用时探测节点是否支持, 重连后重新探测
// ============================================================================
class InternalTxTracer {
public:
  InternalTxTracer(Storage &storage, ChainClient &chain, bool enabled)
      : storage_(storage), chain_(chain), enabled_(enabled) {}

  bool supported() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (supported_)
      return *supported_;

    static const std::string zero_hash = "0x" + std::string(64, '0');
    try {
      chain_.send("debug_traceTransaction", json::array({zero_hash, {{"tracer", "callTracer"}}}));
      supported_ = true;
    } catch (const RpcResponseError &e) {
      // 只有 "方法不存在" 类错误才认为不支持, 其他错误 (比如交易不存在) 说明方法可用
      std::string msg = abi::to_lower(e.what());
      if (e.code() == -32601 || msg.find("method not found") != std::string::npos ||
          msg.find("not supported") != std::string::npos || msg.find("unknown method") != std::string::npos ||
          msg.find("does not exist") != std::string::npos) {
        supported_ = false;
        std::cout << "[Trace] 节点不支持 debug_traceTransaction, 跳过内部交易" << std::endl;
      } else {
        supported_ = true;
      }
    }
    return *supported_;
  }

  void reset_support() {
    std::lock_guard<std::mutex> lock(mutex_);
    supported_.reset();
  }

  // 返回写入的内部交易数; trace 本身失败静默跳过
  size_t trace(const std::string &tx_hash, int64_t block_number, int64_t timestamp) {
    if (!enabled_ || !supported())
      return 0;

    json result;
    try {
      result = chain_.send("debug_traceTransaction",
                           json::array({tx_hash, {{"tracer", "callTracer"}, {"tracerConfig", {{"onlyTopCall", false}}}}}));
    } catch (const RpcResponseError &) {
      return 0;
    }
    if (!result.is_object())
      return 0;

    auto rows = flatten(rpc_decode::call_frame(result), tx_hash, block_number, timestamp);
    for (const auto &itx : rows) {
      storage_.upsert_internal_transaction(itx);
    }
    return rows.size();
  }

  // 根调用本身不算内部交易; 只保留带 value 或者 CREATE/CREATE2 的调用
  static std::vector<InternalTransaction> flatten(const CallFrame &root, const std::string &tx_hash,
                                                  int64_t block_number, int64_t timestamp) {
    std::vector<InternalTransaction> out;
    std::vector<int32_t> path;
    walk(root.calls, path, tx_hash, block_number, timestamp, out);
    return out;
  }

private:
  static void walk(const std::vector<CallFrame> &calls, std::vector<int32_t> &path, const std::string &tx_hash,
                   int64_t block_number, int64_t timestamp, std::vector<InternalTransaction> &out) {
    for (size_t i = 0; i < calls.size(); ++i) {
      const auto &call = calls[i];
      path.push_back(static_cast<int32_t>(i));

      bool has_value = call.value && !abi::is_zero_quantity(*call.value);
      bool is_create = call.type == "CREATE" || call.type == "CREATE2";
      if (has_value || is_create) {
        InternalTransaction itx;
        itx.transaction_hash = tx_hash;
        itx.block_number = block_number;
        itx.trace_address = path;
        itx.type = call.type;
        itx.from = call.from;
        itx.to = call.to;
        if (call.value)
          itx.value = abi::hex_to_decimal(*call.value);
        itx.gas = small_quantity(call.gas);
        itx.gas_used = small_quantity(call.gas_used);
        itx.input = call.input;
        itx.output = call.output;
        itx.error = call.error;
        itx.call_type = abi::to_lower(call.type);
        itx.timestamp = timestamp;
        out.push_back(std::move(itx));
      }

      walk(call.calls, path, tx_hash, block_number, timestamp, out);
      path.pop_back();
    }
  }

  static std::optional<int64_t> small_quantity(const std::optional<std::string> &hex) {
    if (!hex || !rpc_decode::is_small_quantity(*hex))
      return std::nullopt;
    return abi::hex_to_int64(*hex);
  }

  Storage &storage_;
  ChainClient &chain_;
  bool enabled_;

  std::mutex mutex_;
  std::optional<bool> supported_;
};

} // namespace indexer
