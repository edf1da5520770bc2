#pragma once

// ============================================================================
// ChainClient - 链上只读 RPC 抽象 + JSON-RPC 响应解码
// 解码函数对可选字段一律 fail closed: 缺失 -> nullopt, 不抛异常
// ============================================================================

#include <cstdint>
#include <exception>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "abi.hpp"

namespace indexer {

using json = nlohmann::json;

// 网络类错误: DNS / 连接 / TLS / 超时 / 5xx, 触发健康恢复流程
class RpcTransportError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// JSON-RPC error 对象或格式错误的响应
class RpcResponseError : public std::runtime_error {
public:
  RpcResponseError(int64_t code, const std::string &message)
      : std::runtime_error("RPC error " + std::to_string(code) + ": " + message), code_(code) {}
  explicit RpcResponseError(const std::string &message)
      : std::runtime_error(message), code_(0) {}

  int64_t code() const { return code_; }

private:
  int64_t code_;
};

inline bool is_network_error(const std::exception_ptr &eptr) {
  if (!eptr)
    return false;
  try {
    std::rethrow_exception(eptr);
  } catch (const RpcTransportError &) {
    return true;
  } catch (const std::exception &) {
    return false;
  }
}

struct ChainTransaction {
  std::string hash;
  int64_t block_number = 0;
  std::string block_hash;
  int32_t transaction_index = 0;
  std::string from;
  std::optional<std::string> to;
  std::string value = "0";
  int64_t gas = 0;
  std::optional<std::string> gas_price;
  std::optional<std::string> max_fee_per_gas;
  std::optional<std::string> max_priority_fee_per_gas;
  std::string input = "0x";
  int64_t nonce = 0;
  int32_t type = 0;
};

struct ChainLog {
  std::string address;
  std::vector<std::string> topics;
  std::string data = "0x";
  int32_t log_index = 0;
  int64_t block_number = 0;
  std::string block_hash;
  std::string transaction_hash;
  bool removed = false;
};

struct ChainReceipt {
  std::string transaction_hash;
  std::optional<bool> status;
  int64_t gas_used = 0;
  int64_t cumulative_gas_used = 0;
  std::optional<std::string> effective_gas_price;
  std::optional<std::string> contract_address;
  std::vector<ChainLog> logs;
};

struct ChainBlock {
  int64_t number = 0;
  std::string hash;
  std::string parent_hash;
  int64_t timestamp = 0;
  std::string miner;
  int64_t gas_used = 0;
  int64_t gas_limit = 0;
  std::optional<std::string> base_fee_per_gas;
  std::optional<int64_t> size;
  std::optional<std::string> extra_data;
  std::optional<std::string> nonce;
  std::vector<std::string> transaction_hashes;
  std::vector<ChainTransaction> transactions;  // 仅 include_txs 时填充
};

// callTracer 输出的一个节点
struct CallFrame {
  std::string type = "CALL";
  std::optional<std::string> from;
  std::optional<std::string> to;
  std::optional<std::string> value;  // 原始 hex
  std::optional<std::string> gas;
  std::optional<std::string> gas_used;
  std::optional<std::string> input;
  std::optional<std::string> output;
  std::optional<std::string> error;
  std::vector<CallFrame> calls;
};

struct FeeData {
  std::optional<std::string> gas_price;
};

class ChainClient {
public:
  virtual ~ChainClient() = default;

  virtual int64_t get_block_number() = 0;
  virtual std::optional<ChainBlock> get_block(int64_t number, bool include_txs) = 0;
  virtual std::optional<ChainTransaction> get_transaction(const std::string &hash) = 0;
  virtual std::optional<ChainReceipt> get_transaction_receipt(const std::string &hash) = 0;
  virtual std::string get_balance(const std::string &address) = 0;
  virtual std::string get_code(const std::string &address) = 0;
  // eth_call, 返回 hex; revert 抛 RpcResponseError
  virtual std::string call(const std::string &to, const std::string &data) = 0;
  virtual json send(const std::string &method, const json &params) = 0;
  virtual FeeData get_fee_data() = 0;

  // 重建底层传输
  virtual void reconnect() {}
};

// ============================================================================
// 解码
// ============================================================================
namespace rpc_decode {

inline std::optional<std::string> opt_string(const json &j, const char *key) {
  if (!j.is_object() || !j.contains(key) || !j[key].is_string())
    return std::nullopt;
  return j[key].get<std::string>();
}

inline std::optional<std::string> opt_address(const json &j, const char *key) {
  auto s = opt_string(j, key);
  if (!s)
    return std::nullopt;
  return abi::to_lower(*s);
}

inline bool is_small_quantity(const std::string &s) {
  auto digits = abi::strip_0x(s);
  return digits.size() <= 16 && abi::is_hex(digits);
}

inline int64_t quantity(const json &j, const char *key, int64_t fallback = 0) {
  auto s = opt_string(j, key);
  if (!s || !is_small_quantity(*s))
    return fallback;
  return abi::hex_to_int64(*s);
}

inline std::optional<int64_t> opt_quantity(const json &j, const char *key) {
  auto s = opt_string(j, key);
  if (!s || !is_small_quantity(*s))
    return std::nullopt;
  return abi::hex_to_int64(*s);
}

inline std::optional<std::string> opt_decimal(const json &j, const char *key) {
  auto s = opt_string(j, key);
  if (!s)
    return std::nullopt;
  return abi::hex_to_decimal(*s);
}

inline ChainTransaction transaction(const json &j) {
  ChainTransaction tx;
  tx.hash = abi::to_lower(opt_string(j, "hash").value_or(""));
  tx.block_number = quantity(j, "blockNumber");
  tx.block_hash = abi::to_lower(opt_string(j, "blockHash").value_or(""));
  tx.transaction_index = static_cast<int32_t>(quantity(j, "transactionIndex"));
  tx.from = opt_address(j, "from").value_or("");
  tx.to = opt_address(j, "to");
  tx.value = opt_decimal(j, "value").value_or("0");
  tx.gas = quantity(j, "gas");
  tx.gas_price = opt_decimal(j, "gasPrice");
  tx.max_fee_per_gas = opt_decimal(j, "maxFeePerGas");
  tx.max_priority_fee_per_gas = opt_decimal(j, "maxPriorityFeePerGas");
  tx.input = opt_string(j, "input").value_or("0x");
  tx.nonce = quantity(j, "nonce");
  tx.type = static_cast<int32_t>(quantity(j, "type"));
  return tx;
}

inline ChainLog log(const json &j) {
  ChainLog l;
  l.address = opt_address(j, "address").value_or("");
  if (j.contains("topics") && j["topics"].is_array()) {
    for (const auto &t : j["topics"]) {
      if (t.is_string())
        l.topics.push_back(abi::to_lower(t.get<std::string>()));
    }
  }
  l.data = opt_string(j, "data").value_or("0x");
  l.log_index = static_cast<int32_t>(quantity(j, "logIndex"));
  l.block_number = quantity(j, "blockNumber");
  l.block_hash = abi::to_lower(opt_string(j, "blockHash").value_or(""));
  l.transaction_hash = abi::to_lower(opt_string(j, "transactionHash").value_or(""));
  l.removed = j.contains("removed") && j["removed"].is_boolean() && j["removed"].get<bool>();
  return l;
}

inline ChainReceipt receipt(const json &j) {
  ChainReceipt r;
  r.transaction_hash = abi::to_lower(opt_string(j, "transactionHash").value_or(""));
  if (auto status = opt_quantity(j, "status"))
    r.status = *status == 1;
  r.gas_used = quantity(j, "gasUsed");
  r.cumulative_gas_used = quantity(j, "cumulativeGasUsed");
  r.effective_gas_price = opt_decimal(j, "effectiveGasPrice");
  r.contract_address = opt_address(j, "contractAddress");
  if (j.contains("logs") && j["logs"].is_array()) {
    for (const auto &l : j["logs"]) {
      r.logs.push_back(log(l));
    }
  }
  return r;
}

inline ChainBlock block(const json &j) {
  ChainBlock b;
  b.number = quantity(j, "number");
  b.hash = abi::to_lower(opt_string(j, "hash").value_or(""));
  b.parent_hash = abi::to_lower(opt_string(j, "parentHash").value_or(""));
  b.timestamp = quantity(j, "timestamp");
  b.miner = opt_address(j, "miner").value_or(abi::ZERO_ADDRESS);
  b.gas_used = quantity(j, "gasUsed");
  b.gas_limit = quantity(j, "gasLimit");
  b.base_fee_per_gas = opt_decimal(j, "baseFeePerGas");
  b.size = opt_quantity(j, "size");
  b.extra_data = opt_string(j, "extraData");
  b.nonce = opt_string(j, "nonce");
  if (j.contains("transactions") && j["transactions"].is_array()) {
    for (const auto &t : j["transactions"]) {
      if (t.is_string()) {
        b.transaction_hashes.push_back(abi::to_lower(t.get<std::string>()));
      } else if (t.is_object()) {
        auto tx = transaction(t);
        b.transaction_hashes.push_back(tx.hash);
        b.transactions.push_back(std::move(tx));
      }
    }
  }
  return b;
}

inline CallFrame call_frame(const json &j) {
  CallFrame f;
  f.type = opt_string(j, "type").value_or("CALL");
  f.from = opt_address(j, "from");
  f.to = opt_address(j, "to");
  f.value = opt_string(j, "value");
  f.gas = opt_string(j, "gas");
  f.gas_used = opt_string(j, "gasUsed");
  f.input = opt_string(j, "input");
  f.output = opt_string(j, "output");
  f.error = opt_string(j, "error");
  if (j.contains("calls") && j["calls"].is_array()) {
    for (const auto &c : j["calls"]) {
      if (c.is_object())
        f.calls.push_back(call_frame(c));
    }
  }
  return f;
}

} // namespace rpc_decode

} // namespace indexer
