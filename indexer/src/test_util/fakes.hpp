#pragma once

// ============================================================================
// 测试用内存实现: MemoryStorage / FakeChain / FakeHttp
// ============================================================================

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <tuple>
#include <utility>
#include <vector>

#include "../core/storage.hpp"
#include "../infra/abi.hpp"
#include "../infra/chain_client.hpp"
#include "../infra/http_client.hpp"

namespace indexer::test {

// n 与 tag 拼成唯一的 32 字节 hash
inline std::string hash_of(int64_t n, const std::string &tag = "a") {
  char buf[80];
  std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(n));
  std::string body = abi::to_lower(tag);
  std::string hex;
  for (unsigned char c : body) {
    char b[3];
    std::snprintf(b, sizeof(b), "%02x", c);
    hex += b;
  }
  hex = hex.substr(0, 48);
  return "0x" + std::string(48 - hex.size(), '0') + hex + buf;
}

inline std::string address_of(int n) {
  char buf[48];
  std::snprintf(buf, sizeof(buf), "%040x", n);
  return std::string("0x") + buf;
}

inline std::string topic_of_address(const std::string &address) { return "0x" + abi::encode_address(address); }

inline std::string word_of(uint64_t v) { return abi::encode_uint256(abi::uint256(v)); }

// eth_call 返回的动态 string
inline std::string abi_string(const std::string &s) {
  std::string hex;
  for (unsigned char c : s) {
    char b[3];
    std::snprintf(b, sizeof(b), "%02x", c);
    hex += b;
  }
  hex += std::string((64 - hex.size() % 64) % 64, '0');
  return "0x" + word_of(32) + word_of(s.size()) + hex;
}

// ============================================================================
// MemoryStorage
// ============================================================================
class MemoryStorage : public Storage {
public:
  void upsert_block(const Block &block) override {
    std::lock_guard<std::mutex> lock(mutex_);
    blocks_[block.number] = block;
  }

  std::optional<Block> get_block(int64_t number) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = blocks_.find(number);
    if (it == blocks_.end())
      return std::nullopt;
    return it->second;
  }

  std::optional<int64_t> get_max_block_number() override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (blocks_.empty())
      return std::nullopt;
    return blocks_.rbegin()->first;
  }

  std::vector<Block> get_latest_blocks(int limit) override {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Block> out;
    for (auto it = blocks_.rbegin(); it != blocks_.rend() && static_cast<int>(out.size()) < limit; ++it)
      out.push_back(it->second);
    return out;
  }

  void upsert_transaction(const Transaction &tx) override {
    std::lock_guard<std::mutex> lock(mutex_);
    transactions_[tx.hash] = tx;
  }

  std::optional<Transaction> get_transaction(const std::string &hash) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = transactions_.find(hash);
    if (it == transactions_.end())
      return std::nullopt;
    return it->second;
  }

  int64_t count_transactions() override {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int64_t>(transactions_.size());
  }

  void upsert_log(const TransactionLog &log) override {
    std::lock_guard<std::mutex> lock(mutex_);
    logs_[{log.transaction_hash, log.log_index}] = log;
  }

  std::vector<TransactionLog> get_logs(const std::string &tx_hash) override {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TransactionLog> out;
    for (const auto &[key, log] : logs_) {
      if (key.first == tx_hash)
        out.push_back(log);
    }
    return out;
  }

  bool insert_token_transfer(const TokenTransfer &transfer) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto key = std::make_tuple(transfer.transaction_hash, transfer.log_index, transfer.batch_index);
    return transfers_.emplace(key, transfer).second;
  }

  int64_t count_token_transfers() override {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int64_t>(transfers_.size());
  }

  int64_t count_token_transfers_for(const std::string &token_address) override {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::count_if(transfers_.begin(), transfers_.end(),
                         [&](const auto &kv) { return kv.second.token_address == token_address; });
  }

  std::vector<std::pair<std::string, TokenType>> get_unique_token_addresses() override {
    std::lock_guard<std::mutex> lock(mutex_);
    std::set<std::pair<std::string, TokenType>> seen;
    for (const auto &[key, t] : transfers_)
      seen.insert({t.token_address, t.token_type});
    return {seen.begin(), seen.end()};
  }

  std::optional<Token> get_token(const std::string &address) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tokens_.find(address);
    if (it == tokens_.end())
      return std::nullopt;
    return it->second;
  }

  void upsert_token(const Token &token) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tokens_.find(token.address);
    if (it == tokens_.end()) {
      tokens_[token.address] = token;
      return;
    }
    it->second.name = token.name;
    it->second.symbol = token.symbol;
    it->second.decimals = token.decimals;
    it->second.total_supply = token.total_supply;
    it->second.token_type = token.token_type;
  }

  void increment_token_transfer_count(const std::string &address) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tokens_.find(address);
    if (it != tokens_.end())
      ++it->second.transfer_count;
  }

  void set_token_transfer_count(const std::string &address, int64_t count) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tokens_.find(address);
    if (it != tokens_.end())
      it->second.transfer_count = count;
  }

  std::vector<Token> get_tokens(int limit) override {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Token> out;
    for (const auto &[address, token] : tokens_)
      out.push_back(token);
    std::stable_sort(out.begin(), out.end(),
                     [](const Token &a, const Token &b) { return a.transfer_count > b.transfer_count; });
    if (static_cast<int>(out.size()) > limit)
      out.resize(limit);
    return out;
  }

  void upsert_token_holder(const TokenHolder &holder) override {
    std::lock_guard<std::mutex> lock(mutex_);
    holders_[{holder.token_address, holder.holder_address, holder.token_id.value_or("")}] = holder;
  }

  std::optional<TokenHolder> get_token_holder(const std::string &token_address, const std::string &holder_address,
                                              const std::optional<std::string> &token_id) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = holders_.find({token_address, holder_address, token_id.value_or("")});
    if (it == holders_.end())
      return std::nullopt;
    return it->second;
  }

  int64_t refresh_token_holder_count(const std::string &token_address) override {
    std::lock_guard<std::mutex> lock(mutex_);
    std::set<std::string> distinct;
    for (const auto &[key, h] : holders_) {
      if (h.token_address == token_address && h.balance != "0")
        distinct.insert(h.holder_address);
    }
    auto count = static_cast<int64_t>(distinct.size());
    auto it = tokens_.find(token_address);
    if (it != tokens_.end())
      it->second.holder_count = count;
    return count;
  }

  std::optional<NftToken> get_nft_token(const std::string &contract, const std::string &token_id) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = nfts_.find({contract, token_id});
    if (it == nfts_.end())
      return std::nullopt;
    return it->second;
  }

  void upsert_nft_token(const NftToken &nft) override {
    std::lock_guard<std::mutex> lock(mutex_);
    nfts_[{nft.contract_address, nft.token_id}] = nft;
  }

  void upsert_internal_transaction(const InternalTransaction &itx) override {
    std::lock_guard<std::mutex> lock(mutex_);
    internal_[{itx.transaction_hash, join_trace_address(itx.trace_address)}] = itx;
  }

  std::vector<InternalTransaction> get_internal_transactions(const std::string &tx_hash) override {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<InternalTransaction> out;
    for (const auto &[key, itx] : internal_) {
      if (key.first == tx_hash)
        out.push_back(itx);
    }
    return out;
  }

  std::optional<Address> get_address(const std::string &address) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = addresses_.find(address);
    if (it == addresses_.end())
      return std::nullopt;
    return it->second;
  }

  void upsert_address(const Address &address) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = addresses_.find(address.address);
    if (it == addresses_.end()) {
      addresses_[address.address] = address;
      return;
    }
    int64_t first_seen = it->second.first_seen;
    it->second = address;
    it->second.first_seen = first_seen;
  }

  AddressTxCounts get_address_tx_counts(const std::string &address) override {
    std::lock_guard<std::mutex> lock(mutex_);
    AddressTxCounts counts;
    for (const auto &[hash, tx] : transactions_) {
      bool sent = tx.from == address;
      bool received = tx.to && *tx.to == address;
      if (sent || received)
        ++counts.total;
      if (sent)
        ++counts.sent;
      if (received)
        ++counts.received;
    }
    return counts;
  }

  int64_t count_addresses() override {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int64_t>(addresses_.size());
  }

  void update_network_stats(const NetworkStats &stats) override {
    std::lock_guard<std::mutex> lock(mutex_);
    network_stats_ = stats;
  }

  std::optional<NetworkStats> get_network_stats() override {
    std::lock_guard<std::mutex> lock(mutex_);
    return network_stats_;
  }

  void refresh_daily_stats(int64_t from_block, int64_t to_block) override {
    std::lock_guard<std::mutex> lock(mutex_);
    std::set<int64_t> days;
    for (const auto &[number, b] : blocks_) {
      if (number >= from_block && number <= to_block)
        days.insert(b.timestamp - b.timestamp % 86400);
    }
    for (int64_t day : days) {
      DailyStats d;
      d.day_start = day;
      abi::uint256 gas = 0;
      for (const auto &[number, b] : blocks_) {
        if (b.timestamp - b.timestamp % 86400 != day)
          continue;
        ++d.block_count;
        d.transaction_count += b.transaction_count;
        gas += b.gas_used;
      }
      d.gas_used = gas.str();
      daily_[day] = d;
    }
  }

  std::optional<DailyStats> get_daily_stats(int64_t day_start) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = daily_.find(day_start);
    if (it == daily_.end())
      return std::nullopt;
    return it->second;
  }

  std::optional<IndexerState> get_indexer_state() override {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
  }

  void update_indexer_state(int64_t last_indexed_block, bool is_running,
                            const std::optional<std::string> &error) override {
    std::lock_guard<std::mutex> lock(mutex_);
    IndexerState s;
    s.last_indexed_block = last_indexed_block;
    s.is_running = is_running;
    s.last_error = error;
    s.last_updated = std::time(nullptr);
    state_ = s;
    cursor_history_.push_back(last_indexed_block);
  }

  RollbackCounts delete_from_height(int64_t height) override {
    std::lock_guard<std::mutex> lock(mutex_);
    RollbackCounts counts;
    counts.transfers = erase_if_map(transfers_, [&](const auto &t) { return t.block_number >= height; });
    counts.logs = erase_if_map(logs_, [&](const auto &l) { return l.block_number >= height; });
    counts.internal_transactions = erase_if_map(internal_, [&](const auto &i) { return i.block_number >= height; });
    counts.transactions = erase_if_map(transactions_, [&](const auto &t) { return t.block_number >= height; });
    counts.blocks = erase_if_map(blocks_, [&](const auto &b) { return b.number >= height; });
    return counts;
  }

  // 每次写入 indexer_state 的 cursor, 按时间顺序
  std::vector<int64_t> cursor_history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cursor_history_;
  }

  size_t block_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return blocks_.size();
  }

  size_t log_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return logs_.size();
  }

private:
  template <typename Map, typename Pred> static int64_t erase_if_map(Map &m, Pred pred) {
    int64_t n = 0;
    for (auto it = m.begin(); it != m.end();) {
      if (pred(it->second)) {
        it = m.erase(it);
        ++n;
      } else {
        ++it;
      }
    }
    return n;
  }

  mutable std::mutex mutex_;
  std::map<int64_t, Block> blocks_;
  std::map<std::string, Transaction> transactions_;
  std::map<std::pair<std::string, int32_t>, TransactionLog> logs_;
  std::map<std::tuple<std::string, int32_t, int32_t>, TokenTransfer> transfers_;
  std::map<std::string, Token> tokens_;
  std::map<std::tuple<std::string, std::string, std::string>, TokenHolder> holders_;
  std::map<std::pair<std::string, std::string>, NftToken> nfts_;
  std::map<std::pair<std::string, std::string>, InternalTransaction> internal_;
  std::map<std::string, Address> addresses_;
  std::optional<NetworkStats> network_stats_;
  std::map<int64_t, DailyStats> daily_;
  std::optional<IndexerState> state_;
  std::vector<int64_t> cursor_history_;
};

// ============================================================================
// FakeChain
// ============================================================================
class FakeChain : public ChainClient {
public:
  // 加一个区块, 交易 hash 由调用方另外登记
  ChainBlock &add_block(int64_t number, const std::string &tag = "a") {
    std::lock_guard<std::mutex> lock(mutex_);
    ChainBlock b;
    b.number = number;
    b.hash = hash_of(number, tag);
    b.parent_hash = number > 0 ? hash_of(number - 1, tag) : hash_of(0, "genesis-parent");
    b.timestamp = 1700000000 + number * 12;
    b.miner = address_of(0xbeef);
    b.gas_used = 21000;
    b.gas_limit = 30000000;
    blocks_[number] = b;
    head_ = std::max(head_, number);
    return blocks_[number];
  }

  // 添加一条 from -> to 的交易, 返回 hash
  std::string add_transaction(int64_t block_number, const std::string &from, const std::string &to,
                              std::vector<ChainLog> logs = {}, const std::string &tag = "a") {
    std::lock_guard<std::mutex> lock(mutex_);
    auto &block = blocks_.at(block_number);
    int32_t index = static_cast<int32_t>(block.transaction_hashes.size());

    ChainTransaction tx;
    tx.hash = hash_of(block_number * 1000 + index, "tx-" + tag);
    tx.block_number = block_number;
    tx.block_hash = block.hash;
    tx.transaction_index = index;
    tx.from = from;
    tx.to = to;
    tx.value = "1000";
    tx.gas = 21000;
    tx.input = "0xa9059cbb";
    tx.nonce = index;
    block.transaction_hashes.push_back(tx.hash);

    ChainReceipt receipt;
    receipt.transaction_hash = tx.hash;
    receipt.status = true;
    receipt.gas_used = 21000;
    receipt.cumulative_gas_used = 21000 * (index + 1);
    receipt.effective_gas_price = "1000000000";
    int32_t log_index = 0;
    for (auto &log : logs) {
      log.transaction_hash = tx.hash;
      log.block_number = block_number;
      log.block_hash = block.hash;
      log.log_index = log_index++;
      receipt.logs.push_back(log);
    }

    txs_[tx.hash] = tx;
    receipts_[tx.hash] = receipt;
    return tx.hash;
  }

  // 区块里登记一个链上查不到的交易 hash
  void add_unknown_hash(int64_t block_number, const std::string &hash) {
    std::lock_guard<std::mutex> lock(mutex_);
    blocks_.at(block_number).transaction_hashes.push_back(hash);
  }

  // 用 tag 分支重建 [from, to] 区块, 模拟 reorg
  void fork_from(int64_t from, int64_t to, const std::string &tag) {
    for (int64_t n = from; n <= to; ++n) {
      add_block(n, tag);
      std::lock_guard<std::mutex> lock(mutex_);
      if (n == from)
        blocks_[n].parent_hash = blocks_.count(n - 1) ? blocks_[n - 1].hash : blocks_[n].parent_hash;
    }
  }

  void set_head(int64_t head) {
    std::lock_guard<std::mutex> lock(mutex_);
    head_ = head;
  }

  void set_call(const std::string &to, const std::string &data, const std::string &ret) {
    std::lock_guard<std::mutex> lock(mutex_);
    calls_[{to, data}] = ret;
  }

  void clear_call(const std::string &to, const std::string &data) {
    std::lock_guard<std::mutex> lock(mutex_);
    calls_.erase({to, data});
  }

  void set_code(const std::string &address, const std::string &code) {
    std::lock_guard<std::mutex> lock(mutex_);
    codes_[address] = code;
  }

  void set_trace(const std::string &tx_hash, const json &trace) {
    std::lock_guard<std::mutex> lock(mutex_);
    traces_[tx_hash] = trace;
  }

  void set_trace_supported(bool supported) { trace_supported_ = supported; }

  // 接下来 n 次调用抛 RpcTransportError
  void fail_next(int n) { failures_left_ = n; }

  // 接下来 n 次 get_block 抛 RpcResponseError
  void fail_blocks(int n) { block_failures_left_ = n; }

  int reconnects() const { return reconnects_; }
  int calls_made() const { return calls_made_; }

  int64_t get_block_number() override {
    maybe_fail();
    std::lock_guard<std::mutex> lock(mutex_);
    return head_;
  }

  std::optional<ChainBlock> get_block(int64_t number, bool include_txs) override {
    maybe_fail();
    if (block_failures_left_ > 0 && block_failures_left_-- > 0)
      throw RpcResponseError(-32000, "header not found");
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = blocks_.find(number);
    if (it == blocks_.end() || number > head_)
      return std::nullopt;
    ChainBlock b = it->second;
    if (include_txs) {
      for (const auto &h : b.transaction_hashes)
        b.transactions.push_back(txs_.at(h));
    }
    return b;
  }

  std::optional<ChainTransaction> get_transaction(const std::string &hash) override {
    maybe_fail();
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = txs_.find(hash);
    if (it == txs_.end())
      return std::nullopt;
    return it->second;
  }

  std::optional<ChainReceipt> get_transaction_receipt(const std::string &hash) override {
    maybe_fail();
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = receipts_.find(hash);
    if (it == receipts_.end())
      return std::nullopt;
    return it->second;
  }

  std::string get_balance(const std::string &) override {
    maybe_fail();
    return "1000000000000000000";
  }

  std::string get_code(const std::string &address) override {
    maybe_fail();
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = codes_.find(address);
    return it == codes_.end() ? "0x" : it->second;
  }

  std::string call(const std::string &to, const std::string &data) override {
    maybe_fail();
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = calls_.find({to, data});
    if (it == calls_.end())
      throw RpcResponseError(3, "execution reverted");
    return it->second;
  }

  json send(const std::string &method, const json &params) override {
    maybe_fail();
    if (method != "debug_traceTransaction")
      throw RpcResponseError(-32601, "the method " + method + " does not exist/is not available");
    if (!trace_supported_)
      throw RpcResponseError(-32601, "method not found");

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = traces_.find(params.at(0).get<std::string>());
    if (it == traces_.end())
      throw RpcResponseError(-32000, "transaction not found");
    return it->second;
  }

  FeeData get_fee_data() override {
    maybe_fail();
    return FeeData{"1000000000"};
  }

  void reconnect() override { ++reconnects_; }

private:
  void maybe_fail() {
    ++calls_made_;
    int left = failures_left_.load();
    while (left > 0) {
      if (failures_left_.compare_exchange_weak(left, left - 1))
        throw RpcTransportError("connect: Connection refused");
    }
  }

  std::mutex mutex_;
  std::map<int64_t, ChainBlock> blocks_;
  std::map<std::string, ChainTransaction> txs_;
  std::map<std::string, ChainReceipt> receipts_;
  std::map<std::pair<std::string, std::string>, std::string> calls_;
  std::map<std::string, std::string> codes_;
  std::map<std::string, json> traces_;
  int64_t head_ = 0;

  std::atomic<bool> trace_supported_{true};
  std::atomic<int> failures_left_{0};
  std::atomic<int> block_failures_left_{0};
  std::atomic<int> reconnects_{0};
  std::atomic<int> calls_made_{0};
};

// ============================================================================
// FakeHttp
// ============================================================================
class FakeHttp : public HttpFetcher {
public:
  explicit FakeHttp(int delay_ms = 0) : delay_ms_(delay_ms) {}

  void set(const std::string &url, const std::string &body) {
    std::lock_guard<std::mutex> lock(mutex_);
    bodies_[url] = body;
  }

  std::optional<std::string> get(const std::string &url) override {
    if (delay_ms_ > 0)
      std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms_));
    std::lock_guard<std::mutex> lock(mutex_);
    requested_.push_back(url);
    auto it = bodies_.find(url);
    if (it == bodies_.end())
      return std::nullopt;
    return it->second;
  }

  std::vector<std::string> requested() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requested_;
  }

private:
  int delay_ms_;
  mutable std::mutex mutex_;
  std::map<std::string, std::string> bodies_;
  std::vector<std::string> requested_;
};

// ERC20 Transfer 日志
inline ChainLog erc20_transfer(const std::string &token, const std::string &from, const std::string &to,
                               uint64_t value) {
  ChainLog log;
  log.address = token;
  log.topics = {"0xddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef", topic_of_address(from),
                topic_of_address(to)};
  log.data = "0x" + word_of(value);
  return log;
}

// ERC721 Transfer 日志
inline ChainLog erc721_transfer(const std::string &token, const std::string &from, const std::string &to,
                                uint64_t token_id) {
  ChainLog log;
  log.address = token;
  log.topics = {"0xddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef", topic_of_address(from),
                topic_of_address(to), "0x" + word_of(token_id)};
  log.data = "0x";
  return log;
}

} // namespace indexer::test
