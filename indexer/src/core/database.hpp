#pragma once

#include <ctime>
#include <duckdb.hpp>
#include <iostream>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <type_traits>
#include <vector>

#include "storage.hpp"

namespace indexer {

using json = nlohmann::json;

// ============================================================================
// Database - DuckDB 实现的 Storage
// 读写各一个连接, 各自一把锁; 所有失败抛 DatabaseError
// ============================================================================
class Database : public Storage {
public:
  explicit Database(const std::string &path) : db_path_(path) {
    try {
      db_ = std::make_unique<duckdb::DuckDB>(path);
      read_conn_ = std::make_unique<duckdb::Connection>(*db_);
      write_conn_ = std::make_unique<duckdb::Connection>(*db_);
    } catch (const std::exception &e) {
      throw DatabaseError("cannot open database " + path + ": " + e.what());
    }
  }

  Database(const Database &) = delete;
  Database &operator=(const Database &) = delete;

  void init_schema() {
    execute(R"(
      CREATE TABLE IF NOT EXISTS blocks (
        number BIGINT PRIMARY KEY,
        hash TEXT NOT NULL,
        parent_hash TEXT NOT NULL,
        timestamp BIGINT NOT NULL,
        miner TEXT NOT NULL,
        gas_used BIGINT NOT NULL,
        gas_limit BIGINT NOT NULL,
        base_fee_per_gas TEXT,
        transaction_count INTEGER NOT NULL,
        size BIGINT,
        extra_data TEXT,
        nonce TEXT
      )
    )");

    // 二级索引列 (block_number/from/to) 不参与 upsert 更新
    execute(R"(
      CREATE TABLE IF NOT EXISTS transactions (
        hash TEXT PRIMARY KEY,
        block_number BIGINT NOT NULL,
        block_hash TEXT NOT NULL,
        transaction_index INTEGER NOT NULL,
        from_address TEXT NOT NULL,
        to_address TEXT,
        value TEXT NOT NULL,
        gas BIGINT NOT NULL,
        gas_price TEXT,
        max_fee_per_gas TEXT,
        max_priority_fee_per_gas TEXT,
        input TEXT,
        nonce BIGINT NOT NULL,
        type INTEGER NOT NULL,
        status BOOLEAN,
        gas_used BIGINT,
        effective_gas_price TEXT,
        cumulative_gas_used BIGINT,
        contract_address TEXT,
        timestamp BIGINT NOT NULL,
        method_id TEXT,
        method_name TEXT
      )
    )");

    execute(R"(
      CREATE TABLE IF NOT EXISTS transaction_logs (
        transaction_hash TEXT NOT NULL,
        log_index INTEGER NOT NULL,
        address TEXT NOT NULL,
        topics TEXT NOT NULL,
        data TEXT NOT NULL,
        block_number BIGINT NOT NULL,
        block_hash TEXT NOT NULL,
        removed BOOLEAN NOT NULL,
        topic0 TEXT,
        PRIMARY KEY (transaction_hash, log_index)
      )
    )");

    // 只插入不更新
    execute(R"(
      CREATE TABLE IF NOT EXISTS token_transfers (
        transaction_hash TEXT NOT NULL,
        log_index INTEGER NOT NULL,
        batch_index INTEGER NOT NULL,
        block_number BIGINT NOT NULL,
        timestamp BIGINT NOT NULL,
        token_address TEXT NOT NULL,
        from_address TEXT NOT NULL,
        to_address TEXT NOT NULL,
        value TEXT,
        token_id TEXT,
        token_type TEXT NOT NULL,
        PRIMARY KEY (transaction_hash, log_index, batch_index)
      )
    )");

    execute(R"(
      CREATE TABLE IF NOT EXISTS tokens (
        address TEXT PRIMARY KEY,
        name TEXT,
        symbol TEXT,
        decimals INTEGER,
        total_supply TEXT,
        token_type TEXT NOT NULL,
        holder_count BIGINT NOT NULL,
        transfer_count BIGINT NOT NULL
      )
    )");

    // ERC20 的 token_id 存 ''
    execute(R"(
      CREATE TABLE IF NOT EXISTS token_holders (
        token_address TEXT NOT NULL,
        holder_address TEXT NOT NULL,
        token_id TEXT NOT NULL,
        balance TEXT NOT NULL,
        token_type TEXT NOT NULL,
        last_updated BIGINT NOT NULL,
        PRIMARY KEY (token_address, holder_address, token_id)
      )
    )");

    execute(R"(
      CREATE TABLE IF NOT EXISTS nft_tokens (
        contract_address TEXT NOT NULL,
        token_id TEXT NOT NULL,
        owner TEXT,
        name TEXT,
        description TEXT,
        image TEXT,
        image_gateway TEXT,
        metadata_uri TEXT,
        attributes TEXT,
        token_type TEXT NOT NULL,
        last_updated BIGINT NOT NULL,
        PRIMARY KEY (contract_address, token_id)
      )
    )");

    execute(R"(
      CREATE TABLE IF NOT EXISTS internal_transactions (
        transaction_hash TEXT NOT NULL,
        trace_address TEXT NOT NULL,
        block_number BIGINT NOT NULL,
        type TEXT NOT NULL,
        from_address TEXT,
        to_address TEXT,
        value TEXT,
        gas BIGINT,
        gas_used BIGINT,
        input TEXT,
        output TEXT,
        error TEXT,
        call_type TEXT,
        timestamp BIGINT NOT NULL,
        PRIMARY KEY (transaction_hash, trace_address)
      )
    )");

    execute(R"(
      CREATE TABLE IF NOT EXISTS addresses (
        address TEXT PRIMARY KEY,
        balance TEXT NOT NULL,
        transaction_count BIGINT NOT NULL,
        sent_count BIGINT NOT NULL,
        received_count BIGINT NOT NULL,
        is_contract BOOLEAN NOT NULL,
        contract_code TEXT,
        first_seen BIGINT NOT NULL,
        last_seen BIGINT NOT NULL
      )
    )");

    execute(R"(
      CREATE TABLE IF NOT EXISTS network_stats (
        id INTEGER PRIMARY KEY,
        latest_block BIGINT NOT NULL,
        total_transactions BIGINT NOT NULL,
        total_addresses BIGINT NOT NULL,
        total_token_transfers BIGINT NOT NULL,
        avg_block_time TEXT NOT NULL,
        avg_gas_price TEXT NOT NULL,
        last_updated BIGINT NOT NULL
      )
    )");

    execute(R"(
      CREATE TABLE IF NOT EXISTS daily_stats (
        day_start BIGINT PRIMARY KEY,
        block_count BIGINT NOT NULL,
        transaction_count BIGINT NOT NULL,
        gas_used TEXT NOT NULL
      )
    )");

    execute(R"(
      CREATE TABLE IF NOT EXISTS indexer_state (
        id TEXT PRIMARY KEY,
        last_indexed_block BIGINT NOT NULL,
        is_running BOOLEAN NOT NULL,
        last_error TEXT,
        last_updated BIGINT NOT NULL
      )
    )");

    execute("CREATE INDEX IF NOT EXISTS idx_tx_block ON transactions(block_number)");
    execute("CREATE INDEX IF NOT EXISTS idx_tx_from ON transactions(from_address)");
    execute("CREATE INDEX IF NOT EXISTS idx_tx_to ON transactions(to_address)");
    execute("CREATE INDEX IF NOT EXISTS idx_transfer_token ON token_transfers(token_address)");
    execute("CREATE INDEX IF NOT EXISTS idx_transfer_block ON token_transfers(block_number)");
  }

  // ==========================================================================
  // 区块
  // ==========================================================================

  void upsert_block(const Block &b) override {
    execute("INSERT OR REPLACE INTO blocks VALUES (" +
            std::to_string(b.number) + ", " + sql_str(b.hash) + ", " + sql_str(b.parent_hash) + ", " +
            std::to_string(b.timestamp) + ", " + sql_str(b.miner) + ", " + std::to_string(b.gas_used) + ", " +
            std::to_string(b.gas_limit) + ", " + sql_opt(b.base_fee_per_gas) + ", " +
            std::to_string(b.transaction_count) + ", " + sql_opt(b.size) + ", " + sql_opt(b.extra_data) + ", " +
            sql_opt(b.nonce) + ")");
  }

  std::optional<Block> get_block(int64_t number) override {
    auto r = query(BLOCK_COLUMNS + " WHERE number = " + std::to_string(number));
    if (r->RowCount() == 0)
      return std::nullopt;
    return read_block(*r, 0);
  }

  std::optional<int64_t> get_max_block_number() override {
    auto r = query("SELECT MAX(number) FROM blocks");
    return opt_i64(*r, 0, 0);
  }

  std::vector<Block> get_latest_blocks(int limit) override {
    auto r = query(BLOCK_COLUMNS + " ORDER BY number DESC LIMIT " + std::to_string(limit));
    std::vector<Block> out;
    for (size_t row = 0; row < r->RowCount(); ++row)
      out.push_back(read_block(*r, row));
    return out;
  }

  // ==========================================================================
  // 交易 / 日志
  // ==========================================================================

  void upsert_transaction(const Transaction &tx) override {
    execute("INSERT INTO transactions VALUES (" +
            sql_str(tx.hash) + ", " + std::to_string(tx.block_number) + ", " + sql_str(tx.block_hash) + ", " +
            std::to_string(tx.transaction_index) + ", " + sql_str(tx.from) + ", " + sql_opt(tx.to) + ", " +
            sql_str(tx.value) + ", " + std::to_string(tx.gas) + ", " + sql_opt(tx.gas_price) + ", " +
            sql_opt(tx.max_fee_per_gas) + ", " + sql_opt(tx.max_priority_fee_per_gas) + ", " + sql_opt(tx.input) + ", " +
            std::to_string(tx.nonce) + ", " + std::to_string(tx.type) + ", " + sql_opt(tx.status) + ", " +
            sql_opt(tx.gas_used) + ", " + sql_opt(tx.effective_gas_price) + ", " + sql_opt(tx.cumulative_gas_used) + ", " +
            sql_opt(tx.contract_address) + ", " + std::to_string(tx.timestamp) + ", " + sql_opt(tx.method_id) + ", " +
            sql_opt(tx.method_name) + ") "
            "ON CONFLICT (hash) DO UPDATE SET "
            "block_hash = excluded.block_hash, transaction_index = excluded.transaction_index, "
            "value = excluded.value, gas = excluded.gas, gas_price = excluded.gas_price, "
            "max_fee_per_gas = excluded.max_fee_per_gas, max_priority_fee_per_gas = excluded.max_priority_fee_per_gas, "
            "input = excluded.input, nonce = excluded.nonce, type = excluded.type, status = excluded.status, "
            "gas_used = excluded.gas_used, effective_gas_price = excluded.effective_gas_price, "
            "cumulative_gas_used = excluded.cumulative_gas_used, contract_address = excluded.contract_address, "
            "timestamp = excluded.timestamp, method_id = excluded.method_id, method_name = excluded.method_name");
  }

  std::optional<Transaction> get_transaction(const std::string &hash) override {
    auto r = query(
        "SELECT hash, block_number, block_hash, transaction_index, from_address, to_address, value, gas, "
        "gas_price, max_fee_per_gas, max_priority_fee_per_gas, input, nonce, type, status, gas_used, "
        "effective_gas_price, cumulative_gas_used, contract_address, timestamp, method_id, method_name "
        "FROM transactions WHERE hash = " + sql_str(hash));
    if (r->RowCount() == 0)
      return std::nullopt;

    Transaction tx;
    tx.hash = str(*r, 0, 0);
    tx.block_number = i64(*r, 1, 0);
    tx.block_hash = str(*r, 2, 0);
    tx.transaction_index = static_cast<int32_t>(i64(*r, 3, 0));
    tx.from = str(*r, 4, 0);
    tx.to = opt_str(*r, 5, 0);
    tx.value = str(*r, 6, 0);
    tx.gas = i64(*r, 7, 0);
    tx.gas_price = opt_str(*r, 8, 0);
    tx.max_fee_per_gas = opt_str(*r, 9, 0);
    tx.max_priority_fee_per_gas = opt_str(*r, 10, 0);
    tx.input = opt_str(*r, 11, 0);
    tx.nonce = i64(*r, 12, 0);
    tx.type = static_cast<int32_t>(i64(*r, 13, 0));
    tx.status = opt_bool(*r, 14, 0);
    tx.gas_used = opt_i64(*r, 15, 0);
    tx.effective_gas_price = opt_str(*r, 16, 0);
    tx.cumulative_gas_used = opt_i64(*r, 17, 0);
    tx.contract_address = opt_str(*r, 18, 0);
    tx.timestamp = i64(*r, 19, 0);
    tx.method_id = opt_str(*r, 20, 0);
    tx.method_name = opt_str(*r, 21, 0);
    return tx;
  }

  int64_t count_transactions() override { return query_single_int("SELECT COUNT(*) FROM transactions"); }

  void upsert_log(const TransactionLog &l) override {
    execute("INSERT OR REPLACE INTO transaction_logs VALUES (" +
            sql_str(l.transaction_hash) + ", " + std::to_string(l.log_index) + ", " + sql_str(l.address) + ", " +
            sql_str(json(l.topics).dump()) + ", " + sql_str(l.data) + ", " + std::to_string(l.block_number) + ", " +
            sql_str(l.block_hash) + ", " + sql_bool(l.removed) + ", " + sql_opt(l.topic0) + ")");
  }

  std::vector<TransactionLog> get_logs(const std::string &tx_hash) override {
    auto r = query(
        "SELECT transaction_hash, log_index, address, topics, data, block_number, block_hash, removed, topic0 "
        "FROM transaction_logs WHERE transaction_hash = " + sql_str(tx_hash) + " ORDER BY log_index");
    std::vector<TransactionLog> out;
    for (size_t row = 0; row < r->RowCount(); ++row) {
      TransactionLog l;
      l.transaction_hash = str(*r, 0, row);
      l.log_index = static_cast<int32_t>(i64(*r, 1, row));
      l.address = str(*r, 2, row);
      l.topics = json::parse(str(*r, 3, row)).get<std::vector<std::string>>();
      l.data = str(*r, 4, row);
      l.block_number = i64(*r, 5, row);
      l.block_hash = str(*r, 6, row);
      l.removed = opt_bool(*r, 7, row).value_or(false);
      l.topic0 = opt_str(*r, 8, row);
      out.push_back(std::move(l));
    }
    return out;
  }

  // ==========================================================================
  // 代币转账
  // ==========================================================================

  bool insert_token_transfer(const TokenTransfer &t) override {
    std::lock_guard<std::mutex> lock(write_mutex_);
    auto existing = count_locked(run_locked(
        "SELECT COUNT(*) FROM token_transfers WHERE transaction_hash = " + sql_str(t.transaction_hash) +
        " AND log_index = " + std::to_string(t.log_index) + " AND batch_index = " + std::to_string(t.batch_index)));
    if (existing > 0)
      return false;

    run_locked(
        "INSERT OR IGNORE INTO token_transfers VALUES (" +
        sql_str(t.transaction_hash) + ", " + std::to_string(t.log_index) + ", " + std::to_string(t.batch_index) + ", " +
        std::to_string(t.block_number) + ", " + std::to_string(t.timestamp) + ", " + sql_str(t.token_address) + ", " +
        sql_str(t.from) + ", " + sql_str(t.to) + ", " + sql_opt(t.value) + ", " + sql_opt(t.token_id) + ", " +
        sql_str(token_type_name(t.token_type)) + ")");
    return true;
  }

  int64_t count_token_transfers() override { return query_single_int("SELECT COUNT(*) FROM token_transfers"); }

  int64_t count_token_transfers_for(const std::string &token_address) override {
    return query_single_int("SELECT COUNT(*) FROM token_transfers WHERE token_address = " + sql_str(token_address));
  }

  std::vector<std::pair<std::string, TokenType>> get_unique_token_addresses() override {
    auto r = query("SELECT DISTINCT token_address, token_type FROM token_transfers ORDER BY token_address");
    std::vector<std::pair<std::string, TokenType>> out;
    for (size_t row = 0; row < r->RowCount(); ++row) {
      out.emplace_back(str(*r, 0, row), parse_token_type(str(*r, 1, row)).value_or(TokenType::ERC20));
    }
    return out;
  }

  // ==========================================================================
  // 代币
  // ==========================================================================

  std::optional<Token> get_token(const std::string &address) override {
    auto r = query(TOKEN_COLUMNS + " WHERE address = " + sql_str(address));
    if (r->RowCount() == 0)
      return std::nullopt;
    return read_token(*r, 0);
  }

  void upsert_token(const Token &t) override {
    execute("INSERT INTO tokens VALUES (" +
            sql_str(t.address) + ", " + sql_opt(t.name) + ", " + sql_opt(t.symbol) + ", " +
            sql_opt(t.decimals) + ", " + sql_opt(t.total_supply) + ", " + sql_str(token_type_name(t.token_type)) + ", " +
            std::to_string(t.holder_count) + ", " + std::to_string(t.transfer_count) + ") "
            "ON CONFLICT (address) DO UPDATE SET "
            "name = excluded.name, symbol = excluded.symbol, decimals = excluded.decimals, "
            "total_supply = excluded.total_supply, token_type = excluded.token_type");
  }

  void increment_token_transfer_count(const std::string &address) override {
    execute("UPDATE tokens SET transfer_count = transfer_count + 1 WHERE address = " + sql_str(address));
  }

  void set_token_transfer_count(const std::string &address, int64_t count) override {
    execute("UPDATE tokens SET transfer_count = " + std::to_string(count) + " WHERE address = " + sql_str(address));
  }

  std::vector<Token> get_tokens(int limit) override {
    auto r = query(TOKEN_COLUMNS + " ORDER BY transfer_count DESC, address LIMIT " + std::to_string(limit));
    std::vector<Token> out;
    for (size_t row = 0; row < r->RowCount(); ++row)
      out.push_back(read_token(*r, row));
    return out;
  }

  // ==========================================================================
  // 持有者
  // ==========================================================================

  void upsert_token_holder(const TokenHolder &h) override {
    execute("INSERT INTO token_holders VALUES (" +
            sql_str(h.token_address) + ", " + sql_str(h.holder_address) + ", " + sql_str(h.token_id.value_or("")) + ", " +
            sql_str(h.balance) + ", " + sql_str(token_type_name(h.token_type)) + ", " + std::to_string(h.last_updated) + ") "
            "ON CONFLICT (token_address, holder_address, token_id) DO UPDATE SET "
            "balance = excluded.balance, token_type = excluded.token_type, last_updated = excluded.last_updated");
  }

  std::optional<TokenHolder> get_token_holder(const std::string &token_address, const std::string &holder_address,
                                              const std::optional<std::string> &token_id) override {
    auto r = query(
        "SELECT token_address, holder_address, token_id, balance, token_type, last_updated FROM token_holders "
        "WHERE token_address = " + sql_str(token_address) + " AND holder_address = " + sql_str(holder_address) +
        " AND token_id = " + sql_str(token_id.value_or("")));
    if (r->RowCount() == 0)
      return std::nullopt;

    TokenHolder h;
    h.token_address = str(*r, 0, 0);
    h.holder_address = str(*r, 1, 0);
    auto id = str(*r, 2, 0);
    if (!id.empty())
      h.token_id = id;
    h.balance = str(*r, 3, 0);
    h.token_type = parse_token_type(str(*r, 4, 0)).value_or(TokenType::ERC20);
    h.last_updated = i64(*r, 5, 0);
    return h;
  }

  int64_t refresh_token_holder_count(const std::string &token_address) override {
    auto a = sql_str(token_address);
    std::lock_guard<std::mutex> lock(write_mutex_);
    run_locked("UPDATE tokens SET holder_count = (SELECT COUNT(DISTINCT holder_address) FROM token_holders "
               "WHERE token_address = " + a + " AND balance <> '0') WHERE address = " + a);
    return count_locked(run_locked("SELECT COUNT(DISTINCT holder_address) FROM token_holders WHERE token_address = " +
                                   a + " AND balance <> '0'"));
  }

  // ==========================================================================
  // NFT
  // ==========================================================================

  std::optional<NftToken> get_nft_token(const std::string &contract, const std::string &token_id) override {
    auto r = query(
        "SELECT contract_address, token_id, owner, name, description, image, image_gateway, metadata_uri, "
        "attributes, token_type, last_updated FROM nft_tokens WHERE contract_address = " + sql_str(contract) +
        " AND token_id = " + sql_str(token_id));
    if (r->RowCount() == 0)
      return std::nullopt;

    NftToken n;
    n.contract_address = str(*r, 0, 0);
    n.token_id = str(*r, 1, 0);
    n.owner = opt_str(*r, 2, 0);
    n.name = opt_str(*r, 3, 0);
    n.description = opt_str(*r, 4, 0);
    n.image = opt_str(*r, 5, 0);
    n.image_gateway = opt_str(*r, 6, 0);
    n.metadata_uri = opt_str(*r, 7, 0);
    n.attributes = opt_str(*r, 8, 0);
    n.token_type = parse_token_type(str(*r, 9, 0)).value_or(TokenType::ERC721);
    n.last_updated = i64(*r, 10, 0);
    return n;
  }

  void upsert_nft_token(const NftToken &n) override {
    execute("INSERT OR REPLACE INTO nft_tokens VALUES (" +
            sql_str(n.contract_address) + ", " + sql_str(n.token_id) + ", " + sql_opt(n.owner) + ", " +
            sql_opt(n.name) + ", " + sql_opt(n.description) + ", " + sql_opt(n.image) + ", " +
            sql_opt(n.image_gateway) + ", " + sql_opt(n.metadata_uri) + ", " + sql_opt(n.attributes) + ", " +
            sql_str(token_type_name(n.token_type)) + ", " + std::to_string(n.last_updated) + ")");
  }

  // ==========================================================================
  // 内部交易
  // ==========================================================================

  void upsert_internal_transaction(const InternalTransaction &itx) override {
    execute("INSERT OR REPLACE INTO internal_transactions VALUES (" +
            sql_str(itx.transaction_hash) + ", " + sql_str(join_trace_address(itx.trace_address)) + ", " +
            std::to_string(itx.block_number) + ", " + sql_str(itx.type) + ", " + sql_opt(itx.from) + ", " +
            sql_opt(itx.to) + ", " + sql_opt(itx.value) + ", " + sql_opt(itx.gas) + ", " + sql_opt(itx.gas_used) + ", " +
            sql_opt(itx.input) + ", " + sql_opt(itx.output) + ", " + sql_opt(itx.error) + ", " +
            sql_opt(itx.call_type) + ", " + std::to_string(itx.timestamp) + ")");
  }

  std::vector<InternalTransaction> get_internal_transactions(const std::string &tx_hash) override {
    auto r = query(
        "SELECT transaction_hash, trace_address, block_number, type, from_address, to_address, value, gas, "
        "gas_used, input, output, error, call_type, timestamp FROM internal_transactions "
        "WHERE transaction_hash = " + sql_str(tx_hash) + " ORDER BY trace_address");
    std::vector<InternalTransaction> out;
    for (size_t row = 0; row < r->RowCount(); ++row) {
      InternalTransaction itx;
      itx.transaction_hash = str(*r, 0, row);
      itx.trace_address = split_trace_address(str(*r, 1, row));
      itx.block_number = i64(*r, 2, row);
      itx.type = str(*r, 3, row);
      itx.from = opt_str(*r, 4, row);
      itx.to = opt_str(*r, 5, row);
      itx.value = opt_str(*r, 6, row);
      itx.gas = opt_i64(*r, 7, row);
      itx.gas_used = opt_i64(*r, 8, row);
      itx.input = opt_str(*r, 9, row);
      itx.output = opt_str(*r, 10, row);
      itx.error = opt_str(*r, 11, row);
      itx.call_type = opt_str(*r, 12, row);
      itx.timestamp = i64(*r, 13, row);
      out.push_back(std::move(itx));
    }
    return out;
  }

  // ==========================================================================
  // 地址
  // ==========================================================================

  std::optional<Address> get_address(const std::string &address) override {
    auto r = query(
        "SELECT address, balance, transaction_count, sent_count, received_count, is_contract, contract_code, "
        "first_seen, last_seen FROM addresses WHERE address = " + sql_str(address));
    if (r->RowCount() == 0)
      return std::nullopt;

    Address a;
    a.address = str(*r, 0, 0);
    a.balance = str(*r, 1, 0);
    a.transaction_count = i64(*r, 2, 0);
    a.sent_count = i64(*r, 3, 0);
    a.received_count = i64(*r, 4, 0);
    a.is_contract = opt_bool(*r, 5, 0).value_or(false);
    a.contract_code = opt_str(*r, 6, 0);
    a.first_seen = i64(*r, 7, 0);
    a.last_seen = i64(*r, 8, 0);
    return a;
  }

  // first_seen 只在首次插入时写入
  void upsert_address(const Address &a) override {
    execute("INSERT INTO addresses VALUES (" +
            sql_str(a.address) + ", " + sql_str(a.balance) + ", " + std::to_string(a.transaction_count) + ", " +
            std::to_string(a.sent_count) + ", " + std::to_string(a.received_count) + ", " + sql_bool(a.is_contract) + ", " +
            sql_opt(a.contract_code) + ", " + std::to_string(a.first_seen) + ", " + std::to_string(a.last_seen) + ") "
            "ON CONFLICT (address) DO UPDATE SET "
            "balance = excluded.balance, transaction_count = excluded.transaction_count, "
            "sent_count = excluded.sent_count, received_count = excluded.received_count, "
            "is_contract = excluded.is_contract, contract_code = excluded.contract_code, "
            "last_seen = excluded.last_seen");
  }

  AddressTxCounts get_address_tx_counts(const std::string &address) override {
    auto a = sql_str(address);
    auto r = query(
        "SELECT CAST(COUNT(*) AS BIGINT), "
        "CAST(COUNT(*) FILTER (WHERE from_address = " + a + ") AS BIGINT), "
        "CAST(COUNT(*) FILTER (WHERE to_address = " + a + ") AS BIGINT) "
        "FROM transactions WHERE from_address = " + a + " OR to_address = " + a);
    AddressTxCounts counts;
    if (r->RowCount() > 0) {
      counts.total = i64(*r, 0, 0);
      counts.sent = i64(*r, 1, 0);
      counts.received = i64(*r, 2, 0);
    }
    return counts;
  }

  int64_t count_addresses() override { return query_single_int("SELECT COUNT(*) FROM addresses"); }

  // ==========================================================================
  // 统计
  // ==========================================================================

  void update_network_stats(const NetworkStats &s) override {
    execute("INSERT OR REPLACE INTO network_stats VALUES (1, " +
            std::to_string(s.latest_block) + ", " + std::to_string(s.total_transactions) + ", " +
            std::to_string(s.total_addresses) + ", " + std::to_string(s.total_token_transfers) + ", " +
            sql_str(s.avg_block_time) + ", " + sql_str(s.avg_gas_price) + ", " + std::to_string(s.last_updated) + ")");
  }

  std::optional<NetworkStats> get_network_stats() override {
    auto r = query(
        "SELECT latest_block, total_transactions, total_addresses, total_token_transfers, avg_block_time, "
        "avg_gas_price, last_updated FROM network_stats WHERE id = 1");
    if (r->RowCount() == 0)
      return std::nullopt;

    NetworkStats s;
    s.latest_block = i64(*r, 0, 0);
    s.total_transactions = i64(*r, 1, 0);
    s.total_addresses = i64(*r, 2, 0);
    s.total_token_transfers = i64(*r, 3, 0);
    s.avg_block_time = str(*r, 4, 0);
    s.avg_gas_price = str(*r, 5, 0);
    s.last_updated = i64(*r, 6, 0);
    return s;
  }

  // 按天整体重算, 重复写入结果不变
  void refresh_daily_stats(int64_t from_block, int64_t to_block) override {
    execute(
        "INSERT OR REPLACE INTO daily_stats "
        "SELECT timestamp - timestamp % 86400 AS day_start, "
        "CAST(COUNT(*) AS BIGINT), "
        "CAST(SUM(transaction_count) AS BIGINT), "
        "CAST(CAST(SUM(gas_used) AS HUGEINT) AS VARCHAR) "
        "FROM blocks WHERE timestamp - timestamp % 86400 IN ("
        "SELECT DISTINCT timestamp - timestamp % 86400 FROM blocks WHERE number BETWEEN " +
        std::to_string(from_block) + " AND " + std::to_string(to_block) + ") "
        "GROUP BY day_start");
  }

  std::optional<DailyStats> get_daily_stats(int64_t day_start) override {
    auto r = query("SELECT day_start, block_count, transaction_count, gas_used FROM daily_stats WHERE day_start = " +
                   std::to_string(day_start));
    if (r->RowCount() == 0)
      return std::nullopt;

    DailyStats d;
    d.day_start = i64(*r, 0, 0);
    d.block_count = i64(*r, 1, 0);
    d.transaction_count = i64(*r, 2, 0);
    d.gas_used = str(*r, 3, 0);
    return d;
  }

  // ==========================================================================
  // 同步状态
  // ==========================================================================

  std::optional<IndexerState> get_indexer_state() override {
    auto r = query("SELECT last_indexed_block, is_running, last_error, last_updated FROM indexer_state WHERE id = 'main'");
    if (r->RowCount() == 0)
      return std::nullopt;

    IndexerState s;
    s.last_indexed_block = i64(*r, 0, 0);
    s.is_running = opt_bool(*r, 1, 0).value_or(false);
    s.last_error = opt_str(*r, 2, 0);
    s.last_updated = i64(*r, 3, 0);
    return s;
  }

  void update_indexer_state(int64_t last_indexed_block, bool is_running,
                            const std::optional<std::string> &error) override {
    execute("INSERT OR REPLACE INTO indexer_state VALUES ('main', " + std::to_string(last_indexed_block) + ", " +
            sql_bool(is_running) + ", " + sql_opt(error) + ", " + std::to_string(std::time(nullptr)) + ")");
  }

  RollbackCounts delete_from_height(int64_t height) override {
    std::lock_guard<std::mutex> lock(write_mutex_);
    auto h = std::to_string(height);

    run_locked("BEGIN TRANSACTION");
    try {
      RollbackCounts counts;
      counts.transfers = count_locked(run_locked("DELETE FROM token_transfers WHERE block_number >= " + h));
      counts.logs = count_locked(run_locked("DELETE FROM transaction_logs WHERE block_number >= " + h));
      counts.internal_transactions =
          count_locked(run_locked("DELETE FROM internal_transactions WHERE block_number >= " + h));
      counts.transactions = count_locked(run_locked("DELETE FROM transactions WHERE block_number >= " + h));
      counts.blocks = count_locked(run_locked("DELETE FROM blocks WHERE number >= " + h));
      run_locked("COMMIT");
      return counts;
    } catch (const DatabaseError &) {
      auto rollback = write_conn_->Query("ROLLBACK");
      if (rollback->HasError()) {
        std::cerr << "[Database] rollback failed: " << rollback->GetError() << std::endl;
      }
      throw;
    }
  }

  const std::string &path() const { return db_path_; }

private:
  using Result = std::unique_ptr<duckdb::MaterializedQueryResult>;

  inline static const std::string BLOCK_COLUMNS =
      "SELECT number, hash, parent_hash, timestamp, miner, gas_used, gas_limit, base_fee_per_gas, "
      "transaction_count, size, extra_data, nonce FROM blocks";

  inline static const std::string TOKEN_COLUMNS =
      "SELECT address, name, symbol, decimals, total_supply, token_type, holder_count, transfer_count FROM tokens";

  void execute(const std::string &sql) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    run_locked(sql);
  }

  Result run_locked(const std::string &sql) {
    auto result = write_conn_->Query(sql);
    if (result->HasError()) {
      throw DatabaseError(result->GetError());
    }
    return result;
  }

  static int64_t count_locked(const Result &r) {
    if (r->RowCount() == 0 || r->ColumnCount() == 0)
      return 0;
    auto v = r->GetValue(0, 0);
    return v.IsNull() ? 0 : v.GetValue<int64_t>();
  }

  Result query(const std::string &sql) {
    std::lock_guard<std::mutex> lock(read_mutex_);
    auto result = read_conn_->Query(sql);
    if (result->HasError()) {
      throw DatabaseError(result->GetError());
    }
    return result;
  }

  int64_t query_single_int(const std::string &sql) {
    auto r = query(sql);
    return opt_i64(*r, 0, 0).value_or(0);
  }

  static Block read_block(duckdb::MaterializedQueryResult &r, size_t row) {
    Block b;
    b.number = i64(r, 0, row);
    b.hash = str(r, 1, row);
    b.parent_hash = str(r, 2, row);
    b.timestamp = i64(r, 3, row);
    b.miner = str(r, 4, row);
    b.gas_used = i64(r, 5, row);
    b.gas_limit = i64(r, 6, row);
    b.base_fee_per_gas = opt_str(r, 7, row);
    b.transaction_count = static_cast<int32_t>(i64(r, 8, row));
    b.size = opt_i64(r, 9, row);
    b.extra_data = opt_str(r, 10, row);
    b.nonce = opt_str(r, 11, row);
    return b;
  }

  static Token read_token(duckdb::MaterializedQueryResult &r, size_t row) {
    Token t;
    t.address = str(r, 0, row);
    t.name = opt_str(r, 1, row);
    t.symbol = opt_str(r, 2, row);
    if (auto d = opt_i64(r, 3, row))
      t.decimals = static_cast<int32_t>(*d);
    t.total_supply = opt_str(r, 4, row);
    t.token_type = parse_token_type(str(r, 5, row)).value_or(TokenType::ERC20);
    t.holder_count = i64(r, 6, row);
    t.transfer_count = i64(r, 7, row);
    return t;
  }

  static std::vector<int32_t> split_trace_address(const std::string &s) {
    std::vector<int32_t> out;
    size_t start = 0;
    while (start < s.size()) {
      auto comma = s.find(',', start);
      if (comma == std::string::npos)
        comma = s.size();
      out.push_back(std::stoi(s.substr(start, comma - start)));
      start = comma + 1;
    }
    return out;
  }

  // 取值
  static std::optional<std::string> opt_str(duckdb::MaterializedQueryResult &r, size_t col, size_t row) {
    auto v = r.GetValue(col, row);
    if (v.IsNull())
      return std::nullopt;
    return v.ToString();
  }

  static std::string str(duckdb::MaterializedQueryResult &r, size_t col, size_t row) {
    return opt_str(r, col, row).value_or("");
  }

  static std::optional<int64_t> opt_i64(duckdb::MaterializedQueryResult &r, size_t col, size_t row) {
    auto v = r.GetValue(col, row);
    if (v.IsNull())
      return std::nullopt;
    return v.GetValue<int64_t>();
  }

  static int64_t i64(duckdb::MaterializedQueryResult &r, size_t col, size_t row) {
    return opt_i64(r, col, row).value_or(0);
  }

  static std::optional<bool> opt_bool(duckdb::MaterializedQueryResult &r, size_t col, size_t row) {
    auto v = r.GetValue(col, row);
    if (v.IsNull())
      return std::nullopt;
    return v.GetValue<bool>();
  }

  // SQL 字面量
  static std::string sql_str(const std::string &s) {
    std::string out = "'";
    for (char c : s) {
      if (c == '\'')
        out += "''";
      else
        out += c;
    }
    out += "'";
    return out;
  }

  static std::string sql_bool(bool b) { return b ? "TRUE" : "FALSE"; }

  static std::string sql_opt(const std::optional<std::string> &s) { return s ? sql_str(*s) : "NULL"; }

  template <typename Int>
  static std::string sql_opt(const std::optional<Int> &v)
    requires std::is_integral_v<Int> && (!std::is_same_v<Int, bool>)
  {
    return v ? std::to_string(*v) : "NULL";
  }

  static std::string sql_opt(const std::optional<bool> &v) {
    if (!v)
      return "NULL";
    return sql_bool(*v);
  }

  std::string db_path_;
  // DuckDB
  std::unique_ptr<duckdb::DuckDB> db_;
  std::unique_ptr<duckdb::Connection> read_conn_;
  std::unique_ptr<duckdb::Connection> write_conn_;
  std::mutex read_mutex_;
  std::mutex write_mutex_;
};

} // namespace indexer
