#include <csignal>
#include <cstring>
#include <iostream>
#include <string>

#include <boost/asio.hpp>

#include "core/config.hpp"
#include "core/database.hpp"
#include "infra/http_client.hpp"
#include "infra/rpc_client.hpp"
#include "sync/sync_coordinator.hpp"

using namespace indexer;

void print_usage(const char *prog) {
  std::cout << "用法: " << prog << " --config <config.json> [--backfill-tokens] [--balances <address>]"
            << std::endl;
}

int main(int argc, char *argv[]) {
  std::string config_path = "config.json";
  bool backfill_tokens = false;
  std::string balances_of;

  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
      config_path = argv[++i];
    } else if (std::strcmp(argv[i], "--backfill-tokens") == 0) {
      backfill_tokens = true;
    } else if (std::strcmp(argv[i], "--balances") == 0 && i + 1 < argc) {
      balances_of = argv[++i];
    } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
      print_usage(argv[0]);
      return 0;
    }
  }

  std::cout << "========================================" << std::endl;
  std::cout << "    Chain Indexer" << std::endl;
  std::cout << "========================================" << std::endl;

  Config config;
  try {
    config = Config::load(config_path);
  } catch (const std::exception &e) {
    std::cerr << "[Main] 配置错误: " << e.what() << std::endl;
    return 1;
  }

  std::cout << "[Main] DB Path: " << config.db_path << std::endl;
  std::cout << "[Main] RPC Node: " << config.rpc_url << std::endl;
  std::cout << "[Main] Batch: " << config.min_batch_size << ".." << config.max_batch_size << " (+"
            << config.batch_size_step << "), parallel " << config.parallel_blocks << std::endl;
  std::cout << "[Main] Reorg Depth: " << config.reorg_depth << ", Lookback: " << config.start_lookback << std::endl;
  std::cout << "[Main] Tracing: " << (config.enable_tracing ? "on" : "off")
            << ", NFT Metadata: " << (config.enable_nft_metadata ? "on" : "off") << std::endl;

  try {
    Database db(config.db_path);
    db.init_schema();

    RpcClient rpc(config.rpc_url, config.rpc_api_key, config.rpc_timeout_seconds);
    CurlHttpClient http(config.http_timeout_seconds);
    SyncCoordinator sync(config, db, rpc, http);

    if (backfill_tokens) {
      auto result = sync.backfill_token_metadata();
      std::cout << "[Main] 补全结果: success=" << (result.success ? "true" : "false")
                << ", tokens=" << result.tokens_indexed << ", errors=" << result.errors << std::endl;
      return result.success ? 0 : 1;
    }

    if (!balances_of.empty()) {
      for (const auto &b : sync.get_token_balances(balances_of)) {
        std::cout << b.token_address << " " << b.symbol.value_or("?") << " " << b.formatted_balance << std::endl;
      }
      return 0;
    }

    boost::asio::io_context ioc;
    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code &ec, int) {
      if (ec)
        return;
      std::cout << "\n[Main] 正在关闭..." << std::endl;
      sync.stop();
    });

    sync.start();
    std::cout << "[Main] 服务已启动" << std::endl;
    ioc.run();

    std::cout << "[Main] 已退出, cursor=" << sync.current_block() << ", head=" << sync.target_block() << std::endl;
  } catch (const std::exception &e) {
    std::cerr << "[Main] 启动失败: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}
