#pragma once

#include <cstdint>
#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace indexer {

using json = nlohmann::json;

struct Config {
  std::string rpc_url;
  std::string rpc_api_key;
  std::string db_path;

  // 自适应批量
  int min_batch_size = 5;
  int max_batch_size = 30;
  int batch_size_step = 5;
  int parallel_blocks = 5;

  // reorg / 启动回看
  int reorg_depth = 12;
  int64_t start_lookback = 100;

  // 轮询与重试 (毫秒)
  int poll_interval_ms = 3000;
  int error_retry_delay_ms = 10000;
  int max_retry_delay_ms = 60000;
  int failures_before_health_probe = 5;

  bool enable_tracing = true;
  bool enable_nft_metadata = true;
  int nft_metadata_delay_ms = 100;

  int http_timeout_seconds = 10;
  int rpc_timeout_seconds = 30;

  std::vector<std::string> ipfs_gateways = {
      "https://ipfs.io/ipfs/",
      "https://gateway.pinata.cloud/ipfs/",
      "https://cloudflare-ipfs.com/ipfs/"};

  static Config load(const std::string &path) {
    std::ifstream f(path);
    if (!f.is_open()) {
      throw std::runtime_error("cannot open config file: " + path);
    }

    json j;
    try {
      f >> j;
    } catch (const json::parse_error &e) {
      throw std::runtime_error("invalid config file " + path + ": " + e.what());
    }
    return from_json(j);
  }

  static Config from_json(const json &j) {
    auto require = [&](const char *key) -> const json & {
      if (!j.contains(key)) {
        throw std::runtime_error(std::string("config missing required field: ") + key);
      }
      return j[key];
    };

    Config config;
    config.rpc_url = require("rpc_url").get<std::string>();
    config.db_path = require("db_path").get<std::string>();
    config.rpc_api_key = j.value("rpc_api_key", config.rpc_api_key);

    config.min_batch_size = j.value("min_batch_size", config.min_batch_size);
    config.max_batch_size = j.value("max_batch_size", config.max_batch_size);
    config.batch_size_step = j.value("batch_size_step", config.batch_size_step);
    config.parallel_blocks = j.value("parallel_blocks", config.parallel_blocks);
    config.reorg_depth = j.value("reorg_depth", config.reorg_depth);
    config.start_lookback = j.value("start_lookback", config.start_lookback);
    config.poll_interval_ms = j.value("poll_interval_ms", config.poll_interval_ms);
    config.error_retry_delay_ms = j.value("error_retry_delay_ms", config.error_retry_delay_ms);
    config.max_retry_delay_ms = j.value("max_retry_delay_ms", config.max_retry_delay_ms);
    config.failures_before_health_probe =
        j.value("failures_before_health_probe", config.failures_before_health_probe);
    config.enable_tracing = j.value("enable_tracing", config.enable_tracing);
    config.enable_nft_metadata = j.value("enable_nft_metadata", config.enable_nft_metadata);
    config.nft_metadata_delay_ms = j.value("nft_metadata_delay_ms", config.nft_metadata_delay_ms);
    config.http_timeout_seconds = j.value("http_timeout_seconds", config.http_timeout_seconds);
    config.rpc_timeout_seconds = j.value("rpc_timeout_seconds", config.rpc_timeout_seconds);

    if (j.contains("ipfs_gateways")) {
      config.ipfs_gateways.clear();
      for (const auto &g : j["ipfs_gateways"]) {
        config.ipfs_gateways.push_back(g.get<std::string>());
      }
    }

    config.validate();
    return config;
  }

  void validate() const {
    if (!rpc_url.starts_with("http://") && !rpc_url.starts_with("https://")) {
      throw std::runtime_error("rpc_url must start with http:// or https://");
    }
    if (min_batch_size < 1 || max_batch_size < min_batch_size) {
      throw std::runtime_error("require 1 <= min_batch_size <= max_batch_size");
    }
    if (parallel_blocks < 1 || batch_size_step < 1 || reorg_depth < 0) {
      throw std::runtime_error("parallel_blocks and batch_size_step must be >= 1, reorg_depth >= 0");
    }
    if (ipfs_gateways.empty()) {
      throw std::runtime_error("ipfs_gateways must not be empty");
    }
  }
};

} // namespace indexer
