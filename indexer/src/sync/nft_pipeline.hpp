#pragma once

// ============================================================================
// NftMetadataPipeline - 后台单线程消费 NFT 元数据队列
// 入队不阻塞; 每项之间固定间隔; 全部失败时写占位记录
// ============================================================================

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <ctime>
#include <deque>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "../core/storage.hpp"
#include "../infra/abi.hpp"
#include "../infra/chain_client.hpp"
#include "../infra/http_client.hpp"
#include "../infra/uri.hpp"

namespace indexer {

struct NftWorkItem {
  std::string contract_address;
  std::string token_id;
  TokenType token_type = TokenType::ERC721;
};

class NftMetadataPipeline {
public:
  NftMetadataPipeline(Storage &storage, ChainClient &chain, HttpFetcher &http, std::vector<std::string> gateways,
                      int delay_ms, bool enabled = true)
      : storage_(storage), chain_(chain), http_(http), gateways_(std::move(gateways)), delay_ms_(delay_ms),
        enabled_(enabled) {}

  ~NftMetadataPipeline() { stop(); }

  NftMetadataPipeline(const NftMetadataPipeline &) = delete;
  NftMetadataPipeline &operator=(const NftMetadataPipeline &) = delete;

  void start() {
    if (!enabled_)
      return;
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true))
      return;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      stopping_ = false;
    }
    consumer_ = std::thread([this]() { run(); });
  }

  // 处理完当前项后退出, 队列中剩余项丢弃
  void stop() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      stopping_ = true;
    }
    cv_.notify_all();
    if (consumer_.joinable())
      consumer_.join();
    running_ = false;

    std::lock_guard<std::mutex> lock(mutex_);
    if (!queue_.empty()) {
      std::cout << "[Nft] 停止, 丢弃 " << queue_.size() << " 个待处理项" << std::endl;
      queue_.clear();
    }
  }

  void enqueue(NftWorkItem item) {
    if (!enabled_)
      return;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      queue_.push_back(std::move(item));
    }
    cv_.notify_one();
  }

  size_t pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
  }

  // 队列清空且没有正在处理的项
  bool wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this] { return queue_.empty() && !busy_; });
  }

  void process(const NftWorkItem &item) {
    auto existing = storage_.get_nft_token(item.contract_address, item.token_id);
    if (existing && existing->name)
      return;

    NftToken nft;
    nft.contract_address = item.contract_address;
    nft.token_id = item.token_id;
    nft.token_type = item.token_type;
    nft.last_updated = std::time(nullptr);

    try {
      resolve(item, nft);
      std::cout << "[Nft] " << item.contract_address << "#" << item.token_id
                << (nft.name ? " -> " + *nft.name : std::string(" (无元数据)")) << std::endl;
    } catch (const std::exception &e) {
      std::cerr << "[Nft] " << item.contract_address << "#" << item.token_id << " 失败, 写入占位: " << e.what()
                << std::endl;
      nft = NftToken{};
      nft.contract_address = item.contract_address;
      nft.token_id = item.token_id;
      nft.token_type = item.token_type;
      nft.last_updated = std::time(nullptr);
    }

    storage_.upsert_nft_token(nft);
  }

  // ipfs:// 依次尝试所有网关, data: 直接解码, http(s) 直接抓取
  std::optional<json> fetch_metadata(const std::string &metadata_uri) {
    if (uri::is_data(metadata_uri)) {
      auto payload = uri::decode_data_uri(metadata_uri);
      if (!payload)
        return std::nullopt;
      return parse_json(*payload);
    }

    if (uri::is_ipfs(metadata_uri)) {
      for (const auto &gateway : gateways_) {
        auto body = http_.get(uri::ipfs_to_gateway(metadata_uri, gateway));
        if (!body)
          continue;
        if (auto j = parse_json(*body))
          return j;
      }
      return std::nullopt;
    }

    if (uri::is_http(metadata_uri)) {
      auto body = http_.get(metadata_uri);
      if (!body)
        return std::nullopt;
      return parse_json(*body);
    }

    return std::nullopt;
  }

private:
  void run() {
    std::cout << "[Nft] 元数据消费线程启动" << std::endl;
    while (true) {
      NftWorkItem item;
      {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
        if (stopping_)
          break;
        item = std::move(queue_.front());
        queue_.pop_front();
        busy_ = true;
      }

      try {
        process(item);
      } catch (const std::exception &e) {
        std::cerr << "[Nft] 写入 " << item.contract_address << "#" << item.token_id << " 失败: " << e.what()
                  << std::endl;
      }

      {
        std::unique_lock<std::mutex> lock(mutex_);
        busy_ = false;
        idle_cv_.notify_all();
        cv_.wait_for(lock, std::chrono::milliseconds(delay_ms_), [this] { return stopping_; });
      }
    }
    std::cout << "[Nft] 元数据消费线程退出" << std::endl;
  }

  void resolve(const NftWorkItem &item, NftToken &nft) {
    auto id = abi::parse_uint256_dec(item.token_id);
    if (!id)
      return;

    std::optional<std::string> metadata_uri;
    if (item.token_type == TokenType::ERC721) {
      if (auto ret = try_call(item.contract_address, abi::encode_call_uint(abi::selectors::TOKEN_URI, *id)))
        metadata_uri = abi::decode_string(*ret);
      if (auto ret = try_call(item.contract_address, abi::encode_call_uint(abi::selectors::OWNER_OF, *id)))
        nft.owner = abi::decode_address(*ret);
    } else if (item.token_type == TokenType::ERC1155) {
      if (auto ret = try_call(item.contract_address, abi::encode_call_uint(abi::selectors::URI, *id))) {
        if (auto raw = abi::decode_string(*ret))
          metadata_uri = uri::substitute_id(*raw, item.token_id);
      }
    }
    nft.metadata_uri = metadata_uri;
    if (!metadata_uri)
      return;

    auto metadata = fetch_metadata(*metadata_uri);
    if (!metadata || !metadata->is_object())
      return;

    nft.name = string_field(*metadata, "name");
    nft.description = string_field(*metadata, "description");
    nft.image = string_field(*metadata, "image");
    if (nft.image && !gateways_.empty())
      nft.image_gateway = uri::image_gateway_url(*nft.image, gateways_.front());
    if (metadata->contains("attributes") && !(*metadata)["attributes"].is_null())
      nft.attributes = (*metadata)["attributes"].dump();
  }

  std::optional<std::string> try_call(const std::string &to, const std::string &data) {
    try {
      return chain_.call(to, data);
    } catch (const RpcResponseError &) {
      return std::nullopt;
    }
  }

  static std::optional<json> parse_json(const std::string &body) {
    auto j = json::parse(body, nullptr, false);
    if (j.is_discarded())
      return std::nullopt;
    return j;
  }

  static std::optional<std::string> string_field(const json &j, const char *key) {
    if (!j.contains(key) || !j[key].is_string())
      return std::nullopt;
    auto s = j[key].get<std::string>();
    if (s.empty())
      return std::nullopt;
    return s;
  }

  Storage &storage_;
  ChainClient &chain_;
  HttpFetcher &http_;
  std::vector<std::string> gateways_;
  int delay_ms_;
  bool enabled_;

  std::atomic<bool> running_{false};
  std::thread consumer_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::condition_variable idle_cv_;
  std::deque<NftWorkItem> queue_;
  bool stopping_ = false;
  bool busy_ = false;
};

} // namespace indexer
