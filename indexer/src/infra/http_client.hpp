#pragma once

#include <curl/curl.h>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

namespace indexer {

// 元数据抓取接口; 失败 (超时 / 非 2xx / 网络错误) 返回 nullopt
class HttpFetcher {
public:
  virtual ~HttpFetcher() = default;
  virtual std::optional<std::string> get(const std::string &url) = 0;
};

// libcurl 实现, 每次请求一个 easy handle, 可多线程调用
class CurlHttpClient : public HttpFetcher {
public:
  explicit CurlHttpClient(long timeout_seconds = 10) : timeout_seconds_(timeout_seconds) {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
      throw std::runtime_error("curl 初始化失败");
    }
  }

  ~CurlHttpClient() override { curl_global_cleanup(); }

  // 禁止拷贝
  CurlHttpClient(const CurlHttpClient &) = delete;
  CurlHttpClient &operator=(const CurlHttpClient &) = delete;

  std::optional<std::string> get(const std::string &url) override {
    CURL *curl = curl_easy_init();
    if (!curl) {
      std::cerr << "[Nft] curl_easy_init failed" << std::endl;
      return std::nullopt;
    }

    std::string response;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_seconds_);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);

    struct curl_slist *headers = nullptr;
    headers = curl_slist_append(headers, "Accept: application/json");
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

    CURLcode res = curl_easy_perform(curl);
    long status = 0;
    if (res == CURLE_OK) {
      curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
      std::cerr << "[Nft] GET " << url << " failed: " << curl_easy_strerror(res) << std::endl;
      return std::nullopt;
    }
    if (status < 200 || status >= 300) {
      std::cerr << "[Nft] GET " << url << " returned HTTP " << status << std::endl;
      return std::nullopt;
    }
    return response;
  }

private:
  static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp) {
    size_t total = size * nmemb;
    userp->append(static_cast<char *>(contents), total);
    return total;
  }

  long timeout_seconds_;
};

} // namespace indexer
