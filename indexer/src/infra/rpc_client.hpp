#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <type_traits>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>

#include "abi.hpp"
#include "chain_client.hpp"

namespace indexer {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

// ============================================================================
// RpcClient - 基于 Beast 的 JSON-RPC over HTTP(S)
// 每次请求新建连接, 所有阶段都有超时; 可被多个线程同时调用
// ============================================================================
class RpcClient : public ChainClient {
public:
  RpcClient(const std::string &url, const std::string &api_key = "", int timeout_seconds = 30)
      : api_key_(api_key), timeout_(std::chrono::seconds(timeout_seconds)) {
    parse_url(url);
    ssl_ctx_ = make_ssl_context();
  }

  int64_t get_block_number() override {
    json result = rpc_call("eth_blockNumber", json::array());
    auto hex = expect_string(result, "eth_blockNumber");
    if (!rpc_decode::is_small_quantity(hex)) {
      throw RpcResponseError("eth_blockNumber returned " + hex);
    }
    return abi::hex_to_int64(hex);
  }

  std::optional<ChainBlock> get_block(int64_t number, bool include_txs) override {
    json result = rpc_call("eth_getBlockByNumber", json::array({abi::to_hex(number), include_txs}));
    if (result.is_null())
      return std::nullopt;
    return rpc_decode::block(result);
  }

  std::optional<ChainTransaction> get_transaction(const std::string &hash) override {
    json result = rpc_call("eth_getTransactionByHash", json::array({hash}));
    if (result.is_null())
      return std::nullopt;
    return rpc_decode::transaction(result);
  }

  std::optional<ChainReceipt> get_transaction_receipt(const std::string &hash) override {
    json result = rpc_call("eth_getTransactionReceipt", json::array({hash}));
    if (result.is_null())
      return std::nullopt;
    return rpc_decode::receipt(result);
  }

  std::string get_balance(const std::string &address) override {
    json result = rpc_call("eth_getBalance", json::array({address, "latest"}));
    auto decimal = abi::hex_to_decimal(expect_string(result, "eth_getBalance"));
    if (!decimal) {
      throw RpcResponseError("eth_getBalance returned a non-hex quantity");
    }
    return *decimal;
  }

  std::string get_code(const std::string &address) override {
    json result = rpc_call("eth_getCode", json::array({address, "latest"}));
    return expect_string(result, "eth_getCode");
  }

  std::string call(const std::string &to, const std::string &data) override {
    json tx = {{"to", to}, {"data", data}};
    json result = rpc_call("eth_call", json::array({tx, "latest"}));
    return expect_string(result, "eth_call");
  }

  json send(const std::string &method, const json &params) override {
    return rpc_call(method, params);
  }

  FeeData get_fee_data() override {
    json result = rpc_call("eth_gasPrice", json::array());
    FeeData fee;
    if (result.is_string())
      fee.gas_price = abi::hex_to_decimal(result.get<std::string>());
    return fee;
  }

  void reconnect() override {
    auto fresh = make_ssl_context();
    std::lock_guard<std::mutex> lock(ssl_mutex_);
    ssl_ctx_ = std::move(fresh);
  }

private:
  json rpc_call(const std::string &method, const json &params) {
    json request = {
        {"jsonrpc", "2.0"},
        {"id", ++request_id_},
        {"method", method},
        {"params", params}};

    std::string response_body = http_post(request.dump());

    json response;
    try {
      response = json::parse(response_body);
    } catch (const json::parse_error &e) {
      throw RpcResponseError("malformed " + method + " response: " + e.what());
    }

    if (!response.is_object()) {
      throw RpcResponseError("malformed " + method + " response: not an object");
    }
    if (response.contains("error") && !response["error"].is_null()) {
      const auto &err = response["error"];
      int64_t code = 0;
      std::string message = err.dump();
      if (err.is_object()) {
        if (err.contains("code") && err["code"].is_number_integer())
          code = err["code"].get<int64_t>();
        if (err.contains("message") && err["message"].is_string())
          message = err["message"].get<std::string>();
      }
      throw RpcResponseError(code, message);
    }
    if (!response.contains("result")) {
      throw RpcResponseError("malformed " + method + " response: missing result");
    }
    return response["result"];
  }

  static std::string expect_string(const json &result, const char *method) {
    if (!result.is_string()) {
      throw RpcResponseError(std::string(method) + " returned " + result.dump());
    }
    return result.get<std::string>();
  }

  void parse_url(const std::string &url) {
    std::string u = url;

    if (u.starts_with("https://")) {
      use_ssl_ = true;
      u = u.substr(8);
    } else if (u.starts_with("http://")) {
      use_ssl_ = false;
      u = u.substr(7);
    } else {
      throw std::invalid_argument("RPC URL must start with http:// or https://");
    }

    auto slash_pos = u.find('/');
    if (slash_pos != std::string::npos) {
      target_ = u.substr(slash_pos);
      u = u.substr(0, slash_pos);
    } else {
      target_ = "/";
    }

    auto colon_pos = u.find(':');
    if (colon_pos != std::string::npos) {
      host_ = u.substr(0, colon_pos);
      port_ = u.substr(colon_pos + 1);
    } else {
      host_ = u;
      port_ = use_ssl_ ? "443" : "80";
    }
  }

  static std::shared_ptr<ssl::context> make_ssl_context() {
    auto ctx = std::make_shared<ssl::context>(ssl::context::tls_client);
    ctx->set_default_verify_paths();
    ctx->set_verify_mode(ssl::verify_peer);
    return ctx;
  }

  std::string http_post(const std::string &body) {
    asio::io_context ioc;

    http::request<http::string_body> req{http::verb::post, target_, 11};
    req.set(http::field::host, host_);
    req.set(http::field::content_type, "application/json");
    req.set(http::field::user_agent, "ChainIndexer/1.0");
    if (!api_key_.empty()) {
      req.set(http::field::authorization, "Bearer " + api_key_);
    }
    req.body() = body;
    req.prepare_payload();

    tcp::resolver::results_type endpoints;
    try {
      tcp::resolver resolver(ioc);
      endpoints = resolver.resolve(host_, port_);
    } catch (const boost::system::system_error &e) {
      throw RpcTransportError("RPC resolve " + host_ + " failed: " + e.code().message());
    }

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(256 * 1024 * 1024);

    if (use_ssl_) {
      std::shared_ptr<ssl::context> ctx;
      {
        std::lock_guard<std::mutex> lock(ssl_mutex_);
        ctx = ssl_ctx_;
      }
      beast::ssl_stream<beast::tcp_stream> stream(ioc, *ctx);
      if (!SSL_set_tlsext_host_name(stream.native_handle(), host_.c_str())) {
        throw RpcTransportError("RPC TLS SNI setup failed for " + host_);
      }
      exchange(ioc, stream, endpoints, req, buffer, parser);
      beast::error_code ec;
      beast::get_lowest_layer(stream).socket().shutdown(tcp::socket::shutdown_both, ec);
    } else {
      beast::tcp_stream stream(ioc);
      exchange(ioc, stream, endpoints, req, buffer, parser);
      beast::error_code ec;
      stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    }

    auto status = parser.get().result_int();
    if (status >= 500 || status == 429) {
      throw RpcTransportError("RPC endpoint unavailable: HTTP " + std::to_string(status));
    }
    if (status != 200) {
      throw RpcResponseError("RPC HTTP status " + std::to_string(status));
    }

    return parser.get().body();
  }

  // connect -> (handshake) -> write -> read, 每一步单独计时
  template <typename Stream>
  void exchange(asio::io_context &ioc, Stream &stream, const tcp::resolver::results_type &endpoints,
                http::request<http::string_body> &req, beast::flat_buffer &buffer,
                http::response_parser<http::string_body> &parser) {
    constexpr bool is_tls = std::is_same_v<Stream, beast::ssl_stream<beast::tcp_stream>>;
    auto &layer = beast::get_lowest_layer(stream);
    beast::error_code ec;
    const char *stage = "connect";

    auto do_read = [&]() {
      stage = "read";
      layer.expires_after(timeout_);
      http::async_read(stream, buffer, parser, [&](beast::error_code e, std::size_t) {
        if (e)
          ec = e;
      });
    };

    auto do_write = [&]() {
      stage = "write";
      layer.expires_after(timeout_);
      http::async_write(stream, req, [&](beast::error_code e, std::size_t) {
        if (e) {
          ec = e;
          return;
        }
        do_read();
      });
    };

    layer.expires_after(timeout_);
    layer.async_connect(endpoints, [&](beast::error_code e, const tcp::endpoint &) {
      if (e) {
        ec = e;
        return;
      }
      if constexpr (is_tls) {
        stage = "handshake";
        layer.expires_after(timeout_);
        stream.async_handshake(ssl::stream_base::client, [&](beast::error_code he) {
          if (he) {
            ec = he;
            return;
          }
          do_write();
        });
      } else {
        do_write();
      }
    });

    ioc.run();

    if (ec) {
      throw RpcTransportError(std::string("RPC ") + stage + " " + host_ + ":" + port_ +
                              " failed: " + ec.message());
    }
  }

  std::string host_;
  std::string port_;
  std::string target_;
  std::string api_key_;
  bool use_ssl_ = false;
  std::chrono::steady_clock::duration timeout_;
  std::atomic<int64_t> request_id_{0};

  std::mutex ssl_mutex_;
  std::shared_ptr<ssl::context> ssl_ctx_;
};

} // namespace indexer
