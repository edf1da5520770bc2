#pragma once

// ============================================================================
// NFT 元数据 URI 工具: ipfs 网关改写 / data URI 解码 / ERC1155 {id} 替换
// ============================================================================

#include <cctype>
#include <optional>
#include <string>
#include <string_view>

#include <openssl/evp.h>

#include "abi.hpp"

namespace indexer::uri {

inline bool is_ipfs(std::string_view uri) { return uri.starts_with("ipfs://"); }

inline bool is_http(std::string_view uri) {
  return uri.starts_with("http://") || uri.starts_with("https://");
}

inline bool is_data(std::string_view uri) { return uri.starts_with("data:"); }

// CIDv0 (Qm...) 或 CIDv1 (bafy...)
inline bool is_bare_cid(std::string_view uri) {
  std::string_view body;
  if (uri.starts_with("Qm"))
    body = uri.substr(2);
  else if (uri.starts_with("bafy"))
    body = uri.substr(4);
  else
    return false;
  if (body.empty())
    return false;
  for (unsigned char c : body) {
    if (c == '/')
      break;
    if (!std::isalnum(c))
      return false;
  }
  return true;
}

// ipfs://<path> -> <gateway><path>; 其余原样返回
inline std::string ipfs_to_gateway(const std::string &uri, const std::string &gateway) {
  if (is_ipfs(uri))
    return gateway + uri.substr(7);
  return uri;
}

// imageGateway: ipfs:// 与裸 CID 改写到网关, http(s) 与其他不变
inline std::string image_gateway_url(const std::string &image, const std::string &gateway) {
  if (is_ipfs(image))
    return gateway + image.substr(7);
  if (is_http(image))
    return image;
  if (is_bare_cid(image))
    return gateway + image;
  return image;
}

// ERC1155: {id} -> 64 位小写 hex
inline std::string substitute_id(const std::string &uri, const std::string &token_id) {
  auto pos = uri.find("{id}");
  if (pos == std::string::npos)
    return uri;
  auto id = abi::parse_uint256_dec(token_id);
  if (!id)
    return uri;
  std::string out = uri;
  out.replace(pos, 4, abi::encode_uint256(*id));
  return out;
}

inline std::optional<std::string> base64_decode(std::string_view input) {
  std::string in;
  in.reserve(input.size());
  for (char c : input) {
    if (c == '\n' || c == '\r' || c == ' ')
      continue;
    if (c == '-')
      c = '+';
    else if (c == '_')
      c = '/';
    in.push_back(c);
  }
  while (in.size() % 4 != 0)
    in.push_back('=');
  if (in.empty())
    return std::string();

  std::string out(in.size() / 4 * 3, '\0');
  int len = EVP_DecodeBlock(reinterpret_cast<unsigned char *>(out.data()),
                            reinterpret_cast<const unsigned char *>(in.data()), static_cast<int>(in.size()));
  if (len < 0)
    return std::nullopt;

  // EVP_DecodeBlock 不去掉 '=' 对应的填充字节
  size_t padding = 0;
  if (in.size() >= 1 && in[in.size() - 1] == '=')
    ++padding;
  if (in.size() >= 2 && in[in.size() - 2] == '=')
    ++padding;
  out.resize(static_cast<size_t>(len) - padding);
  return out;
}

inline std::string percent_decode(std::string_view input) {
  std::string out;
  out.reserve(input.size());
  for (size_t i = 0; i < input.size(); ++i) {
    if (input[i] == '%' && i + 2 < input.size() &&
        std::isxdigit(static_cast<unsigned char>(input[i + 1])) &&
        std::isxdigit(static_cast<unsigned char>(input[i + 2]))) {
      out.push_back(static_cast<char>(std::stoi(std::string(input.substr(i + 1, 2)), nullptr, 16)));
      i += 2;
    } else {
      out.push_back(input[i]);
    }
  }
  return out;
}

// data:[<mediatype>][;base64],<payload> -> payload 原文
inline std::optional<std::string> decode_data_uri(std::string_view uri) {
  if (!is_data(uri))
    return std::nullopt;
  auto comma = uri.find(',');
  if (comma == std::string_view::npos)
    return std::nullopt;
  auto header = uri.substr(5, comma - 5);
  auto payload = uri.substr(comma + 1);
  if (header.ends_with(";base64"))
    return base64_decode(payload);
  return percent_decode(payload);
}

} // namespace indexer::uri
