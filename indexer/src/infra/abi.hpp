#pragma once

// ============================================================================
// 十六进制 / ABI 编解码工具
// ============================================================================

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <boost/multiprecision/cpp_int.hpp>

namespace indexer::abi {

using uint256 = boost::multiprecision::uint256_t;

constexpr const char *ZERO_ADDRESS = "0x0000000000000000000000000000000000000000";

// 函数选择器
namespace selectors {
constexpr const char *NAME = "0x06fdde03";
constexpr const char *SYMBOL = "0x95d89b41";
constexpr const char *DECIMALS = "0x313ce567";
constexpr const char *TOTAL_SUPPLY = "0x18160ddd";
constexpr const char *BALANCE_OF = "0x70a08231";          // balanceOf(address)
constexpr const char *BALANCE_OF_ID = "0x00fdd58e";       // balanceOf(address,uint256)
constexpr const char *OWNER_OF = "0x6352211e";            // ownerOf(uint256)
constexpr const char *TOKEN_URI = "0xc87b56dd";           // tokenURI(uint256)
constexpr const char *URI = "0x0e89341c";                 // uri(uint256)
} // namespace selectors

inline std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

inline std::string_view strip_0x(std::string_view hex) {
  if (hex.starts_with("0x") || hex.starts_with("0X"))
    hex.remove_prefix(2);
  return hex;
}

inline bool is_hex(std::string_view s) {
  return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isxdigit(c) != 0; });
}

// "0x" 或空串视为 0
inline int64_t hex_to_int64(std::string_view hex) {
  auto digits = strip_0x(hex);
  if (digits.empty())
    return 0;
  return static_cast<int64_t>(std::stoull(std::string(digits), nullptr, 16));
}

inline std::string to_hex(int64_t value) {
  std::stringstream ss;
  ss << "0x" << std::hex << value;
  return ss.str();
}

inline std::optional<uint256> parse_uint256_hex(std::string_view hex) {
  auto digits = strip_0x(hex);
  if (digits.empty())
    return uint256(0);
  // 超过 64 位 hex 的只取低 256 位
  if (digits.size() > 64)
    digits = digits.substr(digits.size() - 64);
  if (!is_hex(digits))
    return std::nullopt;
  return uint256("0x" + std::string(digits));
}

inline std::optional<uint256> parse_uint256_dec(std::string_view dec) {
  if (dec.empty() || !std::all_of(dec.begin(), dec.end(), [](unsigned char c) { return std::isdigit(c) != 0; }))
    return std::nullopt;
  return uint256(std::string(dec));
}

// hex 数量 -> 十进制字符串, 解析失败返回 nullopt
inline std::optional<std::string> hex_to_decimal(std::string_view hex) {
  auto v = parse_uint256_hex(hex);
  if (!v)
    return std::nullopt;
  return v->str();
}

inline bool is_zero_quantity(std::string_view hex) {
  auto v = parse_uint256_hex(hex);
  return !v || *v == 0;
}

inline std::string address_from_topic(std::string_view topic) {
  auto digits = strip_0x(topic);
  if (digits.size() < 40)
    return ZERO_ADDRESS;
  return "0x" + to_lower(std::string(digits.substr(digits.size() - 40)));
}

// data 中第 index 个 32 字节 word (64 个 hex 字符)
inline std::optional<std::string_view> word(std::string_view data, size_t index) {
  auto digits = strip_0x(data);
  size_t start = index * 64;
  if (start + 64 > digits.size())
    return std::nullopt;
  return digits.substr(start, 64);
}

inline std::optional<uint256> word_uint(std::string_view data, size_t index) {
  auto w = word(data, index);
  if (!w)
    return std::nullopt;
  return parse_uint256_hex(*w);
}

// ============================================================================
// 编码
// ============================================================================

inline std::string encode_address(std::string_view address) {
  auto digits = to_lower(std::string(strip_0x(address)));
  return std::string(64 - std::min<size_t>(64, digits.size()), '0') + digits;
}

inline std::string encode_uint256(const uint256 &value) {
  std::stringstream ss;
  ss << std::hex << value;
  auto digits = ss.str();
  return std::string(64 - std::min<size_t>(64, digits.size()), '0') + digits;
}

inline std::string encode_call(const char *selector) { return selector; }

inline std::string encode_call_address(const char *selector, std::string_view address) {
  return std::string(selector) + encode_address(address);
}

inline std::string encode_call_uint(const char *selector, const uint256 &value) {
  return std::string(selector) + encode_uint256(value);
}

inline std::string encode_call_address_uint(const char *selector, std::string_view address, const uint256 &value) {
  return std::string(selector) + encode_address(address) + encode_uint256(value);
}

// ============================================================================
// 解码 (eth_call 返回值), 失败一律返回 nullopt
// ============================================================================

inline std::optional<std::string> decode_uint256(std::string_view ret) {
  auto v = word_uint(ret, 0);
  if (!v)
    return std::nullopt;
  return v->str();
}

inline std::optional<std::string> decode_address(std::string_view ret) {
  auto w = word(ret, 0);
  if (!w)
    return std::nullopt;
  return address_from_topic(*w);
}

inline std::string hex_to_bytes(std::string_view hex) {
  std::string out;
  out.reserve(hex.size() / 2);
  for (size_t i = 0; i + 1 < hex.size(); i += 2) {
    out.push_back(static_cast<char>(std::stoi(std::string(hex.substr(i, 2)), nullptr, 16)));
  }
  return out;
}

// 动态 string, 或者老合约 (MKR 之类) 返回的右补零 bytes32
inline std::optional<std::string> decode_string(std::string_view ret) {
  auto digits = strip_0x(ret);
  if (digits.empty() || !is_hex(digits))
    return std::nullopt;

  if (digits.size() == 64) {
    std::string raw = hex_to_bytes(digits);
    auto end = raw.find('\0');
    if (end != std::string::npos)
      raw.resize(end);
    if (raw.empty())
      return std::nullopt;
    return raw;
  }

  auto offset = word_uint(digits, 0);
  if (!offset || *offset % 32 != 0 || *offset > digits.size() / 2)
    return std::nullopt;
  size_t len_index = static_cast<size_t>(*offset / 32);
  auto len = word_uint(digits, len_index);
  if (!len)
    return std::nullopt;
  size_t start = (len_index + 1) * 64;
  if (*len * 2 > digits.size() - std::min(digits.size(), start))
    return std::nullopt;
  size_t hex_len = static_cast<size_t>(*len) * 2;
  return hex_to_bytes(digits.substr(start, hex_len));
}

// 动态 uint256[] 数组, offset 为字节偏移
inline std::optional<std::vector<uint256>> decode_uint_array(std::string_view data, const uint256 &offset) {
  if (offset % 32 != 0 || offset > strip_0x(data).size() / 2)
    return std::nullopt;
  size_t base = static_cast<size_t>(offset / 32);
  auto len = word_uint(data, base);
  if (!len || *len > 10000)
    return std::nullopt;
  std::vector<uint256> out;
  out.reserve(static_cast<size_t>(*len));
  for (size_t i = 0; i < static_cast<size_t>(*len); ++i) {
    auto v = word_uint(data, base + 1 + i);
    if (!v)
      return std::nullopt;
    out.push_back(*v);
  }
  return out;
}

// 按 decimals 缩放, 去掉末尾多余的 0
inline std::string format_units(const std::string &decimal, int decimals) {
  std::string digits = decimal.empty() ? "0" : decimal;
  if (decimals <= 0)
    return digits;
  if (static_cast<int>(digits.size()) <= decimals)
    digits = std::string(decimals - digits.size() + 1, '0') + digits;

  std::string whole = digits.substr(0, digits.size() - decimals);
  std::string frac = digits.substr(digits.size() - decimals);
  while (!frac.empty() && frac.back() == '0')
    frac.pop_back();
  if (frac.empty())
    frac = "0";
  return whole + "." + frac;
}

} // namespace indexer::abi
