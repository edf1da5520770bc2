#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "../infra/abi.hpp"

namespace indexer {

struct DecodedMethod {
  std::optional<std::string> method_id;
  std::optional<std::string> method_name;
};

class MethodDecoder {
public:
  // input 前 4 字节 (0x + 8 位 hex), 未知选择器只有 id 没有 name
  static DecodedMethod decode(std::string_view input) {
    DecodedMethod out;
    if (input.size() < 10)
      return out;

    std::string id = abi::to_lower(std::string(input.substr(0, 10)));
    out.method_id = id;

    const auto &table = signatures();
    auto it = table.find(id);
    if (it != table.end())
      out.method_name = it->second;
    return out;
  }

private:
  static const std::unordered_map<std::string, std::string> &signatures() {
    static const std::unordered_map<std::string, std::string> table = {
        // ERC20
        {"0xa9059cbb", "transfer"},
        {"0x23b872dd", "transferFrom"},
        {"0x095ea7b3", "approve"},
        {"0x40c10f19", "mint"},
        {"0x42966c68", "burn"},
        {"0xa0712d68", "mint"},
        // Uniswap V2 router
        {"0x38ed1739", "swapExactTokensForTokens"},
        {"0x7ff36ab5", "swapExactETHForTokens"},
        {"0x18cbafe5", "swapExactTokensForETH"},
        {"0x8803dbee", "swapTokensForExactTokens"},
        {"0xfb3bdb41", "swapETHForExactTokens"},
        {"0x4a25d94a", "swapTokensForExactETH"},
        {"0xe8e33700", "addLiquidity"},
        {"0xf305d719", "addLiquidityETH"},
        {"0xbaa2abde", "removeLiquidity"},
        {"0x02751cec", "removeLiquidityETH"},
        // WETH
        {"0xd0e30db0", "deposit"},
        {"0x2e1a7d4d", "withdraw"},
        // Universal router / V3
        {"0x3593564c", "execute"},
        {"0x5ae401dc", "multicall"},
    };
    return table;
  }
};

} // namespace indexer
