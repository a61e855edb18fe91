#pragma once

#include <string>

// Polygon 主网合约地址(小写)
namespace contracts {
constexpr const char *CONDITIONAL_TOKENS = "0x4d97dcd97ec945f40cf65f87097ace5ea0476045";
constexpr const char *CTF_EXCHANGE = "0x4bfb41d5b3570defd03c39a9a4d8de6bd8b8982e";
constexpr const char *NEG_RISK_CTF_EXCHANGE = "0xc5d563a36ae78145c45a50134d48a1215220f80a";
constexpr const char *ZERO_ADDRESS = "0x0000000000000000000000000000000000000000";

inline bool is_exchange(const std::string &addr) {
  return addr == CTF_EXCHANGE || addr == NEG_RISK_CTF_EXCHANGE;
}
} // namespace contracts
