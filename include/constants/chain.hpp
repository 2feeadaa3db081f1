#pragma once
#include <cctype>
#include <string>

namespace ChainConstants {
  // Base mainnet
  inline constexpr unsigned long long DEFAULT_CHAIN_ID = 8453;
  inline const std::string DEFAULT_RPC_URL = "https://mainnet.base.org";
  // Native coin: 18 decimals, addressed by a sentinel instead of a contract
  inline const std::string NATIVE_ASSET = "NATIVE";
  inline const std::string NATIVE_SYMBOL = "ETH";
  inline const std::string NATIVE_NAME = "Ether";
  inline constexpr int NATIVE_DECIMALS = 18;
  // keccak256("Transfer(address,address,uint256)"), shared by ERC-20 and ERC-721
  inline const std::string TRANSFER_TOPIC = "0xddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef";
  inline constexpr unsigned long long NATIVE_TRANSFER_GAS = 21000;

  // The native sentinel, in any letter case.
  inline bool IsNativeAsset(const std::string& asset) {
    if (asset.size() != NATIVE_ASSET.size()) return false;
    for (size_t i = 0; i < asset.size(); ++i) {
      if (std::toupper(static_cast<unsigned char>(asset[i])) != NATIVE_ASSET[i]) return false;
    }
    return true;
  }
}
