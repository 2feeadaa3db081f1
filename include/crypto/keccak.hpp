#pragma once
#include <string>
#include "utils/hex.hpp"

namespace Crypto {
  // 32-byte keccak256 digest of raw bytes
  Bytes Keccak256(const Bytes& data);
  // 0x-prefixed hex keccak256 of the input text taken as raw bytes
  std::string Keccak256Text(const std::string& text);
  // First four bytes of keccak256(signature), 0x-prefixed, e.g. "transfer(address,uint256)" -> 0xa9059cbb
  std::string SelectorOf(const std::string& signature);
}
