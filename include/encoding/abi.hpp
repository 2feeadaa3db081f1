#pragma once
#include <string>
#include "utils/amount.hpp"

// Solidity ABI helpers for the handful of static calls the collector makes.
// Words are 64 hex characters without a 0x prefix.
namespace ABI {
  std::string EncodeAddress(const std::string& address);
  std::string EncodeUint(const Amount& value);
  // Builds 0x-prefixed calldata from a selector and pre-encoded words.
  std::string Call(const std::string& selector0x, const std::string& words = std::string());

  // First return word as uint256. Throws std::invalid_argument on empty ("0x") output.
  Amount DecodeUint(const std::string& result_hex);
  // string return value; falls back to a NUL-trimmed bytes32 for legacy tokens.
  // Throws std::invalid_argument when neither layout fits.
  std::string DecodeString(const std::string& result_hex);

  // 32-byte event topic holding an address (indexed address parameter)
  std::string AddressTopic(const std::string& address);
}
