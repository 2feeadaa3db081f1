#pragma once
#include <string>
#include <vector>
#include "utils/amount.hpp"
#include "utils/hex.hpp"

// Recursive Length Prefix encoding, byte oriented. Each Encode* returns one
// complete RLP item; EncodeList concatenates already-encoded items.
namespace RLP {
  Bytes EncodeBytes(const Bytes& data);
  // 0x-hex string payload (addresses, calldata); "" and "0x" encode as empty
  Bytes EncodeHex(const std::string& hex0x);
  // Big endian without leading zeros; zero is the empty string
  Bytes EncodeUint(const Amount& value);
  Bytes EncodeList(const std::vector<Bytes>& elements);
}
