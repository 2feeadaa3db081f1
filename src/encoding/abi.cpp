#include "encoding/abi.hpp"
#include "utils/hex.hpp"
#include <stdexcept>

namespace ABI {
  std::string EncodeAddress(const std::string& address) {
    return Pad32(ToLowerHex(Strip0x(address)));
  }

  std::string EncodeUint(const Amount& value) {
    return AmountToWordHex(value);
  }

  std::string Call(const std::string& selector0x, const std::string& words) {
    return Ensure0x(Strip0x(selector0x) + words);
  }

  Amount DecodeUint(const std::string& result_hex) {
    std::string s = Strip0x(result_hex);
    if (s.size() < 64) throw std::invalid_argument("short uint256 return data");
    return ParseHexAmount(s.substr(0, 64));
  }

  static std::string PrintableFromBytes(const Bytes& raw) {
    std::string out;
    for (unsigned char c : raw) {
      if (c == 0) break;
      out.push_back(static_cast<char>(c));
    }
    return out;
  }

  std::string DecodeString(const std::string& result_hex) {
    std::string s = Strip0x(result_hex);
    if (s.size() < 64) throw std::invalid_argument("short string return data");
    if (s.size() >= 128) {
      // dynamic layout: offset word, then length word, then the bytes
      Amount offset = ParseHexAmount(s.substr(0, 64));
      if (offset <= 1024) {
        size_t pos = static_cast<size_t>(offset) * 2;
        if (s.size() >= pos + 64) {
          Amount len = ParseHexAmount(s.substr(pos, 64));
          if (len <= 1024 && s.size() >= pos + 64 + static_cast<size_t>(len) * 2) {
            return PrintableFromBytes(HexToBytes(s.substr(pos + 64, static_cast<size_t>(len) * 2)));
          }
        }
      }
    }
    if (s.size() == 64) return PrintableFromBytes(HexToBytes(s));
    throw std::invalid_argument("undecodable string return data");
  }

  std::string AddressTopic(const std::string& address) {
    return "0x" + EncodeAddress(address);
  }
}
