#pragma once
#include <string>
#include <vector>
#include <algorithm>
#include <cctype>
#include <stdexcept>

using Bytes = std::vector<unsigned char>;

inline std::string Ensure0x(const std::string& in) {
  if (in.size() >= 2 && (in[0] == '0') && (in[1] == 'x' || in[1] == 'X')) return in;
  return std::string("0x") + in;
}

inline std::string Strip0x(const std::string& s) {
  if (s.rfind("0x", 0) == 0 || s.rfind("0X", 0) == 0) return s.substr(2);
  return s;
}

inline std::string ToLowerHex(const std::string& s) {
  std::string out = s;
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  return out;
}

inline int HexDigitValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + c - 'a';
  if (c >= 'A' && c <= 'F') return 10 + c - 'A';
  return -1;
}

// Odd-length input is left-padded with a zero nibble. Throws on non-hex characters.
inline Bytes HexToBytes(const std::string& hex) {
  std::string s = Strip0x(hex);
  if (s.size() % 2 != 0) s.insert(s.begin(), '0');
  Bytes out; out.reserve(s.size() / 2);
  for (size_t i = 0; i + 1 < s.size(); i += 2) {
    int hi = HexDigitValue(s[i]), lo = HexDigitValue(s[i + 1]);
    if (hi < 0 || lo < 0) throw std::invalid_argument("invalid hex: " + hex);
    out.push_back(static_cast<unsigned char>((hi << 4) | lo));
  }
  return out;
}

inline std::string BytesToHex0x(const unsigned char* data, size_t len) {
  static const char* hex = "0123456789abcdef";
  std::string out; out.reserve(2 * len + 2); out += "0x";
  for (size_t i = 0; i < len; ++i) { out += hex[data[i] >> 4]; out += hex[data[i] & 0xF]; }
  return out;
}

inline std::string BytesToHex0x(const Bytes& data) { return BytesToHex0x(data.data(), data.size()); }

inline bool IsHexAddress(const std::string& s) {
  if (s.size() != 42 || s[0] != '0' || (s[1] != 'x' && s[1] != 'X')) return false;
  return std::all_of(s.begin() + 2, s.end(), [](char c){ return HexDigitValue(c) >= 0; });
}

// Left-pads (or left-truncates) a hex string to one 32-byte ABI word, no 0x.
inline std::string Pad32(const std::string& hex) {
  std::string s = Strip0x(hex);
  if (s.size() >= 64) return s.substr(s.size() - 64);
  return std::string(64 - s.size(), '0') + s;
}

inline unsigned long long ParseHexULL(const std::string& hex) {
  std::string s = Strip0x(hex);
  if (s.empty()) throw std::invalid_argument("empty hex quantity");
  return std::stoull(s, nullptr, 16);
}

inline std::string ToHexQuantity(unsigned long long v) {
  static const char* hex = "0123456789abcdef";
  if (v == 0) return "0x0";
  std::string digits;
  while (v) { digits.insert(digits.begin(), hex[v & 0xF]); v >>= 4; }
  return "0x" + digits;
}
