#include "utils/amount.hpp"
#include "utils/hex.hpp"
#include <cmath>
#include <stdexcept>

Amount ParseHexAmount(const std::string& hex) {
  std::string s = Strip0x(hex);
  if (s.empty()) throw std::invalid_argument("empty hex quantity");
  size_t first = s.find_first_not_of('0');
  if (first == std::string::npos) return Amount(0);
  if (s.size() - first > 64) throw std::out_of_range("hex quantity wider than 256 bits");
  Amount v = 0;
  for (size_t i = first; i < s.size(); ++i) {
    int d = HexDigitValue(s[i]);
    if (d < 0) throw std::invalid_argument("invalid hex quantity: " + hex);
    v <<= 4;
    v |= static_cast<unsigned>(d);
  }
  return v;
}

std::string AmountToHexQuantity(const Amount& v) {
  if (v == 0) return "0x0";
  auto bytes = AmountToMinimalBytes(v);
  std::string h = BytesToHex0x(bytes);
  // drop a leading zero nibble: quantities carry no leading zeros
  if (h.size() > 3 && h[2] == '0') h.erase(2, 1);
  return h;
}

std::string AmountToWordHex(const Amount& v) {
  auto bytes = AmountToMinimalBytes(v);
  return Pad32(BytesToHex0x(bytes));
}

std::vector<unsigned char> AmountToMinimalBytes(const Amount& v) {
  std::vector<unsigned char> out;
  Amount tmp = v;
  while (tmp != 0) {
    Amount low = tmp & 0xFF;
    out.insert(out.begin(), static_cast<unsigned char>(static_cast<unsigned>(low)));
    tmp >>= 8;
  }
  return out;
}

std::string AmountToDecimal(const Amount& v) { return v.str(); }

std::string FormatUnits(const Amount& v, int decimals) {
  std::string digits = v.str();
  if (decimals <= 0) return digits;
  const size_t d = static_cast<size_t>(decimals);
  if (digits.size() <= d) digits = std::string(d - digits.size() + 1, '0') + digits;
  std::string whole = digits.substr(0, digits.size() - d);
  std::string frac = digits.substr(digits.size() - d);
  while (!frac.empty() && frac.back() == '0') frac.pop_back();
  return frac.empty() ? whole : whole + "." + frac;
}

Amount GweiToWei(double gwei) {
  if (gwei <= 0.0) return Amount(0);
  // whole gwei plus the fractional part at wei resolution
  const double whole = std::floor(gwei);
  const long long frac_wei = std::llround((gwei - whole) * 1e9);
  return Amount(static_cast<unsigned long long>(whole)) * 1000000000u + Amount(static_cast<unsigned long long>(frac_wei));
}
