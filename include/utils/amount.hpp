#pragma once
#include <boost/multiprecision/cpp_int.hpp>
#include <string>
#include <vector>

// On-chain quantities (balances, token ids, wei values) are unsigned 256-bit.
using Amount = boost::multiprecision::uint256_t;

// Parses a 0x-prefixed hex quantity or a 32-byte ABI word. Throws on empty or
// non-hex input and on values wider than 256 bits.
Amount ParseHexAmount(const std::string& hex);

// Minimal 0x-prefixed hex quantity ("0x0" for zero), as JSON-RPC expects.
std::string AmountToHexQuantity(const Amount& v);

// 32-byte big-endian encoding.
std::string AmountToWordHex(const Amount& v);

// Minimal big-endian bytes, empty for zero (RLP integer form).
std::vector<unsigned char> AmountToMinimalBytes(const Amount& v);

std::string AmountToDecimal(const Amount& v);

// 1500000 with 6 decimals -> "1.5"; trailing fractional zeros are dropped.
std::string FormatUnits(const Amount& v, int decimals);

// Converts a decimal gwei figure ("0.05", "3") to wei.
Amount GweiToWei(double gwei);
