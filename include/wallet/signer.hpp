#pragma once
#include <string>
#include <vector>
#include "utils/amount.hpp"

enum class TxType { Legacy, Eip1559 };

struct TransactionFields {
  TxType type = TxType::Legacy;
  unsigned long long chain_id = 8453; // Base
  unsigned long long nonce = 0;
  unsigned long long gas_limit = 0;
  Amount gas_price = 0;                // wei, legacy only
  Amount max_fee_per_gas = 0;          // wei, EIP-1559 only
  Amount max_priority_fee_per_gas = 0; // wei, EIP-1559 only
  std::string to; // 0x...
  Amount value = 0; // wei
  std::string data; // 0x...
};

struct SignedTransaction {
  std::string raw;  // 0x-hex, ready for eth_sendRawTransaction
  std::string hash; // keccak256 of the raw bytes
};

// One account's signing capability. The private key never leaves this object.
class Signer {
public:
  // Throws std::invalid_argument for malformed or out-of-range keys.
  explicit Signer(const std::string& private_key_hex);
  SignedTransaction Sign(const TransactionFields& tx) const;
  const std::string& Address() const { return address_; }
private:
  std::vector<unsigned char> priv_;
  std::string address_;
  SignedTransaction SignLegacy(const TransactionFields& tx) const;
  SignedTransaction SignEip1559(const TransactionFields& tx) const;
};
