#include "wallet/signer.hpp"
#include "crypto/keccak.hpp"
#include "crypto/secp256k1.hpp"
#include "encoding/rlp.hpp"
#include "utils/hex.hpp"
#include <stdexcept>

static Bytes TrimLeadingZeros(const std::vector<unsigned char>& be) {
  size_t i = 0;
  while (i < be.size() && be[i] == 0) ++i;
  return Bytes(be.begin() + static_cast<std::ptrdiff_t>(i), be.end());
}

static SignedTransaction Finish(const Bytes& raw) {
  return SignedTransaction{ BytesToHex0x(raw), BytesToHex0x(Crypto::Keccak256(raw)) };
}

Signer::Signer(const std::string& private_key_hex) {
  if (private_key_hex.empty()) throw std::invalid_argument("empty private key");
  priv_ = HexToBytes(private_key_hex);
  if (priv_.size() != 32) throw std::invalid_argument("invalid private key length");
  auto pub = Crypto::PublicKeyFromPrivate(priv_);
  // address = last 20 bytes of keccak256(pubkey[1:]), skipping the 0x04 prefix
  auto hash = Crypto::Keccak256(Bytes(pub.begin() + 1, pub.end()));
  address_ = BytesToHex0x(hash.data() + 12, 20);
}

SignedTransaction Signer::Sign(const TransactionFields& tx) const {
  return tx.type == TxType::Eip1559 ? SignEip1559(tx) : SignLegacy(tx);
}

SignedTransaction Signer::SignLegacy(const TransactionFields& tx) const {
  // EIP-155 sighash: keccak256(rlp([nonce, gasPrice, gasLimit, to, value, data, chainId, 0, 0]))
  std::vector<Bytes> fields{
    RLP::EncodeUint(tx.nonce),
    RLP::EncodeUint(tx.gas_price),
    RLP::EncodeUint(tx.gas_limit),
    RLP::EncodeHex(tx.to),
    RLP::EncodeUint(tx.value),
    RLP::EncodeHex(tx.data)
  };
  std::vector<Bytes> unsigned_fields = fields;
  unsigned_fields.push_back(RLP::EncodeUint(tx.chain_id));
  unsigned_fields.push_back(RLP::EncodeUint(0));
  unsigned_fields.push_back(RLP::EncodeUint(0));
  auto digest = Crypto::Keccak256(RLP::EncodeList(unsigned_fields));
  auto sig = Crypto::SignDigest(priv_, digest);
  Amount v = Amount(tx.chain_id) * 2 + 35 + sig.recovery_id;
  fields.push_back(RLP::EncodeUint(v));
  fields.push_back(RLP::EncodeBytes(TrimLeadingZeros(sig.r)));
  fields.push_back(RLP::EncodeBytes(TrimLeadingZeros(sig.s)));
  return Finish(RLP::EncodeList(fields));
}

SignedTransaction Signer::SignEip1559(const TransactionFields& tx) const {
  // 0x02 || rlp([chainId, nonce, maxPriorityFeePerGas, maxFeePerGas, gasLimit, to, value, data, accessList])
  std::vector<Bytes> fields{
    RLP::EncodeUint(tx.chain_id),
    RLP::EncodeUint(tx.nonce),
    RLP::EncodeUint(tx.max_priority_fee_per_gas),
    RLP::EncodeUint(tx.max_fee_per_gas),
    RLP::EncodeUint(tx.gas_limit),
    RLP::EncodeHex(tx.to),
    RLP::EncodeUint(tx.value),
    RLP::EncodeHex(tx.data),
    RLP::EncodeList({})
  };
  Bytes preimage{0x02};
  auto body = RLP::EncodeList(fields);
  preimage.insert(preimage.end(), body.begin(), body.end());
  auto sig = Crypto::SignDigest(priv_, Crypto::Keccak256(preimage));
  fields.push_back(RLP::EncodeUint(sig.recovery_id));
  fields.push_back(RLP::EncodeBytes(TrimLeadingZeros(sig.r)));
  fields.push_back(RLP::EncodeBytes(TrimLeadingZeros(sig.s)));
  Bytes raw{0x02};
  auto signed_body = RLP::EncodeList(fields);
  raw.insert(raw.end(), signed_body.begin(), signed_body.end());
  return Finish(raw);
}
