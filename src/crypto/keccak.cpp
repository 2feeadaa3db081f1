#include "crypto/keccak.hpp"
#include <cryptopp/keccak.h>

namespace Crypto {
  Bytes Keccak256(const Bytes& data) {
    CryptoPP::Keccak_256 hash;
    Bytes digest(CryptoPP::Keccak_256::DIGESTSIZE);
    hash.CalculateDigest(digest.data(), data.data(), data.size());
    return digest;
  }

  std::string Keccak256Text(const std::string& text) {
    return BytesToHex0x(Keccak256(Bytes(text.begin(), text.end())));
  }

  std::string SelectorOf(const std::string& signature) {
    return Keccak256Text(signature).substr(0, 10);
  }
}
