#include "encoding/rlp.hpp"

namespace {
  void append(Bytes& buf, const Bytes& more) {
    buf.insert(buf.end(), more.begin(), more.end());
  }

  Bytes encodeLength(size_t len, unsigned char offset) {
    if (len < 56) {
      return Bytes{ static_cast<unsigned char>(offset + len) };
    }
    // long form: offset + 55 + byte count of the length, then the length itself
    Bytes lenBytes;
    size_t tmp = len;
    while (tmp) { lenBytes.insert(lenBytes.begin(), static_cast<unsigned char>(tmp & 0xFF)); tmp >>= 8; }
    Bytes out;
    out.push_back(static_cast<unsigned char>(offset + 55 + lenBytes.size()));
    append(out, lenBytes);
    return out;
  }
}

namespace RLP {
  Bytes EncodeBytes(const Bytes& data) {
    if (data.size() == 1 && data[0] < 0x80) return data;
    Bytes out = encodeLength(data.size(), 0x80);
    append(out, data);
    return out;
  }

  Bytes EncodeHex(const std::string& hex0x) {
    return EncodeBytes(HexToBytes(hex0x));
  }

  Bytes EncodeUint(const Amount& value) {
    return EncodeBytes(AmountToMinimalBytes(value));
  }

  Bytes EncodeList(const std::vector<Bytes>& elements) {
    Bytes payload;
    for (const auto& e : elements) append(payload, e);
    Bytes out = encodeLength(payload.size(), 0xC0);
    append(out, payload);
    return out;
  }
}
