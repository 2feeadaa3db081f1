#include "protocols/erc20.hpp"
#include "node_connection/rpc_client.hpp"
#include "encoding/abi.hpp"
#include "common/errors.hpp"
#include <stdexcept>

namespace ERC20 {
  std::optional<Amount> BalanceOf(RpcClient& rpc, const std::string& token, const std::string& owner) {
    try {
      // balanceOf(address) -> 0x70a08231
      auto res = rpc.EthCall(token, ABI::Call("0x70a08231", ABI::EncodeAddress(owner)));
      return ABI::DecodeUint(res);
    } catch (const RpcError&) {
      return std::nullopt;
    } catch (const std::invalid_argument&) {
      return std::nullopt;
    }
  }

  std::optional<int> Decimals(RpcClient& rpc, const std::string& token) {
    try {
      // decimals() -> 0x313ce567
      Amount d = ABI::DecodeUint(rpc.EthCall(token, ABI::Call("0x313ce567")));
      if (d > 255) return std::nullopt; // uint8 in the standard
      return static_cast<int>(d);
    } catch (const RpcError&) {
      return std::nullopt;
    } catch (const std::invalid_argument&) {
      return std::nullopt;
    }
  }

  std::optional<std::string> Symbol(RpcClient& rpc, const std::string& token) {
    try {
      // symbol() -> 0x95d89b41
      auto s = ABI::DecodeString(rpc.EthCall(token, ABI::Call("0x95d89b41")));
      if (s.empty()) return std::nullopt;
      return s;
    } catch (const RpcError&) {
      return std::nullopt;
    } catch (const std::invalid_argument&) {
      return std::nullopt;
    }
  }

  std::optional<std::string> Name(RpcClient& rpc, const std::string& token) {
    try {
      // name() -> 0x06fdde03
      auto s = ABI::DecodeString(rpc.EthCall(token, ABI::Call("0x06fdde03")));
      if (s.empty()) return std::nullopt;
      return s;
    } catch (const RpcError&) {
      return std::nullopt;
    } catch (const std::invalid_argument&) {
      return std::nullopt;
    }
  }

  std::string BuildTransferCall(const std::string& to, const Amount& amount) {
    // transfer(address,uint256) -> 0xa9059cbb
    return ABI::Call("0xa9059cbb", ABI::EncodeAddress(to) + ABI::EncodeUint(amount));
  }
}
