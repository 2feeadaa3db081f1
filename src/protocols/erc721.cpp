#include "protocols/erc721.hpp"
#include "protocols/erc20.hpp"
#include "node_connection/rpc_client.hpp"
#include "encoding/abi.hpp"
#include "common/errors.hpp"
#include <stdexcept>

namespace ERC721 {
  std::optional<Amount> BalanceOf(RpcClient& rpc, const std::string& collection, const std::string& owner) {
    // same selector and layout as the fungible balanceOf
    return ERC20::BalanceOf(rpc, collection, owner);
  }

  std::optional<bool> SupportsInterface(RpcClient& rpc, const std::string& contract, const std::string& interface_id) {
    try {
      // supportsInterface(bytes4) -> 0x01ffc9a7, bytes4 left-aligned in its word
      std::string word = interface_id.substr(0, 2) == "0x" ? interface_id.substr(2) : interface_id;
      word.resize(64, '0');
      return ABI::DecodeUint(rpc.EthCall(contract, ABI::Call("0x01ffc9a7", word))) != 0;
    } catch (const RpcError&) {
      return std::nullopt;
    } catch (const std::invalid_argument&) {
      return std::nullopt;
    }
  }

  std::optional<Amount> TokenOfOwnerByIndex(RpcClient& rpc, const std::string& collection,
                                            const std::string& owner, unsigned long long index) {
    try {
      // tokenOfOwnerByIndex(address,uint256) -> 0x2f745c59
      auto data = ABI::Call("0x2f745c59", ABI::EncodeAddress(owner) + ABI::EncodeUint(Amount(index)));
      return ABI::DecodeUint(rpc.EthCall(collection, data));
    } catch (const RpcError&) {
      return std::nullopt;
    } catch (const std::invalid_argument&) {
      return std::nullopt;
    }
  }

  std::string BuildTransferFromCall(const std::string& from, const std::string& to, const Amount& token_id) {
    // transferFrom(address,address,uint256) -> 0x23b872dd
    return ABI::Call("0x23b872dd", ABI::EncodeAddress(from) + ABI::EncodeAddress(to) + ABI::EncodeUint(token_id));
  }
}
