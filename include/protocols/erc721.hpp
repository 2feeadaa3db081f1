#pragma once
#include <optional>
#include <string>
#include "utils/amount.hpp"

class RpcClient;

namespace ERC721 {
  // ERC-165 interface id of ERC-721
  inline const std::string INTERFACE_ID = "0x80ac58cd";

  // ERC-165 supportsInterface(interfaceId); nullopt when the contract does not answer
  std::optional<bool> SupportsInterface(RpcClient& rpc, const std::string& contract, const std::string& interface_id);
  // balanceOf(owner): number of tokens the owner holds in the collection
  std::optional<Amount> BalanceOf(RpcClient& rpc, const std::string& collection, const std::string& owner);
  // ERC721Enumerable tokenOfOwnerByIndex(owner, index)
  std::optional<Amount> TokenOfOwnerByIndex(RpcClient& rpc, const std::string& collection,
                                            const std::string& owner, unsigned long long index);
  // transferFrom(from, to, tokenId) calldata
  std::string BuildTransferFromCall(const std::string& from, const std::string& to, const Amount& token_id);
}
