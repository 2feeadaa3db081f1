#pragma once
#include <optional>
#include <string>
#include "utils/amount.hpp"

class RpcClient;

// Each probe returns nullopt when the call fails or the return data does not
// decode; callers decide what a miss means.
namespace ERC20 {
  std::optional<Amount> BalanceOf(RpcClient& rpc, const std::string& token, const std::string& owner);
  std::optional<int> Decimals(RpcClient& rpc, const std::string& token);
  std::optional<std::string> Symbol(RpcClient& rpc, const std::string& token);
  std::optional<std::string> Name(RpcClient& rpc, const std::string& token);
  // transfer(to, amount) calldata
  std::string BuildTransferCall(const std::string& to, const Amount& amount);
}
