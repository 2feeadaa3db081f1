#pragma once
#include <optional>
#include <string>
#include "discovery/asset_types.hpp"

class RpcClient;
class Reporter;

// Decides what a candidate contract is to one account, with no prior metadata.
// Probe order: fungible (balanceOf + decimals, balance > 0), then non-fungible
// (balanceOf as owned count > 0, confirmed by ERC-165 or a readable
// tokenOfOwnerByIndex(owner, 0)). A failed probe falls through to the next one;
// a candidate matching neither is dropped.
class AssetClassifier {
public:
  AssetClassifier(RpcClient& rpc, Reporter& reporter) : rpc_(rpc), reporter_(reporter) {}
  std::optional<Holding> Classify(const std::string& contract, const std::string& account);
  // Native balance via eth_getBalance; nullopt when zero or unreadable.
  std::optional<Holding> ProbeNative(const std::string& account);
private:
  std::optional<Holding> ProbeFungible(const std::string& contract, const std::string& account);
  std::optional<Holding> ProbeNonFungible(const std::string& contract, const std::string& account);
  RpcClient& rpc_;
  Reporter& reporter_;
};
