#include "discovery/asset_classifier.hpp"
#include "node_connection/rpc_client.hpp"
#include "protocols/erc20.hpp"
#include "protocols/erc721.hpp"
#include "common/errors.hpp"
#include "common/reporter.hpp"
#include "constants/chain.hpp"
#include "utils/hex.hpp"

std::optional<Holding> AssetClassifier::Classify(const std::string& contract, const std::string& account) {
  if (auto h = ProbeFungible(contract, account)) return h;
  if (auto h = ProbeNonFungible(contract, account)) return h;
  reporter_.Debug("candidate " + contract + " holds nothing recognizable for " + account);
  return std::nullopt;
}

std::optional<Holding> AssetClassifier::ProbeFungible(const std::string& contract, const std::string& account) {
  auto balance = ERC20::BalanceOf(rpc_, contract, account);
  if (!balance || *balance == 0) return std::nullopt;
  auto decimals = ERC20::Decimals(rpc_, contract);
  if (!decimals) return std::nullopt;
  Holding h;
  h.asset.address = ToLowerHex(contract);
  h.asset.symbol = ERC20::Symbol(rpc_, contract).value_or("UNKNOWN");
  h.asset.name = ERC20::Name(rpc_, contract).value_or("Unknown Token");
  h.asset.detail = FungibleDetail{*decimals};
  h.balance = *balance;
  reporter_.Info("found " + FormatUnits(h.balance, *decimals) + " " + h.asset.symbol + " (" + h.asset.address + ") on " + account);
  return h;
}

std::optional<Holding> AssetClassifier::ProbeNonFungible(const std::string& contract, const std::string& account) {
  auto count = ERC721::BalanceOf(rpc_, contract, account);
  if (!count || *count == 0) return std::nullopt;
  // balanceOf alone also matches a fungible token without decimals()
  if (!ERC721::SupportsInterface(rpc_, contract, ERC721::INTERFACE_ID).value_or(false) &&
      !ERC721::TokenOfOwnerByIndex(rpc_, contract, account, 0)) {
    reporter_.Debug("candidate " + contract + " has a balance but no ERC-721 interface");
    return std::nullopt;
  }
  Holding h;
  h.asset.address = ToLowerHex(contract);
  h.asset.symbol = ERC20::Symbol(rpc_, contract).value_or("NFT");
  h.asset.name = ERC20::Name(rpc_, contract).value_or("NFT Collection");
  h.asset.detail = NonFungibleDetail{};
  h.balance = *count;
  reporter_.Info("found " + AmountToDecimal(h.balance) + " NFT(s) of " + h.asset.name + " (" + h.asset.address + ") on " + account);
  return h;
}

std::optional<Holding> AssetClassifier::ProbeNative(const std::string& account) {
  Amount balance = 0;
  try {
    balance = rpc_.EthGetBalance(account);
  } catch (const RpcError& e) {
    reporter_.Error("native balance of " + account + " unavailable: " + e.what());
    return std::nullopt;
  }
  if (balance == 0) return std::nullopt;
  Holding h;
  h.asset.address = ChainConstants::NATIVE_ASSET;
  h.asset.symbol = ChainConstants::NATIVE_SYMBOL;
  h.asset.name = ChainConstants::NATIVE_NAME;
  h.asset.detail = NativeDetail{ChainConstants::NATIVE_DECIMALS};
  h.balance = balance;
  reporter_.Info("native balance of " + account + ": " + FormatUnits(balance, ChainConstants::NATIVE_DECIMALS) + " " + h.asset.symbol);
  return h;
}
