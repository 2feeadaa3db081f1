#include "discovery/discovery_engine.hpp"
#include "discovery/asset_classifier.hpp"
#include "node_connection/rpc_client.hpp"
#include "common/cancellation.hpp"
#include "common/errors.hpp"
#include "common/reporter.hpp"
#include "constants/chain.hpp"

AccountDiscovery DiscoveryEngine::Discover(const std::string& account) {
  AccountDiscovery out;
  out.account = account;
  AssetClassifier classifier(rpc_, reporter_);
  if (auto native = classifier.ProbeNative(account)) out.holdings.push_back(*native);

  LogScanner scanner(rpc_, reporter_, scan_, cancel_);
  try {
    out.scan = scanner.Scan(account);
    out.scan_completed = !out.scan.cancelled;
  } catch (const RpcError& e) {
    reporter_.Error("cannot scan " + account + ": chain head unavailable: " + e.what());
    return out;
  }
  if (out.scan.cancelled) { out.cancelled = true; return out; }

  for (const auto& candidate : out.scan.candidates) {
    if (cancel_ && cancel_->IsCancelled()) { out.cancelled = true; break; }
    if (auto h = classifier.Classify(candidate, account)) out.holdings.push_back(*h);
  }
  return out;
}

AccountDiscovery DiscoveryEngine::DiscoverAsset(const std::string& account, const std::string& asset) {
  AccountDiscovery out;
  out.account = account;
  AssetClassifier classifier(rpc_, reporter_);
  std::optional<Holding> h;
  if (ChainConstants::IsNativeAsset(asset)) h = classifier.ProbeNative(account);
  else h = classifier.Classify(asset, account);
  if (h) out.holdings.push_back(*h);
  else reporter_.Info("no balance of " + asset + " on " + account);
  return out;
}
