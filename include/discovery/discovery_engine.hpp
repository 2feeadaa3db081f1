#pragma once
#include <string>
#include <vector>
#include "discovery/asset_types.hpp"
#include "discovery/log_scanner.hpp"

class RpcClient;
class Reporter;
class CancellationToken;

struct AccountDiscovery {
  std::string account;
  std::vector<Holding> holdings; // native first, then classified candidates in scan order
  ScanReport scan;
  bool scan_completed = false;   // false when the head could not be read or scanning was skipped
  bool cancelled = false;
};

// Per-account discovery: native balance, log scan, then classification of
// every candidate. All RPC failures are contained here.
class DiscoveryEngine {
public:
  DiscoveryEngine(RpcClient& rpc, Reporter& reporter, const ScanSettings& scan,
                  const CancellationToken* cancel = nullptr)
    : rpc_(rpc), reporter_(reporter), scan_(scan), cancel_(cancel) {}
  AccountDiscovery Discover(const std::string& account);
  // Probes only `asset` ("NATIVE" or a contract) for the account, no scan.
  AccountDiscovery DiscoverAsset(const std::string& account, const std::string& asset);
private:
  RpcClient& rpc_;
  Reporter& reporter_;
  ScanSettings scan_;
  const CancellationToken* cancel_;
};
