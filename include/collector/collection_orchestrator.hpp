#pragma once
#include <string>
#include <vector>
#include "collector/run_summary.hpp"
#include "config/collector_config.hpp"
#include "discovery/inventory.hpp"
#include "wallet/signer.hpp"

class HttpClient;
class AssetSelector;
class Reporter;
class TransferLedger;
class CancellationToken;
class RpcClient;

// Drives one run: endpoint selection, per-account discovery, aggregation,
// asset selection, per-account dispatch and the final summary. Accounts are
// handled strictly one after another on the calling thread.
class CollectionOrchestrator {
public:
  CollectionOrchestrator(HttpClient& http, AssetSelector& selector, Reporter& reporter,
                         const CollectorConfig& config, TransferLedger* ledger = nullptr,
                         const CancellationToken* cancel = nullptr)
    : http_(http), selector_(selector), reporter_(reporter), config_(config), ledger_(ledger), cancel_(cancel) {}

  // Precondition failures end in RunState::Halted; nothing here throws for them.
  RunSummary Run(const std::vector<std::string>& private_keys);

  RunState State() const { return state_; }
  const Inventory& GetInventory() const { return inventory_; }

private:
  HttpClient& http_;
  AssetSelector& selector_;
  Reporter& reporter_;
  CollectorConfig config_;
  TransferLedger* ledger_;
  const CancellationToken* cancel_;
  RunState state_ = RunState::Init;
  Inventory inventory_;

  void Enter(RunState next);
  bool Cancelled() const;
  RunSummary Halt(RunSummary summary, const std::string& reason);
  RunSummary Finish(RunSummary summary, RunState final_state);
  std::vector<Signer> LoadSigners(const std::vector<std::string>& private_keys, RunSummary& summary);
  void DiscoverAll(RpcClient& rpc, const std::vector<Signer>& signers, RunSummary& summary);
  void DispatchAll(RpcClient& rpc, const std::vector<Signer>& signers, const AssetRecord& record,
                   unsigned long long chain_id, RunSummary& summary);
};
