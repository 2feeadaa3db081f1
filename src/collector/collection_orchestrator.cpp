#include "collector/collection_orchestrator.hpp"
#include "collector/asset_selector.hpp"
#include "discovery/discovery_engine.hpp"
#include "dispatch/transfer_dispatcher.hpp"
#include "node_connection/endpoint_selector.hpp"
#include "node_connection/rpc_client.hpp"
#include "wallet/nonce_manager.hpp"
#include "gas/gas_strategy.hpp"
#include "telemetry/transfer_ledger.hpp"
#include "common/cancellation.hpp"
#include "common/errors.hpp"
#include "common/reporter.hpp"
#include "utils/hex.hpp"
#include <unordered_set>

void CollectionOrchestrator::Enter(RunState next) {
  reporter_.Debug(std::string("state ") + RunStateName(state_) + " -> " + RunStateName(next));
  state_ = next;
}

bool CollectionOrchestrator::Cancelled() const {
  return cancel_ && cancel_->IsCancelled();
}

RunSummary CollectionOrchestrator::Halt(RunSummary summary, const std::string& reason) {
  reporter_.Error("halting: " + reason);
  summary.halt_reason = reason;
  return Finish(std::move(summary), RunState::Halted);
}

RunSummary CollectionOrchestrator::Finish(RunSummary summary, RunState final_state) {
  Enter(final_state);
  summary.final_state = final_state;
  reporter_.Info(std::string("=== run finished: ") + RunStateName(final_state) + " ===");
  reporter_.Info("accounts processed: " + std::to_string(summary.accounts_processed) + "/" +
                 std::to_string(summary.accounts_total));
  if (summary.accounts_rejected > 0) {
    reporter_.Warning("credentials rejected: " + std::to_string(summary.accounts_rejected));
  }
  if (summary.accounts_unscanned > 0) {
    reporter_.Warning("accounts without a log scan: " + std::to_string(summary.accounts_unscanned));
  }
  reporter_.Info("transfers confirmed: " + std::to_string(summary.transfers_confirmed) +
                 ", failed: " + std::to_string(summary.transfers_failed) +
                 ", timed out: " + std::to_string(summary.transfers_timed_out));
  if (summary.nft_transfers_issued > 0) {
    reporter_.Info("NFT transfers issued: " + std::to_string(summary.nft_transfers_issued));
  } else if (!summary.selected_asset.empty()) {
    reporter_.Info("total collected: " + summary.CollectedDisplay() + " " + summary.selected_symbol +
                   " (" + AmountToDecimal(summary.collected) + " base units)");
  }
  if (ledger_) ledger_->RecordSummary(summary);
  return summary;
}

std::vector<Signer> CollectionOrchestrator::LoadSigners(const std::vector<std::string>& private_keys,
                                                        RunSummary& summary) {
  std::vector<Signer> signers;
  std::unordered_set<std::string> seen;
  for (size_t i = 0; i < private_keys.size(); ++i) {
    try {
      Signer s(private_keys[i]);
      if (!seen.insert(s.Address()).second) {
        reporter_.Warning("credential " + std::to_string(i + 1) + " repeats account " + s.Address() + ", ignored");
        continue;
      }
      signers.push_back(std::move(s));
    } catch (const std::invalid_argument& e) {
      ++summary.accounts_rejected;
      reporter_.Error("credential " + std::to_string(i + 1) + " unusable: " + e.what());
    }
  }
  return signers;
}

void CollectionOrchestrator::DiscoverAll(RpcClient& rpc, const std::vector<Signer>& signers, RunSummary& summary) {
  ScanSettings scan;
  scan.lookback_blocks = config_.scan_lookback_blocks;
  scan.window_blocks = config_.scan_window_blocks;
  scan.max_attempts = config_.scan_max_attempts;
  scan.backoff_step = config_.scan_backoff_step;
  scan.window_delay = config_.scan_window_delay;
  DiscoveryEngine engine(rpc, reporter_, scan, cancel_);

  for (size_t i = 0; i < signers.size(); ++i) {
    if (Cancelled()) return;
    const std::string& account = signers[i].Address();
    reporter_.Info("--- account " + std::to_string(i + 1) + "/" + std::to_string(signers.size()) + ": " + account + " ---");
    AccountDiscovery found = config_.preselected_asset
      ? engine.DiscoverAsset(account, *config_.preselected_asset)
      : engine.Discover(account);
    if (!config_.preselected_asset && !found.scan_completed && !found.cancelled) {
      ++summary.accounts_unscanned;
      reporter_.Warning("log scan did not run for " + account + ", only its native balance is known");
    } else if (!config_.preselected_asset && found.scan_completed) {
      reporter_.Info("scanned blocks " + std::to_string(found.scan.range.from_block) + "-" +
                     std::to_string(found.scan.range.to_block) + ": " +
                     std::to_string(found.scan.candidates.size()) + " candidate(s), " +
                     std::to_string(found.scan.windows_skipped) + " window(s) skipped, " +
                     std::to_string(found.scan.windows_failed) + " failed");
    }
    inventory_.AddAll(account, found.holdings);
    if (found.cancelled) return;
  }
}

void CollectionOrchestrator::DispatchAll(RpcClient& rpc, const std::vector<Signer>& signers, const AssetRecord& record,
                                         unsigned long long chain_id, RunSummary& summary) {
  NonceManager nonces(rpc, reporter_);
  GasStrategy gas(rpc, config_.gas_price_wei);
  DispatchSettings settings;
  settings.tx_type = config_.tx_type;
  settings.chain_id = chain_id;
  settings.gas_limit = config_.gas_limit;
  settings.native_gas_limit = config_.native_gas_limit;
  settings.confirm_timeout = config_.confirm_timeout;
  settings.receipt_poll = config_.receipt_poll_interval;
  settings.operation_delay = config_.operation_delay;
  TransferDispatcher dispatcher(rpc, nonces, gas, reporter_, settings, cancel_);

  const std::string destination = ToLowerHex(config_.recipient);
  for (size_t i = 0; i < record.balances.size(); ++i) {
    if (Cancelled()) return;
    const AccountBalance& holder = record.balances[i];
    const Signer* signer = nullptr;
    for (const auto& s : signers) {
      if (s.Address() == holder.account) { signer = &s; break; }
    }
    if (!signer) {
      reporter_.Error("no credential for " + holder.account + ", skipped");
      continue;
    }
    ++summary.accounts_processed;
    if (holder.account == destination) {
      reporter_.Info(holder.account + " is the destination, nothing to move");
      continue;
    }
    for (const auto& outcome : dispatcher.DispatchHolding(*signer, record.asset, holder.balance, destination)) {
      summary.Count(outcome);
      if (ledger_) ledger_->Record(outcome);
    }
    if (i + 1 < record.balances.size() && !PauseFor(config_.operation_delay, cancel_)) return;
  }
}

RunSummary CollectionOrchestrator::Run(const std::vector<std::string>& private_keys) {
  RunSummary summary;
  state_ = RunState::Init;
  inventory_ = Inventory();

  if (private_keys.empty()) return Halt(std::move(summary), "no credentials configured");
  if (!IsHexAddress(config_.recipient)) {
    return Halt(std::move(summary), "no valid destination configured (RECIPIENT_ADDRESS='" + config_.recipient + "')");
  }
  const std::vector<Signer> signers = LoadSigners(private_keys, summary);
  summary.accounts_total = signers.size();
  if (signers.empty()) return Halt(std::move(summary), "no usable credentials");
  reporter_.Info("destination: " + config_.recipient + ", accounts: " + std::to_string(signers.size()));

  Endpoint endpoint;
  try {
    EndpointSelector endpoints(http_, reporter_, config_.auth_header, config_.rpc_timeout_ms);
    endpoint = endpoints.Select(config_.EndpointCandidates());
  } catch (const NoReachableEndpoint& e) {
    return Halt(std::move(summary), e.what());
  }
  summary.endpoint = endpoint.url;
  Enter(RunState::EndpointSelected);

  RpcClient rpc(http_, endpoint.url, config_.auth_header, config_.rpc_timeout_ms);
  unsigned long long chain_id = config_.chain_id;
  if (chain_id == 0) {
    try {
      chain_id = rpc.EthChainId();
    } catch (const RpcError& e) {
      return Halt(std::move(summary), std::string("chain id unavailable: ") + e.what());
    }
  }
  reporter_.Info("chain id " + std::to_string(chain_id));

  Enter(RunState::Scanning);
  DiscoverAll(rpc, signers, summary);
  if (Cancelled()) return Finish(std::move(summary), RunState::Cancelled);

  Enter(RunState::Aggregated);
  summary.assets_discovered = inventory_.Size();
  const std::vector<AssetRecord> ranked = inventory_.Ordered();
  for (const auto& r : ranked) reporter_.Info("inventory: " + DescribeRecord(r));
  if (ranked.empty()) {
    reporter_.Warning("nothing to collect");
    return Finish(std::move(summary), RunState::Summarized);
  }

  Enter(RunState::AwaitingSelection);
  const std::optional<std::string> choice = selector_.Choose(ranked);
  if (!choice || Cancelled()) {
    reporter_.Info("no asset selected");
    return Finish(std::move(summary), RunState::Cancelled);
  }
  const AssetRecord* record = inventory_.Find(*choice);
  if (!record) {
    reporter_.Error("selected asset " + *choice + " is not in the inventory");
    return Finish(std::move(summary), RunState::Cancelled);
  }
  summary.selected_asset = record->asset.address;
  summary.selected_symbol = record->asset.symbol;
  summary.selected_decimals = record->asset.Decimals();
  reporter_.Info("collecting " + DescribeRecord(*record));

  Enter(RunState::Dispatching);
  DispatchAll(rpc, signers, *record, chain_id, summary);
  if (Cancelled()) return Finish(std::move(summary), RunState::Cancelled);
  return Finish(std::move(summary), RunState::Summarized);
}
