#pragma once
#include <string>
#include <vector>
#include "dispatch/transfer_types.hpp"

enum class RunState {
  Init,
  EndpointSelected,
  Scanning,
  Aggregated,
  AwaitingSelection,
  Dispatching,
  Summarized,
  Cancelled, // no selection made, or interrupted; partial statistics still reported
  Halted     // precondition failure before any state-changing action
};

const char* RunStateName(RunState state);

struct RunSummary {
  RunState final_state = RunState::Init;
  std::string halt_reason;
  std::string endpoint;
  size_t accounts_total = 0;
  size_t accounts_processed = 0;
  size_t accounts_rejected = 0;   // credentials that did not parse
  size_t accounts_unscanned = 0;  // log scan could not run for the account
  size_t assets_discovered = 0;
  std::string selected_asset;   // address or "NATIVE"; empty when nothing was chosen
  std::string selected_symbol;
  int selected_decimals = 0;
  size_t transfers_confirmed = 0;
  size_t transfers_failed = 0;
  size_t transfers_timed_out = 0;
  size_t nft_transfers_issued = 0;
  Amount collected = 0;         // base units confirmed, native or fungible selections only
  std::vector<TransferOutcome> outcomes;

  void Count(const TransferOutcome& outcome);
  std::string CollectedDisplay() const;
  int ExitCode() const { return final_state == RunState::Halted ? 1 : 0; }
};
