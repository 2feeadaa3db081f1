#include "collector/run_summary.hpp"

const char* RunStateName(RunState state) {
  switch (state) {
    case RunState::Init: return "Init";
    case RunState::EndpointSelected: return "EndpointSelected";
    case RunState::Scanning: return "Scanning";
    case RunState::Aggregated: return "Aggregated";
    case RunState::AwaitingSelection: return "AwaitingSelection";
    case RunState::Dispatching: return "Dispatching";
    case RunState::Summarized: return "Summarized";
    case RunState::Cancelled: return "Cancelled";
    case RunState::Halted: return "Halted";
  }
  return "Unknown";
}

void RunSummary::Count(const TransferOutcome& outcome) {
  if (outcome.intent.asset.Kind() == AssetKind::NonFungibleToken) ++nft_transfers_issued;
  switch (outcome.state) {
    case OutcomeState::Confirmed:
      ++transfers_confirmed;
      collected += outcome.amount_sent;
      break;
    case OutcomeState::Failed: ++transfers_failed; break;
    case OutcomeState::TimedOut: ++transfers_timed_out; break;
  }
  outcomes.push_back(outcome);
}

std::string RunSummary::CollectedDisplay() const {
  return FormatUnits(collected, selected_decimals);
}
