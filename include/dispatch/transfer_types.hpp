#pragma once
#include <optional>
#include <string>
#include "discovery/asset_types.hpp"

// One transfer the dispatcher is asked to perform.
// amount: base units for fungible assets, full balance for native (the fee is
// taken out before sending); ignored for non-fungible ones, which use token_id.
struct TransferIntent {
  std::string account;
  std::string destination;
  AssetMeta asset;
  Amount amount = 0;
  std::optional<Amount> token_id;
};

enum class OutcomeState { Confirmed, Failed, TimedOut };

inline const char* OutcomeStateName(OutcomeState s) {
  switch (s) {
    case OutcomeState::Confirmed: return "CONFIRMED";
    case OutcomeState::Failed: return "FAILED";
    case OutcomeState::TimedOut: return "TIMED_OUT";
  }
  return "UNKNOWN";
}

struct TransferOutcome {
  TransferIntent intent;
  OutcomeState state = OutcomeState::Failed;
  std::string tx_hash;                          // empty when nothing was submitted
  std::optional<unsigned long long> block_number; // Confirmed, or reverted in a block
  std::string reason;                           // Failed / TimedOut
  Amount amount_sent = 0;                       // value actually moved, 0 for NFTs
};
