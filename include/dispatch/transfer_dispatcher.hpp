#pragma once
#include <chrono>
#include <string>
#include <vector>
#include "dispatch/transfer_types.hpp"
#include "wallet/signer.hpp"

class RpcClient;
class NonceManager;
class GasStrategy;
class Reporter;
class CancellationToken;

struct DispatchSettings {
  TxType tx_type = TxType::Legacy;
  unsigned long long chain_id = 8453;
  unsigned long long gas_limit = 100000;       // contract transfers
  unsigned long long native_gas_limit = 21000;
  std::chrono::milliseconds confirm_timeout{120000};
  std::chrono::milliseconds receipt_poll{2000};
  std::chrono::milliseconds operation_delay{1000}; // between transfers of one collection
  unsigned long long max_token_ids = 10000;        // enumeration cap per collection
  int max_unreadable_indices = 5;                  // consecutive misses that end enumeration
};

// Builds, signs, submits and confirms transfers for one account at a time.
// Never throws for a per-transfer problem: everything ends up in the outcome.
class TransferDispatcher {
public:
  TransferDispatcher(RpcClient& rpc, NonceManager& nonces, GasStrategy& gas, Reporter& reporter,
                     const DispatchSettings& settings, const CancellationToken* cancel = nullptr)
    : rpc_(rpc), nonces_(nonces), gas_(gas), reporter_(reporter), settings_(settings), cancel_(cancel) {}

  TransferOutcome Dispatch(const TransferIntent& intent, const Signer& signer);

  // Moves an account's whole holding of `asset` to `destination`. Native and
  // fungible assets take one transfer; a collection takes one per token owned.
  std::vector<TransferOutcome> DispatchHolding(const Signer& signer, const AssetMeta& asset,
                                               const Amount& balance, const std::string& destination);

  // Token ids owned by `owner`, by index. Unreadable indices are skipped;
  // max_unreadable_indices misses in a row end the walk. known_count is used
  // when the owned-count query itself fails. At most max_token_ids are read.
  std::vector<Amount> EnumerateTokenIds(const std::string& collection, const std::string& owner,
                                        const Amount& known_count);
private:
  RpcClient& rpc_;
  NonceManager& nonces_;
  GasStrategy& gas_;
  Reporter& reporter_;
  DispatchSettings settings_;
  const CancellationToken* cancel_;

  TransferOutcome AwaitReceipt(TransferOutcome outcome);
  static TransferOutcome Fail(const TransferIntent& intent, const std::string& reason);
};
