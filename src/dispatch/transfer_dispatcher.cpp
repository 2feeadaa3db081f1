#include "dispatch/transfer_dispatcher.hpp"
#include "node_connection/rpc_client.hpp"
#include "wallet/nonce_manager.hpp"
#include "gas/gas_strategy.hpp"
#include "protocols/erc20.hpp"
#include "protocols/erc721.hpp"
#include "common/cancellation.hpp"
#include "common/errors.hpp"
#include "common/reporter.hpp"
#include "utils/hex.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

TransferOutcome TransferDispatcher::Fail(const TransferIntent& intent, const std::string& reason) {
  TransferOutcome o;
  o.intent = intent;
  o.state = OutcomeState::Failed;
  o.reason = reason;
  return o;
}

TransferOutcome TransferDispatcher::Dispatch(const TransferIntent& intent, const Signer& signer) {
  const std::string tag = intent.account + " " + intent.asset.symbol + " (" + intent.asset.address + ")";
  if (ToLowerHex(signer.Address()) != ToLowerHex(intent.account)) {
    return Fail(intent, "signer " + signer.Address() + " does not control " + intent.account);
  }
  if (!IsHexAddress(intent.destination)) {
    return Fail(intent, "invalid destination " + intent.destination);
  }

  GasQuote quote;
  try {
    quote = gas_.Quote();
  } catch (const RpcError& e) {
    reporter_.Error("gas price unavailable for " + tag + ": " + e.what());
    return Fail(intent, std::string("gas price unavailable: ") + e.what());
  }

  TransactionFields tx;
  tx.type = settings_.tx_type;
  tx.chain_id = settings_.chain_id;
  tx.gas_price = quote.gas_price;
  tx.max_fee_per_gas = quote.gas_price;
  tx.max_priority_fee_per_gas = quote.gas_price;
  Amount amount_sent = 0;

  switch (intent.asset.Kind()) {
    case AssetKind::Native: {
      tx.gas_limit = settings_.native_gas_limit;
      const Amount fee = quote.gas_price * tx.gas_limit;
      if (intent.amount <= fee) {
        reporter_.Warning("native balance of " + intent.account + " does not cover the fee of " +
                          AmountToDecimal(fee) + " wei");
        return Fail(intent, "balance " + AmountToDecimal(intent.amount) + " does not cover fee " + AmountToDecimal(fee));
      }
      tx.to = ToLowerHex(intent.destination);
      tx.value = intent.amount - fee;
      tx.data = "0x";
      amount_sent = tx.value;
      break;
    }
    case AssetKind::FungibleToken:
      tx.gas_limit = settings_.gas_limit;
      tx.to = intent.asset.address;
      tx.data = ERC20::BuildTransferCall(intent.destination, intent.amount);
      amount_sent = intent.amount;
      break;
    case AssetKind::NonFungibleToken:
      if (!intent.token_id) return Fail(intent, "no token id given for collection transfer");
      tx.gas_limit = settings_.gas_limit;
      tx.to = intent.asset.address;
      tx.data = ERC721::BuildTransferFromCall(intent.account, intent.destination, *intent.token_id);
      break;
  }

  // Read immediately before signing; never reused across transfers.
  try {
    tx.nonce = nonces_.Next(intent.account);
  } catch (const RpcError& e) {
    reporter_.Error("nonce unavailable for " + tag + ": " + e.what());
    return Fail(intent, std::string("nonce unavailable: ") + e.what());
  }

  SignedTransaction signed_tx;
  try {
    signed_tx = signer.Sign(tx);
  } catch (const std::exception& e) {
    reporter_.Error("signing failed for " + tag + ": " + e.what());
    return Fail(intent, std::string("signing failed: ") + e.what());
  }

  TransferOutcome outcome;
  outcome.intent = intent;
  outcome.amount_sent = amount_sent;
  try {
    outcome.tx_hash = rpc_.EthSendRawTransaction(signed_tx.raw);
  } catch (const RpcError& e) {
    reporter_.Error("submission rejected for " + tag + " nonce " + std::to_string(tx.nonce) + ": " + e.what());
    outcome.state = OutcomeState::Failed;
    outcome.reason = std::string("submission rejected: ") + e.what();
    outcome.amount_sent = 0;
    return outcome;
  }
  reporter_.Info("submitted " + outcome.tx_hash + " for " + tag + " nonce " + std::to_string(tx.nonce));
  return AwaitReceipt(std::move(outcome));
}

TransferOutcome TransferDispatcher::AwaitReceipt(TransferOutcome outcome) {
  const auto deadline = std::chrono::steady_clock::now() + settings_.confirm_timeout;
  for (;;) {
    try {
      if (auto receipt = rpc_.EthGetTransactionReceipt(outcome.tx_hash)) {
        const json& r = *receipt;
        if (r.contains("blockNumber") && r["blockNumber"].is_string()) {
          outcome.block_number = ParseHexULL(r["blockNumber"].get<std::string>());
        }
        const std::string block = outcome.block_number ? std::to_string(*outcome.block_number) : "?";
        if (r.contains("status") && r["status"].is_string() && ParseHexULL(r["status"].get<std::string>()) == 0) {
          outcome.state = OutcomeState::Failed;
          outcome.reason = "reverted in block " + block;
          outcome.amount_sent = 0;
          reporter_.Error("transaction " + outcome.tx_hash + " reverted in block " + block);
        } else {
          outcome.state = OutcomeState::Confirmed;
          reporter_.Info("transaction " + outcome.tx_hash + " confirmed in block " + block);
        }
        return outcome;
      }
    } catch (const RpcError& e) {
      reporter_.Warning("receipt poll for " + outcome.tx_hash + " failed: " + e.what());
    } catch (const std::logic_error& e) {
      reporter_.Warning("unreadable receipt for " + outcome.tx_hash + ": " + e.what());
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      outcome.state = OutcomeState::TimedOut;
      outcome.reason = "not included within " + std::to_string(settings_.confirm_timeout.count()) + " ms";
      reporter_.Warning("transaction " + outcome.tx_hash + " still pending after " +
                        std::to_string(settings_.confirm_timeout.count()) + " ms; it may still confirm");
      return outcome;
    }
    if (!PauseFor(settings_.receipt_poll, cancel_)) {
      outcome.state = OutcomeState::TimedOut;
      outcome.reason = "confirmation wait interrupted";
      reporter_.Warning("stopped waiting for " + outcome.tx_hash + "; it may still confirm");
      return outcome;
    }
  }
}

std::vector<Amount> TransferDispatcher::EnumerateTokenIds(const std::string& collection, const std::string& owner,
                                                          const Amount& known_count) {
  Amount count = known_count;
  if (auto c = ERC721::BalanceOf(rpc_, collection, owner)) {
    count = *c;
  } else {
    reporter_.Warning("owned count of " + collection + " for " + owner + " unreadable, using " +
                      AmountToDecimal(known_count) + " from discovery");
  }
  if (count > settings_.max_token_ids) {
    reporter_.Warning("owned count " + AmountToDecimal(count) + " of " + collection + " for " + owner +
                      " capped at " + std::to_string(settings_.max_token_ids));
    count = settings_.max_token_ids;
  }
  const unsigned long long limit = static_cast<unsigned long long>(count);
  std::vector<Amount> ids;
  int misses = 0;
  for (unsigned long long i = 0; i < limit; ++i) {
    if (cancel_ && cancel_->IsCancelled()) break;
    if (auto id = ERC721::TokenOfOwnerByIndex(rpc_, collection, owner, i)) {
      ids.push_back(*id);
      misses = 0;
      continue;
    }
    reporter_.Warning("token at index " + std::to_string(i) + " of " + collection + " for " + owner +
                      " unreadable, skipped");
    if (++misses >= settings_.max_unreadable_indices) {
      reporter_.Error("enumeration of " + collection + " for " + owner + " stopped after " +
                      std::to_string(misses) + " unreadable indices in a row");
      break;
    }
  }
  return ids;
}

std::vector<TransferOutcome> TransferDispatcher::DispatchHolding(const Signer& signer, const AssetMeta& asset,
                                                                 const Amount& balance, const std::string& destination) {
  std::vector<TransferOutcome> outcomes;
  TransferIntent base;
  base.account = signer.Address();
  base.destination = destination;
  base.asset = asset;

  if (asset.Kind() != AssetKind::NonFungibleToken) {
    base.amount = balance;
    outcomes.push_back(Dispatch(base, signer));
    return outcomes;
  }

  const auto ids = EnumerateTokenIds(asset.address, signer.Address(), balance);
  reporter_.Info(std::to_string(ids.size()) + " token(s) of " + asset.address + " to move from " + signer.Address());
  for (size_t i = 0; i < ids.size(); ++i) {
    if (cancel_ && cancel_->IsCancelled()) break;
    TransferIntent intent = base;
    intent.amount = 1;
    intent.token_id = ids[i];
    outcomes.push_back(Dispatch(intent, signer));
    if (i + 1 < ids.size() && !PauseFor(settings_.operation_delay, cancel_)) break;
  }
  return outcomes;
}
