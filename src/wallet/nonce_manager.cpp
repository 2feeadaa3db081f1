#include "wallet/nonce_manager.hpp"
#include "node_connection/rpc_client.hpp"
#include "common/reporter.hpp"
#include "utils/hex.hpp"

unsigned long long NonceManager::Next(const std::string& address) {
  const std::string key = ToLowerHex(address);
  unsigned long long fresh = rpc_.EthGetTransactionCount(address, "pending");
  auto it = last_issued_.find(key);
  if (it != last_issued_.end() && fresh <= it->second) {
    reporter_.Warning("node reports nonce " + std::to_string(fresh) + " for " + address +
                      " but " + std::to_string(it->second) + " was already used; using " +
                      std::to_string(it->second + 1));
    fresh = it->second + 1;
  }
  last_issued_[key] = fresh;
  return fresh;
}
