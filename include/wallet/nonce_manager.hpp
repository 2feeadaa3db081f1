#pragma once
#include <string>
#include <unordered_map>

class RpcClient;
class Reporter;

// Hands out transaction sequence numbers. Every call reads the account's
// pending count from the node; nothing is reserved ahead of time. If the node
// has not caught up with a number this process already used, the next one
// after it is returned instead, so numbers from one account strictly increase.
class NonceManager {
public:
  NonceManager(RpcClient& rpc, Reporter& reporter) : rpc_(rpc), reporter_(reporter) {}
  // Throws RpcError when the count cannot be read.
  unsigned long long Next(const std::string& address);
private:
  RpcClient& rpc_;
  Reporter& reporter_;
  std::unordered_map<std::string, unsigned long long> last_issued_;
};
