#pragma once
#include <string>
#include <optional>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include "utils/amount.hpp"

class HttpClient;

// Synchronous JSON-RPC client bound to one endpoint. Every call either returns
// the decoded result or throws TransientRpcError / PermanentRpcError.
class RpcClient {
public:
  RpcClient(HttpClient& http,
            const std::string& endpoint_url,
            const std::optional<std::string>& auth_header = std::nullopt,
            int timeout_ms = 15000);

  // Generic call(method, params) -> result.
  nlohmann::json Call(const std::string& method, const nlohmann::json& params);

  unsigned long long EthBlockNumber();
  unsigned long long EthChainId();
  Amount EthGetBalance(const std::string& address, const std::string& block_tag = "latest");
  // Returns the 0x-hex return data of a read-only contract call.
  std::string EthCall(const std::string& to, const std::string& data, const std::string& block_tag = "latest");
  // filter: {"fromBlock","toBlock","topics",...}; returns the log array.
  nlohmann::json EthGetLogs(const nlohmann::json& filter);
  unsigned long long EthGetTransactionCount(const std::string& address, const std::string& block_tag = "pending");
  Amount EthGasPrice();
  // Returns the transaction hash reported by the node.
  std::string EthSendRawTransaction(const std::string& raw_tx_hex);
  // nullopt while the transaction is not yet included.
  std::optional<nlohmann::json> EthGetTransactionReceipt(const std::string& tx_hash);

  const std::string& Endpoint() const { return endpoint_; }
private:
  HttpClient& http_;
  std::string endpoint_;
  int timeout_ms_;
  int next_id_ = 1;
  std::unordered_map<std::string, std::string> default_headers_;
  std::string ExpectString(const nlohmann::json& result, const std::string& method) const;
};
