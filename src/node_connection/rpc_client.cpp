#include "node_connection/rpc_client.hpp"
#include "net/http_client.hpp"
#include "common/errors.hpp"
#include "utils/json_rpc.hpp"
#include "utils/hex.hpp"
#include <cctype>
#include <stdexcept>

using json = nlohmann::json;

static inline std::string Trim(const std::string& s) {
  size_t start = 0, end = s.size();
  while (start < end && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
  while (end > start && std::isspace(static_cast<unsigned char>(s[end-1]))) --end;
  return s.substr(start, end - start);
}

// "Name: value" sets that header; a bare value becomes the Authorization header.
static void ApplyAuthHeader(std::unordered_map<std::string, std::string>& headers,
                            const std::optional<std::string>& auth_header_opt) {
  if (!auth_header_opt) return;
  const std::string& raw = *auth_header_opt;
  auto pos = raw.find(':');
  if (pos != std::string::npos) {
    std::string name = Trim(raw.substr(0, pos));
    std::string value = Trim(raw.substr(pos + 1));
    if (!name.empty() && !value.empty()) {
      headers[name] = value;
      return;
    }
  }
  headers["Authorization"] = raw;
}

RpcClient::RpcClient(HttpClient& http,
                     const std::string& endpoint_url,
                     const std::optional<std::string>& auth_header,
                     int timeout_ms)
  : http_(http), endpoint_(endpoint_url), timeout_ms_(timeout_ms) {
  default_headers_["Content-Type"] = "application/json";
  ApplyAuthHeader(default_headers_, auth_header);
}

json RpcClient::Call(const std::string& method, const json& params) {
  auto payload = JsonRpcUtil::BuildRequest(method, params, next_id_++);
  auto resp = http_.Post(endpoint_, payload, default_headers_, timeout_ms_);
  if (resp.status == 0) {
    throw TransientRpcError(method + ": " + (resp.error.empty() ? "no response" : resp.error), 0, 0);
  }
  return JsonRpcUtil::ExtractResult(resp.body, resp.status);
}

std::string RpcClient::ExpectString(const json& result, const std::string& method) const {
  if (!result.is_string()) throw PermanentRpcError(method + ": unexpected result " + result.dump());
  return result.get<std::string>();
}

static unsigned long long ToULL(const std::string& hex, const std::string& method) {
  try {
    return ParseHexULL(hex);
  } catch (const std::exception& e) {
    throw PermanentRpcError(method + ": bad quantity '" + hex + "': " + e.what());
  }
}

static Amount ToAmount(const std::string& hex, const std::string& method) {
  try {
    return ParseHexAmount(hex);
  } catch (const std::exception& e) {
    throw PermanentRpcError(method + ": bad quantity '" + hex + "': " + e.what());
  }
}

unsigned long long RpcClient::EthBlockNumber() {
  return ToULL(ExpectString(Call("eth_blockNumber", json::array()), "eth_blockNumber"), "eth_blockNumber");
}

unsigned long long RpcClient::EthChainId() {
  return ToULL(ExpectString(Call("eth_chainId", json::array()), "eth_chainId"), "eth_chainId");
}

Amount RpcClient::EthGetBalance(const std::string& address, const std::string& block_tag) {
  auto r = Call("eth_getBalance", json::array({address, block_tag}));
  return ToAmount(ExpectString(r, "eth_getBalance"), "eth_getBalance");
}

std::string RpcClient::EthCall(const std::string& to, const std::string& data, const std::string& block_tag) {
  json call = {{"to", to}, {"data", data}};
  return ExpectString(Call("eth_call", json::array({call, block_tag})), "eth_call");
}

json RpcClient::EthGetLogs(const json& filter) {
  auto r = Call("eth_getLogs", json::array({filter}));
  if (!r.is_array()) throw PermanentRpcError("eth_getLogs: result is not an array");
  return r;
}

unsigned long long RpcClient::EthGetTransactionCount(const std::string& address, const std::string& block_tag) {
  auto r = Call("eth_getTransactionCount", json::array({address, block_tag}));
  return ToULL(ExpectString(r, "eth_getTransactionCount"), "eth_getTransactionCount");
}

Amount RpcClient::EthGasPrice() {
  return ToAmount(ExpectString(Call("eth_gasPrice", json::array()), "eth_gasPrice"), "eth_gasPrice");
}

std::string RpcClient::EthSendRawTransaction(const std::string& raw_tx_hex) {
  return ExpectString(Call("eth_sendRawTransaction", json::array({raw_tx_hex})), "eth_sendRawTransaction");
}

std::optional<json> RpcClient::EthGetTransactionReceipt(const std::string& tx_hash) {
  auto r = Call("eth_getTransactionReceipt", json::array({tx_hash}));
  if (r.is_null()) return std::nullopt;
  if (!r.is_object()) throw PermanentRpcError("eth_getTransactionReceipt: unexpected result " + r.dump());
  return r;
}
