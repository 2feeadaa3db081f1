#pragma once
#include <deque>
#include <map>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "net/http_client.hpp"
#include "encoding/abi.hpp"
#include "utils/amount.hpp"
#include "utils/hex.hpp"

// In-memory JSON-RPC node behind the HttpClient interface. Holds native
// balances, ERC-20 and ERC-721 contracts, Transfer logs and submitted
// transactions, and can inject faults per method or per scan window.
class FakeChain : public HttpClient {
public:
  using json = nlohmann::json;

  struct Fault {
    long http_status = 200;
    int code = 0;
    std::string message;
    std::string raw_error;  // when set, sent verbatim as the "error" member
  };

  static Fault Transient() { return Fault{200, -32005, "limit exceeded"}; }
  static Fault Permanent() { return Fault{200, -32602, "invalid params"}; }

  struct Contract {
    bool fungible = true;
    int decimals = 18;
    std::string symbol;
    std::string name;
    std::map<std::string, Amount> balances;                // fungible holders
    std::map<std::string, std::vector<Amount>> owned;      // collection holders, by index
    std::set<unsigned long long> broken_indices;           // tokenOfOwnerByIndex reverts here
    bool balance_reverts = false;
    bool decimals_reverts = false;
    bool supports_erc721 = false;                          // answers ERC-165 for 0x80ac58cd
  };

  struct TransferLog {
    std::string contract;
    std::string from;
    std::string to;
    unsigned long long block = 0;
  };

  unsigned long long head = 100000;
  unsigned long long chain_id = 8453;
  Amount gas_price = Amount(1000000000);  // 1 gwei
  std::set<std::string> unreachable_urls;
  std::map<std::string, Amount> native_balances;
  std::map<std::string, Contract> contracts;
  std::vector<TransferLog> logs;
  // eth_getLogs faults consumed in order, keyed by the window's fromBlock
  std::map<unsigned long long, std::deque<Fault>> log_faults;
  // faults consumed in order, keyed by method name
  std::map<std::string, std::deque<Fault>> method_faults;
  // answered calls of a method before its faults start to apply
  std::map<std::string, size_t> method_faults_after;
  // 0-based eth_sendRawTransaction indices that are rejected / revert on inclusion
  std::set<size_t> rejected_sends;
  std::set<size_t> reverted_sends;
  bool include_transactions = true;
  bool advance_nonce_on_send = true;

  std::vector<std::pair<std::string, json>> requests;
  std::vector<std::string> sent_raw;
  std::vector<unsigned long long> nonces_read;

  void AddToken(const std::string& address, int decimals, const std::string& symbol, const std::string& name) {
    Contract c;
    c.fungible = true;
    c.decimals = decimals;
    c.symbol = symbol;
    c.name = name;
    contracts[ToLowerHex(address)] = c;
  }

  void AddCollection(const std::string& address, const std::string& symbol, const std::string& name) {
    Contract c;
    c.fungible = false;
    c.supports_erc721 = true;
    c.decimals = 0;
    c.symbol = symbol;
    c.name = name;
    contracts[ToLowerHex(address)] = c;
  }

  Contract& At(const std::string& address) { return contracts.at(ToLowerHex(address)); }

  void AddLog(const std::string& contract, const std::string& from, const std::string& to, unsigned long long block) {
    logs.push_back(TransferLog{ToLowerHex(contract), ToLowerHex(from), ToLowerHex(to), block});
  }

  size_t CountOf(const std::string& method) const {
    size_t n = 0;
    for (const auto& r : requests) {
      if (r.second.value("method", std::string()) == method) ++n;
    }
    return n;
  }

  std::vector<json> RequestsFor(const std::string& method) const {
    std::vector<json> out;
    for (const auto& r : requests) {
      if (r.second.value("method", std::string()) == method) out.push_back(r.second);
    }
    return out;
  }

  HttpResponse Post(const std::string& url, const std::string& body,
                    const std::unordered_map<std::string, std::string>&, int) override {
    json req = json::parse(body);
    requests.emplace_back(url, req);
    if (unreachable_urls.count(url)) {
      HttpResponse r;
      r.error = "connection refused";
      return r;
    }
    const std::string method = req.value("method", std::string());
    const json& params = req["params"];
    const json id = req["id"];

    const size_t seen = method_calls_[method]++;
    auto after = method_faults_after.find(method);
    const bool armed = after == method_faults_after.end() || seen >= after->second;
    auto mf = method_faults.find(method);
    if (armed && mf != method_faults.end() && !mf->second.empty()) {
      Fault f = mf->second.front();
      mf->second.pop_front();
      return ErrorResponse(id, f);
    }

    if (method == "eth_blockNumber") return Result(id, ToHexQuantity(head));
    if (method == "eth_chainId") return Result(id, ToHexQuantity(chain_id));
    if (method == "eth_gasPrice") return Result(id, AmountToHexQuantity(gas_price));
    if (method == "eth_getBalance") {
      auto it = native_balances.find(ToLowerHex(params[0].get<std::string>()));
      return Result(id, AmountToHexQuantity(it == native_balances.end() ? Amount(0) : it->second));
    }
    if (method == "eth_getLogs") return GetLogs(id, params[0]);
    if (method == "eth_call") return Call(id, params[0]);
    if (method == "eth_getTransactionCount") {
      const std::string who = ToLowerHex(params[0].get<std::string>());
      last_nonce_reader_ = who;
      nonces_read.push_back(nonces_[who]);
      return Result(id, ToHexQuantity(nonces_[who]));
    }
    if (method == "eth_sendRawTransaction") return Send(id, params[0].get<std::string>());
    if (method == "eth_getTransactionReceipt") {
      auto it = receipts_.find(params[0].get<std::string>());
      if (!include_transactions || it == receipts_.end()) return Result(id, nullptr);
      return Result(id, it->second);
    }
    return ErrorResponse(id, Fault{200, -32601, "method not found"});
  }

  void SetNonce(const std::string& address, unsigned long long n) { nonces_[ToLowerHex(address)] = n; }

private:
  std::map<std::string, unsigned long long> nonces_;
  std::map<std::string, size_t> method_calls_;
  std::map<std::string, json> receipts_;
  std::string last_nonce_reader_;

  static HttpResponse Result(const json& id, const json& result) {
    json body = {{"jsonrpc", "2.0"}, {"id", id}, {"result", result}};
    HttpResponse r;
    r.status = 200;
    r.body = body.dump();
    return r;
  }

  static HttpResponse ErrorResponse(const json& id, const Fault& f) {
    json error = f.raw_error.empty() ? json{{"code", f.code}, {"message", f.message}} : json::parse(f.raw_error);
    json body = {{"jsonrpc", "2.0"}, {"id", id}, {"error", error}};
    HttpResponse r;
    r.status = f.http_status;
    r.body = body.dump();
    return r;
  }

  static std::string Word(const Amount& v) { return "0x" + AmountToWordHex(v); }

  static std::string EncodeString(const std::string& s) {
    std::string hex;
    static const char* digits = "0123456789abcdef";
    for (unsigned char c : s) { hex += digits[c >> 4]; hex += digits[c & 0xF]; }
    while (hex.size() % 64 != 0 || hex.empty()) hex += '0';
    return "0x" + AmountToWordHex(Amount(32)) + AmountToWordHex(Amount(s.size())) + hex;
  }

  HttpResponse GetLogs(const json& id, const json& filter) {
    const unsigned long long from = ParseHexULL(filter["fromBlock"].get<std::string>());
    const unsigned long long to = ParseHexULL(filter["toBlock"].get<std::string>());
    auto lf = log_faults.find(from);
    if (lf != log_faults.end() && !lf->second.empty()) {
      Fault f = lf->second.front();
      lf->second.pop_front();
      return ErrorResponse(id, f);
    }
    const json& topics = filter["topics"];
    json out = json::array();
    for (const auto& l : logs) {
      if (l.block < from || l.block > to) continue;
      if (topics.size() > 1 && !topics[1].is_null() && topics[1].get<std::string>() != ABI::AddressTopic(l.from)) continue;
      if (topics.size() > 2 && !topics[2].is_null() && topics[2].get<std::string>() != ABI::AddressTopic(l.to)) continue;
      out.push_back({{"address", l.contract}, {"blockNumber", ToHexQuantity(l.block)}});
    }
    return Result(id, out);
  }

  HttpResponse Call(const json& id, const json& call) {
    const Fault revert{200, 3, "execution reverted"};
    auto it = contracts.find(ToLowerHex(call["to"].get<std::string>()));
    if (it == contracts.end()) return Result(id, "0x");
    Contract& c = it->second;
    const std::string data = Strip0x(call["data"].get<std::string>());
    const std::string selector = data.substr(0, 8);
    auto word_address = [&](size_t i) { return "0x" + data.substr(8 + i * 64 + 24, 40); };
    auto word_uint = [&](size_t i) { return ParseHexAmount(data.substr(8 + i * 64, 64)); };

    if (selector == "70a08231") {
      if (c.balance_reverts) return ErrorResponse(id, revert);
      const std::string owner = word_address(0);
      if (c.fungible) {
        auto b = c.balances.find(owner);
        return Result(id, Word(b == c.balances.end() ? Amount(0) : b->second));
      }
      auto o = c.owned.find(owner);
      return Result(id, Word(o == c.owned.end() ? Amount(0) : Amount(o->second.size())));
    }
    if (selector == "313ce567") {
      if (!c.fungible || c.decimals_reverts) return ErrorResponse(id, revert);
      return Result(id, Word(c.decimals));
    }
    if (selector == "95d89b41") return Result(id, EncodeString(c.symbol));
    if (selector == "06fdde03") return Result(id, EncodeString(c.name));
    if (selector == "01ffc9a7") {
      if (c.fungible) return ErrorResponse(id, revert);
      return Result(id, Word(c.supports_erc721 && data.substr(8, 8) == "80ac58cd" ? 1 : 0));
    }
    if (selector == "2f745c59") {
      const std::string owner = word_address(0);
      const unsigned long long index = static_cast<unsigned long long>(word_uint(1));
      auto o = c.owned.find(owner);
      if (c.fungible || c.broken_indices.count(index) || o == c.owned.end() || index >= o->second.size()) {
        return ErrorResponse(id, revert);
      }
      return Result(id, Word(o->second[index]));
    }
    return ErrorResponse(id, revert);
  }

  HttpResponse Send(const json& id, const std::string& raw) {
    const size_t index = sent_raw.size();
    sent_raw.push_back(raw);
    if (rejected_sends.count(index)) {
      return ErrorResponse(id, Fault{200, -32000, "insufficient funds for gas * price + value"});
    }
    if (advance_nonce_on_send && !last_nonce_reader_.empty()) ++nonces_[last_nonce_reader_];
    const std::string hash = "0x" + AmountToWordHex(Amount(0xabc000 + index));
    receipts_[hash] = {
      {"transactionHash", hash},
      {"blockNumber", ToHexQuantity(head + 1 + index)},
      {"status", reverted_sends.count(index) ? "0x0" : "0x1"}
    };
    return Result(id, hash);
  }
};
