#include "utils/json_rpc.hpp"
#include "common/errors.hpp"
#include <algorithm>
#include <cctype>

using json = nlohmann::json;

namespace JsonRpcUtil {
  std::string BuildRequest(const std::string& method, const json& params, int id) {
    json req = {{"jsonrpc", "2.0"}, {"method", method}, {"params", params}, {"id", id}};
    return req.dump();
  }

  bool IsTransient(int code, const std::string& message, long http_status) {
    if (http_status == 0 || http_status == 429 || http_status == 502 || http_status == 503 || http_status == 504) return true;
    // -32005: limit exceeded, -32016: over rate limit (provider specific), 429 mirrored into the code
    if (code == -32005 || code == -32016 || code == 429) return true;
    std::string m = message;
    std::transform(m.begin(), m.end(), m.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    static const char* kMarkers[] = {
      "rate limit", "too many requests", "busy", "overloaded", "temporarily unavailable",
      "try again", "timeout", "timed out", "capacity", "exceeded the rps"
    };
    for (const char* marker : kMarkers) {
      if (m.find(marker) != std::string::npos) return true;
    }
    return false;
  }

  void ThrowClassified(int code, const std::string& message, long http_status) {
    if (IsTransient(code, message, http_status)) throw TransientRpcError(message, code, http_status);
    throw PermanentRpcError(message, code, http_status);
  }

  json ExtractResult(const std::string& body, long http_status) {
    auto j = json::parse(body, nullptr, false);
    if (http_status < 200 || http_status >= 300) {
      std::string msg = "HTTP status " + std::to_string(http_status);
      int code = 0;
      if (!j.is_discarded() && j.is_object() && j.contains("error") && j["error"].is_object()) {
        const auto& e = j["error"];
        if (e.contains("code") && e["code"].is_number_integer()) code = e["code"].get<int>();
        msg += ": " + (e.contains("message") && e["message"].is_string() ? e["message"].get<std::string>() : e.dump());
      }
      ThrowClassified(code, msg, http_status);
    }
    if (j.is_discarded() || !j.is_object()) throw PermanentRpcError("malformed JSON-RPC response", 0, http_status);
    if (j.contains("error") && !j["error"].is_null()) {
      const auto& e = j["error"];
      if (e.is_object()) {
        int code = e.contains("code") && e["code"].is_number_integer() ? e["code"].get<int>() : 0;
        std::string msg = e.contains("message") && e["message"].is_string() ? e["message"].get<std::string>() : e.dump();
        ThrowClassified(code, msg, http_status);
      }
      ThrowClassified(0, e.dump(), http_status);
    }
    if (!j.contains("result")) throw PermanentRpcError("missing result", 0, http_status);
    return j["result"];
  }
}
