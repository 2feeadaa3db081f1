#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace JsonRpcUtil {
  // {"jsonrpc":"2.0","method":...,"params":...,"id":id}
  std::string BuildRequest(const std::string& method, const nlohmann::json& params, int id = 1);
  // Returns the "result" member. Throws TransientRpcError / PermanentRpcError for
  // transport failures, non-2xx statuses, error objects and unparseable bodies.
  nlohmann::json ExtractResult(const std::string& body, long http_status);
  // True for the rate-limit / overload / temporary-unavailability family.
  bool IsTransient(int code, const std::string& message, long http_status);
  // Throws the matching RpcError subclass.
  [[noreturn]] void ThrowClassified(int code, const std::string& message, long http_status);
}
