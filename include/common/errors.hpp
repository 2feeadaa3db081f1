#pragma once
#include <stdexcept>
#include <string>

// Any failed JSON-RPC exchange. code is the JSON-RPC error code (0 if none),
// http_status the HTTP status (0 when the transport itself failed).
class RpcError : public std::runtime_error {
public:
  RpcError(const std::string& what, int code = 0, long http_status = 0)
    : std::runtime_error(what), code_(code), http_status_(http_status) {}
  int code() const { return code_; }
  long http_status() const { return http_status_; }
private:
  int code_;
  long http_status_;
};

// Rate limiting, overload, temporary unavailability: worth retrying later.
class TransientRpcError : public RpcError {
public:
  using RpcError::RpcError;
};

// Malformed call, unsupported method, revert, unparseable response: retrying is pointless.
class PermanentRpcError : public RpcError {
public:
  using RpcError::RpcError;
};

// Missing credentials, missing destination, unusable endpoint: the run halts
// before any state-changing action.
class PreconditionError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class NoReachableEndpoint : public PreconditionError {
public:
  using PreconditionError::PreconditionError;
};
