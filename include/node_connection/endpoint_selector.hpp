#pragma once
#include <optional>
#include <string>
#include <vector>

class HttpClient;
class Reporter;

enum class Liveness { Untested, Reachable, Unreachable };

struct Endpoint {
  std::string url;
  Liveness liveness = Liveness::Untested;
  unsigned long long head = 0; // block height seen by the liveness probe
};

// Picks the first endpoint, in configured order, that answers eth_blockNumber.
// A failed probe disqualifies the URL immediately; there is no retry.
class EndpointSelector {
public:
  EndpointSelector(HttpClient& http, Reporter& reporter,
                   const std::optional<std::string>& auth_header = std::nullopt,
                   int probe_timeout_ms = 10000)
    : http_(http), reporter_(reporter), auth_header_(auth_header), probe_timeout_ms_(probe_timeout_ms) {}
  // Throws NoReachableEndpoint when no candidate answers.
  Endpoint Select(const std::vector<std::string>& urls);
  // Every candidate with its final liveness; untried ones stay Untested.
  const std::vector<Endpoint>& Candidates() const { return candidates_; }
private:
  HttpClient& http_;
  Reporter& reporter_;
  std::optional<std::string> auth_header_;
  int probe_timeout_ms_;
  std::vector<Endpoint> candidates_;
};
