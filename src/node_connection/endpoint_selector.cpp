#include "node_connection/endpoint_selector.hpp"
#include "node_connection/rpc_client.hpp"
#include "common/errors.hpp"
#include "common/reporter.hpp"

Endpoint EndpointSelector::Select(const std::vector<std::string>& urls) {
  candidates_.clear();
  for (const auto& u : urls) candidates_.push_back(Endpoint{u, Liveness::Untested, 0});
  for (auto& ep : candidates_) {
    reporter_.Info("probing RPC endpoint " + ep.url);
    try {
      RpcClient probe(http_, ep.url, auth_header_, probe_timeout_ms_);
      ep.head = probe.EthBlockNumber();
      ep.liveness = Liveness::Reachable;
      reporter_.Info("connected to " + ep.url + ", head block " + std::to_string(ep.head));
      return ep;
    } catch (const RpcError& e) {
      ep.liveness = Liveness::Unreachable;
      reporter_.Warning("endpoint " + ep.url + " unreachable: " + e.what());
    }
  }
  throw NoReachableEndpoint("no reachable RPC endpoint among " + std::to_string(candidates_.size()) + " candidate(s)");
}
