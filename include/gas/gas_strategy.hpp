#pragma once
#include "utils/amount.hpp"

class RpcClient;

struct GasQuote { Amount gas_price; };

// Fixed operator-configured gas price, or the node's eth_gasPrice when none is set.
class GasStrategy {
public:
  GasStrategy(RpcClient& rpc, const Amount& configured_gas_price) : rpc_(rpc), configured_(configured_gas_price) {}
  // Throws RpcError when the price has to come from the node and cannot be read.
  GasQuote Quote();
private:
  RpcClient& rpc_;
  Amount configured_;
};
