#include "gas/gas_strategy.hpp"
#include "node_connection/rpc_client.hpp"
#include "common/errors.hpp"

GasQuote GasStrategy::Quote() {
  if (configured_ > 0) return GasQuote{ configured_ };
  Amount p = rpc_.EthGasPrice();
  if (p == 0) throw PermanentRpcError("eth_gasPrice returned zero");
  return GasQuote{ p };
}
