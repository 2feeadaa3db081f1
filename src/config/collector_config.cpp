#include "config/collector_config.hpp"
#include "common/config_manager.hpp"
#include "constants/chain.hpp"
#include <algorithm>
#include <cctype>

std::vector<std::string> CollectorConfig::EndpointCandidates() const {
  std::vector<std::string> out;
  auto add = [&](const std::string& url) {
    if (url.empty()) return;
    if (std::find(out.begin(), out.end(), url) == out.end()) out.push_back(url);
  };
  add(rpc_url);
  for (const auto& u : fallback_rpc_urls) add(u);
  return out;
}

static std::chrono::milliseconds SecondsToMs(double s) {
  if (s <= 0.0) return std::chrono::milliseconds(0);
  return std::chrono::milliseconds(static_cast<long long>(s * 1000.0));
}

CollectorConfig LoadCollectorConfig() {
  CollectorConfig cfg;
  cfg.rpc_url = ConfigManager::Get("RPC_URL").value_or(ChainConstants::DEFAULT_RPC_URL);
  cfg.fallback_rpc_urls = ConfigManager::GetList("ALTERNATIVE_RPC_URLS");
  if (auto a = ConfigManager::Get("RPC_AUTH_HEADER"); a && !a->empty()) cfg.auth_header = *a;
  cfg.rpc_timeout_ms = ConfigManager::GetIntOr("RPC_TIMEOUT_MS", cfg.rpc_timeout_ms);
  cfg.http_verify_tls = ConfigManager::GetBoolOr("HTTP_VERIFY_TLS", cfg.http_verify_tls);
  cfg.http_enable_http2 = ConfigManager::GetBoolOr("HTTP_ENABLE_HTTP2", cfg.http_enable_http2);
  cfg.recipient = ConfigManager::Get("RECIPIENT_ADDRESS").value_or("");
  if (auto t = ConfigManager::Get("TOKEN_ADDRESS"); t && !t->empty()) {
    cfg.preselected_asset = ChainConstants::IsNativeAsset(*t) ? ChainConstants::NATIVE_ASSET : *t;
  }
  cfg.chain_id = ConfigManager::GetUint64Or("CHAIN_ID", 0);
  std::string tx_type = ConfigManager::Get("TX_TYPE").value_or("legacy");
  std::transform(tx_type.begin(), tx_type.end(), tx_type.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  cfg.tx_type = tx_type == "eip1559" ? TxType::Eip1559 : TxType::Legacy;
  cfg.gas_price_wei = GweiToWei(ConfigManager::GetDoubleOr("GAS_PRICE", 0.0));
  cfg.gas_limit = ConfigManager::GetUint64Or("GAS_LIMIT", cfg.gas_limit);
  cfg.native_gas_limit = ConfigManager::GetUint64Or("NATIVE_GAS_LIMIT", ChainConstants::NATIVE_TRANSFER_GAS);
  cfg.operation_delay = std::chrono::milliseconds(ConfigManager::GetUint64Or("DELAY", 1000));
  cfg.scan_lookback_blocks = ConfigManager::GetUint64Or("SCAN_LOOKBACK_BLOCKS", cfg.scan_lookback_blocks);
  cfg.scan_window_blocks = std::max<unsigned long long>(1, ConfigManager::GetUint64Or("SCAN_WINDOW_BLOCKS", cfg.scan_window_blocks));
  cfg.scan_window_delay = SecondsToMs(ConfigManager::GetDoubleOr("SCAN_WINDOW_DELAY_S", 0.5));
  cfg.scan_max_attempts = std::max(1, ConfigManager::GetIntOr("SCAN_MAX_RETRIES", cfg.scan_max_attempts));
  cfg.scan_backoff_step = std::chrono::milliseconds(ConfigManager::GetUint64Or("SCAN_BACKOFF_STEP_MS", 2000));
  cfg.confirm_timeout = SecondsToMs(ConfigManager::GetDoubleOr("CONFIRM_TIMEOUT_S", 120.0));
  cfg.receipt_poll_interval = std::chrono::milliseconds(ConfigManager::GetUint64Or("RECEIPT_POLL_MS", 2000));
  cfg.keys_file = ConfigManager::Get("KEYS_FILE").value_or(cfg.keys_file);
  cfg.log_file = ConfigManager::Get("LOG_FILE").value_or(cfg.log_file);
  cfg.log_level = ConfigManager::Get("LOG_LEVEL").value_or(cfg.log_level);
  cfg.ledger_file = ConfigManager::Get("LEDGER_FILE").value_or(cfg.ledger_file);
  return cfg;
}
