#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include "utils/amount.hpp"
#include "wallet/signer.hpp"

struct CollectorConfig {
  std::string rpc_url;
  std::vector<std::string> fallback_rpc_urls;
  std::optional<std::string> auth_header;
  int rpc_timeout_ms = 15000;
  bool http_verify_tls = true;
  bool http_enable_http2 = true;
  std::string recipient;
  // Contract address, or "NATIVE"; when set the scan and the prompt are skipped.
  std::optional<std::string> preselected_asset;
  unsigned long long chain_id = 0; // 0: ask the endpoint
  TxType tx_type = TxType::Legacy;
  Amount gas_price_wei = 0;        // 0: use eth_gasPrice
  unsigned long long gas_limit = 100000;
  unsigned long long native_gas_limit = 21000;
  std::chrono::milliseconds operation_delay{1000};
  unsigned long long scan_lookback_blocks = 50000;
  unsigned long long scan_window_blocks = 5000;
  std::chrono::milliseconds scan_window_delay{500};
  int scan_max_attempts = 3;
  std::chrono::milliseconds scan_backoff_step{2000};
  std::chrono::milliseconds confirm_timeout{120000};
  std::chrono::milliseconds receipt_poll_interval{2000};
  std::string keys_file = "keys.txt";
  std::string log_file = "collector.log";
  std::string log_level = "info";
  std::string ledger_file = "collection_log.csv";

  // Primary first, then fallbacks in configured order, duplicates removed.
  std::vector<std::string> EndpointCandidates() const;
};

// Builds the typed configuration from ConfigManager keys (see .env.example).
CollectorConfig LoadCollectorConfig();
