#include "common/logger.hpp"
#include "common/config_manager.hpp"
#include "common/cancellation.hpp"
#include "common/reporter.hpp"
#include "config/collector_config.hpp"
#include "config/credentials.hpp"
#include "net/http_client.hpp"
#include "collector/asset_selector.hpp"
#include "collector/collection_orchestrator.hpp"
#include "telemetry/transfer_ledger.hpp"
#include <csignal>
#include <iostream>
#include <memory>

static CancellationToken g_cancel;

extern "C" void OnInterrupt(int) {
  g_cancel.Cancel();
}

static void PrintSummary(const RunSummary& s) {
  std::cout << "\n=== SUMMARY ===\n"
            << "State:               " << RunStateName(s.final_state) << "\n";
  if (!s.halt_reason.empty()) std::cout << "Halted:              " << s.halt_reason << "\n";
  if (!s.endpoint.empty()) std::cout << "Endpoint:            " << s.endpoint << "\n";
  std::cout << "Accounts processed:  " << s.accounts_processed << "/" << s.accounts_total << "\n";
  if (s.accounts_rejected > 0) std::cout << "Keys rejected:       " << s.accounts_rejected << "\n";
  if (s.accounts_unscanned > 0) std::cout << "Accounts unscanned:  " << s.accounts_unscanned << "\n";
  std::cout << "Assets discovered:   " << s.assets_discovered << "\n"
            << "Transfers confirmed: " << s.transfers_confirmed << "\n"
            << "Transfers failed:    " << s.transfers_failed << "\n"
            << "Transfers timed out: " << s.transfers_timed_out << "\n";
  if (s.nft_transfers_issued > 0) {
    std::cout << "NFT transfers issued: " << s.nft_transfers_issued << "\n";
  } else if (!s.selected_asset.empty()) {
    std::cout << "Total collected:     " << s.CollectedDisplay() << " " << s.selected_symbol << "\n";
  }
  std::cout << std::flush;
}

int main(int argc, char** argv) {
  try {
    const std::string env_path = argc > 1 ? argv[1] : ".env";
    ConfigManager::Initialize(env_path);
    const CollectorConfig config = LoadCollectorConfig();
    Logger::Initialize(config.log_file, ParseLogLevel(config.log_level), true);
    Logger::Info("=== Asset collector starting ===");
    Logger::Info("Config: " + env_path + ", keys: " + config.keys_file + ", destination: " + config.recipient);

    std::signal(SIGINT, OnInterrupt);

    HttpClientTuning http_tuning;
    http_tuning.enable_tcp_keepalive = true;
    http_tuning.enable_http2 = config.http_enable_http2;
    http_tuning.verify_tls = config.http_verify_tls;
    if (!http_tuning.verify_tls) Logger::Warning("TLS certificate verification disabled");
    std::unique_ptr<HttpClient> http = CreateCurlHttpClient(http_tuning);

    const std::vector<std::string> keys = LoadCredentials(config.keys_file);
    if (keys.empty()) Logger::Error("No private keys found in " + config.keys_file);

    std::unique_ptr<AssetSelector> selector;
    if (config.preselected_asset) {
      Logger::Info("Asset preselected: " + *config.preselected_asset);
      selector.reset(new PreselectedAssetSelector(*config.preselected_asset));
    } else {
      selector.reset(new ConsoleAssetSelector(std::cin, std::cout));
    }

    TransferLedger ledger(config.ledger_file);
    LogReporter reporter("collector");
    CollectionOrchestrator orchestrator(*http, *selector, reporter, config, &ledger, &g_cancel);
    const RunSummary summary = orchestrator.Run(keys);

    PrintSummary(summary);
    Logger::Shutdown();
    return summary.ExitCode();
  } catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << std::endl;
    Logger::Critical(std::string("Fatal error: ") + e.what());
    Logger::Shutdown();
    return 1;
  }
}
