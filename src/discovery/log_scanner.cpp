#include "discovery/log_scanner.hpp"
#include "node_connection/rpc_client.hpp"
#include "common/cancellation.hpp"
#include "common/errors.hpp"
#include "common/reporter.hpp"
#include "constants/chain.hpp"
#include "encoding/abi.hpp"
#include "utils/hex.hpp"

using json = nlohmann::json;

std::vector<ScanWindow> PlanScanWindows(unsigned long long head,
                                        unsigned long long lookback,
                                        unsigned long long window_size) {
  if (window_size == 0) window_size = 1;
  const unsigned long long start = head > lookback ? head - lookback : 0;
  const unsigned long long span = head - start;
  unsigned long long count = (span + window_size - 1) / window_size;
  if (count == 0) count = 1;
  std::vector<ScanWindow> windows;
  windows.reserve(static_cast<size_t>(count));
  for (unsigned long long i = 0; i < count; ++i) {
    ScanWindow w;
    w.from_block = start + i * window_size;
    w.to_block = (i + 1 == count) ? head : w.from_block + window_size - 1;
    windows.push_back(w);
  }
  return windows;
}

static std::string WindowLabel(const ScanWindow& w) {
  return "[" + std::to_string(w.from_block) + ", " + std::to_string(w.to_block) + "]";
}

ScanReport LogScanner::Scan(const std::string& account) {
  return ScanUpTo(account, rpc_.EthBlockNumber());
}

ScanReport LogScanner::ScanUpTo(const std::string& account, unsigned long long head) {
  ScanReport report;
  auto windows = PlanScanWindows(head, settings_.lookback_blocks, settings_.window_blocks);
  report.windows_total = windows.size();
  report.range = ScanWindow{windows.front().from_block, windows.back().to_block};
  reporter_.Info("scanning " + account + " blocks " + WindowLabel(report.range) + " in " +
                 std::to_string(windows.size()) + " window(s)");

  std::unordered_set<std::string> seen;
  for (size_t i = 0; i < windows.size(); ++i) {
    if (cancel_ && cancel_->IsCancelled()) { report.cancelled = true; break; }
    std::vector<std::string> found;
    switch (ScanWindowPair(account, windows[i], found)) {
      case WindowStatus::Ok:
        for (auto& addr : found) {
          if (seen.insert(addr).second) report.candidates.push_back(addr);
        }
        break;
      case WindowStatus::Skipped:
        ++report.windows_skipped;
        break;
      case WindowStatus::Failed:
        ++report.windows_failed;
        break;
    }
    if (i + 1 < windows.size() && !pause_(settings_.window_delay, cancel_)) { report.cancelled = true; break; }
  }
  reporter_.Info("scan of " + account + " done: " + std::to_string(report.candidates.size()) + " candidate contract(s), " +
                 std::to_string(report.windows_skipped) + " skipped and " + std::to_string(report.windows_failed) +
                 " failed window(s)" + (report.cancelled ? " (cancelled)" : ""));
  return report;
}

LogScanner::WindowStatus LogScanner::ScanWindowPair(const std::string& account, const ScanWindow& w,
                                                    std::vector<std::string>& found) {
  const std::string account_topic = ABI::AddressTopic(account);
  json base = {{"fromBlock", ToHexQuantity(w.from_block)}, {"toBlock", ToHexQuantity(w.to_block)}};
  json as_receiver = base;
  as_receiver["topics"] = json::array({ChainConstants::TRANSFER_TOPIC, nullptr, account_topic});
  json as_sender = base;
  as_sender["topics"] = json::array({ChainConstants::TRANSFER_TOPIC, account_topic});

  const int attempts = settings_.max_attempts > 0 ? settings_.max_attempts : 1;
  for (int attempt = 1; attempt <= attempts; ++attempt) {
    std::vector<std::string> batch;
    try {
      QueryInto(as_receiver, batch);
      QueryInto(as_sender, batch);
      found = std::move(batch);
      return WindowStatus::Ok;
    } catch (const TransientRpcError& e) {
      reporter_.Warning("window " + WindowLabel(w) + " for " + account + ": attempt " + std::to_string(attempt) +
                        "/" + std::to_string(attempts) + " hit transient error: " + e.what());
      if (attempt == attempts) break;
      if (!pause_(settings_.backoff_step * attempt, cancel_)) break;
    } catch (const RpcError& e) {
      reporter_.Error("window " + WindowLabel(w) + " for " + account + " failed, no retry: " + e.what());
      return WindowStatus::Failed;
    }
  }
  reporter_.Warning("window " + WindowLabel(w) + " for " + account + " skipped after " +
                    std::to_string(attempts) + " attempt(s)");
  return WindowStatus::Skipped;
}

void LogScanner::QueryInto(const json& filter, std::vector<std::string>& found) {
  auto logs = rpc_.EthGetLogs(filter);
  for (const auto& entry : logs) {
    if (!entry.is_object() || !entry.contains("address") || !entry["address"].is_string()) continue;
    const std::string addr = ToLowerHex(entry["address"].get<std::string>());
    if (IsHexAddress(addr)) found.push_back(addr);
  }
}
