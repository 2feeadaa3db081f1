#pragma once
#include <chrono>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/cancellation.hpp"

class RpcClient;
class Reporter;

// Inclusive block range queried in one eth_getLogs call.
struct ScanWindow {
  unsigned long long from_block = 0;
  unsigned long long to_block = 0;
};

// Splits [max(0, head - lookback), head] into max(1, ceil(span / window_size))
// contiguous windows of window_size blocks; the last one runs to head.
std::vector<ScanWindow> PlanScanWindows(unsigned long long head,
                                        unsigned long long lookback,
                                        unsigned long long window_size);

struct ScanSettings {
  unsigned long long lookback_blocks = 50000;
  unsigned long long window_blocks = 5000;
  int max_attempts = 3;                               // per window, transient failures only
  std::chrono::milliseconds backoff_step{2000};       // attempt k waits k * step before retrying
  std::chrono::milliseconds window_delay{500};        // pause between windows
};

struct ScanReport {
  std::vector<std::string> candidates; // distinct emitter contracts, first-seen order, lowercase
  ScanWindow range;
  size_t windows_total = 0;
  size_t windows_skipped = 0;   // transient failure on every attempt
  size_t windows_failed = 0;    // permanent failure, not retried
  bool cancelled = false;
};

// Finds every contract that emitted a Transfer event naming an account as
// sender or receiver inside the lookback range. Failures stay local to their
// window: the scan always runs to the end of the plan (or until cancelled).
class LogScanner {
public:
  LogScanner(RpcClient& rpc, Reporter& reporter, const ScanSettings& settings,
             const CancellationToken* cancel = nullptr, PauseFunction pause = PauseFor)
    : rpc_(rpc), reporter_(reporter), settings_(settings), cancel_(cancel), pause_(std::move(pause)) {}
  // Reads the chain head, then scans. Throws RpcError if the head cannot be read.
  ScanReport Scan(const std::string& account);
  ScanReport ScanUpTo(const std::string& account, unsigned long long head);
private:
  enum class WindowStatus { Ok, Skipped, Failed };
  WindowStatus ScanWindowPair(const std::string& account, const ScanWindow& w, std::vector<std::string>& found);
  void QueryInto(const nlohmann::json& filter, std::vector<std::string>& found);
  RpcClient& rpc_;
  Reporter& reporter_;
  ScanSettings settings_;
  const CancellationToken* cancel_;
  PauseFunction pause_;
};
