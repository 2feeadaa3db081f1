#pragma once
#include <chrono>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>

struct TransferOutcome;
struct RunSummary;

// Append-only CSV audit trail: one row per transfer outcome, one per run summary.
class TransferLedger {
public:
  explicit TransferLedger(const std::string& filename);
  ~TransferLedger();

  bool IsOpen() const { return file_.is_open(); }
  void Record(const TransferOutcome& outcome);
  void RecordSummary(const RunSummary& summary);

  void Flush();

private:
  std::ofstream file_;
  std::mutex mutex_;
  std::string filename_;

  std::vector<std::string> write_buffer_;
  static constexpr size_t BUFFER_SIZE = 32;
  std::chrono::steady_clock::time_point last_flush_;
  static constexpr auto FLUSH_INTERVAL = std::chrono::seconds(5);

  void WriteHeader();
  void WriteToBuffer(const std::string& row);
  void FlushBuffer();
  static std::string Quote(const std::string& field);
  static std::string GetCurrentTimestamp();
};
