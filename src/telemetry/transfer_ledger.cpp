#include "telemetry/transfer_ledger.hpp"
#include "collector/run_summary.hpp"
#include "common/logger.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

TransferLedger::TransferLedger(const std::string& filename)
  : filename_(filename), last_flush_(std::chrono::steady_clock::now()) {
  write_buffer_.reserve(BUFFER_SIZE);
  std::ifstream check_file(filename);
  bool has_header = false;
  if (check_file.good()) {
    std::string first_line;
    if (std::getline(check_file, first_line)) {
      has_header = first_line.find("Timestamp") != std::string::npos && first_line.find("TX_Hash") != std::string::npos;
    }
  }
  check_file.close();

  file_.open(filename, std::ios::app);
  if (!file_.is_open()) {
    Logger::Error("Failed to open transfer ledger: " + filename);
    return;
  }
  if (!has_header) {
    WriteHeader();
    file_.flush();
  }
}

TransferLedger::~TransferLedger() {
  if (file_.is_open()) {
    Flush();
    file_.close();
  }
}

void TransferLedger::WriteHeader() {
  file_ << "Timestamp,Kind,Account,Asset,Symbol,Token_ID,Amount,State,TX_Hash,Block,Reason" << std::endl;
}

std::string TransferLedger::Quote(const std::string& field) {
  std::string out = "\"";
  for (char c : field) {
    if (c == '"') out += "\"\"";
    else out += c;
  }
  return out + "\"";
}

void TransferLedger::Record(const TransferOutcome& outcome) {
  const TransferIntent& in = outcome.intent;
  std::ostringstream oss;
  oss << Quote(GetCurrentTimestamp()) << ","
      << "TRANSFER,"
      << Quote(in.account) << ","
      << Quote(in.asset.address) << ","
      << Quote(in.asset.symbol) << ","
      << (in.token_id ? AmountToDecimal(*in.token_id) : "") << ","
      << AmountToDecimal(outcome.amount_sent) << ","
      << OutcomeStateName(outcome.state) << ","
      << Quote(outcome.tx_hash) << ","
      << (outcome.block_number ? std::to_string(*outcome.block_number) : "") << ","
      << Quote(outcome.reason) << "\n";
  WriteToBuffer(oss.str());
}

void TransferLedger::RecordSummary(const RunSummary& s) {
  std::ostringstream reason;
  reason << "state=" << RunStateName(s.final_state)
         << " accounts=" << s.accounts_processed << "/" << s.accounts_total
         << " rejected=" << s.accounts_rejected
         << " unscanned=" << s.accounts_unscanned
         << " confirmed=" << s.transfers_confirmed
         << " failed=" << s.transfers_failed
         << " timed_out=" << s.transfers_timed_out
         << " nft_transfers=" << s.nft_transfers_issued;
  if (!s.halt_reason.empty()) reason << " halt=" << s.halt_reason;

  std::ostringstream oss;
  oss << Quote(GetCurrentTimestamp()) << ","
      << "SUMMARY,"
      << "\"\","
      << Quote(s.selected_asset) << ","
      << Quote(s.selected_symbol) << ","
      << ","
      << AmountToDecimal(s.collected) << ","
      << RunStateName(s.final_state) << ","
      << "\"\",,"
      << Quote(reason.str()) << "\n";
  WriteToBuffer(oss.str());
  Flush();
}

void TransferLedger::WriteToBuffer(const std::string& row) {
  std::lock_guard<std::mutex> lock(mutex_);
  write_buffer_.push_back(row);
  if (write_buffer_.size() >= BUFFER_SIZE ||
      std::chrono::steady_clock::now() - last_flush_ >= FLUSH_INTERVAL) {
    FlushBuffer();
  }
}

void TransferLedger::FlushBuffer() {
  if (write_buffer_.empty() || !file_.is_open()) return;
  for (const auto& row : write_buffer_) file_ << row;
  file_.flush();
  write_buffer_.clear();
  last_flush_ = std::chrono::steady_clock::now();
}

void TransferLedger::Flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  FlushBuffer();
}

std::string TransferLedger::GetCurrentTimestamp() {
  auto now = std::chrono::system_clock::now();
  auto time_t = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

  std::stringstream ss;
  ss << std::put_time(std::gmtime(&time_t), "%Y-%m-%d %H:%M:%S");
  ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
  ss << " UTC";
  return ss.str();
}
