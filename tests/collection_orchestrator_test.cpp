#include "collector/collection_orchestrator.hpp"
#include "collector/asset_selector.hpp"
#include "telemetry/transfer_ledger.hpp"
#include "common/cancellation.hpp"
#include "constants/chain.hpp"
#include "support/fake_chain.hpp"
#include "support/recording_reporter.hpp"
#include "support/test_keys.hpp"
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>

namespace {

const std::string kUsdc = "0x833589fcd6edb6e08f4c7c32d4f71b54bda02913";
const std::string kPunks = "0x00000000000000000000000000000000000000c0";
const std::string kOther = "0x00000000000000000000000000000000000000ee";

// Answers with a fixed choice and remembers what it was offered.
class ScriptedSelector : public AssetSelector {
public:
  explicit ScriptedSelector(std::optional<std::string> choice) : choice_(std::move(choice)) {}
  std::optional<std::string> Choose(const std::vector<AssetRecord>& ranked) override {
    offered = ranked;
    return choice_;
  }
  std::vector<AssetRecord> offered;
private:
  std::optional<std::string> choice_;
};

CollectorConfig TestConfig() {
  CollectorConfig cfg;
  cfg.rpc_url = "https://primary";
  cfg.fallback_rpc_urls = {"https://backup"};
  cfg.recipient = TestKeys::kVault;
  cfg.operation_delay = std::chrono::milliseconds(0);
  cfg.scan_window_delay = std::chrono::milliseconds(0);
  cfg.scan_backoff_step = std::chrono::milliseconds(0);
  cfg.confirm_timeout = std::chrono::milliseconds(100);
  cfg.receipt_poll_interval = std::chrono::milliseconds(5);
  return cfg;
}

class CollectionOrchestratorTest : public ::testing::Test {
protected:
  CollectionOrchestratorTest() {
    chain.AddToken(kUsdc, 6, "USDC", "USD Coin");
    chain.AddCollection(kPunks, "PUNK", "Punks");
  }
  FakeChain chain;
  RecordingReporter reporter;
};

}  // namespace

TEST_F(CollectionOrchestratorTest, FungibleBalanceCollected) {
  chain.At(kUsdc).balances[TestKeys::kAddr1] = Amount(1500000);
  chain.AddLog(kUsdc, kOther, TestKeys::kAddr1, 80000);
  ScriptedSelector selector(kUsdc);
  CollectionOrchestrator orchestrator(chain, selector, reporter, TestConfig());

  const RunSummary s = orchestrator.Run({TestKeys::kKey1});
  EXPECT_EQ(s.final_state, RunState::Summarized);
  EXPECT_EQ(s.ExitCode(), 0);
  ASSERT_EQ(selector.offered.size(), 1u);
  EXPECT_EQ(s.transfers_confirmed, 1u);
  EXPECT_EQ(s.transfers_failed, 0u);
  EXPECT_EQ(s.collected, 1500000);
  EXPECT_EQ(s.CollectedDisplay(), "1.5");
  EXPECT_EQ(s.selected_symbol, "USDC");
  EXPECT_EQ(chain.CountOf("eth_sendRawTransaction"), 1u);
  EXPECT_TRUE(orchestrator.GetInventory().TotalsConsistent());
}

TEST_F(CollectionOrchestratorTest, CollectionTransfersCountedIndependently) {
  chain.At(kPunks).owned[TestKeys::kAddr2] = {Amount(11), Amount(42)};
  chain.AddLog(kPunks, kOther, TestKeys::kAddr2, 70000);
  chain.rejected_sends = {1};
  ScriptedSelector selector(kPunks);
  CollectionOrchestrator orchestrator(chain, selector, reporter, TestConfig());

  const RunSummary s = orchestrator.Run({TestKeys::kKey2});
  EXPECT_EQ(s.final_state, RunState::Summarized);
  EXPECT_EQ(s.nft_transfers_issued, 2u);
  EXPECT_EQ(s.transfers_confirmed, 1u);
  EXPECT_EQ(s.transfers_failed, 1u);
  EXPECT_EQ(chain.CountOf("eth_sendRawTransaction"), 2u);
  ASSERT_EQ(s.outcomes.size(), 2u);
}

TEST_F(CollectionOrchestratorTest, AllEndpointsDownHaltsBeforeAnyTransaction) {
  chain.unreachable_urls = {"https://primary", "https://backup"};
  chain.At(kUsdc).balances[TestKeys::kAddr1] = Amount(1500000);
  ScriptedSelector selector(kUsdc);
  CollectionOrchestrator orchestrator(chain, selector, reporter, TestConfig());

  const RunSummary s = orchestrator.Run({TestKeys::kKey1});
  EXPECT_EQ(s.final_state, RunState::Halted);
  EXPECT_NE(s.ExitCode(), 0);
  EXPECT_EQ(chain.CountOf("eth_sendRawTransaction"), 0u);
  EXPECT_EQ(chain.CountOf("eth_getLogs"), 0u);
  EXPECT_FALSE(reporter.errors.empty());
}

TEST_F(CollectionOrchestratorTest, MissingPreconditionsHaltWithoutTouchingTheNode) {
  ScriptedSelector selector(kUsdc);
  CollectorConfig no_destination = TestConfig();
  no_destination.recipient = "0x...";

  CollectionOrchestrator without_keys(chain, selector, reporter, TestConfig());
  EXPECT_EQ(without_keys.Run({}).final_state, RunState::Halted);
  CollectionOrchestrator without_destination(chain, selector, reporter, no_destination);
  EXPECT_EQ(without_destination.Run({TestKeys::kKey1}).final_state, RunState::Halted);
  CollectionOrchestrator bad_keys(chain, selector, reporter, TestConfig());
  EXPECT_EQ(bad_keys.Run({"0x1234", "not a key"}).final_state, RunState::Halted);
  EXPECT_TRUE(chain.requests.empty());
}

TEST_F(CollectionOrchestratorTest, NoSelectionCancelsWithoutDispatch) {
  chain.native_balances[TestKeys::kAddr1] = Amount(1000000000000000000ULL);
  ScriptedSelector selector(std::nullopt);
  CollectionOrchestrator orchestrator(chain, selector, reporter, TestConfig());

  const RunSummary s = orchestrator.Run({TestKeys::kKey1});
  EXPECT_EQ(s.final_state, RunState::Cancelled);
  EXPECT_EQ(s.ExitCode(), 0);
  EXPECT_EQ(s.assets_discovered, 1u);
  EXPECT_EQ(chain.CountOf("eth_sendRawTransaction"), 0u);
}

TEST_F(CollectionOrchestratorTest, PreselectedAssetSkipsScanning) {
  chain.At(kUsdc).balances[TestKeys::kAddr1] = Amount(250000);
  chain.At(kUsdc).balances[TestKeys::kAddr3] = Amount(750000);
  CollectorConfig cfg = TestConfig();
  cfg.preselected_asset = kUsdc;
  PreselectedAssetSelector selector(kUsdc);
  CollectionOrchestrator orchestrator(chain, selector, reporter, cfg);

  const RunSummary s = orchestrator.Run({TestKeys::kKey1, TestKeys::kKey2, TestKeys::kKey3});
  EXPECT_EQ(s.final_state, RunState::Summarized);
  EXPECT_EQ(chain.CountOf("eth_getLogs"), 0u);
  EXPECT_EQ(s.accounts_total, 3u);
  EXPECT_EQ(s.accounts_processed, 2u);
  EXPECT_EQ(s.transfers_confirmed, 2u);
  EXPECT_EQ(s.collected, 1000000);
  EXPECT_EQ(s.CollectedDisplay(), "1");
}

TEST_F(CollectionOrchestratorTest, InterruptedRunReportsCancelled) {
  chain.At(kUsdc).balances[TestKeys::kAddr1] = Amount(1500000);
  CancellationToken cancel;
  cancel.Cancel();
  ScriptedSelector selector(kUsdc);
  CollectionOrchestrator orchestrator(chain, selector, reporter, TestConfig(), nullptr, &cancel);

  const RunSummary s = orchestrator.Run({TestKeys::kKey1});
  EXPECT_EQ(s.final_state, RunState::Cancelled);
  EXPECT_EQ(chain.CountOf("eth_sendRawTransaction"), 0u);
}

TEST_F(CollectionOrchestratorTest, LedgerGetsOneRowPerOutcomeAndSummary) {
  const std::string path = ::testing::TempDir() + "collector_ledger_test.csv";
  std::remove(path.c_str());
  chain.At(kUsdc).balances[TestKeys::kAddr1] = Amount(1);
  chain.At(kUsdc).balances[TestKeys::kAddr2] = Amount(2);
  chain.AddLog(kUsdc, kOther, TestKeys::kAddr1, 90000);
  chain.AddLog(kUsdc, kOther, TestKeys::kAddr2, 90001);
  ScriptedSelector selector(kUsdc);
  {
    TransferLedger ledger(path);
    ASSERT_TRUE(ledger.IsOpen());
    CollectionOrchestrator orchestrator(chain, selector, reporter, TestConfig(), &ledger);
    const RunSummary s = orchestrator.Run({TestKeys::kKey1, TestKeys::kKey2});
    EXPECT_EQ(s.transfers_confirmed, 2u);
  }
  std::ifstream in(path);
  std::vector<std::string> lines;
  for (std::string line; std::getline(in, line);) lines.push_back(line);
  ASSERT_EQ(lines.size(), 4u);
  EXPECT_NE(lines[0].find("TX_Hash"), std::string::npos);
  EXPECT_NE(lines[1].find("CONFIRMED"), std::string::npos);
  EXPECT_NE(lines[3].find("SUMMARY"), std::string::npos);
}

TEST_F(CollectionOrchestratorTest, RejectedCredentialsAreCounted) {
  chain.At(kUsdc).balances[TestKeys::kAddr1] = Amount(1500000);
  chain.AddLog(kUsdc, kOther, TestKeys::kAddr1, 80000);
  ScriptedSelector selector(kUsdc);
  CollectionOrchestrator orchestrator(chain, selector, reporter, TestConfig());

  const RunSummary s = orchestrator.Run({"0x1234", TestKeys::kKey1, "not a key"});
  EXPECT_EQ(s.final_state, RunState::Summarized);
  EXPECT_EQ(s.accounts_rejected, 2u);
  EXPECT_EQ(s.accounts_total, 1u);
  EXPECT_EQ(s.transfers_confirmed, 1u);
  EXPECT_TRUE(RecordingReporter::AnyContains(reporter.warnings, "credentials rejected: 2"));
}

TEST_F(CollectionOrchestratorTest, UnreadableHeadLeavesAccountUnscanned) {
  chain.native_balances[TestKeys::kAddr1] = Amount(1000000000000000000ULL);
  chain.At(kUsdc).balances[TestKeys::kAddr1] = Amount(1500000);
  chain.AddLog(kUsdc, kOther, TestKeys::kAddr1, 80000);
  // endpoint selection reads the head once; the scan's read fails
  chain.method_faults_after["eth_blockNumber"] = 1;
  chain.method_faults["eth_blockNumber"].push_back(FakeChain::Permanent());
  ScriptedSelector selector(std::nullopt);
  CollectionOrchestrator orchestrator(chain, selector, reporter, TestConfig());

  const RunSummary s = orchestrator.Run({TestKeys::kKey1});
  EXPECT_EQ(s.accounts_unscanned, 1u);
  EXPECT_EQ(chain.CountOf("eth_getLogs"), 0u);
  ASSERT_EQ(selector.offered.size(), 1u);
  EXPECT_EQ(selector.offered[0].asset.address, ChainConstants::NATIVE_ASSET);
  EXPECT_TRUE(RecordingReporter::AnyContains(reporter.warnings, "log scan did not run for " + TestKeys::kAddr1));
}
