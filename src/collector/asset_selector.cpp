#include "collector/asset_selector.hpp"
#include "constants/chain.hpp"
#include "utils/hex.hpp"
#include <istream>
#include <ostream>

std::string DescribeRecord(const AssetRecord& record) {
  const AssetMeta& a = record.asset;
  std::string qty = a.Kind() == AssetKind::NonFungibleToken
    ? AmountToDecimal(record.total) + " NFT(s)"
    : FormatUnits(record.total, a.Decimals());
  return "[" + std::string(AssetKindName(a.Kind())) + "] " + qty + " " + a.symbol + " - " + a.name +
         " (" + a.address + ") on " + std::to_string(record.balances.size()) + " account(s)";
}

std::optional<std::string> ConsoleAssetSelector::Choose(const std::vector<AssetRecord>& ranked) {
  if (ranked.empty()) return std::nullopt;
  out_ << "\nAssets found:\n";
  for (size_t i = 0; i < ranked.size(); ++i) {
    out_ << "  " << (i + 1) << ". " << DescribeRecord(ranked[i]) << "\n";
  }
  for (;;) {
    out_ << "Select asset to collect (1-" << ranked.size() << ", 0 to cancel): " << std::flush;
    std::string line;
    if (!std::getline(in_, line)) return std::nullopt;
    line.erase(0, line.find_first_not_of(" \t\r"));
    line.erase(line.find_last_not_of(" \t\r") + 1);
    if (line.empty() || line == "0") return std::nullopt;
    size_t pos = 0;
    unsigned long choice = 0;
    try {
      choice = std::stoul(line, &pos);
    } catch (const std::logic_error&) {
      pos = 0;
    }
    if (pos == line.size() && choice >= 1 && choice <= ranked.size()) {
      return ranked[choice - 1].asset.address;
    }
    out_ << "Invalid choice: " << line << "\n";
  }
}

std::optional<std::string> PreselectedAssetSelector::Choose(const std::vector<AssetRecord>& ranked) {
  const std::string wanted = ChainConstants::IsNativeAsset(asset_) ? ChainConstants::NATIVE_ASSET : ToLowerHex(asset_);
  for (const auto& r : ranked) {
    if (r.asset.address == wanted) return r.asset.address;
  }
  return std::nullopt;
}
