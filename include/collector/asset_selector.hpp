#pragma once
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>
#include "discovery/asset_types.hpp"

// Picks which aggregated asset to collect. nullopt means "collect nothing".
class AssetSelector {
public:
  virtual ~AssetSelector() = default;
  virtual std::optional<std::string> Choose(const std::vector<AssetRecord>& ranked) = 0;
};

// Prints the ranked inventory and reads a 1-based index. 0, an empty line or
// end of input cancels; anything else unparseable asks again.
class ConsoleAssetSelector : public AssetSelector {
public:
  ConsoleAssetSelector(std::istream& in, std::ostream& out) : in_(in), out_(out) {}
  std::optional<std::string> Choose(const std::vector<AssetRecord>& ranked) override;
private:
  std::istream& in_;
  std::ostream& out_;
};

// Answers with a fixed asset, if it was found at all.
class PreselectedAssetSelector : public AssetSelector {
public:
  explicit PreselectedAssetSelector(std::string asset) : asset_(std::move(asset)) {}
  std::optional<std::string> Choose(const std::vector<AssetRecord>& ranked) override;
private:
  std::string asset_;
};

// One display line per record, e.g. "1.5 USDC (0x...) on 2 account(s)".
std::string DescribeRecord(const AssetRecord& record);
