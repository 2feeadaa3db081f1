#pragma once
#include <string>
#include <unordered_map>
#include <vector>
#include "discovery/asset_types.hpp"

// Merges per-account holdings into one table keyed by asset address.
// Metadata is fixed by the first sighting; later sightings only add balances.
class Inventory {
public:
  void Add(const std::string& account, const Holding& holding);
  void AddAll(const std::string& account, const std::vector<Holding>& holdings);
  // Native first, then fungible, then non-fungible; first-discovered first within a group.
  std::vector<AssetRecord> Ordered() const;
  const AssetRecord* Find(const std::string& address) const;
  // True when every record's total equals the sum of its per-account balances.
  bool TotalsConsistent() const;
  bool Empty() const { return records_.empty(); }
  size_t Size() const { return records_.size(); }
private:
  std::vector<AssetRecord> records_;
  std::unordered_map<std::string, size_t> index_;
};
