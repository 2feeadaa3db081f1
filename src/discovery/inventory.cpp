#include "discovery/inventory.hpp"
#include "constants/chain.hpp"
#include "utils/hex.hpp"

static std::string AssetKey(const std::string& address) {
  return ChainConstants::IsNativeAsset(address) ? ChainConstants::NATIVE_ASSET : ToLowerHex(address);
}

void Inventory::Add(const std::string& account, const Holding& holding) {
  const std::string key = AssetKey(holding.asset.address);
  auto it = index_.find(key);
  if (it == index_.end()) {
    AssetRecord rec;
    rec.asset = holding.asset;
    rec.asset.address = key;
    index_.emplace(key, records_.size());
    records_.push_back(std::move(rec));
    it = index_.find(key);
  }
  AssetRecord& rec = records_[it->second];
  rec.balances.push_back(AccountBalance{account, holding.balance});
  rec.total += holding.balance;
}

void Inventory::AddAll(const std::string& account, const std::vector<Holding>& holdings) {
  for (const auto& h : holdings) Add(account, h);
}

std::vector<AssetRecord> Inventory::Ordered() const {
  std::vector<AssetRecord> out;
  out.reserve(records_.size());
  for (AssetKind kind : {AssetKind::Native, AssetKind::FungibleToken, AssetKind::NonFungibleToken}) {
    for (const auto& r : records_) {
      if (r.asset.Kind() == kind) out.push_back(r);
    }
  }
  return out;
}

const AssetRecord* Inventory::Find(const std::string& address) const {
  auto it = index_.find(AssetKey(address));
  if (it == index_.end()) return nullptr;
  return &records_[it->second];
}

bool Inventory::TotalsConsistent() const {
  for (const auto& r : records_) {
    Amount sum = 0;
    for (const auto& b : r.balances) sum += b.balance;
    if (sum != r.total) return false;
  }
  return true;
}
