#include "discovery/asset_types.hpp"

const char* AssetKindName(AssetKind kind) {
  switch (kind) {
    case AssetKind::Native: return "Native";
    case AssetKind::FungibleToken: return "FungibleToken";
    case AssetKind::NonFungibleToken: return "NonFungibleToken";
  }
  return "Unknown";
}

AssetKind AssetMeta::Kind() const {
  if (std::holds_alternative<NativeDetail>(detail)) return AssetKind::Native;
  if (std::holds_alternative<FungibleDetail>(detail)) return AssetKind::FungibleToken;
  return AssetKind::NonFungibleToken;
}

int AssetMeta::Decimals() const {
  if (auto n = std::get_if<NativeDetail>(&detail)) return n->decimals;
  if (auto f = std::get_if<FungibleDetail>(&detail)) return f->decimals;
  return 0;
}
