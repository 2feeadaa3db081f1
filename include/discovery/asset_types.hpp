#pragma once
#include <string>
#include <variant>
#include <vector>
#include "utils/amount.hpp"

enum class AssetKind { Native, FungibleToken, NonFungibleToken };

const char* AssetKindName(AssetKind kind);

// Kind-specific parts of an asset; the common fields live in AssetMeta.
struct NativeDetail { int decimals = 18; };
struct FungibleDetail { int decimals = 0; };
struct NonFungibleDetail {};
using AssetDetail = std::variant<NativeDetail, FungibleDetail, NonFungibleDetail>;

struct AssetMeta {
  std::string address; // lowercase contract address, or "NATIVE"
  std::string symbol;
  std::string name;
  AssetDetail detail;

  AssetKind Kind() const;
  // 0 for non-fungible collections
  int Decimals() const;
};

// One account's balance of one asset, as classified at discovery time.
// For a non-fungible collection the balance is the number of tokens owned.
struct Holding {
  AssetMeta asset;
  Amount balance = 0;
};

struct AccountBalance {
  std::string account;
  Amount balance = 0;
};

// Cross-account view of one asset. total is the sum of balances.
struct AssetRecord {
  AssetMeta asset;
  std::vector<AccountBalance> balances;
  Amount total = 0;
};
