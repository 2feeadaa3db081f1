#include "discovery/inventory.hpp"
#include "constants/chain.hpp"
#include <gtest/gtest.h>

namespace {

Holding Native(const Amount& balance) {
  Holding h;
  h.asset.address = ChainConstants::NATIVE_ASSET;
  h.asset.symbol = "ETH";
  h.asset.name = "Ether";
  h.asset.detail = NativeDetail{18};
  h.balance = balance;
  return h;
}

Holding Token(const std::string& address, const std::string& symbol, int decimals, const Amount& balance) {
  Holding h;
  h.asset.address = address;
  h.asset.symbol = symbol;
  h.asset.name = symbol + " token";
  h.asset.detail = FungibleDetail{decimals};
  h.balance = balance;
  return h;
}

Holding Collection(const std::string& address, const Amount& count) {
  Holding h;
  h.asset.address = address;
  h.asset.symbol = "NFT";
  h.asset.name = "NFT Collection";
  h.asset.detail = NonFungibleDetail{};
  h.balance = count;
  return h;
}

const std::string kA = "0x00000000000000000000000000000000000000a1";
const std::string kB = "0x00000000000000000000000000000000000000b2";
const std::string kC = "0x00000000000000000000000000000000000000c3";

}  // namespace

TEST(InventoryTest, OrdersNativeThenFungibleThenCollections) {
  Inventory inv;
  inv.AddAll("acct1", {Collection(kC, 2), Token(kB, "BBB", 18, 10)});
  inv.AddAll("acct2", {Native(5), Token(kA, "AAA", 6, 3)});
  const auto ranked = inv.Ordered();
  ASSERT_EQ(ranked.size(), 4u);
  EXPECT_EQ(ranked[0].asset.address, "NATIVE");
  EXPECT_EQ(ranked[1].asset.address, kB);
  EXPECT_EQ(ranked[2].asset.address, kA);
  EXPECT_EQ(ranked[3].asset.address, kC);
}

TEST(InventoryTest, TotalsSumPerAccountBalances) {
  Inventory inv;
  inv.Add("acct1", Token(kA, "AAA", 6, 1500000));
  inv.Add("acct2", Token("0x00000000000000000000000000000000000000A1", "AAA", 6, 500000));
  inv.Add("acct3", Token(kA, "AAA", 6, 1));
  ASSERT_EQ(inv.Size(), 1u);
  const AssetRecord* rec = inv.Find(kA);
  ASSERT_NE(rec, nullptr);
  EXPECT_EQ(rec->total, 2000001);
  ASSERT_EQ(rec->balances.size(), 3u);
  EXPECT_EQ(rec->balances[1].account, "acct2");
  EXPECT_TRUE(inv.TotalsConsistent());
}

TEST(InventoryTest, FirstSightingFixesMetadata) {
  Inventory inv;
  inv.Add("acct1", Token(kA, "FIRST", 6, 1));
  inv.Add("acct2", Token(kA, "SECOND", 18, 1));
  EXPECT_EQ(inv.Find(kA)->asset.symbol, "FIRST");
  EXPECT_EQ(inv.Find(kA)->asset.Decimals(), 6);
}

TEST(InventoryTest, EmptyInventory) {
  Inventory inv;
  EXPECT_TRUE(inv.Empty());
  EXPECT_TRUE(inv.Ordered().empty());
  EXPECT_EQ(inv.Find(kA), nullptr);
}
