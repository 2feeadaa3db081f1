#include "utils/amount.hpp"
#include "utils/hex.hpp"
#include <gtest/gtest.h>
#include <limits>
#include <stdexcept>

TEST(HexTest, AddressShapeIsChecked) {
  EXPECT_TRUE(IsHexAddress("0x7e5f4552091a69125d5dfcb7b8c2659029395bdf"));
  EXPECT_TRUE(IsHexAddress("0x7E5F4552091A69125d5DfCb7b8C2659029395Bdf"));
  EXPECT_FALSE(IsHexAddress("0x..."));
  EXPECT_FALSE(IsHexAddress("7e5f4552091a69125d5dfcb7b8c2659029395bdf"));
  EXPECT_FALSE(IsHexAddress("0x7e5f4552091a69125d5dfcb7b8c2659029395bdg"));
}

TEST(HexTest, HexToBytesPadsOddLength) {
  const Bytes b = HexToBytes("0xabc");
  ASSERT_EQ(b.size(), 2u);
  EXPECT_EQ(b[0], 0x0a);
  EXPECT_EQ(b[1], 0xbc);
  EXPECT_THROW(HexToBytes("0xzz"), std::invalid_argument);
}

TEST(HexTest, QuantitiesHaveNoLeadingZeros) {
  EXPECT_EQ(ToHexQuantity(0), "0x0");
  EXPECT_EQ(ToHexQuantity(256), "0x100");
  EXPECT_EQ(ParseHexULL("0x186a0"), 100000u);
  EXPECT_THROW(ParseHexULL("0x"), std::invalid_argument);
}

TEST(AmountTest, ParsesFullWidthWords) {
  const Amount max = ParseHexAmount("0x" + std::string(64, 'f'));
  EXPECT_EQ(max, std::numeric_limits<Amount>::max());
  EXPECT_EQ(ParseHexAmount("0x0000000000000000000000000000000000000000000000000000000000000012"), 18);
  EXPECT_THROW(ParseHexAmount("0x1" + std::string(64, '0')), std::out_of_range);
  EXPECT_THROW(ParseHexAmount(""), std::invalid_argument);
}

TEST(AmountTest, HexQuantityAndWord) {
  EXPECT_EQ(AmountToHexQuantity(0), "0x0");
  EXPECT_EQ(AmountToHexQuantity(Amount(4096)), "0x1000");
  EXPECT_EQ(AmountToWordHex(Amount(1)), std::string(63, '0') + "1");
  EXPECT_TRUE(AmountToMinimalBytes(0).empty());
}

TEST(AmountTest, FormatUnitsDropsTrailingZeros) {
  EXPECT_EQ(FormatUnits(Amount(1500000), 6), "1.5");
  EXPECT_EQ(FormatUnits(Amount(1000000), 6), "1");
  EXPECT_EQ(FormatUnits(Amount(5), 6), "0.000005");
  EXPECT_EQ(FormatUnits(Amount(42), 0), "42");
  EXPECT_EQ(FormatUnits(Amount("1000000000000000000000"), 18), "1000");
}

TEST(AmountTest, GweiToWei) {
  EXPECT_EQ(GweiToWei(0.0), 0);
  EXPECT_EQ(GweiToWei(3.0), Amount(3000000000ULL));
  EXPECT_EQ(GweiToWei(0.05), Amount(50000000ULL));
}
