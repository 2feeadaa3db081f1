#include "crypto/keccak.hpp"
#include "constants/chain.hpp"
#include <gtest/gtest.h>

TEST(KeccakTest, EmptyInput) {
  EXPECT_EQ(Crypto::Keccak256Text(""), "0xc5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470");
  EXPECT_EQ(Crypto::Keccak256(Bytes{}).size(), 32u);
}

TEST(KeccakTest, TransferEventTopic) {
  EXPECT_EQ(Crypto::Keccak256Text("Transfer(address,address,uint256)"), ChainConstants::TRANSFER_TOPIC);
}

TEST(KeccakTest, FunctionSelectors) {
  EXPECT_EQ(Crypto::SelectorOf("transfer(address,uint256)"), "0xa9059cbb");
  EXPECT_EQ(Crypto::SelectorOf("balanceOf(address)"), "0x70a08231");
  EXPECT_EQ(Crypto::SelectorOf("decimals()"), "0x313ce567");
  EXPECT_EQ(Crypto::SelectorOf("transferFrom(address,address,uint256)"), "0x23b872dd");
  EXPECT_EQ(Crypto::SelectorOf("tokenOfOwnerByIndex(address,uint256)"), "0x2f745c59");
}
