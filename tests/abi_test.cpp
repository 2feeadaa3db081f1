#include "encoding/abi.hpp"
#include "protocols/erc20.hpp"
#include "protocols/erc721.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

TEST(AbiTest, EncodesAddressAsLowercaseWord) {
  EXPECT_EQ(ABI::EncodeAddress("0x7E5F4552091A69125d5DfCb7b8C2659029395Bdf"),
            std::string(24, '0') + "7e5f4552091a69125d5dfcb7b8c2659029395bdf");
  EXPECT_EQ(ABI::AddressTopic("0x7e5f4552091a69125d5dfcb7b8c2659029395bdf"),
            "0x" + std::string(24, '0') + "7e5f4552091a69125d5dfcb7b8c2659029395bdf");
}

TEST(AbiTest, DecodeUintUsesFirstWord) {
  EXPECT_EQ(ABI::DecodeUint("0x" + std::string(62, '0') + "06" + std::string(64, 'f')), 6);
  EXPECT_THROW(ABI::DecodeUint("0x"), std::invalid_argument);
}

TEST(AbiTest, DecodeDynamicString) {
  // "USDC"
  const std::string ret = "0x"
    "0000000000000000000000000000000000000000000000000000000000000020"
    "0000000000000000000000000000000000000000000000000000000000000004"
    "5553444300000000000000000000000000000000000000000000000000000000";
  EXPECT_EQ(ABI::DecodeString(ret), "USDC");
}

TEST(AbiTest, DecodeBytes32String) {
  // legacy tokens return a NUL padded bytes32, e.g. "MKR"
  EXPECT_EQ(ABI::DecodeString("0x4d4b520000000000000000000000000000000000000000000000000000000000"), "MKR");
  EXPECT_THROW(ABI::DecodeString("0x1234"), std::invalid_argument);
}

TEST(AbiTest, TransferCalldata) {
  const std::string call = ERC20::BuildTransferCall("0x00000000000000000000000000000000000000aa", Amount(1500000));
  EXPECT_EQ(call.substr(0, 10), "0xa9059cbb");
  EXPECT_EQ(call.size(), 2u + 8u + 128u);
  EXPECT_EQ(call.substr(call.size() - 6), "16e360");
}

TEST(AbiTest, TransferFromCalldata) {
  const std::string call = ERC721::BuildTransferFromCall("0x7e5f4552091a69125d5dfcb7b8c2659029395bdf",
                                                         "0x00000000000000000000000000000000000000aa", Amount(7));
  EXPECT_EQ(call.substr(0, 10), "0x23b872dd");
  EXPECT_EQ(call.size(), 2u + 8u + 192u);
  EXPECT_EQ(call.substr(call.size() - 2), "07");
}
