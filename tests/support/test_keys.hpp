#pragma once
#include <string>

// Private keys 1, 2 and 3 and the addresses they control.
namespace TestKeys {
  inline const std::string kKey1 = "0x0000000000000000000000000000000000000000000000000000000000000001";
  inline const std::string kKey2 = "0x0000000000000000000000000000000000000000000000000000000000000002";
  inline const std::string kKey3 = "0x0000000000000000000000000000000000000000000000000000000000000003";
  inline const std::string kAddr1 = "0x7e5f4552091a69125d5dfcb7b8c2659029395bdf";
  inline const std::string kAddr2 = "0x2b5ad5c4795c026514f8317c7a215e218dccd6cf";
  inline const std::string kAddr3 = "0x6813eb9362372eef6200f3b1dbc3f819671cba69";
  inline const std::string kVault = "0x00000000000000000000000000000000000000aa";
}
