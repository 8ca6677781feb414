// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>

#include "util/uint.hpp"

#include <algorithm>
#include <string>

TEST_CASE("uint256: hex rendering", "[uint256]") {
  uint256 hash;
  CHECK(hash.GetHex() == std::string(64, '0'));
  CHECK(hash == uint256());

  auto it = hash.begin();
  *it = 0xab;
  *(hash.end() - 1) = 0x01;
  CHECK(hash.GetHex() == "ab" + std::string(60, '0') + "01");
  CHECK_FALSE(hash == uint256());
}

TEST_CASE("uint256: byte order", "[uint256]") {
  uint256 hash;
  uint8_t value = 0;
  for (auto& b : hash) {
    b = value;
    value += 0x11;
  }
  CHECK(hash.GetHex().substr(0, 8) == "00112233");

  uint256 same;
  std::copy(hash.begin(), hash.end(), same.begin());
  CHECK(same == hash);
}
