// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>

#include "util/arith_uint256.hpp"

#include <string>

TEST_CASE("arith_uint256: ordering", "[arith_uint256]") {
  const arith_uint256 small(100);
  const arith_uint256 large(1ULL << 40);

  CHECK(small < large);
  CHECK(large > small);
  CHECK(small <= arith_uint256(100));
  CHECK(small == arith_uint256(100));
  CHECK(small != large);
  CHECK(arith_uint256() < small);

  // Second limb dominates the first
  CHECK(arith_uint256(1ULL << 32) > arith_uint256(0xFFFFFFFFULL));
  CHECK(arith_uint256(~0ULL) > arith_uint256(~0ULL - 1));
}

TEST_CASE("arith_uint256: decimal rendering", "[arith_uint256]") {
  CHECK(arith_uint256().ToString() == "0");
  CHECK(arith_uint256(7).ToString() == "7");
  CHECK(arith_uint256(1234567890).ToString() == "1234567890");
  CHECK(arith_uint256(1ULL << 32).ToString() == "4294967296");
  CHECK(arith_uint256(~0ULL).ToString() == "18446744073709551615");
}
