// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <array>
#include <compare>
#include <cstdint>
#include <string>

// Unsigned 256-bit integer for cumulative chain difficulty
class arith_uint256 {
public:
  static constexpr int WIDTH = 8;  // 32-bit limbs, least significant first

  constexpr arith_uint256() = default;
  constexpr arith_uint256(uint64_t v) {  // NOLINT(google-explicit-constructor)
    limbs_[0] = static_cast<uint32_t>(v);
    limbs_[1] = static_cast<uint32_t>(v >> 32);
  }

  friend bool operator==(const arith_uint256&, const arith_uint256&) = default;
  friend std::strong_ordering operator<=>(const arith_uint256& a, const arith_uint256& b);

  // Decimal rendering, no leading zeros ("0" for zero)
  std::string ToString() const;

private:
  bool IsZero() const;

  // Divide in place by a small divisor, returning the remainder
  uint32_t DivSmall(uint32_t divisor);

  std::array<uint32_t, WIDTH> limbs_{};
};
