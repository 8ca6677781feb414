// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/arith_uint256.hpp"

#include <algorithm>

std::strong_ordering operator<=>(const arith_uint256& a, const arith_uint256& b) {
  for (int i = arith_uint256::WIDTH - 1; i >= 0; --i) {
    if (a.limbs_[i] != b.limbs_[i]) {
      return a.limbs_[i] <=> b.limbs_[i];
    }
  }
  return std::strong_ordering::equal;
}

bool arith_uint256::IsZero() const {
  return std::all_of(limbs_.begin(), limbs_.end(), [](uint32_t l) { return l == 0; });
}

uint32_t arith_uint256::DivSmall(uint32_t divisor) {
  uint64_t rem = 0;
  for (int i = WIDTH - 1; i >= 0; --i) {
    const uint64_t cur = (rem << 32) | limbs_[i];
    limbs_[i] = static_cast<uint32_t>(cur / divisor);
    rem = cur % divisor;
  }
  return static_cast<uint32_t>(rem);
}

std::string arith_uint256::ToString() const {
  if (IsZero()) {
    return "0";
  }
  arith_uint256 n = *this;
  std::string digits;
  while (!n.IsZero()) {
    digits.push_back(static_cast<char>('0' + n.DivSmall(10)));
  }
  std::reverse(digits.begin(), digits.end());
  return digits;
}
