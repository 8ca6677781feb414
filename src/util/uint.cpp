// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/uint.hpp"

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

}  // namespace

std::string uint256::GetHex() const {
  std::string out;
  out.reserve(WIDTH * 2);
  for (uint8_t b : data_) {
    out.push_back(kHexDigits[b >> 4]);
    out.push_back(kHexDigits[b & 0x0f]);
  }
  return out;
}
