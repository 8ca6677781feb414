// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

// 256-bit opaque blob (block hashes). Hex form is byte order, no prefix.
class uint256 {
public:
  static constexpr size_t WIDTH = 32;

  constexpr uint256() = default;

  std::string GetHex() const;

  auto begin() { return data_.begin(); }
  auto end() { return data_.end(); }
  auto begin() const { return data_.begin(); }
  auto end() const { return data_.end(); }

  friend bool operator==(const uint256&, const uint256&) = default;

private:
  std::array<uint8_t, WIDTH> data_{};
};
