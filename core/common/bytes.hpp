/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <gsl/span>
#include <vector>

namespace tc {
  using Bytes = std::vector<uint8_t>;
  using BytesIn = gsl::span<const uint8_t>;
  using BytesOut = gsl::span<uint8_t>;

  template <size_t N>
  using BytesN = std::array<uint8_t, N>;

  inline Bytes copy(BytesIn r) {
    return {r.begin(), r.end()};
  }
  void copy(Bytes &&) = delete;

  inline void append(Bytes &l, BytesIn r) {
    l.insert(l.end(), r.begin(), r.end());
  }

  inline bool equal(BytesIn l, BytesIn r) {
    return std::equal(l.begin(), l.end(), r.begin(), r.end());
  }

  /** Lexicographic byte order */
  inline bool less(BytesIn l, BytesIn r) {
    return std::lexicographical_compare(l.begin(), l.end(), r.begin(), r.end());
  }
}  // namespace tc
