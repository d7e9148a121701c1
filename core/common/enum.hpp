/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <type_traits>

namespace tc::common {
  /// Underlying integer of enum value, e.g. `to_int(Color::kRed)`
  template <typename Enum>
  constexpr std::underlying_type_t<Enum> to_int(Enum value) {
    return static_cast<std::underlying_type_t<Enum>>(value);
  }

  /// Enum value from underlying integer, values outside of enumerators are kept
  template <typename Enum>
  constexpr Enum from_int(std::underlying_type_t<Enum> value) {
    return static_cast<Enum>(value);
  }
}  // namespace tc::common
