/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstring>
#include <type_traits>

#include <boost/endian/conversion.hpp>

#include "common/bytes.hpp"

namespace tc::common {
  /// Byte order of multi-byte numbers in a buffer
  enum class Endian { kBig, kLittle };

  /// Unsigned integer of same size as T
  template <typename T>
  using UintOf = std::conditional_t<
      sizeof(T) == 1,
      uint8_t,
      std::conditional_t<
          sizeof(T) == 2,
          uint16_t,
          std::conditional_t<sizeof(T) == 4, uint32_t, uint64_t>>>;

  /**
   * Appends bit pattern of arithmetic value in given byte order
   * @tparam T integer or floating point type of 1, 2, 4 or 8 bytes
   */
  template <typename T>
  void putNumber(Bytes &l, T value, Endian endian) {
    static_assert(std::is_arithmetic_v<T>);
    using U = UintOf<T>;
    static_assert(sizeof(U) == sizeof(T));
    U bits{};
    std::memcpy(&bits, &value, sizeof(T));
    bits = endian == Endian::kBig ? boost::endian::native_to_big(bits)
                                  : boost::endian::native_to_little(bits);
    const auto offset{l.size()};
    l.resize(offset + sizeof(T));
    std::memcpy(l.data() + offset, &bits, sizeof(T));
  }

  /// Reads arithmetic value from first sizeof(T) bytes of input
  template <typename T>
  T getNumber(const uint8_t *input, Endian endian) {
    static_assert(std::is_arithmetic_v<T>);
    using U = UintOf<T>;
    U bits{};
    std::memcpy(&bits, input, sizeof(T));
    bits = endian == Endian::kBig ? boost::endian::big_to_native(bits)
                                  : boost::endian::little_to_native(bits);
    T value{};
    std::memcpy(&value, &bits, sizeof(T));
    return value;
  }
}  // namespace tc::common
