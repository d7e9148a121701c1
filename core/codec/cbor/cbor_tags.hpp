/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>
#include <type_traits>
#include <vector>

#include "codec/cbor/cbor_shape.hpp"
#include "common/endian.hpp"

namespace tc::codec::cbor {
  using common::Endian;

  /// Registered tag numbers, meaning is not enforced
  namespace tags {
    constexpr uint64_t kDatetimeString{0};
    constexpr uint64_t kEpochDatetime{1};
    constexpr uint64_t kPositiveBignum{2};
    constexpr uint64_t kNegativeBignum{3};
    constexpr uint64_t kDecimalFraction{4};
    constexpr uint64_t kBigfloat{5};
    constexpr uint64_t kExpectedBase64Url{21};
    constexpr uint64_t kExpectedBase64{22};
    constexpr uint64_t kExpectedBase16{23};
    constexpr uint64_t kEncodedCbor{24};
    constexpr uint64_t kUri{32};
    constexpr uint64_t kBase64Url{33};
    constexpr uint64_t kBase64{34};
    constexpr uint64_t kMime{36};

    // RFC 8746 typed arrays
    constexpr uint64_t kUint8Array{64};
    constexpr uint64_t kUint16BeArray{65};
    constexpr uint64_t kUint32BeArray{66};
    constexpr uint64_t kUint64BeArray{67};
    constexpr uint64_t kUint8ClampedArray{68};
    constexpr uint64_t kUint16LeArray{69};
    constexpr uint64_t kUint32LeArray{70};
    constexpr uint64_t kUint64LeArray{71};
    constexpr uint64_t kSint8Array{72};
    constexpr uint64_t kSint16BeArray{73};
    constexpr uint64_t kSint32BeArray{74};
    constexpr uint64_t kSint64BeArray{75};
    constexpr uint64_t kSint16LeArray{77};
    constexpr uint64_t kSint32LeArray{78};
    constexpr uint64_t kSint64LeArray{79};
    constexpr uint64_t kFloat16BeArray{80};
    constexpr uint64_t kFloat32BeArray{81};
    constexpr uint64_t kFloat64BeArray{82};
    constexpr uint64_t kFloat128BeArray{83};
    constexpr uint64_t kFloat16LeArray{84};
    constexpr uint64_t kFloat32LeArray{85};
    constexpr uint64_t kFloat64LeArray{86};
    constexpr uint64_t kFloat128LeArray{87};
  }  // namespace tags

  /// Raw bit pattern of IEEE 754 binary128 number, most significant byte first
  using Float128Bits = BytesN<16>;

  /** Writes tag header followed by value */
  template <typename T>
  outcome::result<void> encodeTagged(CborEncoder &e,
                                     uint64_t tag,
                                     const T &value) {
    OUTCOME_TRY(e.writeTag(tag));
    return e.encode(value);
  }

  outcome::result<void> encodeDatetimeString(CborEncoder &e,
                                             std::string_view datetime);
  /** Seconds since 1970-01-01T00:00Z */
  outcome::result<void> encodeEpochDatetime(CborEncoder &e, int64_t epoch);
  outcome::result<void> encodeUri(CborEncoder &e, std::string_view uri);
  /** Text is already base64url encoded */
  outcome::result<void> encodeBase64Url(CborEncoder &e, std::string_view data);
  /** Text is already base64 encoded */
  outcome::result<void> encodeBase64(CborEncoder &e, std::string_view data);

  /**
   * Tag of typed array with given element type and byte order.
   * Byte order is ignored for single byte elements.
   */
  template <typename T>
  constexpr uint64_t typedArrayTag(Endian endian) {
    const bool big{endian == Endian::kBig};
    if constexpr (std::is_same_v<T, uint8_t>) {
      return tags::kUint8Array;
    } else if constexpr (std::is_same_v<T, int8_t>) {
      return tags::kSint8Array;
    } else if constexpr (std::is_same_v<T, uint16_t>) {
      return big ? tags::kUint16BeArray : tags::kUint16LeArray;
    } else if constexpr (std::is_same_v<T, uint32_t>) {
      return big ? tags::kUint32BeArray : tags::kUint32LeArray;
    } else if constexpr (std::is_same_v<T, uint64_t>) {
      return big ? tags::kUint64BeArray : tags::kUint64LeArray;
    } else if constexpr (std::is_same_v<T, int16_t>) {
      return big ? tags::kSint16BeArray : tags::kSint16LeArray;
    } else if constexpr (std::is_same_v<T, int32_t>) {
      return big ? tags::kSint32BeArray : tags::kSint32LeArray;
    } else if constexpr (std::is_same_v<T, int64_t>) {
      return big ? tags::kSint64BeArray : tags::kSint64LeArray;
    } else if constexpr (std::is_same_v<T, float>) {
      return big ? tags::kFloat32BeArray : tags::kFloat32LeArray;
    } else {
      static_assert(std::is_same_v<T, double>, "not a typed array element");
      return big ? tags::kFloat64BeArray : tags::kFloat64LeArray;
    }
  }

  /** Writes elements as tagged byte string in given byte order */
  template <typename T>
  outcome::result<void> encodeTypedArray(CborEncoder &e,
                                         gsl::span<const T> values,
                                         Endian endian) {
    Bytes bytes;
    bytes.reserve(values.size() * sizeof(T));
    for (const auto &value : values) {
      common::putNumber(bytes, value, endian);
    }
    OUTCOME_TRY(e.writeTag(typedArrayTag<T>(endian)));
    return e.writeBytes(bytes);
  }

  /**
   * Reads typed array with given element type and byte order.
   * Uint8 array also accepts clamped uint8 tag.
   * @return CborDecodeError::kWrongTag if tag is different,
   * CborDecodeError::kWrongSize if byte count is not multiple of element size
   */
  template <typename T>
  outcome::result<std::vector<T>> decodeTypedArray(CborDecoder &d,
                                                   Endian endian) {
    OUTCOME_TRY(tag, d.readTag());
    const auto expected{typedArrayTag<T>(endian)};
    if (tag != expected
        && !(expected == tags::kUint8Array
             && tag == tags::kUint8ClampedArray)) {
      return CborDecodeError::kWrongTag;
    }
    OUTCOME_TRY(bytes, d.readBytes());
    if (bytes.size() % sizeof(T) != 0) {
      return CborDecodeError::kWrongSize;
    }
    std::vector<T> values;
    values.reserve(bytes.size() / sizeof(T));
    for (size_t i{0}; i < bytes.size(); i += sizeof(T)) {
      values.push_back(common::getNumber<T>(bytes.data() + i, endian));
    }
    return values;
  }

  outcome::result<void> encodeUint8Array(CborEncoder &e, BytesIn data);
  /** Values are clamped on conversion, not on encode */
  outcome::result<void> encodeUint8ClampedArray(CborEncoder &e, BytesIn data);
  outcome::result<void> encodeSint8Array(CborEncoder &e,
                                         gsl::span<const int8_t> data);

  outcome::result<void> encodeUint16BeArray(CborEncoder &e,
                                            gsl::span<const uint16_t> data);
  outcome::result<void> encodeUint32BeArray(CborEncoder &e,
                                            gsl::span<const uint32_t> data);
  outcome::result<void> encodeUint64BeArray(CborEncoder &e,
                                            gsl::span<const uint64_t> data);
  outcome::result<void> encodeUint16LeArray(CborEncoder &e,
                                            gsl::span<const uint16_t> data);
  outcome::result<void> encodeUint32LeArray(CborEncoder &e,
                                            gsl::span<const uint32_t> data);
  outcome::result<void> encodeUint64LeArray(CborEncoder &e,
                                            gsl::span<const uint64_t> data);

  outcome::result<void> encodeSint16BeArray(CborEncoder &e,
                                            gsl::span<const int16_t> data);
  outcome::result<void> encodeSint32BeArray(CborEncoder &e,
                                            gsl::span<const int32_t> data);
  outcome::result<void> encodeSint64BeArray(CborEncoder &e,
                                            gsl::span<const int64_t> data);
  outcome::result<void> encodeSint16LeArray(CborEncoder &e,
                                            gsl::span<const int16_t> data);
  outcome::result<void> encodeSint32LeArray(CborEncoder &e,
                                            gsl::span<const int32_t> data);
  outcome::result<void> encodeSint64LeArray(CborEncoder &e,
                                            gsl::span<const int64_t> data);

  /// Elements are raw binary16 bit patterns
  outcome::result<void> encodeFloat16BeArray(CborEncoder &e,
                                             gsl::span<const uint16_t> data);
  outcome::result<void> encodeFloat16LeArray(CborEncoder &e,
                                             gsl::span<const uint16_t> data);
  outcome::result<void> encodeFloat32BeArray(CborEncoder &e,
                                             gsl::span<const float> data);
  outcome::result<void> encodeFloat32LeArray(CborEncoder &e,
                                             gsl::span<const float> data);
  outcome::result<void> encodeFloat64BeArray(CborEncoder &e,
                                             gsl::span<const double> data);
  outcome::result<void> encodeFloat64LeArray(CborEncoder &e,
                                             gsl::span<const double> data);
  /// Little endian form reverses bytes of each element
  outcome::result<void> encodeFloat128BeArray(
      CborEncoder &e, gsl::span<const Float128Bits> data);
  outcome::result<void> encodeFloat128LeArray(
      CborEncoder &e, gsl::span<const Float128Bits> data);

  /** Reads binary16 bit patterns of tag 80 or 84 */
  outcome::result<std::vector<uint16_t>> decodeFloat16Array(CborDecoder &d,
                                                            Endian endian);
  /** Reads binary128 bit patterns of tag 83 or 87 */
  outcome::result<std::vector<Float128Bits>> decodeFloat128Array(
      CborDecoder &d, Endian endian);
}  // namespace tc::codec::cbor
