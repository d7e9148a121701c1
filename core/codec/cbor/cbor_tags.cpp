/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/cbor/cbor_tags.hpp"

#include <algorithm>

namespace tc::codec::cbor {
  namespace {
    outcome::result<Bytes> readTypedBytes(CborDecoder &d,
                                          uint64_t expected,
                                          size_t element) {
      OUTCOME_TRY(tag, d.readTag());
      if (tag != expected) {
        return CborDecodeError::kWrongTag;
      }
      OUTCOME_TRY(bytes, d.readBytes());
      if (bytes.size() % element != 0) {
        return CborDecodeError::kWrongSize;
      }
      return std::move(bytes);
    }
  }  // namespace

  outcome::result<void> encodeDatetimeString(CborEncoder &e,
                                             std::string_view datetime) {
    return encodeTagged(e, tags::kDatetimeString, datetime);
  }

  outcome::result<void> encodeEpochDatetime(CborEncoder &e, int64_t epoch) {
    return encodeTagged(e, tags::kEpochDatetime, epoch);
  }

  outcome::result<void> encodeUri(CborEncoder &e, std::string_view uri) {
    return encodeTagged(e, tags::kUri, uri);
  }

  outcome::result<void> encodeBase64Url(CborEncoder &e,
                                        std::string_view data) {
    return encodeTagged(e, tags::kBase64Url, data);
  }

  outcome::result<void> encodeBase64(CborEncoder &e, std::string_view data) {
    return encodeTagged(e, tags::kBase64, data);
  }

  outcome::result<void> encodeUint8Array(CborEncoder &e, BytesIn data) {
    return encodeTagged(e, tags::kUint8Array, data);
  }

  outcome::result<void> encodeUint8ClampedArray(CborEncoder &e,
                                                BytesIn data) {
    return encodeTagged(e, tags::kUint8ClampedArray, data);
  }

  outcome::result<void> encodeSint8Array(CborEncoder &e,
                                         gsl::span<const int8_t> data) {
    return encodeTypedArray(e, data, Endian::kBig);
  }

  outcome::result<void> encodeUint16BeArray(CborEncoder &e,
                                            gsl::span<const uint16_t> data) {
    return encodeTypedArray(e, data, Endian::kBig);
  }

  outcome::result<void> encodeUint32BeArray(CborEncoder &e,
                                            gsl::span<const uint32_t> data) {
    return encodeTypedArray(e, data, Endian::kBig);
  }

  outcome::result<void> encodeUint64BeArray(CborEncoder &e,
                                            gsl::span<const uint64_t> data) {
    return encodeTypedArray(e, data, Endian::kBig);
  }

  outcome::result<void> encodeUint16LeArray(CborEncoder &e,
                                            gsl::span<const uint16_t> data) {
    return encodeTypedArray(e, data, Endian::kLittle);
  }

  outcome::result<void> encodeUint32LeArray(CborEncoder &e,
                                            gsl::span<const uint32_t> data) {
    return encodeTypedArray(e, data, Endian::kLittle);
  }

  outcome::result<void> encodeUint64LeArray(CborEncoder &e,
                                            gsl::span<const uint64_t> data) {
    return encodeTypedArray(e, data, Endian::kLittle);
  }

  outcome::result<void> encodeSint16BeArray(CborEncoder &e,
                                            gsl::span<const int16_t> data) {
    return encodeTypedArray(e, data, Endian::kBig);
  }

  outcome::result<void> encodeSint32BeArray(CborEncoder &e,
                                            gsl::span<const int32_t> data) {
    return encodeTypedArray(e, data, Endian::kBig);
  }

  outcome::result<void> encodeSint64BeArray(CborEncoder &e,
                                            gsl::span<const int64_t> data) {
    return encodeTypedArray(e, data, Endian::kBig);
  }

  outcome::result<void> encodeSint16LeArray(CborEncoder &e,
                                            gsl::span<const int16_t> data) {
    return encodeTypedArray(e, data, Endian::kLittle);
  }

  outcome::result<void> encodeSint32LeArray(CborEncoder &e,
                                            gsl::span<const int32_t> data) {
    return encodeTypedArray(e, data, Endian::kLittle);
  }

  outcome::result<void> encodeSint64LeArray(CborEncoder &e,
                                            gsl::span<const int64_t> data) {
    return encodeTypedArray(e, data, Endian::kLittle);
  }

  outcome::result<void> encodeFloat16BeArray(CborEncoder &e,
                                             gsl::span<const uint16_t> data) {
    Bytes bytes;
    for (auto bits : data) {
      common::putNumber(bytes, bits, Endian::kBig);
    }
    return encodeTagged(e, tags::kFloat16BeArray, bytes);
  }

  outcome::result<void> encodeFloat16LeArray(CborEncoder &e,
                                             gsl::span<const uint16_t> data) {
    Bytes bytes;
    for (auto bits : data) {
      common::putNumber(bytes, bits, Endian::kLittle);
    }
    return encodeTagged(e, tags::kFloat16LeArray, bytes);
  }

  outcome::result<void> encodeFloat32BeArray(CborEncoder &e,
                                             gsl::span<const float> data) {
    return encodeTypedArray(e, data, Endian::kBig);
  }

  outcome::result<void> encodeFloat32LeArray(CborEncoder &e,
                                             gsl::span<const float> data) {
    return encodeTypedArray(e, data, Endian::kLittle);
  }

  outcome::result<void> encodeFloat64BeArray(CborEncoder &e,
                                             gsl::span<const double> data) {
    return encodeTypedArray(e, data, Endian::kBig);
  }

  outcome::result<void> encodeFloat64LeArray(CborEncoder &e,
                                             gsl::span<const double> data) {
    return encodeTypedArray(e, data, Endian::kLittle);
  }

  outcome::result<void> encodeFloat128BeArray(
      CborEncoder &e, gsl::span<const Float128Bits> data) {
    Bytes bytes;
    for (const auto &bits : data) {
      append(bytes, bits);
    }
    return encodeTagged(e, tags::kFloat128BeArray, bytes);
  }

  outcome::result<void> encodeFloat128LeArray(
      CborEncoder &e, gsl::span<const Float128Bits> data) {
    Bytes bytes;
    for (const auto &bits : data) {
      bytes.insert(bytes.end(), bits.rbegin(), bits.rend());
    }
    return encodeTagged(e, tags::kFloat128LeArray, bytes);
  }

  outcome::result<std::vector<uint16_t>> decodeFloat16Array(CborDecoder &d,
                                                            Endian endian) {
    OUTCOME_TRY(bytes,
                readTypedBytes(d,
                               endian == Endian::kBig ? tags::kFloat16BeArray
                                                      : tags::kFloat16LeArray,
                               sizeof(uint16_t)));
    std::vector<uint16_t> values;
    values.reserve(bytes.size() / sizeof(uint16_t));
    for (size_t i{0}; i < bytes.size(); i += sizeof(uint16_t)) {
      values.push_back(common::getNumber<uint16_t>(bytes.data() + i, endian));
    }
    return values;
  }

  outcome::result<std::vector<Float128Bits>> decodeFloat128Array(
      CborDecoder &d, Endian endian) {
    OUTCOME_TRY(bytes,
                readTypedBytes(d,
                               endian == Endian::kBig ? tags::kFloat128BeArray
                                                      : tags::kFloat128LeArray,
                               sizeof(Float128Bits)));
    std::vector<Float128Bits> values;
    values.reserve(bytes.size() / sizeof(Float128Bits));
    for (auto it{bytes.begin()}; it != bytes.end();
         it += sizeof(Float128Bits)) {
      Float128Bits bits{};
      if (endian == Endian::kBig) {
        std::copy(it, it + bits.size(), bits.begin());
      } else {
        std::reverse_copy(it, it + bits.size(), bits.begin());
      }
      values.push_back(bits);
    }
    return values;
  }
}  // namespace tc::codec::cbor
