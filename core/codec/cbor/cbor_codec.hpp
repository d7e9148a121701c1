/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "codec/cbor/cbor_shape.hpp"
#include "codec/cbor/fwd.hpp"

namespace tc::codec::cbor {
  /**
   * Rejects empty input of whole-buffer decode
   * @return CborDecodeError::kEmptyInput
   */
  outcome::result<void> expectInput(BytesIn input);

  /**
   * Rejects bytes left after top-level item
   * @return CborDecodeError::kTrailingData
   */
  outcome::result<void> expectEnd(CborDecoder &decoder);

  /**
   * @brief CBOR encoding to byte-vector
   * @tparam Type to be encoded
   * @param arg data to be encoded
   * @return encoded data
   */
  template <typename T>
  outcome::result<Bytes> encode(const T &arg,
                                const CborEncoderConfig &config = {}) {
    Bytes bytes;
    BytesSink sink{bytes};
    CborEncoder encoder{sink, config};
    OUTCOME_TRY(encoder.encode(arg));
    return bytes;
  }

  /**
   * @brief CBOR encoding to sink
   * @param sink receives encoded data, its errors are returned as is
   */
  template <typename T>
  outcome::result<void> encode(CborSink &sink,
                               const T &arg,
                               const CborEncoderConfig &config = {}) {
    CborEncoder encoder{sink, config};
    return encoder.encode(arg);
  }

  /**
   * @brief CBOR decoding from byte-vector
   * @tparam T - type of the value to decode
   * @param input - data to decode, must contain exactly one item
   * @return operation result
   * @see cbor_errors.hpp for possible error cases
   */
  template <typename T>
  outcome::result<T> decode(BytesIn input,
                            const CborDecoderConfig &config = {}) {
    OUTCOME_TRY(expectInput(input));
    BytesSource source{input};
    CborDecoder decoder{source, config};
    T data{};
    OUTCOME_TRY(decoder.decode(data));
    OUTCOME_TRY(expectEnd(decoder));
    return data;
  }

  /**
   * @brief CBOR decoding of one item from source
   * Bytes after the item are left in source.
   */
  template <typename T>
  outcome::result<T> decode(CborSource &source,
                            const CborDecoderConfig &config = {}) {
    CborDecoder decoder{source, config};
    T data{};
    OUTCOME_TRY(decoder.decode(data));
    return data;
  }
}  // namespace tc::codec::cbor
