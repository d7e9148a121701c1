/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include "codec/cbor/cbor_config.hpp"
#include "codec/cbor/cbor_sink.hpp"
#include "codec/cbor/cbor_token.hpp"

namespace tc::codec::cbor {
  /**
   * Writes CBOR items to sink.
   * Integers, lengths and tags use shortest argument form.
   * Nothing is buffered, so count of list or map items must be known before
   * header is written, see CborEncodeBuffer otherwise.
   */
  class CborEncoder {
   public:
    explicit CborEncoder(CborSink &sink, CborEncoderConfig config = {});

    const CborEncoderConfig &config() const;

    /** Writes initial byte and argument */
    outcome::result<void> writeHeader(CborToken::Type type, uint64_t argument);
    /** Writes already encoded items as is */
    outcome::result<void> writeRaw(BytesIn bytes);

    outcome::result<void> writeNull();
    outcome::result<void> writeBool(bool value);
    outcome::result<void> writeUint(uint64_t value);
    /** Writes major type 0 for non-negative, major type 1 for negative */
    outcome::result<void> writeInt(int64_t value);
    outcome::result<void> writeFloat32(float value);
    outcome::result<void> writeFloat64(double value);
    outcome::result<void> writeBytes(BytesIn bytes);
    outcome::result<void> writeStr(std::string_view str);
    /** Writes tag header, tagged item must follow */
    outcome::result<void> writeTag(uint64_t tag);
    /** Writes list header, count items must follow */
    outcome::result<void> writeList(uint64_t count);
    /** Writes map header, count key-value pairs must follow */
    outcome::result<void> writeMap(uint64_t count);

    outcome::result<void> writeListIndefinite();
    outcome::result<void> writeMapIndefinite();
    /** Definite byte strings must follow as chunks */
    outcome::result<void> writeBytesIndefinite();
    /** Definite text strings must follow as chunks */
    outcome::result<void> writeStrIndefinite();
    /** Ends indefinite length item */
    outcome::result<void> writeBreak();

    /** Encodes value using its cborEncode overload */
    template <typename T>
    outcome::result<void> encode(const T &value) {
      return cborEncode(*this, value);
    }

   private:
    outcome::result<void> writeByte(uint8_t byte);

    CborSink &sink_;
    CborEncoderConfig config_;
  };
}  // namespace tc::codec::cbor
