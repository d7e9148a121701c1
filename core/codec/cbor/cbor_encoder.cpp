/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/cbor/cbor_encoder.hpp"

#include "common/endian.hpp"
#include "common/span.hpp"

namespace tc::codec::cbor {
  using common::Endian;

  CborEncoder::CborEncoder(CborSink &sink, CborEncoderConfig config)
      : sink_{sink}, config_{config} {}

  const CborEncoderConfig &CborEncoder::config() const {
    return config_;
  }

  outcome::result<void> CborEncoder::writeHeader(CborToken::Type type,
                                                 uint64_t argument) {
    return sink_.write(CborTokenEncoder{type, argument});
  }

  outcome::result<void> CborEncoder::writeRaw(BytesIn bytes) {
    return sink_.write(bytes);
  }

  outcome::result<void> CborEncoder::writeByte(uint8_t byte) {
    return sink_.write(BytesIn{&byte, 1});
  }

  outcome::result<void> CborEncoder::writeNull() {
    return writeByte(kNull);
  }

  outcome::result<void> CborEncoder::writeBool(bool value) {
    return writeByte(value ? kTrue : kFalse);
  }

  outcome::result<void> CborEncoder::writeUint(uint64_t value) {
    return writeHeader(CborToken::UINT, value);
  }

  outcome::result<void> CborEncoder::writeInt(int64_t value) {
    if (value < 0) {
      return writeHeader(CborToken::INT, static_cast<uint64_t>(~value));
    }
    return writeUint(static_cast<uint64_t>(value));
  }

  outcome::result<void> CborEncoder::writeFloat32(float value) {
    Bytes bytes{CborToken::_first(CborToken::SPECIAL, kExtraFloat32)};
    common::putNumber(bytes, value, Endian::kBig);
    return sink_.write(bytes);
  }

  outcome::result<void> CborEncoder::writeFloat64(double value) {
    Bytes bytes{CborToken::_first(CborToken::SPECIAL, kExtraFloat64)};
    common::putNumber(bytes, value, Endian::kBig);
    return sink_.write(bytes);
  }

  outcome::result<void> CborEncoder::writeBytes(BytesIn bytes) {
    OUTCOME_TRY(writeHeader(CborToken::BYTES, bytes.size()));
    return sink_.write(bytes);
  }

  outcome::result<void> CborEncoder::writeStr(std::string_view str) {
    OUTCOME_TRY(writeHeader(CborToken::STR, str.size()));
    return sink_.write(common::span::cbytes(str));
  }

  outcome::result<void> CborEncoder::writeTag(uint64_t tag) {
    return writeHeader(CborToken::TAG, tag);
  }

  outcome::result<void> CborEncoder::writeList(uint64_t count) {
    return writeHeader(CborToken::LIST, count);
  }

  outcome::result<void> CborEncoder::writeMap(uint64_t count) {
    return writeHeader(CborToken::MAP, count);
  }

  outcome::result<void> CborEncoder::writeListIndefinite() {
    return writeByte(CborToken::_first(CborToken::LIST, kExtraIndefinite));
  }

  outcome::result<void> CborEncoder::writeMapIndefinite() {
    return writeByte(CborToken::_first(CborToken::MAP, kExtraIndefinite));
  }

  outcome::result<void> CborEncoder::writeBytesIndefinite() {
    return writeByte(CborToken::_first(CborToken::BYTES, kExtraIndefinite));
  }

  outcome::result<void> CborEncoder::writeStrIndefinite() {
    return writeByte(CborToken::_first(CborToken::STR, kExtraIndefinite));
  }

  outcome::result<void> CborEncoder::writeBreak() {
    return writeByte(kBreak);
  }
}  // namespace tc::codec::cbor
