/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <utility>

#include "codec/cbor/cbor_config.hpp"
#include "codec/cbor/cbor_source.hpp"
#include "codec/cbor/cbor_token.hpp"
#include "codec/cbor/cbor_visitor.hpp"

namespace tc::codec::cbor {
  /**
   * Reads CBOR items from source.
   * Keeps at most one byte read ahead, so peeked byte is not lost when
   * decoding continues.
   */
  class CborDecoder {
   public:
    explicit CborDecoder(CborSource &source, CborDecoderConfig config = {});

    const CborDecoderConfig &config() const;

    /** Returns next byte without consuming it */
    outcome::result<uint8_t> peek();
    /** Consumes next byte */
    outcome::result<uint8_t> readByte();
    /** Returns next initial byte without consuming it */
    outcome::result<CborToken> peekHeader();
    /** Consumes initial byte, argument bytes are left */
    outcome::result<CborToken> readHeader();
    /**
     * Reads argument of given additional information.
     * @return none for indefinite length (31),
     * CborDecodeError::kInvalidCbor for reserved values (28-30)
     */
    outcome::result<boost::optional<uint64_t>> readLength(uint8_t info);
    /** Reads argument which must be definite */
    outcome::result<uint64_t> readArgument(const CborToken &token);

    /** Whether next byte is break, does not consume it */
    outcome::result<bool> isBreak();
    /** Consumes break */
    outcome::result<void> readBreak();
    /** Whether next item is null or undefined, does not consume it */
    outcome::result<bool> isNull();
    /** Reads tag number, tagged item follows */
    outcome::result<uint64_t> readTag();
    /** Consumes tag headers in front of next item */
    outcome::result<void> skipTags();
    /** Whether input has no more bytes */
    outcome::result<bool> atEnd();

    /**
     * Decodes one item into visitor.
     * Single dispatch point for all typed reads. Checks nesting depth and
     * indefinite length policy, validates UTF-8 of text strings.
     */
    outcome::result<void> decodeAny(CborVisitor &visitor);
    /** Continues decoding of item which initial byte was already read */
    outcome::result<void> decodeAny(const CborToken &token,
                                    CborVisitor &visitor);
    /** Consumes one item */
    outcome::result<void> skip();
    /** Consumes one item and returns its encoded bytes */
    outcome::result<Bytes> readItem();

    outcome::result<void> readNull();
    outcome::result<bool> readBool();
    outcome::result<uint64_t> readUint();
    /** Reads major type 0 or 1 as signed */
    outcome::result<int64_t> readInt();
    outcome::result<double> readFloat();
    outcome::result<Bytes> readBytes();
    outcome::result<std::string> readStr();

    /** Decodes list, f(CborSeqAccess &) reads elements */
    template <typename F>
    outcome::result<void> readList(F &&f) {
      struct Visitor : CborVisitor {
        F &f;
        explicit Visitor(F &f) : f{f} {}
        outcome::result<void> visitList(CborSeqAccess &list) override {
          return f(list);
        }
      } visitor{f};
      return decodeAny(visitor);
    }

    /** Decodes map, f(CborSeqAccess &) reads key-value pairs */
    template <typename F>
    outcome::result<void> readMap(F &&f) {
      struct Visitor : CborVisitor {
        F &f;
        explicit Visitor(F &f) : f{f} {}
        outcome::result<void> visitMap(CborSeqAccess &map) override {
          return f(map);
        }
      } visitor{f};
      return decodeAny(visitor);
    }

    /** Decodes value using its cborDecode overload */
    template <typename T>
    outcome::result<void> decode(T &value) {
      return cborDecode(*this, value);
    }

   private:
    outcome::result<void> readRaw(BytesOut out);
    template <typename Out>
    outcome::result<void> readAppend(uint64_t size, Out &out);
    template <typename Out>
    outcome::result<void> readString(const CborToken &token, Out &out);
    outcome::result<void> decodeNested(const CborToken &token,
                                       CborVisitor &visitor);

    CborSource &source_;
    CborDecoderConfig config_;
    boost::optional<uint8_t> pending_;
    size_t depth_{};
    /** Receives bytes read from source while readItem runs */
    Bytes *record_{};
  };
}  // namespace tc::codec::cbor
