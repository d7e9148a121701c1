/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "codec/cbor/cbor_codec.hpp"

namespace tc::codec::cbor {
  /**
   * Value with optional tag number.
   * Without tag it is encoded exactly as bare value.
   */
  template <typename T>
  struct Tagged {
    boost::optional<uint64_t> tag;
    T value{};

    /**
     * Decodes whole input, reading tag header if present
     * @see decodeTagged
     */
    static outcome::result<Tagged<T>> fromTaggedBytes(
        BytesIn input, const CborDecoderConfig &config = {});
  };

  template <typename T>
  bool operator==(const Tagged<T> &l, const Tagged<T> &r) {
    return l.tag == r.tag && l.value == r.value;
  }

  template <typename T>
  bool operator!=(const Tagged<T> &l, const Tagged<T> &r) {
    return !(l == r);
  }

  /** Explicit `{"tag": uint | null, "value": item}` map */
  struct CborTagRecord {
    boost::optional<uint64_t> tag;
    /// encoded value item
    Bytes value;
  };

  /**
   * Reads encoded map item as tag record.
   * "value" is required, missing "tag" means no tag, other keys are ignored.
   * @return none if item has other shape
   */
  boost::optional<CborTagRecord> asTagRecord(
      BytesIn item, const CborDecoderConfig &config = {});

  template <typename T>
  struct CborKeepsTag<Tagged<T>> : std::true_type {};

  /**
   * Tag aware decode.
   * Tag header is consumed and kept, item after it is decoded as T.
   */
  template <typename T>
  outcome::result<void> decodeTagged(CborDecoder &d, Tagged<T> &tagged) {
    OUTCOME_TRY(token, d.peekHeader());
    if (token.type == CborToken::TAG) {
      OUTCOME_TRY(tag, d.readTag());
      tagged.tag = tag;
    } else {
      tagged.tag = boost::none;
    }
    return d.decode(tagged.value);
  }

  template <typename T>
  outcome::result<void> cborEncode(CborEncoder &e, const Tagged<T> &tagged) {
    if (tagged.tag) {
      OUTCOME_TRY(e.writeTag(*tagged.tag));
    }
    return e.encode(tagged.value);
  }

  /**
   * Shape inferred decode.
   * Scalars and lists have no tag. Map is tried as tag record first, then as
   * T itself. Tag header is kept as tag.
   */
  template <typename T>
  outcome::result<void> cborDecode(CborDecoder &d, Tagged<T> &tagged) {
    OUTCOME_TRY(token, d.peekHeader());
    if (token.type == CborToken::TAG) {
      return decodeTagged(d, tagged);
    }
    if (token.type != CborToken::MAP) {
      tagged.tag = boost::none;
      return d.decode(tagged.value);
    }
    // map item is read once, then decoded as record or as T
    OUTCOME_TRY(item, d.readItem());
    if (auto record{asTagRecord(item, d.config())}) {
      auto value{decode<T>(record->value, d.config())};
      if (value) {
        tagged.tag = record->tag;
        tagged.value = std::move(value.value());
        return outcome::success();
      }
    }
    tagged.tag = boost::none;
    OUTCOME_TRYA(tagged.value, decode<T>(item, d.config()));
    return outcome::success();
  }

  template <typename T>
  outcome::result<Tagged<T>> Tagged<T>::fromTaggedBytes(
      BytesIn input, const CborDecoderConfig &config) {
    OUTCOME_TRY(expectInput(input));
    BytesSource source{input};
    CborDecoder decoder{source, config};
    Tagged<T> tagged;
    OUTCOME_TRY(decodeTagged(decoder, tagged));
    OUTCOME_TRY(expectEnd(decoder));
    return tagged;
  }
}  // namespace tc::codec::cbor
